#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QObject>
#include <QList>
#include <QPair>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>
#include <optional>
#include "backend/domain/models/HistoryEntry.h"
#include "backend/domain/models/MediaFile.h"

/**
 * @brief One named SQLite connection (WAL journal) and the queries run on it.
 *
 * A QSqlDatabase connection may only be used from the thread that opened it,
 * so background work opens its own DatabaseManager on the same file.
 *
 * Before the application exits the owner calls checkpointAndClose(), which
 * merges the write-ahead log back into the main file and drops the connection.
 */
class DatabaseManager : public QObject {
    Q_OBJECT

public:
    explicit DatabaseManager(const QString& connectionName, QObject* parent = nullptr);
    ~DatabaseManager() override;

    bool open(const QString& filePath, QString* errorString = nullptr);
    bool isOpen() const;
    void close();

    // PRAGMA wal_checkpoint(TRUNCATE) then close. Closing happens even if the checkpoint fails.
    bool checkpointAndClose(QString* errorString = nullptr);
    bool checkpoint(QString* errorString = nullptr);

    QString connectionName() const { return m_connectionName; }
    QString filePath() const { return m_filePath; }
    QString lastError() const { return m_lastError; }
    QString journalMode() const;

    // Folders
    std::optional<Folder> importFolder(const QString& path, const QString& name);
    std::optional<Folder> folderById(qint64 folderId) const;
    QList<Folder> allFolders() const;

    // Media files
    std::optional<MediaFile> addMediaFile(const QString& path, MediaType type, std::optional<qint64> folderId);
    QList<MediaFile> addMediaFiles(const QList<QPair<QString, MediaType>>& files, qint64 folderId);
    QList<MediaFile> mediaFilesByFolder(qint64 folderId) const;
    QList<MediaFile> rootMediaFiles() const;
    bool deleteMediaFile(qint64 mediaFileId);
    bool updateMediaFilesOrder(const QList<MediaFile>& files);

    // History slots
    bool replaceHistory(const QList<HistoryEntry>& entries);
    QList<HistoryEntry> loadHistory() const;
    bool clearHistory();

private:
    QSqlDatabase database() const;
    bool createSchema();
    bool exec(const QString& statement);
    int nextFolderOrderIndex() const;
    int nextMediaOrderIndex(std::optional<qint64> folderId) const;
    std::optional<MediaFile> findMediaFile(const QString& path, std::optional<qint64> folderId) const;
    void setError(const QString& context, const QString& error) const;

    QString m_connectionName;
    QString m_filePath;
    mutable QString m_lastError;
};

#endif // DATABASEMANAGER_H
