#ifndef IMPORTMANAGER_H
#define IMPORTMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <optional>
#include "backend/domain/models/MediaFile.h"

class DatabaseManager;
template<typename T> class QFutureWatcher;

/**
 * @brief Brings media files and folders from disk into the library database.
 *
 * Folder scans are recursive and ordered naturally ("2.jpg" before "10.jpg").
 * Failures are reported through importError() and an empty return value.
 */
class ImportManager : public QObject {
    Q_OBJECT

public:
    explicit ImportManager(DatabaseManager* database, QObject* parent = nullptr);
    ~ImportManager() override;

    static const QStringList& imageExtensions();
    static const QStringList& videoExtensions();
    static const QStringList& audioExtensions();
    static QStringList allExtensions();
    static bool isSupportedFile(const QString& path);
    static std::optional<MediaType> mediaTypeForPath(const QString& path);
    // Recursive scan, supported files only, natural file-name order
    static QStringList scanMediaFiles(const QString& folderPath);

    std::optional<MediaFile> importSingleFile(const QString& filePath);
    FolderImportResult importFolder(const QString& folderPath);

    SyncSummary syncFolder(qint64 folderId);
    SyncSummary syncAllFolders();
    // Runs syncAllFolders() on a worker thread with its own connection; result arrives via syncFinished()
    bool syncAllFoldersAsync();
    bool isSyncRunning() const { return m_syncWatcher != nullptr; }
    // Blocks until a running background sync has finished, dropping its result,
    // and refuses further background syncs. Returns whether a sync was running.
    bool waitForSync();

signals:
    void importError(const QString& message);
    void syncFinished(const SyncSummary& summary);

private:
    static SyncSummary syncFolderWith(DatabaseManager& database, const Folder& folder);
    static void reapplyNaturalOrder(DatabaseManager& database, qint64 folderId);
    static SyncSummary syncDatabaseFile(const QString& databasePath);

    DatabaseManager* m_database;
    QFutureWatcher<SyncSummary>* m_syncWatcher = nullptr;
    bool m_syncStopped = false;
};

#endif // IMPORTMANAGER_H
