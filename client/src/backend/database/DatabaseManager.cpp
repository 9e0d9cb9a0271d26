#include "backend/database/DatabaseManager.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

namespace {
    MediaFile mediaFileFromQuery(const QSqlQuery& query) {
        MediaFile file;
        file.id = query.value(0).toLongLong();
        file.name = query.value(1).toString();
        file.path = query.value(2).toString();
        file.type = static_cast<MediaType>(query.value(3).toInt());
        if (!query.value(4).isNull()) {
            file.folderId = query.value(4).toLongLong();
        }
        file.orderIndex = query.value(5).toInt();
        return file;
    }

    Folder folderFromQuery(const QSqlQuery& query) {
        Folder folder;
        folder.id = query.value(0).toLongLong();
        folder.name = query.value(1).toString();
        folder.path = query.value(2).toString();
        folder.orderIndex = query.value(3).toInt();
        return folder;
    }

    const QString MEDIA_COLUMNS = QStringLiteral("id, name, path, type, folder_id, order_index");
}

DatabaseManager::DatabaseManager(const QString& connectionName, QObject* parent)
    : QObject(parent)
    , m_connectionName(connectionName)
{
}

DatabaseManager::~DatabaseManager() {
    close();
}

QSqlDatabase DatabaseManager::database() const {
    return QSqlDatabase::database(m_connectionName, false);
}

bool DatabaseManager::isOpen() const {
    return QSqlDatabase::contains(m_connectionName) && database().isOpen();
}

bool DatabaseManager::open(const QString& filePath, QString* errorString) {
    if (isOpen()) {
        if (errorString) *errorString = QStringLiteral("connection %1 already open").arg(m_connectionName);
        return false;
    }

    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        setError("open", QStringLiteral("cannot create directory %1").arg(info.absolutePath()));
        if (errorString) *errorString = m_lastError;
        return false;
    }

    bool opened = false;
    QString openError;
    {
        QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
        db.setDatabaseName(info.absoluteFilePath());
        opened = db.open();
        if (!opened) openError = db.lastError().text();
    }
    if (!opened) {
        QSqlDatabase::removeDatabase(m_connectionName);
        setError("open", openError);
        if (errorString) *errorString = m_lastError;
        return false;
    }

    m_filePath = info.absoluteFilePath();
    if (!exec(QStringLiteral("PRAGMA journal_mode=WAL")) || !exec(QStringLiteral("PRAGMA foreign_keys=ON")) || !createSchema()) {
        if (errorString) *errorString = m_lastError;
        close();
        return false;
    }

    m_lastError.clear();
    qDebug() << "DatabaseManager: Opened" << m_connectionName << "at" << m_filePath << "journal" << journalMode();
    return true;
}

void DatabaseManager::close() {
    if (!QSqlDatabase::contains(m_connectionName)) return;
    {
        QSqlDatabase db = database();
        if (db.isOpen()) db.close();
    }
    QSqlDatabase::removeDatabase(m_connectionName);
    qDebug() << "DatabaseManager: Closed" << m_connectionName;
}

bool DatabaseManager::checkpoint(QString* errorString) {
    if (!isOpen()) {
        if (errorString) *errorString = QStringLiteral("connection %1 is not open").arg(m_connectionName);
        return false;
    }
    QSqlQuery query(database());
    if (!query.exec(QStringLiteral("PRAGMA wal_checkpoint(TRUNCATE)"))) {
        setError("checkpoint", query.lastError().text());
        if (errorString) *errorString = m_lastError;
        return false;
    }
    // Row: busy, log frames, checkpointed frames
    if (query.next() && query.value(0).toInt() != 0) {
        setError("checkpoint", QStringLiteral("database busy, WAL not fully merged"));
        if (errorString) *errorString = m_lastError;
        return false;
    }
    return true;
}

bool DatabaseManager::checkpointAndClose(QString* errorString) {
    if (!isOpen()) {
        return true; // nothing left to merge
    }
    const bool merged = checkpoint(errorString);
    close();
    return merged;
}

QString DatabaseManager::journalMode() const {
    if (!isOpen()) return QString();
    QSqlQuery query(database());
    if (query.exec(QStringLiteral("PRAGMA journal_mode")) && query.next()) {
        return query.value(0).toString();
    }
    return QString();
}

bool DatabaseManager::exec(const QString& statement) {
    QSqlQuery query(database());
    if (!query.exec(statement)) {
        setError(statement.left(40), query.lastError().text());
        return false;
    }
    return true;
}

bool DatabaseManager::createSchema() {
    return exec(QStringLiteral(
               "CREATE TABLE IF NOT EXISTS folders ("
               " id INTEGER PRIMARY KEY AUTOINCREMENT,"
               " name TEXT NOT NULL,"
               " path TEXT NOT NULL UNIQUE,"
               " order_index INTEGER NOT NULL DEFAULT 0)"))
        && exec(QStringLiteral(
               "CREATE TABLE IF NOT EXISTS media_files ("
               " id INTEGER PRIMARY KEY AUTOINCREMENT,"
               " name TEXT NOT NULL,"
               " path TEXT NOT NULL,"
               " type INTEGER NOT NULL,"
               " folder_id INTEGER REFERENCES folders(id) ON DELETE CASCADE,"
               " order_index INTEGER NOT NULL DEFAULT 0)"))
        && exec(QStringLiteral(
               "CREATE INDEX IF NOT EXISTS idx_media_files_folder ON media_files(folder_id)"))
        && exec(QStringLiteral(
               "CREATE TABLE IF NOT EXISTS history_records ("
               " id INTEGER PRIMARY KEY AUTOINCREMENT,"
               " slot INTEGER NOT NULL,"
               " title TEXT NOT NULL,"
               " reference TEXT NOT NULL,"
               " recorded_at TEXT NOT NULL)"));
}

void DatabaseManager::setError(const QString& context, const QString& error) const {
    m_lastError = error;
    qWarning() << "DatabaseManager:" << m_connectionName << context << "failed:" << error;
}

int DatabaseManager::nextFolderOrderIndex() const {
    QSqlQuery query(database());
    if (query.exec(QStringLiteral("SELECT COALESCE(MAX(order_index), 0) FROM folders")) && query.next()) {
        return query.value(0).toInt() + 1;
    }
    return 1;
}

int DatabaseManager::nextMediaOrderIndex(std::optional<qint64> folderId) const {
    QSqlQuery query(database());
    if (folderId) {
        query.prepare(QStringLiteral("SELECT COALESCE(MAX(order_index), 0) FROM media_files WHERE folder_id = ?"));
        query.addBindValue(*folderId);
    } else {
        query.prepare(QStringLiteral("SELECT COALESCE(MAX(order_index), 0) FROM media_files WHERE folder_id IS NULL"));
    }
    if (query.exec() && query.next()) {
        return query.value(0).toInt() + 1;
    }
    return 1;
}

std::optional<Folder> DatabaseManager::importFolder(const QString& path, const QString& name) {
    {
        QSqlQuery query(database());
        query.prepare(QStringLiteral("SELECT id, name, path, order_index FROM folders WHERE path = ?"));
        query.addBindValue(path);
        if (query.exec() && query.next()) {
            return folderFromQuery(query);
        }
    }

    Folder folder;
    folder.name = name;
    folder.path = path;
    folder.orderIndex = nextFolderOrderIndex();

    QSqlQuery insert(database());
    insert.prepare(QStringLiteral("INSERT INTO folders (name, path, order_index) VALUES (?, ?, ?)"));
    insert.addBindValue(folder.name);
    insert.addBindValue(folder.path);
    insert.addBindValue(folder.orderIndex);
    if (!insert.exec()) {
        setError("importFolder", insert.lastError().text());
        return std::nullopt;
    }
    folder.id = insert.lastInsertId().toLongLong();
    return folder;
}

std::optional<Folder> DatabaseManager::folderById(qint64 folderId) const {
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT id, name, path, order_index FROM folders WHERE id = ?"));
    query.addBindValue(folderId);
    if (query.exec() && query.next()) {
        return folderFromQuery(query);
    }
    return std::nullopt;
}

QList<Folder> DatabaseManager::allFolders() const {
    QList<Folder> folders;
    QSqlQuery query(database());
    if (!query.exec(QStringLiteral("SELECT id, name, path, order_index FROM folders ORDER BY order_index"))) {
        setError("allFolders", query.lastError().text());
        return folders;
    }
    while (query.next()) {
        folders.append(folderFromQuery(query));
    }
    return folders;
}

std::optional<MediaFile> DatabaseManager::findMediaFile(const QString& path, std::optional<qint64> folderId) const {
    QSqlQuery query(database());
    if (folderId) {
        query.prepare(QStringLiteral("SELECT %1 FROM media_files WHERE path = ? AND folder_id = ?").arg(MEDIA_COLUMNS));
        query.addBindValue(path);
        query.addBindValue(*folderId);
    } else {
        query.prepare(QStringLiteral("SELECT %1 FROM media_files WHERE path = ? AND folder_id IS NULL").arg(MEDIA_COLUMNS));
        query.addBindValue(path);
    }
    if (query.exec() && query.next()) {
        return mediaFileFromQuery(query);
    }
    return std::nullopt;
}

std::optional<MediaFile> DatabaseManager::addMediaFile(const QString& path, MediaType type, std::optional<qint64> folderId) {
    if (const std::optional<MediaFile> existing = findMediaFile(path, folderId)) {
        return existing;
    }

    MediaFile file;
    file.name = QFileInfo(path).completeBaseName();
    file.path = path;
    file.type = type;
    file.folderId = folderId;
    file.orderIndex = nextMediaOrderIndex(folderId);

    QSqlQuery insert(database());
    insert.prepare(QStringLiteral("INSERT INTO media_files (name, path, type, folder_id, order_index) VALUES (?, ?, ?, ?, ?)"));
    insert.addBindValue(file.name);
    insert.addBindValue(file.path);
    insert.addBindValue(static_cast<int>(file.type));
    insert.addBindValue(folderId ? QVariant(*folderId) : QVariant(QMetaType::fromType<qint64>()));
    insert.addBindValue(file.orderIndex);
    if (!insert.exec()) {
        setError("addMediaFile", insert.lastError().text());
        return std::nullopt;
    }
    file.id = insert.lastInsertId().toLongLong();
    return file;
}

QList<MediaFile> DatabaseManager::addMediaFiles(const QList<QPair<QString, MediaType>>& files, qint64 folderId) {
    QList<MediaFile> added;
    QSqlDatabase db = database();
    const bool transaction = db.transaction();
    for (const auto& entry : files) {
        if (std::optional<MediaFile> file = addMediaFile(entry.first, entry.second, folderId)) {
            added.append(*file);
        }
    }
    if (transaction && !db.commit()) {
        setError("addMediaFiles", db.lastError().text());
        db.rollback();
        return {};
    }
    return added;
}

QList<MediaFile> DatabaseManager::mediaFilesByFolder(qint64 folderId) const {
    QList<MediaFile> files;
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT %1 FROM media_files WHERE folder_id = ? ORDER BY order_index").arg(MEDIA_COLUMNS));
    query.addBindValue(folderId);
    if (!query.exec()) {
        setError("mediaFilesByFolder", query.lastError().text());
        return files;
    }
    while (query.next()) {
        files.append(mediaFileFromQuery(query));
    }
    return files;
}

QList<MediaFile> DatabaseManager::rootMediaFiles() const {
    QList<MediaFile> files;
    QSqlQuery query(database());
    if (!query.exec(QStringLiteral("SELECT %1 FROM media_files WHERE folder_id IS NULL ORDER BY order_index").arg(MEDIA_COLUMNS))) {
        setError("rootMediaFiles", query.lastError().text());
        return files;
    }
    while (query.next()) {
        files.append(mediaFileFromQuery(query));
    }
    return files;
}

bool DatabaseManager::deleteMediaFile(qint64 mediaFileId) {
    QSqlQuery query(database());
    query.prepare(QStringLiteral("DELETE FROM media_files WHERE id = ?"));
    query.addBindValue(mediaFileId);
    if (!query.exec()) {
        setError("deleteMediaFile", query.lastError().text());
        return false;
    }
    return query.numRowsAffected() > 0;
}

bool DatabaseManager::updateMediaFilesOrder(const QList<MediaFile>& files) {
    QSqlDatabase db = database();
    db.transaction();
    QSqlQuery query(db);
    query.prepare(QStringLiteral("UPDATE media_files SET order_index = ? WHERE id = ?"));
    for (const MediaFile& file : files) {
        query.addBindValue(file.orderIndex);
        query.addBindValue(file.id);
        if (!query.exec()) {
            setError("updateMediaFilesOrder", query.lastError().text());
            db.rollback();
            return false;
        }
    }
    return db.commit();
}

bool DatabaseManager::replaceHistory(const QList<HistoryEntry>& entries) {
    QSqlDatabase db = database();
    db.transaction();
    QSqlQuery query(db);
    if (!query.exec(QStringLiteral("DELETE FROM history_records"))) {
        setError("replaceHistory", query.lastError().text());
        db.rollback();
        return false;
    }
    query.prepare(QStringLiteral("INSERT INTO history_records (slot, title, reference, recorded_at) VALUES (?, ?, ?, ?)"));
    for (int slot = 0; slot < entries.size(); ++slot) {
        const HistoryEntry& entry = entries.at(slot);
        query.addBindValue(slot);
        query.addBindValue(entry.title);
        query.addBindValue(entry.reference);
        query.addBindValue(entry.recordedAt.toString(Qt::ISODateWithMs));
        if (!query.exec()) {
            setError("replaceHistory", query.lastError().text());
            db.rollback();
            return false;
        }
    }
    if (!db.commit()) {
        setError("replaceHistory", db.lastError().text());
        return false;
    }
    return true;
}

QList<HistoryEntry> DatabaseManager::loadHistory() const {
    QList<HistoryEntry> entries;
    QSqlQuery query(database());
    if (!query.exec(QStringLiteral("SELECT title, reference, recorded_at FROM history_records ORDER BY slot"))) {
        setError("loadHistory", query.lastError().text());
        return entries;
    }
    while (query.next()) {
        HistoryEntry entry;
        entry.title = query.value(0).toString();
        entry.reference = query.value(1).toString();
        entry.recordedAt = QDateTime::fromString(query.value(2).toString(), Qt::ISODateWithMs);
        entries.append(entry);
    }
    return entries;
}

bool DatabaseManager::clearHistory() {
    return exec(QStringLiteral("DELETE FROM history_records"));
}
