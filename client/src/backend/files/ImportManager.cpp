#include "backend/files/ImportManager.h"
#include "backend/database/DatabaseManager.h"
#include <QCollator>
#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QSet>
#include <QtConcurrent/QtConcurrentRun>
#include <algorithm>
#include <atomic>

namespace {
    std::atomic<int> s_syncConnectionCounter{0};

    void sortNaturally(QStringList& paths) {
        QCollator collator;
        collator.setNumericMode(true);
        collator.setCaseSensitivity(Qt::CaseInsensitive);
        std::stable_sort(paths.begin(), paths.end(), [&collator](const QString& a, const QString& b) {
            const int byName = collator.compare(QFileInfo(a).fileName(), QFileInfo(b).fileName());
            if (byName != 0) return byName < 0;
            return collator.compare(a, b) < 0;
        });
    }
}

ImportManager::ImportManager(DatabaseManager* database, QObject* parent)
    : QObject(parent)
    , m_database(database)
{
}

ImportManager::~ImportManager() {
    waitForSync();
}

bool ImportManager::waitForSync() {
    m_syncStopped = true;
    if (!m_syncWatcher) return false;

    QFutureWatcher<SyncSummary>* watcher = m_syncWatcher;
    m_syncWatcher = nullptr;
    disconnect(watcher, nullptr, this, nullptr);
    watcher->waitForFinished();
    watcher->deleteLater();
    qDebug() << "ImportManager: Background sync drained before shutdown";
    return true;
}

const QStringList& ImportManager::imageExtensions() {
    static const QStringList extensions = {"jpg", "jpeg", "png", "bmp", "gif", "tif"};
    return extensions;
}

const QStringList& ImportManager::videoExtensions() {
    static const QStringList extensions = {"mp4", "avi", "mkv", "mov", "wmv", "flv", "f4v", "rm", "rmvb"};
    return extensions;
}

const QStringList& ImportManager::audioExtensions() {
    static const QStringList extensions = {"mp3", "wav", "flac", "ogg", "m4a", "aac"};
    return extensions;
}

QStringList ImportManager::allExtensions() {
    return imageExtensions() + videoExtensions() + audioExtensions();
}

std::optional<MediaType> ImportManager::mediaTypeForPath(const QString& path) {
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix.isEmpty()) return std::nullopt;
    if (imageExtensions().contains(suffix)) return MediaType::Image;
    if (videoExtensions().contains(suffix)) return MediaType::Video;
    if (audioExtensions().contains(suffix)) return MediaType::Audio;
    return std::nullopt;
}

bool ImportManager::isSupportedFile(const QString& path) {
    return mediaTypeForPath(path).has_value();
}

QStringList ImportManager::scanMediaFiles(const QString& folderPath) {
    QStringList files;
    QDirIterator it(folderPath, QDir::Files | QDir::Readable | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (isSupportedFile(path)) {
            files.append(QFileInfo(path).absoluteFilePath());
        }
    }
    sortNaturally(files);
    return files;
}

std::optional<MediaFile> ImportManager::importSingleFile(const QString& filePath) {
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        qWarning() << "ImportManager: File does not exist:" << filePath;
        emit importError(tr("File does not exist: %1").arg(filePath));
        return std::nullopt;
    }

    const std::optional<MediaType> type = mediaTypeForPath(filePath);
    if (!type) {
        qWarning() << "ImportManager: Unsupported file format:" << filePath;
        emit importError(tr("Unsupported file format: %1").arg(info.fileName()));
        return std::nullopt;
    }

    if (!m_database || !m_database->isOpen()) {
        emit importError(tr("Media library is not available"));
        return std::nullopt;
    }

    std::optional<MediaFile> file = m_database->addMediaFile(info.absoluteFilePath(), *type, std::nullopt);
    if (!file) {
        emit importError(tr("Failed to import file: %1").arg(m_database->lastError()));
        return std::nullopt;
    }
    qDebug() << "ImportManager: Imported file" << file->name;
    return file;
}

FolderImportResult ImportManager::importFolder(const QString& folderPath) {
    FolderImportResult result;
    const QFileInfo info(folderPath);
    if (!info.exists() || !info.isDir()) {
        qWarning() << "ImportManager: Folder does not exist:" << folderPath;
        emit importError(tr("Folder does not exist: %1").arg(folderPath));
        return result;
    }
    if (!m_database || !m_database->isOpen()) {
        emit importError(tr("Media library is not available"));
        return result;
    }

    const QString absolutePath = info.absoluteFilePath();
    const QStringList scanned = scanMediaFiles(absolutePath);
    if (scanned.isEmpty()) {
        qDebug() << "ImportManager: No supported media in" << absolutePath;
        emit importError(tr("The selected folder contains no supported media files"));
        return result;
    }

    result.folder = m_database->importFolder(absolutePath, info.fileName());
    if (!result.folder) {
        emit importError(tr("Failed to import folder: %1").arg(m_database->lastError()));
        return result;
    }

    for (const MediaFile& known : m_database->mediaFilesByFolder(result.folder->id)) {
        result.existingFiles.append(known.path);
    }
    const QSet<QString> existing(result.existingFiles.cbegin(), result.existingFiles.cend());

    QList<QPair<QString, MediaType>> toAdd;
    for (const QString& path : scanned) {
        if (existing.contains(path)) continue;
        toAdd.append(qMakePair(path, *mediaTypeForPath(path)));
    }
    if (!toAdd.isEmpty()) {
        result.newFiles = m_database->addMediaFiles(toAdd, result.folder->id);
    }

    qDebug() << "ImportManager: Imported folder" << result.folder->name
             << "new:" << result.newFiles.size() << "existing:" << result.existingFiles.size();
    return result;
}

SyncSummary ImportManager::syncFolderWith(DatabaseManager& database, const Folder& folder) {
    SyncSummary summary;
    if (!QFileInfo(folder.path).isDir()) {
        qWarning() << "ImportManager: Folder missing on disk, skipping sync:" << folder.path;
        return summary;
    }

    const QStringList current = scanMediaFiles(folder.path);
    const QSet<QString> currentSet(current.cbegin(), current.cend());
    const QList<MediaFile> known = database.mediaFilesByFolder(folder.id);
    QSet<QString> knownSet;
    for (const MediaFile& file : known) knownSet.insert(file.path);

    QList<QPair<QString, MediaType>> toAdd;
    for (const QString& path : current) {
        if (!knownSet.contains(path)) {
            toAdd.append(qMakePair(path, *mediaTypeForPath(path)));
        }
    }
    if (!toAdd.isEmpty()) {
        summary.added = database.addMediaFiles(toAdd, folder.id).size();
    }

    for (const MediaFile& file : known) {
        if (!currentSet.contains(file.path) && database.deleteMediaFile(file.id)) {
            ++summary.removed;
        }
    }

    if (summary.added > 0 || summary.removed > 0) {
        reapplyNaturalOrder(database, folder.id);
    }
    qDebug() << "ImportManager: Synced" << folder.name << "added:" << summary.added << "removed:" << summary.removed;
    return summary;
}

void ImportManager::reapplyNaturalOrder(DatabaseManager& database, qint64 folderId) {
    QList<MediaFile> files = database.mediaFilesByFolder(folderId);
    if (files.isEmpty()) return;

    QCollator collator;
    collator.setNumericMode(true);
    collator.setCaseSensitivity(Qt::CaseInsensitive);
    std::stable_sort(files.begin(), files.end(), [&collator](const MediaFile& a, const MediaFile& b) {
        return collator.compare(QFileInfo(a.path).fileName(), QFileInfo(b.path).fileName()) < 0;
    });
    for (int i = 0; i < files.size(); ++i) {
        files[i].orderIndex = i + 1;
    }
    if (!database.updateMediaFilesOrder(files)) {
        qWarning() << "ImportManager: Failed to reorder folder" << folderId << database.lastError();
    }
}

SyncSummary ImportManager::syncFolder(qint64 folderId) {
    if (!m_database || !m_database->isOpen()) return SyncSummary();
    const std::optional<Folder> folder = m_database->folderById(folderId);
    if (!folder) {
        qWarning() << "ImportManager: Unknown folder id" << folderId;
        return SyncSummary();
    }
    return syncFolderWith(*m_database, *folder);
}

SyncSummary ImportManager::syncAllFolders() {
    SyncSummary total;
    if (!m_database || !m_database->isOpen()) return total;
    for (const Folder& folder : m_database->allFolders()) {
        total += syncFolderWith(*m_database, folder);
    }
    return total;
}

SyncSummary ImportManager::syncDatabaseFile(const QString& databasePath) {
    SyncSummary total;
    DatabaseManager database(QStringLiteral("projecteur-sync-%1").arg(++s_syncConnectionCounter));
    QString error;
    if (!database.open(databasePath, &error)) {
        qWarning() << "ImportManager: Background sync could not open database:" << error;
        return total;
    }
    for (const Folder& folder : database.allFolders()) {
        total += syncFolderWith(database, folder);
    }
    database.close();
    return total;
}

bool ImportManager::syncAllFoldersAsync() {
    if (m_syncWatcher) {
        qDebug() << "ImportManager: Sync already running";
        return false;
    }
    if (m_syncStopped) {
        qDebug() << "ImportManager: Background sync is stopped";
        return false;
    }
    if (!m_database || !m_database->isOpen()) {
        return false;
    }

    auto* watcher = new QFutureWatcher<SyncSummary>(this);
    m_syncWatcher = watcher;
    connect(watcher, &QFutureWatcher<SyncSummary>::finished, this, [this, watcher]() {
        const SyncSummary summary = watcher->result();
        watcher->deleteLater();
        m_syncWatcher = nullptr;
        qDebug() << "ImportManager: Background sync finished, added:" << summary.added << "removed:" << summary.removed;
        emit syncFinished(summary);
    });
    watcher->setFuture(QtConcurrent::run([path = m_database->filePath()]() {
        return syncDatabaseFile(path);
    }));
    return true;
}
