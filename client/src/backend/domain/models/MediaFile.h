#ifndef MEDIAFILE_H
#define MEDIAFILE_H

#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

enum class MediaType {
    Image = 0,
    Video = 1,
    Audio = 2
};

struct Folder {
    qint64 id = 0;
    QString name;
    QString path;
    int orderIndex = 0;
};

struct MediaFile {
    qint64 id = 0;
    QString name;       // file name without extension
    QString path;       // absolute path on disk
    MediaType type = MediaType::Image;
    std::optional<qint64> folderId; // empty for files imported at root level
    int orderIndex = 0;
};

struct FolderImportResult {
    std::optional<Folder> folder;
    QList<MediaFile> newFiles;
    QStringList existingFiles;
};

struct SyncSummary {
    int added = 0;
    int removed = 0;
    int updated = 0;

    SyncSummary& operator+=(const SyncSummary& other) {
        added += other.added;
        removed += other.removed;
        updated += other.updated;
        return *this;
    }
};

#endif // MEDIAFILE_H
