#include "backend/database/DatabaseManager.h"
#include <QFileInfo>
#include <QTemporaryDir>
#include <gtest/gtest.h>

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        m_path = m_dir.filePath("library.db");
        QString error;
        ASSERT_TRUE(m_db.open(m_path, &error)) << error.toStdString();
    }

    QTemporaryDir m_dir;
    QString m_path;
    DatabaseManager m_db{QStringLiteral("database-manager-test")};
};

TEST_F(DatabaseManagerTest, OpensInWalMode) {
    EXPECT_TRUE(m_db.isOpen());
    EXPECT_EQ(m_db.journalMode().toLower(), QString("wal"));
    EXPECT_EQ(m_db.filePath(), QFileInfo(m_path).absoluteFilePath());
}

TEST_F(DatabaseManagerTest, SecondOpenOnSameConnectionFails) {
    QString error;
    EXPECT_FALSE(m_db.open(m_path, &error));
    EXPECT_FALSE(error.isEmpty());

    DatabaseManager twin(m_db.connectionName());
    EXPECT_FALSE(twin.open(m_dir.filePath("other.db")));
}

TEST_F(DatabaseManagerTest, RootMediaFilesAreDeduplicatedByPath) {
    const std::optional<MediaFile> first = m_db.addMediaFile("/media/a.png", MediaType::Image, std::nullopt);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->name, QString("a"));
    EXPECT_EQ(first->orderIndex, 1);
    EXPECT_FALSE(first->folderId.has_value());

    const std::optional<MediaFile> again = m_db.addMediaFile("/media/a.png", MediaType::Image, std::nullopt);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->id, first->id);

    const std::optional<MediaFile> second = m_db.addMediaFile("/media/b.mp4", MediaType::Video, std::nullopt);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->orderIndex, 2);

    const QList<MediaFile> root = m_db.rootMediaFiles();
    ASSERT_EQ(root.size(), 2);
    EXPECT_EQ(root.at(0).path, QString("/media/a.png"));
    EXPECT_EQ(root.at(1).type, MediaType::Video);
}

TEST_F(DatabaseManagerTest, FoldersAreReusedByPath) {
    const std::optional<Folder> folder = m_db.importFolder("/media/songs", "songs");
    ASSERT_TRUE(folder.has_value());
    EXPECT_EQ(folder->orderIndex, 1);

    const std::optional<Folder> same = m_db.importFolder("/media/songs", "renamed");
    ASSERT_TRUE(same.has_value());
    EXPECT_EQ(same->id, folder->id);
    EXPECT_EQ(same->name, QString("songs"));

    ASSERT_TRUE(m_db.importFolder("/media/slides", "slides").has_value());
    const QList<Folder> folders = m_db.allFolders();
    ASSERT_EQ(folders.size(), 2);
    EXPECT_EQ(folders.at(1).name, QString("slides"));

    const std::optional<Folder> byId = m_db.folderById(folder->id);
    ASSERT_TRUE(byId.has_value());
    EXPECT_EQ(byId->path, QString("/media/songs"));
    EXPECT_FALSE(m_db.folderById(9999).has_value());
}

TEST_F(DatabaseManagerTest, BatchAddKeepsFolderOrderAndSkipsDuplicates) {
    const std::optional<Folder> folder = m_db.importFolder("/media/songs", "songs");
    ASSERT_TRUE(folder.has_value());

    const QList<QPair<QString, MediaType>> batch = {
        {"/media/songs/1.mp3", MediaType::Audio},
        {"/media/songs/2.mp3", MediaType::Audio},
        {"/media/songs/10.mp3", MediaType::Audio},
    };
    const QList<MediaFile> added = m_db.addMediaFiles(batch, folder->id);
    ASSERT_EQ(added.size(), 3);

    m_db.addMediaFiles({{"/media/songs/2.mp3", MediaType::Audio}}, folder->id);

    const QList<MediaFile> files = m_db.mediaFilesByFolder(folder->id);
    ASSERT_EQ(files.size(), 3);
    EXPECT_EQ(files.at(0).name, QString("1"));
    EXPECT_EQ(files.at(1).name, QString("2"));
    EXPECT_EQ(files.at(2).name, QString("10"));
    EXPECT_TRUE(m_db.rootMediaFiles().isEmpty());

    // The same path at root level is a separate entry
    EXPECT_TRUE(m_db.addMediaFile("/media/songs/1.mp3", MediaType::Audio, std::nullopt).has_value());
    EXPECT_EQ(m_db.rootMediaFiles().size(), 1);
}

TEST_F(DatabaseManagerTest, DeleteAndReorder) {
    const std::optional<MediaFile> a = m_db.addMediaFile("/media/a.png", MediaType::Image, std::nullopt);
    const std::optional<MediaFile> b = m_db.addMediaFile("/media/b.png", MediaType::Image, std::nullopt);
    ASSERT_TRUE(a && b);

    MediaFile movedA = *a;
    movedA.orderIndex = 2;
    MediaFile movedB = *b;
    movedB.orderIndex = 1;
    ASSERT_TRUE(m_db.updateMediaFilesOrder({movedA, movedB}));

    QList<MediaFile> root = m_db.rootMediaFiles();
    ASSERT_EQ(root.size(), 2);
    EXPECT_EQ(root.first().id, b->id);

    EXPECT_TRUE(m_db.deleteMediaFile(a->id));
    EXPECT_FALSE(m_db.deleteMediaFile(a->id));
    root = m_db.rootMediaFiles();
    ASSERT_EQ(root.size(), 1);
    EXPECT_EQ(root.first().id, b->id);
}

TEST_F(DatabaseManagerTest, HistoryIsReplacedAsAWhole) {
    const QDateTime when = QDateTime::fromString("2024-03-01T10:00:00.000", Qt::ISODateWithMs);
    ASSERT_TRUE(m_db.replaceHistory({{"First", "/media/a.png", when}, {"Second", "/media/b.mp4", when}}));
    ASSERT_TRUE(m_db.replaceHistory({{"Only", "/media/c.png", when}}));

    const QList<HistoryEntry> history = m_db.loadHistory();
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history.first().title, QString("Only"));
    EXPECT_EQ(history.first().reference, QString("/media/c.png"));
    EXPECT_EQ(history.first().recordedAt, when);

    ASSERT_TRUE(m_db.clearHistory());
    EXPECT_TRUE(m_db.loadHistory().isEmpty());
}

TEST_F(DatabaseManagerTest, CheckpointMergesWalAndCloses) {
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(m_db.addMediaFile(QStringLiteral("/media/%1.png").arg(i), MediaType::Image, std::nullopt).has_value());
    }

    QString error;
    EXPECT_TRUE(m_db.checkpointAndClose(&error)) << error.toStdString();
    EXPECT_FALSE(m_db.isOpen());

    const QFileInfo wal(m_path + "-wal");
    EXPECT_TRUE(!wal.exists() || wal.size() == 0);

    // Data survives in the main file
    ASSERT_TRUE(m_db.open(m_path));
    EXPECT_EQ(m_db.rootMediaFiles().size(), 20);
}

TEST_F(DatabaseManagerTest, CheckpointOnClosedConnectionIsANoOp) {
    m_db.close();
    EXPECT_FALSE(m_db.isOpen());
    EXPECT_TRUE(m_db.checkpointAndClose());

    QString error;
    EXPECT_FALSE(m_db.checkpoint(&error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(DatabaseManagerStandaloneTest, UnopenableLocationFails) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    DatabaseManager db(QStringLiteral("database-manager-bad-path"));
    // A directory cannot be opened as a database file
    QString error;
    EXPECT_FALSE(db.open(dir.path(), &error));
    EXPECT_FALSE(db.isOpen());
    EXPECT_FALSE(error.isEmpty());
}
