#include "backend/database/HistoryStore.h"
#include "backend/database/DatabaseManager.h"
#include <QSignalSpy>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace {
HistoryEntry entry(int n) {
    HistoryEntry e;
    e.title = QStringLiteral("Item %1").arg(n);
    e.reference = QStringLiteral("/media/%1.png").arg(n);
    return e;
}
}

class HistoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        ASSERT_TRUE(m_db.open(m_dir.filePath("history.db")));
    }

    QTemporaryDir m_dir;
    DatabaseManager m_db{QStringLiteral("history-store-test")};
};

TEST_F(HistoryStoreTest, KeepsTheTenMostRecent) {
    HistoryStore store(&m_db);
    for (int i = 1; i <= 12; ++i) {
        store.record(entry(i));
    }

    ASSERT_EQ(store.size(), HistoryStore::MAX_ENTRIES);
    EXPECT_EQ(store.entries().first().title, QString("Item 12"));
    EXPECT_EQ(store.entries().last().title, QString("Item 3"));
    EXPECT_TRUE(store.entries().first().recordedAt.isValid());
}

TEST_F(HistoryStoreTest, RerecordingMovesToTop) {
    HistoryStore store(&m_db);
    store.record(entry(1));
    store.record(entry(2));
    store.record(entry(3));
    store.record(entry(1));

    ASSERT_EQ(store.size(), 3);
    EXPECT_EQ(store.entries().at(0).title, QString("Item 1"));
    EXPECT_EQ(store.entries().at(1).title, QString("Item 3"));
    EXPECT_EQ(store.entries().at(2).title, QString("Item 2"));
}

TEST_F(HistoryStoreTest, RemoveAtIgnoresOutOfRange) {
    HistoryStore store(&m_db);
    store.record(entry(1));
    store.record(entry(2));
    QSignalSpy changed(&store, &HistoryStore::historyChanged);

    store.removeAt(5);
    store.removeAt(-1);
    EXPECT_EQ(changed.count(), 0);

    store.removeAt(0);
    EXPECT_EQ(changed.count(), 1);
    ASSERT_EQ(store.size(), 1);
    EXPECT_EQ(store.entries().first().title, QString("Item 1"));
}

TEST_F(HistoryStoreTest, PersistAndReloadKeepsOrder) {
    {
        HistoryStore store(&m_db);
        store.record(entry(1));
        store.record(entry(2));
        ASSERT_TRUE(store.persistOrClear(true));
    }

    HistoryStore reloaded(&m_db);
    ASSERT_TRUE(reloaded.load());
    ASSERT_EQ(reloaded.size(), 2);
    EXPECT_EQ(reloaded.entries().at(0).title, QString("Item 2"));
    EXPECT_EQ(reloaded.entries().at(1).reference, QString("/media/1.png"));
}

TEST_F(HistoryStoreTest, ClearOnExitWipesTable) {
    HistoryStore store(&m_db);
    store.record(entry(1));
    ASSERT_TRUE(store.persist());

    ASSERT_TRUE(store.persistOrClear(false));
    EXPECT_EQ(store.size(), 0);
    EXPECT_TRUE(m_db.loadHistory().isEmpty());
}

TEST_F(HistoryStoreTest, ClosedDatabaseReportsFailure) {
    HistoryStore store(&m_db);
    store.record(entry(1));
    m_db.close();

    EXPECT_FALSE(store.load());
    EXPECT_FALSE(store.persist());
    EXPECT_FALSE(store.clear());
    EXPECT_EQ(store.size(), 0);

    HistoryStore detached(nullptr);
    EXPECT_FALSE(detached.persistOrClear(true));
}
