#ifndef HISTORYSTORE_H
#define HISTORYSTORE_H

#include <QObject>
#include <QList>
#include "backend/domain/models/HistoryEntry.h"

class DatabaseManager;

// Most-recent-first list of projected items, backed by the history_records table.
class HistoryStore : public QObject {
    Q_OBJECT

public:
    static constexpr int MAX_ENTRIES = 10;

    explicit HistoryStore(DatabaseManager* database, QObject* parent = nullptr);
    ~HistoryStore() override = default;

    bool load();
    void record(const HistoryEntry& entry);
    void removeAt(int index);

    const QList<HistoryEntry>& entries() const { return m_entries; }
    int size() const { return m_entries.size(); }

    bool persist();
    bool clear();
    // Exit-time decision driven by the saveHistoryOnExit preference.
    bool persistOrClear(bool saveOnExit);

signals:
    void historyChanged();

private:
    DatabaseManager* m_database;
    QList<HistoryEntry> m_entries;
};

#endif // HISTORYSTORE_H
