#include "backend/database/HistoryStore.h"
#include "backend/database/DatabaseManager.h"
#include <QDebug>

HistoryStore::HistoryStore(DatabaseManager* database, QObject* parent)
    : QObject(parent)
    , m_database(database)
{
}

bool HistoryStore::load() {
    if (!m_database || !m_database->isOpen()) {
        qWarning() << "HistoryStore: Cannot load, database not open";
        return false;
    }
    m_entries = m_database->loadHistory();
    while (m_entries.size() > MAX_ENTRIES) {
        m_entries.removeLast();
    }
    qDebug() << "HistoryStore: Loaded" << m_entries.size() << "entries";
    emit historyChanged();
    return true;
}

void HistoryStore::record(const HistoryEntry& entry) {
    // Re-recording an item moves it back to the top
    m_entries.removeAll(entry);
    HistoryEntry stamped = entry;
    if (!stamped.recordedAt.isValid()) {
        stamped.recordedAt = QDateTime::currentDateTime();
    }
    m_entries.prepend(stamped);
    while (m_entries.size() > MAX_ENTRIES) {
        m_entries.removeLast();
    }
    emit historyChanged();
}

void HistoryStore::removeAt(int index) {
    if (index < 0 || index >= m_entries.size()) return;
    m_entries.removeAt(index);
    emit historyChanged();
}

bool HistoryStore::persist() {
    if (!m_database || !m_database->isOpen()) {
        qWarning() << "HistoryStore: Cannot persist, database not open";
        return false;
    }
    const bool saved = m_database->replaceHistory(m_entries);
    qDebug() << "HistoryStore: Persisted" << m_entries.size() << "entries" << (saved ? "" : "(failed)");
    return saved;
}

bool HistoryStore::clear() {
    m_entries.clear();
    emit historyChanged();
    if (!m_database || !m_database->isOpen()) {
        qWarning() << "HistoryStore: Cleared in memory only, database not open";
        return false;
    }
    return m_database->clearHistory();
}

bool HistoryStore::persistOrClear(bool saveOnExit) {
    return saveOnExit ? persist() : clear();
}
