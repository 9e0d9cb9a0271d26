#ifndef HISTORYENTRY_H
#define HISTORYENTRY_H

#include <QDateTime>
#include <QString>

// One recently projected item, shown in the history slots.
struct HistoryEntry {
    QString title;
    QString reference; // path or passage reference the entry re-opens
    QDateTime recordedAt;

    bool operator==(const HistoryEntry& other) const {
        return title == other.title && reference == other.reference;
    }
};

#endif // HISTORYENTRY_H
