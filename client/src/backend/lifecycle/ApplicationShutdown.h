#ifndef APPLICATIONSHUTDOWN_H
#define APPLICATIONSHUTDOWN_H

#include <QList>
#include <QtGlobal>
#include <QPointer>
#include <QString>
#include "backend/lifecycle/ShutdownSequence.h"

class AuthService;
class DatabaseManager;
class FpsMonitor;
class GlobalHotKeyManager;
class HistoryStore;
class ImportManager;
class ProjectionManager;
class SettingsManager;
class VideoPlayerManager;

// Everything the main window tears down on close. Any pointer may be null.
struct ShutdownCollaborators {
    QPointer<SettingsManager> settings;
    QPointer<VideoPlayerManager> videoPlayer;
    QList<int> videoSubscriptions;
    QPointer<ProjectionManager> projection;
    QPointer<GlobalHotKeyManager> hotKeys;
    QPointer<FpsMonitor> fpsMonitor;
    QPointer<AuthService> auth;
    QPointer<HistoryStore> history;
    QPointer<ImportManager> importManager;
    QPointer<DatabaseManager> historyDatabase;
    QPointer<DatabaseManager> libraryDatabase;
};

/**
 * @brief The main window's close-time cleanup, in its fixed order.
 *
 *  1. persist-settings            7. shutdown-auth-session
 *  2. unsubscribe-video-listeners 8. persist-history
 *  3. stop-video-player           9. stop-background-sync
 *  4. close-projection           10. checkpoint-history-database
 *  5. release-global-hotkeys     11. checkpoint-library-database
 *  6. stop-fps-monitor
 *
 * Step 8 saves or clears the history depending on the saveHistoryOnExit
 * preference read from the settings at the time the step runs. Step 9 drains
 * the folder sync worker so nothing writes the library while it is checkpointed.
 */
class ApplicationShutdown {
public:
    static const QString PERSIST_SETTINGS;
    static const QString UNSUBSCRIBE_VIDEO_LISTENERS;
    static const QString STOP_VIDEO_PLAYER;
    static const QString CLOSE_PROJECTION;
    static const QString RELEASE_GLOBAL_HOTKEYS;
    static const QString STOP_FPS_MONITOR;
    static const QString SHUTDOWN_AUTH_SESSION;
    static const QString PERSIST_HISTORY;
    static const QString STOP_BACKGROUND_SYNC;
    static const QString CHECKPOINT_HISTORY_DATABASE;
    static const QString CHECKPOINT_LIBRARY_DATABASE;

    explicit ApplicationShutdown(const ShutdownCollaborators& collaborators);
    Q_DISABLE_COPY(ApplicationShutdown)

    const ShutdownReport& run() { return m_sequence.run(); }
    bool hasRun() const { return m_sequence.hasRun(); }
    QStringList stepNames() const { return m_sequence.stepNames(); }
    const ShutdownReport& report() const { return m_sequence.report(); }

private:
    static ShutdownStepResult checkpointDatabase(DatabaseManager* database);

    ShutdownCollaborators m_collaborators;
    ShutdownSequence m_sequence;
};

#endif // APPLICATIONSHUTDOWN_H
