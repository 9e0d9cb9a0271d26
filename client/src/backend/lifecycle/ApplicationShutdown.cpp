#include "backend/lifecycle/ApplicationShutdown.h"
#include "backend/auth/AuthService.h"
#include "backend/database/DatabaseManager.h"
#include "backend/database/HistoryStore.h"
#include "backend/files/ImportManager.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/managers/system/FpsMonitor.h"
#include "backend/managers/system/GlobalHotKeyManager.h"
#include "backend/media/VideoPlayerManager.h"
#include "frontend/projection/ProjectionManager.h"

const QString ApplicationShutdown::PERSIST_SETTINGS = QStringLiteral("persist-settings");
const QString ApplicationShutdown::UNSUBSCRIBE_VIDEO_LISTENERS = QStringLiteral("unsubscribe-video-listeners");
const QString ApplicationShutdown::STOP_VIDEO_PLAYER = QStringLiteral("stop-video-player");
const QString ApplicationShutdown::CLOSE_PROJECTION = QStringLiteral("close-projection");
const QString ApplicationShutdown::RELEASE_GLOBAL_HOTKEYS = QStringLiteral("release-global-hotkeys");
const QString ApplicationShutdown::STOP_FPS_MONITOR = QStringLiteral("stop-fps-monitor");
const QString ApplicationShutdown::SHUTDOWN_AUTH_SESSION = QStringLiteral("shutdown-auth-session");
const QString ApplicationShutdown::PERSIST_HISTORY = QStringLiteral("persist-history");
const QString ApplicationShutdown::STOP_BACKGROUND_SYNC = QStringLiteral("stop-background-sync");
const QString ApplicationShutdown::CHECKPOINT_HISTORY_DATABASE = QStringLiteral("checkpoint-history-database");
const QString ApplicationShutdown::CHECKPOINT_LIBRARY_DATABASE = QStringLiteral("checkpoint-library-database");

namespace {
    const QString NOT_CREATED = QStringLiteral("not created");
}

ApplicationShutdown::ApplicationShutdown(const ShutdownCollaborators& collaborators)
    : m_collaborators(collaborators)
{
    const ShutdownCollaborators& c = m_collaborators;

    m_sequence.addStep(PERSIST_SETTINGS, [&c]() {
        if (!c.settings) return ShutdownStepResult::skipped(NOT_CREATED);
        return ShutdownStepResult::fromBool(c.settings->saveSettings(), QStringLiteral("QSettings could not be written"));
    });

    m_sequence.addStep(UNSUBSCRIBE_VIDEO_LISTENERS, [&c]() {
        if (!c.videoPlayer) return ShutdownStepResult::skipped(NOT_CREATED);
        int stale = 0;
        for (int handle : c.videoSubscriptions) {
            if (!c.videoPlayer->unsubscribe(handle)) ++stale;
        }
        // Anything subscribed outside the main window goes too
        c.videoPlayer->unsubscribeAll();
        ShutdownStepResult result = ShutdownStepResult::ok();
        if (stale > 0) result.message = QStringLiteral("%1 handle(s) already released").arg(stale);
        return result;
    });

    m_sequence.addStep(STOP_VIDEO_PLAYER, [&c]() {
        if (!c.videoPlayer) return ShutdownStepResult::skipped(NOT_CREATED);
        c.videoPlayer->stop();
        c.videoPlayer->dispose();
        return ShutdownStepResult::ok();
    });

    m_sequence.addStep(CLOSE_PROJECTION, [&c]() {
        if (!c.projection) return ShutdownStepResult::skipped(NOT_CREATED);
        const bool wasOpen = c.projection->closeProjection();
        c.projection->dispose();
        ShutdownStepResult result = ShutdownStepResult::ok();
        result.message = wasOpen ? QStringLiteral("projection window closed") : QString();
        return result;
    });

    m_sequence.addStep(RELEASE_GLOBAL_HOTKEYS, [&c]() {
        if (!c.hotKeys) return ShutdownStepResult::skipped(NOT_CREATED);
        c.hotKeys->dispose();
        return ShutdownStepResult::ok();
    });

    m_sequence.addStep(STOP_FPS_MONITOR, [&c]() {
        if (!c.fpsMonitor) return ShutdownStepResult::skipped(NOT_CREATED);
        c.fpsMonitor->dispose();
        return ShutdownStepResult::ok();
    });

    m_sequence.addStep(SHUTDOWN_AUTH_SESSION, [&c]() {
        if (!c.auth) return ShutdownStepResult::skipped(NOT_CREATED);
        return ShutdownStepResult::fromBool(c.auth->shutdown(), QStringLiteral("auth session did not shut down"));
    });

    m_sequence.addStep(PERSIST_HISTORY, [&c]() {
        if (!c.history) return ShutdownStepResult::skipped(NOT_CREATED);
        const bool save = c.settings ? c.settings->getSaveHistoryOnExit() : true;
        const bool done = c.history->persistOrClear(save);
        ShutdownStepResult result = ShutdownStepResult::fromBool(done, save
            ? QStringLiteral("history could not be saved")
            : QStringLiteral("history could not be cleared"));
        if (done) result.message = save ? QStringLiteral("saved") : QStringLiteral("cleared");
        return result;
    });

    m_sequence.addStep(STOP_BACKGROUND_SYNC, [&c]() {
        if (!c.importManager) return ShutdownStepResult::skipped(NOT_CREATED);
        ShutdownStepResult result = ShutdownStepResult::ok();
        if (c.importManager->waitForSync()) result.message = QStringLiteral("waited for running sync");
        return result;
    });

    m_sequence.addStep(CHECKPOINT_HISTORY_DATABASE, [&c]() {
        return checkpointDatabase(c.historyDatabase.data());
    });

    m_sequence.addStep(CHECKPOINT_LIBRARY_DATABASE, [&c]() {
        return checkpointDatabase(c.libraryDatabase.data());
    });
}

ShutdownStepResult ApplicationShutdown::checkpointDatabase(DatabaseManager* database) {
    if (!database) return ShutdownStepResult::skipped(NOT_CREATED);
    if (!database->isOpen()) return ShutdownStepResult::skipped(QStringLiteral("connection not open"));
    QString error;
    return ShutdownStepResult::fromBool(database->checkpointAndClose(&error), error);
}
