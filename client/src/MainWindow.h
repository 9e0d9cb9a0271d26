#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QCloseEvent>
#include <QEvent>
#include <QResizeEvent>
#include <QString>
#include <memory>
#include "backend/auth/AuthService.h"
#include "backend/domain/models/MediaFile.h"
#include "backend/lifecycle/ShutdownSequence.h"
#include "backend/media/VideoPlayerManager.h"

class QLabel;
class QListWidget;
class QListWidgetItem;
class QPushButton;
class QTimer;
class SettingsManager;
class DatabaseManager;
class HistoryStore;
class ImportManager;
class UpdateService;
class ProjectionManager;
class GlobalHotKeyManager;
class FpsMonitor;
class WindowEventHandler;
class ApplicationShutdown;

class MainWindow : public QMainWindow, private IVideoPlayerListener {
    Q_OBJECT

public:
    // dataDirectory holds library.db and history.db; empty means the platform app-data location
    MainWindow(AuthService* authService, SettingsManager* settingsManager,
               const QString& dataDirectory = QString(), QWidget* parent = nullptr);
    ~MainWindow() override;

    // Accessors for WindowEventHandler and tests
    SettingsManager* getSettingsManager() const { return m_settingsManager; }
    AuthService* getAuthService() const { return m_authService; }
    DatabaseManager* getLibraryDatabase() const { return m_libraryDatabase; }
    DatabaseManager* getHistoryDatabase() const { return m_historyDatabase; }
    HistoryStore* getHistoryStore() const { return m_historyStore; }
    ImportManager* getImportManager() const { return m_importManager; }
    UpdateService* getUpdateService() const { return m_updateService; }
    VideoPlayerManager* getVideoPlayer() const { return m_videoPlayer; }
    ProjectionManager* getProjectionManager() const { return m_projectionManager; }
    GlobalHotKeyManager* getHotKeyManager() const { return m_hotKeyManager; }
    FpsMonitor* getFpsMonitor() const { return m_fpsMonitor; }
    int getVideoSubscription() const { return m_videoSubscription; }
    QString getDataDirectory() const { return m_dataDirectory; }

    // Runs the close-time cleanup once; later calls return the first report
    const ShutdownReport& runShutdown();
    bool hasShutDown() const;

    // True while the projection permission check is in flight
    bool isProjectionRequestPending() const { return m_projectionRequestPending; }
    bool isTrialProjectionRunning() const;

public slots:
    void showLoginDialog();
    void importFiles();
    void importFolder();
    void syncFolders();
    void toggleProjection();
    void togglePlayback();
    void refreshMediaList();
    void refreshAccountInfo();
    // Confirms, asks for the password, then resets the bound devices
    void unbindDevices();
    void resetDevicesWithPassword(const QString& password);

protected:
    bool event(QEvent* event) override;
    void closeEvent(QCloseEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void changeEvent(QEvent* event) override;

private slots:
    void onAuthenticationChanged(bool authenticated);
    void onSessionRevoked(const QString& reason, const QString& message);
    void onTrialProjectionEnded();
    void onMediaActivated(QListWidgetItem* item);
    void onSyncFinished(const SyncSummary& summary);
    void onFpsUpdated(double mainFps, double projectionFps);
    void refreshHistoryList();
    void checkForUpdates();

private:
    // IVideoPlayerListener
    void onPlayStateChanged(bool playing) override;
    void onMediaChanged(const QString& filePath) override;
    void onMediaEnded() override;

    void setupUI();
    void openDatabases();
    void registerHotKeys();
    void projectMedia(const MediaFile& file);
    // Opens the projection once the account (or a trial) allows it
    void requestProjection();
    void onProjectionPermission(const AuthService::ProjectionPermission& permission);
    void updateAccountLabel();
    void showStatus(const QString& message, int timeoutMs = 4000);

    AuthService* m_authService;
    SettingsManager* m_settingsManager;
    QString m_dataDirectory;

    DatabaseManager* m_libraryDatabase;
    DatabaseManager* m_historyDatabase;
    HistoryStore* m_historyStore;
    ImportManager* m_importManager;
    UpdateService* m_updateService;
    VideoPlayerManager* m_videoPlayer;
    ProjectionManager* m_projectionManager;
    GlobalHotKeyManager* m_hotKeyManager;
    FpsMonitor* m_fpsMonitor;
    WindowEventHandler* m_windowEventHandler;
    std::unique_ptr<ApplicationShutdown> m_shutdown;
    QTimer* m_trialTimer;
    int m_videoSubscription = 0;
    bool m_projectionRequestPending = false;

    // UI
    QLabel* m_accountLabel = nullptr;
    QPushButton* m_loginButton = nullptr;
    QPushButton* m_refreshAccountButton = nullptr;
    QPushButton* m_unbindButton = nullptr;
    QPushButton* m_projectButton = nullptr;
    QPushButton* m_playButton = nullptr;
    QListWidget* m_mediaList = nullptr;
    QListWidget* m_historyList = nullptr;
    QLabel* m_fpsLabel = nullptr;
};

#endif // MAINWINDOW_H
