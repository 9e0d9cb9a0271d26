#include "MainWindow.h"
#include "backend/auth/AuthService.h"
#include "backend/database/DatabaseManager.h"
#include "backend/database/HistoryStore.h"
#include "backend/files/ImportManager.h"
#include "backend/lifecycle/ApplicationShutdown.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/managers/system/FpsMonitor.h"
#include "backend/managers/system/GlobalHotKeyManager.h"
#include "backend/network/UpdateService.h"
#include "frontend/handlers/WindowEventHandler.h"
#include "frontend/projection/ProjectionManager.h"
#include "frontend/ui/dialogs/LoginDialog.h"
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QImage>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QPointer>
#include <QPushButton>
#include <QStandardPaths>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>

namespace {
    constexpr int ROLE_PATH = Qt::UserRole;
    constexpr int ROLE_TYPE = Qt::UserRole + 1;
    constexpr int UPDATE_CHECK_DELAY_MS = 3000;

    QString updatesUrl(const QString& serverUrl) {
        return serverUrl + QStringLiteral("/updates");
    }
}

MainWindow::MainWindow(AuthService* authService, SettingsManager* settingsManager,
                       const QString& dataDirectory, QWidget* parent)
    : QMainWindow(parent),
      m_authService(authService),
      m_settingsManager(settingsManager),
      m_dataDirectory(dataDirectory.isEmpty()
                          ? QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
                          : dataDirectory),
      m_libraryDatabase(new DatabaseManager(QStringLiteral("projecteur-library"), this)),
      m_historyDatabase(new DatabaseManager(QStringLiteral("projecteur-history"), this)),
      m_historyStore(new HistoryStore(m_historyDatabase, this)),
      m_importManager(new ImportManager(m_libraryDatabase, this)),
      m_updateService(new UpdateService(updatesUrl(settingsManager ? settingsManager->getServerUrl()
                                                                   : SettingsManager::DEFAULT_SERVER_URL), this)),
      m_videoPlayer(new VideoPlayerManager(this)),
      m_projectionManager(new ProjectionManager(this)),
      m_hotKeyManager(new GlobalHotKeyManager(this)),
      m_fpsMonitor(new FpsMonitor(this)),
      m_windowEventHandler(new WindowEventHandler(this, this)),
      m_trialTimer(new QTimer(this))
{
    setWindowTitle("Projecteur");
    setupUI();
    openDatabases();

    if (m_settingsManager && !m_settingsManager->getWindowGeometry().isEmpty()) {
        restoreGeometry(m_settingsManager->getWindowGeometry());
    }

    if (m_authService) {
        if (m_settingsManager) m_authService->setBaseUrl(m_settingsManager->getServerUrl());
        connect(m_authService, &AuthService::authenticationChanged, this, &MainWindow::onAuthenticationChanged);
        connect(m_authService, &AuthService::accountInfoChanged, this, &MainWindow::updateAccountLabel);
        connect(m_authService, &AuthService::sessionRevoked, this, &MainWindow::onSessionRevoked);
        onAuthenticationChanged(m_authService->isAuthenticated());
    }
    if (m_settingsManager) {
        connect(m_settingsManager, &SettingsManager::serverUrlChanged, this, [this](const QString& url) {
            if (m_authService) m_authService->setBaseUrl(url);
            m_updateService->setBaseUrl(updatesUrl(url));
        });
    }

    m_videoSubscription = m_videoPlayer->subscribe(this);

    connect(m_importManager, &ImportManager::importError, this, [this](const QString& message) { showStatus(message); });
    connect(m_importManager, &ImportManager::syncFinished, this, &MainWindow::onSyncFinished);
    connect(m_historyStore, &HistoryStore::historyChanged, this, &MainWindow::refreshHistoryList);
    connect(m_projectionManager, &ProjectionManager::framePresented, m_fpsMonitor, &FpsMonitor::recordProjectionFrame);
    connect(m_projectionManager, &ProjectionManager::projectionStateChanged, this, [this](bool open) {
        m_projectButton->setText(open ? tr("Close projection") : tr("Project"));
        if (!open) {
            m_trialTimer->stop();
            if (m_authService) m_authService->resetTrialProjection();
        }
    });
    m_trialTimer->setSingleShot(true);
    connect(m_trialTimer, &QTimer::timeout, this, &MainWindow::onTrialProjectionEnded);
    connect(m_fpsMonitor, &FpsMonitor::fpsUpdated, this, &MainWindow::onFpsUpdated);
    connect(m_updateService, &UpdateService::updateAvailable, this, [this](const QString& version) {
        showStatus(tr("Version %1 is available").arg(version), 10000);
    });

    registerHotKeys();
    m_fpsMonitor->startMonitoring();

    m_historyStore->load();
    refreshMediaList();
    m_importManager->syncAllFoldersAsync();
    QTimer::singleShot(UPDATE_CHECK_DELAY_MS, this, &MainWindow::checkForUpdates);

    ShutdownCollaborators collaborators;
    collaborators.settings = m_settingsManager;
    collaborators.videoPlayer = m_videoPlayer;
    collaborators.videoSubscriptions = {m_videoSubscription};
    collaborators.projection = m_projectionManager;
    collaborators.hotKeys = m_hotKeyManager;
    collaborators.fpsMonitor = m_fpsMonitor;
    collaborators.auth = m_authService;
    collaborators.history = m_historyStore;
    collaborators.importManager = m_importManager;
    collaborators.historyDatabase = m_historyDatabase;
    collaborators.libraryDatabase = m_libraryDatabase;
    m_shutdown = std::make_unique<ApplicationShutdown>(collaborators);
}

MainWindow::~MainWindow() {
    // Windows destroyed without a close event still release their databases
    if (m_shutdown && !m_shutdown->hasRun()) {
        m_shutdown->run();
    }
}

void MainWindow::setupUI() {
    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);

    auto* accountRow = new QHBoxLayout();
    m_accountLabel = new QLabel(tr("Not logged in"), central);
    m_loginButton = new QPushButton(tr("Log in"), central);
    m_refreshAccountButton = new QPushButton(tr("Refresh"), central);
    m_unbindButton = new QPushButton(tr("Unbind devices"), central);
    m_refreshAccountButton->setVisible(false);
    m_unbindButton->setVisible(false);
    accountRow->addWidget(m_accountLabel);
    accountRow->addStretch();
    accountRow->addWidget(m_refreshAccountButton);
    accountRow->addWidget(m_unbindButton);
    accountRow->addWidget(m_loginButton);
    layout->addLayout(accountRow);

    auto* actionsRow = new QHBoxLayout();
    auto* importFilesButton = new QPushButton(tr("Import files"), central);
    auto* importFolderButton = new QPushButton(tr("Import folder"), central);
    auto* syncButton = new QPushButton(tr("Sync folders"), central);
    m_projectButton = new QPushButton(tr("Project"), central);
    m_playButton = new QPushButton(tr("Play"), central);
    actionsRow->addWidget(importFilesButton);
    actionsRow->addWidget(importFolderButton);
    actionsRow->addWidget(syncButton);
    actionsRow->addStretch();
    actionsRow->addWidget(m_playButton);
    actionsRow->addWidget(m_projectButton);
    layout->addLayout(actionsRow);

    m_mediaList = new QListWidget(central);
    m_historyList = new QListWidget(central);
    m_historyList->setMaximumHeight(160);
    layout->addWidget(m_mediaList, 1);
    layout->addWidget(new QLabel(tr("History"), central));
    layout->addWidget(m_historyList);
    setCentralWidget(central);

    m_fpsLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_fpsLabel);

    connect(m_loginButton, &QPushButton::clicked, this, [this]() {
        if (m_authService && m_authService->isAuthenticated()) {
            m_authService->logout();
        } else {
            showLoginDialog();
        }
    });
    connect(m_refreshAccountButton, &QPushButton::clicked, this, &MainWindow::refreshAccountInfo);
    connect(m_unbindButton, &QPushButton::clicked, this, &MainWindow::unbindDevices);
    connect(importFilesButton, &QPushButton::clicked, this, &MainWindow::importFiles);
    connect(importFolderButton, &QPushButton::clicked, this, &MainWindow::importFolder);
    connect(syncButton, &QPushButton::clicked, this, &MainWindow::syncFolders);
    connect(m_projectButton, &QPushButton::clicked, this, &MainWindow::toggleProjection);
    connect(m_playButton, &QPushButton::clicked, this, &MainWindow::togglePlayback);
    connect(m_mediaList, &QListWidget::itemActivated, this, &MainWindow::onMediaActivated);
    connect(m_historyList, &QListWidget::itemActivated, this, &MainWindow::onMediaActivated);
}

void MainWindow::openDatabases() {
    const QDir dir(m_dataDirectory);
    QString error;
    if (!m_libraryDatabase->open(dir.filePath(QStringLiteral("library.db")), &error)) {
        qWarning() << "MainWindow: Media library unavailable:" << error;
        showStatus(tr("Media library unavailable: %1").arg(error), 0);
    }
    if (!m_historyDatabase->open(dir.filePath(QStringLiteral("history.db")), &error)) {
        qWarning() << "MainWindow: History database unavailable:" << error;
    }
}

void MainWindow::registerHotKeys() {
    m_hotKeyManager->registerHotKey(QKeySequence(Qt::Key_F5), [this]() { toggleProjection(); });
    m_hotKeyManager->registerHotKey(QKeySequence(Qt::Key_F6), [this]() { togglePlayback(); });
}

const ShutdownReport& MainWindow::runShutdown() {
    return m_shutdown->run();
}

bool MainWindow::hasShutDown() const {
    return m_shutdown && m_shutdown->hasRun();
}

void MainWindow::showStatus(const QString& message, int timeoutMs) {
    statusBar()->showMessage(message, timeoutMs);
}

void MainWindow::showLoginDialog() {
    if (!m_authService) return;
    LoginDialog dialog(m_authService, this);
    dialog.exec();
}

void MainWindow::onAuthenticationChanged(bool authenticated) {
    const bool signedIn = authenticated && m_authService;
    m_loginButton->setText(signedIn ? tr("Log out") : tr("Log in"));
    m_refreshAccountButton->setVisible(signedIn);
    m_unbindButton->setVisible(signedIn);
    if (signedIn) m_trialTimer->stop();
    updateAccountLabel();
}

void MainWindow::updateAccountLabel() {
    if (!m_authService || !m_authService->isAuthenticated()) {
        m_accountLabel->setText(tr("Not logged in"));
        return;
    }
    m_accountLabel->setText(tr("%1 (%2 days left, %3 device resets)")
                                .arg(m_authService->username())
                                .arg(m_authService->remainingDays())
                                .arg(m_authService->resetDeviceCount()));
}

void MainWindow::onSessionRevoked(const QString& reason, const QString& message) {
    qWarning() << "MainWindow: Session revoked:" << reason;
    showStatus(message.isEmpty() ? tr("Your login is no longer valid, please log in again") : message, 0);
}

void MainWindow::refreshAccountInfo() {
    if (!m_authService || !m_authService->isAuthenticated()) return;
    m_refreshAccountButton->setEnabled(false);
    m_refreshAccountButton->setText(tr("Refreshing..."));

    QPointer<MainWindow> guard(this);
    m_authService->refreshAccountInfo([guard](const RemoteCallOutcome& outcome) {
        if (!guard) return;
        guard->m_refreshAccountButton->setEnabled(true);
        guard->m_refreshAccountButton->setText(tr("Refresh"));
        if (outcome.success) {
            guard->updateAccountLabel();
            guard->showStatus(outcome.message);
        } else {
            guard->showStatus(tr("Could not refresh the account, showing cached data"));
        }
    });
}

void MainWindow::unbindDevices() {
    if (!m_authService || !m_authService->isAuthenticated()) return;

    const int resetsLeft = m_authService->resetDeviceCount();
    if (resetsLeft <= 0) {
        QMessageBox::warning(this, tr("Cannot unbind"),
                             tr("No device resets left. Please contact the administrator."));
        return;
    }
    const QMessageBox::StandardButton confirmed = QMessageBox::question(this, tr("Unbind devices"),
        tr("All bound devices will be cleared and you will be logged out.\n"
           "Resets left: %1, after this one: %2.\n\nUnbind now?").arg(resetsLeft).arg(resetsLeft - 1));
    if (confirmed != QMessageBox::Yes) return;

    bool ok = false;
    const QString password = QInputDialog::getText(this, tr("Unbind devices"), tr("Account password:"),
                                                   QLineEdit::Password, QString(), &ok);
    if (!ok || password.isEmpty()) return;
    resetDevicesWithPassword(password);
}

void MainWindow::resetDevicesWithPassword(const QString& password) {
    if (!m_authService) return;
    m_unbindButton->setEnabled(false);

    QPointer<MainWindow> guard(this);
    m_authService->resetDevices(password, [guard](const RemoteCallOutcome& outcome) {
        if (!guard) return;
        guard->m_unbindButton->setEnabled(true);
        if (!outcome.success) {
            guard->showStatus(tr("Device reset failed: %1").arg(outcome.message), 0);
            return;
        }
        const int resetsLeft = guard->m_authService->resetDeviceCount();
        guard->m_authService->logout();
        guard->showStatus(tr("%1. Resets left: %2. Please log in again.").arg(outcome.message).arg(resetsLeft), 0);
    });
}

void MainWindow::importFiles() {
    const QString startDir = m_settingsManager ? m_settingsManager->getLastImportDirectory() : QString();
    const QString filter = tr("Media (%1)").arg(QStringLiteral("*.") + ImportManager::allExtensions().join(QStringLiteral(" *.")));
    const QStringList paths = QFileDialog::getOpenFileNames(this, tr("Import files"), startDir, filter);
    if (paths.isEmpty()) return;

    int imported = 0;
    for (const QString& path : paths) {
        if (m_importManager->importSingleFile(path)) ++imported;
    }
    if (m_settingsManager) m_settingsManager->setLastImportDirectory(QFileInfo(paths.first()).absolutePath());
    showStatus(tr("Imported %1 file(s)").arg(imported));
    refreshMediaList();
}

void MainWindow::importFolder() {
    const QString startDir = m_settingsManager ? m_settingsManager->getLastImportDirectory() : QString();
    const QString path = QFileDialog::getExistingDirectory(this, tr("Import folder"), startDir);
    if (path.isEmpty()) return;

    const FolderImportResult result = m_importManager->importFolder(path);
    if (m_settingsManager) m_settingsManager->setLastImportDirectory(path);
    if (result.folder) {
        showStatus(tr("%1: %2 new, %3 already imported")
                       .arg(result.folder->name).arg(result.newFiles.size()).arg(result.existingFiles.size()));
    }
    refreshMediaList();
}

void MainWindow::syncFolders() {
    if (!m_importManager->syncAllFoldersAsync()) {
        showStatus(tr("Sync already running"));
    }
}

void MainWindow::onSyncFinished(const SyncSummary& summary) {
    if (summary.added > 0 || summary.removed > 0) {
        showStatus(tr("Folders synced: %1 added, %2 removed").arg(summary.added).arg(summary.removed));
    }
    refreshMediaList();
}

void MainWindow::refreshMediaList() {
    m_mediaList->clear();
    if (!m_libraryDatabase->isOpen()) return;

    auto addItem = [this](const MediaFile& file, const QString& prefix) {
        auto* item = new QListWidgetItem(prefix + file.name, m_mediaList);
        item->setData(ROLE_PATH, file.path);
        item->setData(ROLE_TYPE, static_cast<int>(file.type));
    };
    for (const Folder& folder : m_libraryDatabase->allFolders()) {
        const QString prefix = folder.name + QStringLiteral(" / ");
        for (const MediaFile& file : m_libraryDatabase->mediaFilesByFolder(folder.id)) {
            addItem(file, prefix);
        }
    }
    for (const MediaFile& file : m_libraryDatabase->rootMediaFiles()) {
        addItem(file, QString());
    }
}

void MainWindow::refreshHistoryList() {
    m_historyList->clear();
    for (const HistoryEntry& entry : m_historyStore->entries()) {
        auto* item = new QListWidgetItem(entry.title, m_historyList);
        item->setData(ROLE_PATH, entry.reference);
        if (const std::optional<MediaType> type = ImportManager::mediaTypeForPath(entry.reference)) {
            item->setData(ROLE_TYPE, static_cast<int>(*type));
        }
    }
}

void MainWindow::onMediaActivated(QListWidgetItem* item) {
    if (!item || !item->data(ROLE_TYPE).isValid()) return;
    MediaFile file;
    file.path = item->data(ROLE_PATH).toString();
    file.name = QFileInfo(file.path).completeBaseName();
    file.type = static_cast<MediaType>(item->data(ROLE_TYPE).toInt());
    projectMedia(file);
}

void MainWindow::projectMedia(const MediaFile& file) {
    if (file.type == MediaType::Image) {
        const QImage image(file.path);
        if (image.isNull()) {
            showStatus(tr("Cannot read image %1").arg(file.path));
            return;
        }
        m_projectionManager->updateImage(image);
        if (!m_projectionManager->isOpen()) {
            requestProjection();
        }
    } else if (m_videoPlayer->load(file.path)) {
        m_videoPlayer->play();
    } else {
        showStatus(tr("Cannot play %1").arg(file.path));
        return;
    }

    HistoryEntry entry;
    entry.title = file.name;
    entry.reference = file.path;
    m_historyStore->record(entry);
}

void MainWindow::toggleProjection() {
    if (m_projectionManager->isOpen()) {
        m_projectionManager->closeProjection();
    } else {
        requestProjection();
    }
}

void MainWindow::requestProjection() {
    if (m_projectionRequestPending || hasShutDown()) return;
    if (!m_authService) {
        showStatus(tr("Projection is unavailable without an account service"));
        return;
    }

    m_projectionRequestPending = true;
    QPointer<MainWindow> guard(this);
    m_authService->verifyProjectionPermission([guard](const AuthService::ProjectionPermission& permission) {
        if (guard) guard->onProjectionPermission(permission);
    });
}

void MainWindow::onProjectionPermission(const AuthService::ProjectionPermission& permission) {
    m_projectionRequestPending = false;
    if (hasShutDown()) return;
    if (!permission.allowed) {
        qDebug() << "MainWindow: Projection refused:" << permission.message;
        showStatus(permission.message);
        return;
    }

    if (permission.trial) {
        m_authService->startTrialProjection();
        const int remainingMs = m_authService->trialProjectionRemainingMs();
        m_trialTimer->start(remainingMs);
        showStatus(tr("%1: projection ends in %2 s").arg(permission.message).arg((remainingMs + 999) / 1000));
    }
    if (!m_projectionManager->isOpen()) {
        m_projectionManager->openProjection(m_settingsManager ? m_settingsManager->getProjectionScreen() : -1);
    }
}

bool MainWindow::isTrialProjectionRunning() const {
    return m_trialTimer->isActive();
}

void MainWindow::onTrialProjectionEnded() {
    if (m_authService && m_authService->canUseProjection()) return;
    qDebug() << "MainWindow: Trial projection ended";
    m_projectionManager->closeProjection();
    if (m_authService) m_authService->resetTrialProjection();
    showStatus(tr("Trial projection ended. Please log in to keep projecting."), 0);
}

void MainWindow::togglePlayback() {
    if (m_videoPlayer->isPlaying()) {
        m_videoPlayer->pause();
    } else {
        m_videoPlayer->play();
    }
}

void MainWindow::onPlayStateChanged(bool playing) {
    m_playButton->setText(playing ? tr("Pause") : tr("Play"));
}

void MainWindow::onMediaChanged(const QString& filePath) {
    showStatus(tr("Playing %1").arg(QFileInfo(filePath).fileName()));
}

void MainWindow::onMediaEnded() {
    if (!m_videoPlayer->isLoopEnabled()) {
        m_playButton->setText(tr("Play"));
    }
}

void MainWindow::onFpsUpdated(double mainFps, double projectionFps) {
    m_fpsLabel->setText(m_projectionManager->isOpen()
                            ? tr("%1 fps | projection %2 fps").arg(mainFps, 0, 'f', 0).arg(projectionFps, 0, 'f', 0)
                            : tr("%1 fps").arg(mainFps, 0, 'f', 0));
}

void MainWindow::checkForUpdates() {
    m_updateService->checkForUpdates([](const std::optional<VersionInfo>& info) {
        if (!info) {
            qDebug() << "MainWindow: No update available";
        }
    });
}

bool MainWindow::event(QEvent* event) {
    if (event->type() == QEvent::UpdateRequest && m_fpsMonitor) {
        m_fpsMonitor->recordMainFrame();
    }
    return QMainWindow::event(event);
}

void MainWindow::closeEvent(QCloseEvent* event) {
    m_windowEventHandler->handleCloseEvent(event);
}

void MainWindow::resizeEvent(QResizeEvent* event) {
    QMainWindow::resizeEvent(event);
    m_windowEventHandler->handleResizeEvent(event);
}

void MainWindow::changeEvent(QEvent* event) {
    QMainWindow::changeEvent(event);
    if (m_windowEventHandler) m_windowEventHandler->handleChangeEvent(event);
}
