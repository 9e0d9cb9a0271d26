#include "frontend/handlers/WindowEventHandler.h"
#include "MainWindow.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/managers/system/FpsMonitor.h"
#include <QDebug>

WindowEventHandler::WindowEventHandler(MainWindow* mainWindow, QObject* parent)
    : QObject(parent)
    , m_mainWindow(mainWindow)
{
}

void WindowEventHandler::handleCloseEvent(QCloseEvent* event)
{
    // Record geometry before the settings are persisted by the first shutdown step
    if (m_mainWindow->getSettingsManager()) {
        m_mainWindow->getSettingsManager()->setWindowGeometry(m_mainWindow->saveGeometry());
    }
    const ShutdownReport& report = m_mainWindow->runShutdown();
    if (!report.allSucceeded()) {
        qWarning() << "WindowEventHandler: Closing with" << report.failureCount() << "cleanup failure(s)";
    }
    event->accept();
}

void WindowEventHandler::handleResizeEvent(QResizeEvent* event)
{
    Q_UNUSED(event);
    if (m_mainWindow->getSettingsManager() && m_mainWindow->isVisible()) {
        m_mainWindow->getSettingsManager()->setWindowGeometry(m_mainWindow->saveGeometry());
    }
}

void WindowEventHandler::handleChangeEvent(QEvent* event)
{
    if (event->type() != QEvent::WindowStateChange) return;
    FpsMonitor* monitor = m_mainWindow->getFpsMonitor();
    if (!monitor || monitor->isDisposed()) return;

    const bool minimized = (m_mainWindow->windowState() & Qt::WindowMinimized);
    if (minimized) {
        monitor->stopMonitoring();
    } else {
        monitor->startMonitoring();
    }
}
