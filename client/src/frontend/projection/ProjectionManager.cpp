#include "frontend/projection/ProjectionManager.h"
#include <QDebug>
#include <QGuiApplication>
#include <QPainter>
#include <QScreen>

ProjectionWindow::ProjectionWindow(QWidget* parent)
    : QWidget(parent)
{
    setWindowFlag(Qt::FramelessWindowHint, true);
    setWindowFlag(Qt::WindowStaysOnTopHint, true);
#ifdef Q_OS_WIN
    setWindowFlag(Qt::Tool, true);
#endif
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setCursor(Qt::BlankCursor);
    setObjectName(QStringLiteral("ProjectionWindow"));
}

void ProjectionWindow::setImage(const QImage& image) {
    m_image = image;
    update();
}

void ProjectionWindow::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.fillRect(rect(), Qt::black);
    if (!m_image.isNull()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        const QSize scaled = m_image.size().scaled(size(), Qt::KeepAspectRatio);
        const QRect target(QPoint((width() - scaled.width()) / 2, (height() - scaled.height()) / 2), scaled);
        painter.drawImage(target, m_image);
    }
    emit framePresented();
}

ProjectionManager::ProjectionManager(QObject* parent)
    : QObject(parent)
{
}

ProjectionManager::~ProjectionManager() {
    dispose();
}

QScreen* ProjectionManager::targetScreen(int screenIndex) {
    const QList<QScreen*> screens = QGuiApplication::screens();
    if (screenIndex >= 0 && screenIndex < screens.size()) {
        return screens.at(screenIndex);
    }
    QScreen* primary = QGuiApplication::primaryScreen();
    for (QScreen* screen : screens) {
        if (screen != primary) return screen;
    }
    return primary;
}

bool ProjectionManager::isOpen() const {
    return m_window && m_window->isVisible();
}

bool ProjectionManager::openProjection(int screenIndex) {
    if (m_disposed) {
        qWarning() << "ProjectionManager: Cannot open after dispose";
        return false;
    }
    QScreen* screen = targetScreen(screenIndex);
    if (!screen) {
        qWarning() << "ProjectionManager: No screen available";
        return false;
    }

    if (!m_window) {
        m_window = new ProjectionWindow();
        m_window->setAttribute(Qt::WA_DeleteOnClose, false);
        connect(m_window, &ProjectionWindow::framePresented, this, &ProjectionManager::framePresented);
    }
    m_window->setImage(m_currentImage);
    m_window->setScreen(screen);
    m_window->setGeometry(screen->geometry());
    m_window->showFullScreen();
    qDebug() << "ProjectionManager: Projection opened on" << screen->name() << screen->geometry();
    emit projectionStateChanged(true);
    return true;
}

void ProjectionManager::updateImage(const QImage& image) {
    m_currentImage = image;
    if (m_window) {
        m_window->setImage(image);
    }
}

bool ProjectionManager::closeProjection() {
    if (!m_window) return false;
    const bool wasOpen = m_window->isVisible();
    m_window->hide();
    delete m_window.data();
    m_window = nullptr;
    if (wasOpen) {
        qDebug() << "ProjectionManager: Projection closed";
        emit projectionStateChanged(false);
    }
    return wasOpen;
}

void ProjectionManager::dispose() {
    if (m_disposed) return;
    closeProjection();
    m_currentImage = QImage();
    m_disposed = true;
}
