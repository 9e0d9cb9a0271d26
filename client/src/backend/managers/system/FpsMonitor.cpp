#include "backend/managers/system/FpsMonitor.h"
#include <QDebug>
#include <QTimer>

FpsMonitor::FpsMonitor(QObject* parent)
    : QObject(parent)
    , m_sampleTimer(new QTimer(this))
{
    m_sampleTimer->setInterval(SAMPLE_INTERVAL_MS);
    connect(m_sampleTimer, &QTimer::timeout, this, &FpsMonitor::sample);
}

FpsMonitor::~FpsMonitor() {
    dispose();
}

bool FpsMonitor::isMonitoring() const {
    return m_sampleTimer && m_sampleTimer->isActive();
}

void FpsMonitor::startMonitoring() {
    if (m_disposed || isMonitoring()) return;
    m_mainFrames = 0;
    m_projectionFrames = 0;
    m_clock.start();
    m_sampleTimer->start();
    qDebug() << "FpsMonitor: Monitoring started";
}

void FpsMonitor::stopMonitoring() {
    if (!m_sampleTimer) return;
    m_sampleTimer->stop();
    m_mainFrames = 0;
    m_projectionFrames = 0;
    m_mainFps = 0.0;
    m_projectionFps = 0.0;
}

bool FpsMonitor::dispose() {
    if (m_disposed) return false;
    const bool wasRunning = isMonitoring();
    stopMonitoring();
    delete m_sampleTimer;
    m_sampleTimer = nullptr;
    m_disposed = true;
    qDebug() << "FpsMonitor: Disposed";
    return wasRunning;
}

void FpsMonitor::recordMainFrame() {
    if (isMonitoring()) ++m_mainFrames;
}

void FpsMonitor::recordProjectionFrame() {
    if (isMonitoring()) ++m_projectionFrames;
}

void FpsMonitor::sample() {
    const qint64 elapsedMs = m_clock.restart();
    if (elapsedMs <= 0) return;
    m_mainFps = m_mainFrames * 1000.0 / elapsedMs;
    m_projectionFps = m_projectionFrames * 1000.0 / elapsedMs;
    m_mainFrames = 0;
    m_projectionFrames = 0;
    emit fpsUpdated(m_mainFps, m_projectionFps);
}
