#include "backend/managers/app/SettingsManager.h"
#include <QSettings>
#include <QDebug>

const QString SettingsManager::DEFAULT_SERVER_URL = QStringLiteral("https://api.projecteur.app");

SettingsManager::SettingsManager(QObject* parent)
    : QObject(parent)
    , m_serverUrl(DEFAULT_SERVER_URL)
    , m_saveHistoryOnExit(true)
    , m_projectionScreen(-1)
{
}

void SettingsManager::loadSettings() {
    QSettings settings("Projecteur", "Client");
    m_serverUrl = settings.value("serverUrl", DEFAULT_SERVER_URL).toString();
    if (m_serverUrl.trimmed().isEmpty()) m_serverUrl = DEFAULT_SERVER_URL;
    m_saveHistoryOnExit = settings.value("saveHistoryOnExit", true).toBool();
    m_lastImportDirectory = settings.value("lastImportDirectory").toString();
    m_windowGeometry = settings.value("windowGeometry").toByteArray();
    m_projectionScreen = settings.value("projectionScreen", -1).toInt();

    qDebug() << "SettingsManager: Settings loaded - URL:" << m_serverUrl
             << "Save history on exit:" << m_saveHistoryOnExit
             << "Projection screen:" << m_projectionScreen;
}

bool SettingsManager::saveSettings() {
    QSettings settings("Projecteur", "Client");
    settings.setValue("serverUrl", m_serverUrl.isEmpty() ? DEFAULT_SERVER_URL : m_serverUrl);
    settings.setValue("saveHistoryOnExit", m_saveHistoryOnExit);
    settings.setValue("lastImportDirectory", m_lastImportDirectory);
    if (!m_windowGeometry.isEmpty()) {
        settings.setValue("windowGeometry", m_windowGeometry);
    }
    settings.setValue("projectionScreen", m_projectionScreen);
    settings.sync();

    if (settings.status() != QSettings::NoError) {
        qWarning() << "SettingsManager: Failed to save settings, status" << settings.status();
        return false;
    }
    qDebug() << "SettingsManager: Settings saved";
    emit settingsChanged();
    return true;
}

void SettingsManager::setServerUrl(const QString& url) {
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty() || m_serverUrl == trimmed) return;
    m_serverUrl = trimmed;
    saveSettings();
    emit serverUrlChanged(trimmed);
}

void SettingsManager::setSaveHistoryOnExit(bool enabled) {
    if (m_saveHistoryOnExit != enabled) {
        m_saveHistoryOnExit = enabled;
        saveSettings();
    }
}

void SettingsManager::setLastImportDirectory(const QString& directory) {
    if (m_lastImportDirectory != directory) {
        m_lastImportDirectory = directory;
        saveSettings();
    }
}

void SettingsManager::setProjectionScreen(int screenIndex) {
    if (m_projectionScreen != screenIndex) {
        m_projectionScreen = screenIndex;
        saveSettings();
    }
}
