#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QByteArray>
#include <QString>

/**
 * SettingsManager
 * Owns the user-adjustable preferences stored in QSettings("Projecteur", "Client"):
 * - Server URL (authentication and updates)
 * - Whether the projection history is kept on exit
 * - Last import directory, main window geometry, projection screen
 */
class SettingsManager : public QObject {
    Q_OBJECT

public:
    static const QString DEFAULT_SERVER_URL;

    explicit SettingsManager(QObject* parent = nullptr);
    ~SettingsManager() = default;

    // Settings persistence
    void loadSettings();
    bool saveSettings();

    // Getters
    QString getServerUrl() const { return m_serverUrl; }
    bool getSaveHistoryOnExit() const { return m_saveHistoryOnExit; }
    QString getLastImportDirectory() const { return m_lastImportDirectory; }
    QByteArray getWindowGeometry() const { return m_windowGeometry; }
    int getProjectionScreen() const { return m_projectionScreen; }

    // Setters
    void setServerUrl(const QString& url);
    void setSaveHistoryOnExit(bool enabled);
    void setLastImportDirectory(const QString& directory);
    // Held in memory until the next saveSettings()
    void setWindowGeometry(const QByteArray& geometry) { m_windowGeometry = geometry; }
    void setProjectionScreen(int screenIndex);

signals:
    void settingsChanged();
    void serverUrlChanged(const QString& newUrl);

private:
    QString m_serverUrl;
    bool m_saveHistoryOnExit;
    QString m_lastImportDirectory;
    QByteArray m_windowGeometry;
    int m_projectionScreen;
};

#endif // SETTINGSMANAGER_H
