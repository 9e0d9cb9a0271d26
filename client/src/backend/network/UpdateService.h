#ifndef UPDATESERVICE_H
#define UPDATESERVICE_H

#include <QObject>
#include <QList>
#include <QString>
#include <functional>
#include <optional>

class QNetworkAccessManager;
class QNetworkReply;

struct UpdateFileInfo {
    QString fileName;
    QString downloadUrl;
    qint64 fileSize = 0;
};

struct VersionInfo {
    QString version;
    QList<UpdateFileInfo> files;
};

/**
 * @brief Polls the release server for a newer client build.
 *
 * The server publishes {base}/latest.txt holding "major.minor.patch" and, per
 * release, {base}/v{version}/files.txt listing one file name per line.
 */
class UpdateService : public QObject {
    Q_OBJECT

public:
    using CheckCallback = std::function<void(const std::optional<VersionInfo>&)>;

    static constexpr int MAX_ATTEMPTS = 3;
    static constexpr int DEFAULT_RETRY_DELAY_MS = 2000;
    static constexpr int REQUEST_TIMEOUT_MS = 15000;

    explicit UpdateService(const QString& baseUrl, QObject* parent = nullptr);
    ~UpdateService() override = default;

    void setBaseUrl(const QString& baseUrl) { m_baseUrl = baseUrl; }
    QString baseUrl() const { return m_baseUrl; }
    void setRetryDelayMs(int delayMs) { m_retryDelayMs = delayMs; }
    void setCurrentVersion(const QString& version) { m_currentVersion = version; }
    QString currentVersion() const;

    std::optional<VersionInfo> lastCheckedVersionInfo() const { return m_lastChecked; }
    bool isChecking() const { return m_checking; }
    int lastAttemptCount() const { return m_attempt; }

    // Callback receives the newer release, or nullopt when up to date or unreachable
    bool checkForUpdates(const CheckCallback& callback);

    static bool isValidVersionString(const QString& version);
    // <0, 0, >0 like strcmp; missing components count as 0
    static int compareVersions(const QString& a, const QString& b);
    static QList<UpdateFileInfo> parseFilesList(const QString& baseUrl, const QString& version, const QByteArray& body);

signals:
    void updateAvailable(const QString& version);

private:
    void startAttempt();
    void handleLatestReply(QNetworkReply* reply);
    void fetchFilesList(const QString& version);
    void retryOrFinish(const QString& reason);
    void finish(const std::optional<VersionInfo>& info);

    QNetworkAccessManager* m_network;
    QString m_baseUrl;
    QString m_currentVersion;
    int m_retryDelayMs = DEFAULT_RETRY_DELAY_MS;
    int m_attempt = 0;
    bool m_checking = false;
    CheckCallback m_callback;
    std::optional<VersionInfo> m_lastChecked;
};

#endif // UPDATESERVICE_H
