#ifndef AUTHSERVICE_H
#define AUTHSERVICE_H

#include <QObject>
#include <QDateTime>
#include <QElapsedTimer>
#include <QJsonObject>
#include <QNetworkReply>
#include <QString>
#include <optional>
#include "backend/auth/IAuthGateway.h"

class QNetworkAccessManager;
class QTimer;

/**
 * @brief Account session against the licensing server.
 *
 * Constructed once in main() and handed to the windows that need it; there is
 * no global instance. Requests are JSON POSTs; every reply is classified into
 * a RemoteCallOutcome so callers can tell a server rejection from a transport
 * failure or an aborted transfer.
 */
class AuthService : public QObject, public IAuthGateway {
    Q_OBJECT

public:
    struct DeviceInfo {
        int boundDevices = 0;
        int maxDevices = 0;
        int remainingSlots = 0;
        bool isNewDevice = false;
    };

    // Decoded server response. parsed == false means the body was not a JSON object.
    struct ServerResponse {
        bool parsed = false;
        bool success = false;
        bool valid = false;
        QString message;
        QString reason;
        QString token;
        std::optional<QDateTime> expiresAt;
        int remainingDays = 0;
        int resetDeviceCount = 0;
        // Top-level counter returned by reset-devices; -1 when absent
        int resetRemaining = -1;
        std::optional<DeviceInfo> deviceInfo;
    };

    // Answer of verifyProjectionPermission(). trial means allowed without an account.
    struct ProjectionPermission {
        bool allowed = false;
        bool trial = false;
        QString message;
    };
    using ProjectionPermissionCallback = std::function<void(const ProjectionPermission&)>;

    static constexpr int REQUEST_TIMEOUT_MS = 10000;
    static constexpr int REFRESH_TIMEOUT_MS = 8000;
    static constexpr int PERMISSION_CHECK_TIMEOUT_MS = 3000;
    static constexpr int HEARTBEAT_FIRST_DELAY_MS = 60 * 1000;
    static constexpr int HEARTBEAT_INTERVAL_MS = 20 * 60 * 1000;
    static constexpr int TRIAL_MIN_MS = 30 * 1000;
    static constexpr int TRIAL_MAX_MS = 60 * 1000;

    explicit AuthService(const QString& baseUrl, QObject* parent = nullptr);
    ~AuthService() override;

    void setBaseUrl(const QString& baseUrl);
    QString baseUrl() const { return m_baseUrl; }

    // IAuthGateway
    void login(const QString& username, const QString& password, const RemoteCallCompletion& completion) override;
    void registerAccount(const SessionCredentials& credentials, const RemoteCallCompletion& completion) override;

    void logout();

    // Asks the server for fresh expiry, device and reset data. Replies false when
    // signed out or offline; a revocation reason from the server also logs out.
    void refreshAccountInfo(const RemoteCallCompletion& completion);
    // Unbinds every device of the signed-in account. Needs the account password.
    void resetDevices(const QString& password, const RemoteCallCompletion& completion);
    static bool isRevocationReason(const QString& reason);

    // Signed in with an unexpired account
    bool canUseProjection() const;
    // Signed-in users pass at once. Otherwise the server is asked: if it answers
    // normally a login is required, if it is unreachable or failing a trial is granted.
    void verifyProjectionPermission(const ProjectionPermissionCallback& callback);

    // Trial projection for signed-out users, random length within the trial range
    void startTrialProjection();
    bool isTrialProjectionActive() const;
    bool isTrialProjectionExpired() const;
    int trialProjectionRemainingMs() const;
    void resetTrialProjection();
    void setTrialDurationRange(int minMs, int maxMs);

    // First heartbeat fires firstDelayMs after login, then every intervalMs
    void setHeartbeatTiming(int firstDelayMs, int intervalMs);
    int heartbeatIntervalMs() const { return m_heartbeatIntervalMs; }

    // Stops the heartbeat and detaches every listener. Safe to call more than once.
    bool shutdown();
    bool isShutDown() const { return m_shutDown; }

    bool isAuthenticated() const { return m_authenticated; }
    QString username() const { return m_username; }
    std::optional<QDateTime> expiresAt() const { return m_expiresAt; }
    int remainingDays() const { return m_remainingDays; }
    int resetDeviceCount() const { return m_resetDeviceCount; }
    std::optional<DeviceInfo> deviceInfo() const { return m_deviceInfo; }
    bool isHeartbeatActive() const;

    static ServerResponse parseResponse(const QByteArray& body);
    static RemoteErrorKind classifyNetworkError(QNetworkReply::NetworkError error);
    static QString hardwareId();

signals:
    void authenticationChanged(bool authenticated);
    void accountInfoChanged();
    // Server revoked the session (device unbound, account disabled, expired...)
    void sessionRevoked(const QString& reason, const QString& message);

private slots:
    void sendHeartbeat();

private:
    using ResponseHandler = std::function<void(const ServerResponse&)>;

    void postJson(const QString& endpoint, const QJsonObject& body,
                  const ResponseHandler& onResponse, const RemoteCallCompletion& onError,
                  int timeoutMs = REQUEST_TIMEOUT_MS);
    void applyLogin(const QString& username, const ServerResponse& response);
    void applyAccountInfo(const ServerResponse& response);
    void clearSession();

    QNetworkAccessManager* m_network;
    QTimer* m_heartbeatTimer;
    QString m_baseUrl;
    int m_heartbeatFirstDelayMs = HEARTBEAT_FIRST_DELAY_MS;
    int m_heartbeatIntervalMs = HEARTBEAT_INTERVAL_MS;

    bool m_authenticated = false;
    bool m_shutDown = false;
    QString m_username;
    QString m_token;
    std::optional<QDateTime> m_expiresAt;
    int m_remainingDays = 0;
    int m_resetDeviceCount = 0;
    std::optional<DeviceInfo> m_deviceInfo;

    QElapsedTimer m_trialClock;
    int m_trialDurationMs = 0;
    int m_trialMinMs = TRIAL_MIN_MS;
    int m_trialMaxMs = TRIAL_MAX_MS;
};

#endif // AUTHSERVICE_H
