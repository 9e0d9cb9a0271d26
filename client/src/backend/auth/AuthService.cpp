#include "backend/auth/AuthService.h"
#include <QCoreApplication>
#include <QCryptographicHash>
#include <QDebug>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QRandomGenerator>
#include <QStringList>
#include <QSysInfo>
#include <QTimer>
#include <QUrl>

namespace {
    const QString VERIFY_ENDPOINT = QStringLiteral("/api/auth/verify");
    const QString REGISTER_ENDPOINT = QStringLiteral("/api/user/register");
    const QString HEARTBEAT_ENDPOINT = QStringLiteral("/api/auth/heartbeat");
    const QString RESET_DEVICES_ENDPOINT = QStringLiteral("/api/user/reset-devices");

    const char* const PARSE_FAILED = "Failed to parse server response";
}

AuthService::AuthService(const QString& baseUrl, QObject* parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_heartbeatTimer(new QTimer(this))
    , m_baseUrl(baseUrl)
{
    connect(m_heartbeatTimer, &QTimer::timeout, this, &AuthService::sendHeartbeat);
}

AuthService::~AuthService() {
    shutdown();
}

void AuthService::setBaseUrl(const QString& baseUrl) {
    if (m_baseUrl == baseUrl) return;
    m_baseUrl = baseUrl;
    qDebug() << "AuthService: Base URL set to" << m_baseUrl;
}

bool AuthService::isHeartbeatActive() const {
    return m_heartbeatTimer->isActive();
}

void AuthService::setHeartbeatTiming(int firstDelayMs, int intervalMs) {
    m_heartbeatFirstDelayMs = qMax(0, firstDelayMs);
    m_heartbeatIntervalMs = qMax(1, intervalMs);
}

void AuthService::login(const QString& username, const QString& password, const RemoteCallCompletion& completion) {
    qDebug() << "AuthService: Login requested for" << username;

    QJsonObject body;
    body["username"] = username;
    body["password"] = password;
    body["hardware_id"] = hardwareId();
    body["device_name"] = QSysInfo::machineHostName();
    body["os_version"] = QSysInfo::prettyProductName();
    body["app_version"] = QCoreApplication::applicationVersion();

    postJson(VERIFY_ENDPOINT, body, [this, username, completion](const ServerResponse& response) {
        if (!response.parsed) {
            completion(RemoteCallOutcome::reply(false, tr(PARSE_FAILED)));
            return;
        }
        if (!response.success) {
            completion(RemoteCallOutcome::reply(false, response.message.isEmpty() ? tr("Verification failed") : response.message));
            return;
        }
        if (!response.valid) {
            completion(RemoteCallOutcome::reply(false, response.message.isEmpty() ? tr("Account is not valid") : response.message));
            return;
        }
        applyLogin(username, response);
        completion(RemoteCallOutcome::reply(true, tr("Login successful! Account valid for %1 more days").arg(m_remainingDays)));
    }, completion);
}

void AuthService::registerAccount(const SessionCredentials& credentials, const RemoteCallCompletion& completion) {
    qDebug() << "AuthService: Registration requested for" << credentials.username;

    QJsonObject body;
    body["username"] = credentials.username;
    body["password"] = credentials.password;
    body["email"] = credentials.email;
    body["hardware_id"] = hardwareId();
    body["device_name"] = QSysInfo::machineHostName();

    postJson(REGISTER_ENDPOINT, body, [this, completion](const ServerResponse& response) {
        if (!response.parsed) {
            completion(RemoteCallOutcome::reply(false, tr(PARSE_FAILED)));
            return;
        }
        if (!response.success) {
            completion(RemoteCallOutcome::reply(false, response.message.isEmpty() ? tr("Registration failed") : response.message));
            return;
        }
        completion(RemoteCallOutcome::reply(true, response.message.isEmpty() ? tr("Registration successful!") : response.message));
    }, completion);
}

void AuthService::logout() {
    const bool wasAuthenticated = m_authenticated;
    clearSession();
    qDebug() << "AuthService: Logged out";
    if (wasAuthenticated) {
        emit authenticationChanged(false);
    }
}

bool AuthService::isRevocationReason(const QString& reason) {
    static const QStringList reasons = {
        QStringLiteral("device_unbound"), QStringLiteral("device_reset"), QStringLiteral("device_mismatch"),
        QStringLiteral("disabled"), QStringLiteral("expired"), QStringLiteral("session_expired"),
        QStringLiteral("user_not_found")
    };
    return reasons.contains(reason);
}

void AuthService::refreshAccountInfo(const RemoteCallCompletion& completion) {
    if (!m_authenticated || m_username.isEmpty()) {
        completion(RemoteCallOutcome::reply(false, tr("Please log in first")));
        return;
    }
    qDebug() << "AuthService: Refreshing account info for" << m_username;

    QJsonObject body;
    body["token"] = m_token;
    body["hardware_id"] = hardwareId();

    postJson(HEARTBEAT_ENDPOINT, body, [this, completion](const ServerResponse& response) {
        if (!response.parsed) {
            completion(RemoteCallOutcome::reply(false, tr(PARSE_FAILED)));
            return;
        }
        if (!response.success || !response.valid) {
            const QString message = response.message.isEmpty() ? tr("Account verification failed") : response.message;
            if (isRevocationReason(response.reason)) {
                qWarning() << "AuthService: Session revoked on refresh:" << response.reason;
                emit sessionRevoked(response.reason, message);
                logout();
            }
            completion(RemoteCallOutcome::reply(false, message));
            return;
        }
        applyAccountInfo(response);
        completion(RemoteCallOutcome::reply(true, tr("Account information refreshed")));
    }, completion, REFRESH_TIMEOUT_MS);
}

void AuthService::resetDevices(const QString& password, const RemoteCallCompletion& completion) {
    if (!m_authenticated || m_username.isEmpty()) {
        completion(RemoteCallOutcome::reply(false, tr("Please log in first")));
        return;
    }
    qDebug() << "AuthService: Device reset requested for" << m_username << "resets left" << m_resetDeviceCount;

    QJsonObject body;
    body["username"] = m_username;
    body["password"] = password;
    body["hardware_id"] = hardwareId();

    postJson(RESET_DEVICES_ENDPOINT, body, [this, completion](const ServerResponse& response) {
        if (!response.parsed) {
            completion(RemoteCallOutcome::reply(false, tr(PARSE_FAILED)));
            return;
        }
        if (!response.success) {
            completion(RemoteCallOutcome::reply(false, response.message.isEmpty() ? tr("Device reset failed") : response.message));
            return;
        }
        if (response.resetRemaining >= 0) {
            m_resetDeviceCount = response.resetRemaining;
        }
        qDebug() << "AuthService: Devices reset, resets left" << m_resetDeviceCount;
        emit accountInfoChanged();
        completion(RemoteCallOutcome::reply(true, response.message.isEmpty() ? tr("Devices reset") : response.message));
    }, completion);
}

bool AuthService::canUseProjection() const {
    if (!m_authenticated || !m_expiresAt) return false;
    return QDateTime::currentDateTimeUtc() < *m_expiresAt;
}

void AuthService::verifyProjectionPermission(const ProjectionPermissionCallback& callback) {
    if (canUseProjection()) {
        callback({true, false, tr("Logged in")});
        return;
    }

    qDebug() << "AuthService: Not signed in, asking the server before projecting";
    QNetworkRequest request(QUrl(m_baseUrl + VERIFY_ENDPOINT));
    request.setTransferTimeout(PERMISSION_CHECK_TIMEOUT_MS);
    QNetworkReply* reply = m_network->get(request);
    connect(reply, &QNetworkReply::finished, this, [reply, callback]() {
        reply->deleteLater();
        const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (reply->error() == QNetworkReply::NoError) {
            callback({false, false, tr("Server is reachable, please log in to use projection")});
            return;
        }
        if (status.isValid()) {
            qDebug() << "AuthService: Server answered" << status.toInt() << "- trial projection allowed";
            callback({true, true, tr("Trial mode (server error)")});
            return;
        }
        if (classifyNetworkError(reply->error()) == RemoteErrorKind::Cancelled) {
            callback({true, true, tr("Trial mode (server timeout)")});
            return;
        }
        qDebug() << "AuthService: Server unreachable:" << reply->errorString();
        callback({true, true, tr("Trial mode (offline)")});
    });
}

void AuthService::startTrialProjection() {
    if (m_authenticated) {
        resetTrialProjection();
        return;
    }
    m_trialDurationMs = m_trialMinMs == m_trialMaxMs
        ? m_trialMinMs
        : QRandomGenerator::global()->bounded(m_trialMinMs, m_trialMaxMs + 1);
    m_trialClock.start();
    qDebug() << "AuthService: Trial projection started for" << m_trialDurationMs << "ms";
}

bool AuthService::isTrialProjectionActive() const {
    return m_trialClock.isValid() && !isTrialProjectionExpired();
}

bool AuthService::isTrialProjectionExpired() const {
    if (!m_trialClock.isValid()) return true;
    return m_trialClock.elapsed() >= m_trialDurationMs;
}

int AuthService::trialProjectionRemainingMs() const {
    if (m_authenticated || !m_trialClock.isValid()) return 0;
    return static_cast<int>(qMax<qint64>(0, m_trialDurationMs - m_trialClock.elapsed()));
}

void AuthService::resetTrialProjection() {
    m_trialClock.invalidate();
    m_trialDurationMs = 0;
}

void AuthService::setTrialDurationRange(int minMs, int maxMs) {
    m_trialMinMs = qMax(0, minMs);
    m_trialMaxMs = qMax(m_trialMinMs, maxMs);
}

bool AuthService::shutdown() {
    if (m_shutDown) return true;
    m_shutDown = true;
    m_heartbeatTimer->stop();
    // Listeners belong to windows that are going away
    disconnect(this, &AuthService::authenticationChanged, nullptr, nullptr);
    qDebug() << "AuthService: Session torn down";
    return true;
}

void AuthService::sendHeartbeat() {
    if (!m_authenticated || m_token.isEmpty()) {
        m_heartbeatTimer->stop();
        return;
    }
    // The first beat runs on the short delay; settle into the regular interval
    if (m_heartbeatTimer->interval() != m_heartbeatIntervalMs) {
        m_heartbeatTimer->start(m_heartbeatIntervalMs);
    }

    QJsonObject body;
    body["username"] = m_username;
    body["token"] = m_token;
    body["hardware_id"] = hardwareId();

    postJson(HEARTBEAT_ENDPOINT, body, [this](const ServerResponse& response) {
        if (m_shutDown) return;
        if (response.parsed && response.success && !response.valid) {
            qWarning() << "AuthService: Heartbeat rejected by server:" << response.message;
            emit sessionRevoked(response.reason, response.message);
            logout();
            return;
        }
        if (response.parsed && response.success) {
            applyAccountInfo(response);
        }
    }, [](const RemoteCallOutcome& outcome) {
        // Offline is tolerated; the next heartbeat retries
        qDebug() << "AuthService: Heartbeat failed:" << outcome.message;
    });
}

void AuthService::postJson(const QString& endpoint, const QJsonObject& body,
                           const ResponseHandler& onResponse, const RemoteCallCompletion& onError, int timeoutMs) {
    QNetworkRequest request(QUrl(m_baseUrl + endpoint));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setTransferTimeout(timeoutMs);

    QNetworkReply* reply = m_network->post(request, QJsonDocument(body).toJson(QJsonDocument::Compact));
    connect(reply, &QNetworkReply::finished, this, [reply, onResponse, onError]() {
        reply->deleteLater();
        const QByteArray payload = reply->readAll();
        const QNetworkReply::NetworkError error = reply->error();

        if (error == QNetworkReply::NoError) {
            onResponse(parseResponse(payload));
            return;
        }

        // HTTP-level errors usually still carry the server's JSON explanation
        const bool hasHttpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid();
        if (hasHttpStatus && !payload.isEmpty()) {
            const ServerResponse response = parseResponse(payload);
            if (response.parsed) {
                onResponse(response);
                return;
            }
        }

        const RemoteErrorKind kind = classifyNetworkError(error);
        qWarning() << "AuthService: Request to" << reply->url().path() << "failed:" << reply->errorString();
        onError(RemoteCallOutcome::failed(kind, reply->errorString()));
    });
}

void AuthService::applyLogin(const QString& username, const ServerResponse& response) {
    m_username = username;
    m_token = response.token;
    m_expiresAt = response.expiresAt;
    m_remainingDays = response.remainingDays;
    m_resetDeviceCount = response.resetDeviceCount;
    m_deviceInfo = response.deviceInfo;
    m_authenticated = true;
    resetTrialProjection();

    if (m_deviceInfo) {
        qDebug() << "AuthService: Devices bound" << m_deviceInfo->boundDevices << "/" << m_deviceInfo->maxDevices
                 << "remaining slots" << m_deviceInfo->remainingSlots;
    }
    qDebug() << "AuthService: Logged in as" << m_username << "remaining days" << m_remainingDays;

    if (!m_shutDown) {
        m_heartbeatTimer->start(m_heartbeatFirstDelayMs);
    }
    emit authenticationChanged(true);
}

void AuthService::applyAccountInfo(const ServerResponse& response) {
    if (response.expiresAt) m_expiresAt = response.expiresAt;
    if (response.remainingDays > 0) m_remainingDays = response.remainingDays;
    if (response.deviceInfo) m_deviceInfo = response.deviceInfo;
    m_resetDeviceCount = response.resetDeviceCount;
    emit accountInfoChanged();
}

void AuthService::clearSession() {
    m_authenticated = false;
    m_username.clear();
    m_token.clear();
    m_expiresAt.reset();
    m_remainingDays = 0;
    m_resetDeviceCount = 0;
    m_deviceInfo.reset();
    m_heartbeatTimer->stop();
}

AuthService::ServerResponse AuthService::parseResponse(const QByteArray& body) {
    ServerResponse response;
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return response;
    }

    const QJsonObject root = doc.object();
    response.parsed = true;
    response.success = root.value("success").toBool();
    response.valid = root.value("valid").toBool();
    response.message = root.value("message").toString();
    response.reason = root.value("reason").toString();
    if (response.message.isEmpty()) {
        response.message = response.reason;
    }
    if (root.contains("reset_remaining")) {
        response.resetRemaining = root.value("reset_remaining").toInt();
    } else if (root.contains("reset_count")) {
        response.resetRemaining = root.value("reset_count").toInt();
    }

    const QJsonObject data = root.value("data").toObject();
    response.token = data.value("token").toString();
    if (data.contains("expires_at") && !data.value("expires_at").isNull()) {
        response.expiresAt = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(data.value("expires_at").toDouble()));
    }
    response.remainingDays = data.value("remaining_days").toInt();
    response.resetDeviceCount = data.value("reset_device_count").toInt();

    if (data.value("device_info").isObject()) {
        const QJsonObject device = data.value("device_info").toObject();
        DeviceInfo info;
        info.boundDevices = device.value("bound_devices").toInt();
        info.maxDevices = device.value("max_devices").toInt();
        info.remainingSlots = device.value("remaining_slots").toInt();
        info.isNewDevice = device.value("is_new_device").toBool();
        response.deviceInfo = info;
    }
    return response;
}

RemoteErrorKind AuthService::classifyNetworkError(QNetworkReply::NetworkError error) {
    switch (error) {
    case QNetworkReply::NoError:
        return RemoteErrorKind::None;
    case QNetworkReply::OperationCanceledError:
    case QNetworkReply::TimeoutError:
        return RemoteErrorKind::Cancelled;
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::SslHandshakeFailedError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::UnknownProxyError:
        return RemoteErrorKind::Transport;
    default:
        return RemoteErrorKind::Unexpected;
    }
}

QString AuthService::hardwareId() {
    QByteArray machineId = QSysInfo::machineUniqueId();
    if (machineId.isEmpty()) {
        machineId = QSysInfo::machineHostName().toUtf8();
    }
    const QByteArray hash = QCryptographicHash::hash(machineId + QSysInfo::currentCpuArchitecture().toUtf8(),
                                                     QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}
