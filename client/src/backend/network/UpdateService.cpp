#include "backend/network/UpdateService.h"
#include <QCoreApplication>
#include <QDebug>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QRegularExpression>
#include <QTimer>
#include <QUrl>

namespace {
    const QString FALLBACK_VERSION = QStringLiteral("1.0.0");
    const QByteArray USER_AGENT = QByteArrayLiteral("Projecteur-Updater");
}

UpdateService::UpdateService(const QString& baseUrl, QObject* parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
{
}

QString UpdateService::currentVersion() const {
    if (!m_currentVersion.isEmpty()) return m_currentVersion;
    const QString appVersion = QCoreApplication::applicationVersion();
    return isValidVersionString(appVersion) ? appVersion : FALLBACK_VERSION;
}

bool UpdateService::isValidVersionString(const QString& version) {
    static const QRegularExpression pattern(QStringLiteral("^\\d+\\.\\d+\\.\\d+$"));
    return pattern.match(version).hasMatch();
}

int UpdateService::compareVersions(const QString& a, const QString& b) {
    const QStringList left = a.split('.');
    const QStringList right = b.split('.');
    const int count = qMax(left.size(), right.size());
    for (int i = 0; i < count; ++i) {
        const int l = i < left.size() ? left.at(i).toInt() : 0;
        const int r = i < right.size() ? right.at(i).toInt() : 0;
        if (l != r) return l < r ? -1 : 1;
    }
    return 0;
}

QList<UpdateFileInfo> UpdateService::parseFilesList(const QString& baseUrl, const QString& version, const QByteArray& body) {
    QList<UpdateFileInfo> files;
    const QStringList lines = QString::fromUtf8(body).split(QRegularExpression(QStringLiteral("[\r\n]")), Qt::SkipEmptyParts);
    for (const QString& line : lines) {
        const QString name = line.trimmed();
        if (name.isEmpty()) continue;
        UpdateFileInfo file;
        file.fileName = name;
        file.downloadUrl = QStringLiteral("%1/v%2/%3").arg(baseUrl, version, name);
        files.append(file);
    }
    return files;
}

bool UpdateService::checkForUpdates(const CheckCallback& callback) {
    if (m_checking) {
        qDebug() << "UpdateService: Check already in progress";
        return false;
    }
    m_checking = true;
    m_attempt = 0;
    m_callback = callback;
    startAttempt();
    return true;
}

void UpdateService::startAttempt() {
    ++m_attempt;
    if (m_attempt > 1) {
        qDebug() << "UpdateService: Retry" << m_attempt << "/" << MAX_ATTEMPTS;
    }
    QNetworkRequest request(QUrl(m_baseUrl + QStringLiteral("/latest.txt")));
    request.setHeader(QNetworkRequest::UserAgentHeader, USER_AGENT);
    request.setTransferTimeout(REQUEST_TIMEOUT_MS);
    QNetworkReply* reply = m_network->get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply]() { handleLatestReply(reply); });
}

void UpdateService::handleLatestReply(QNetworkReply* reply) {
    reply->deleteLater();
    if (reply->error() != QNetworkReply::NoError) {
        retryOrFinish(reply->errorString());
        return;
    }

    const QString latest = QString::fromUtf8(reply->readAll()).trimmed();
    if (!isValidVersionString(latest)) {
        qWarning() << "UpdateService: Malformed version string" << latest;
        finish(std::nullopt);
        return;
    }

    const QString current = currentVersion();
    if (compareVersions(latest, current) <= 0) {
        qDebug() << "UpdateService: Up to date, current" << current << "latest" << latest;
        finish(std::nullopt);
        return;
    }
    qDebug() << "UpdateService: New version available" << latest << "(current" << current << ")";
    fetchFilesList(latest);
}

void UpdateService::fetchFilesList(const QString& version) {
    QNetworkRequest request(QUrl(QStringLiteral("%1/v%2/files.txt").arg(m_baseUrl, version)));
    request.setHeader(QNetworkRequest::UserAgentHeader, USER_AGENT);
    request.setTransferTimeout(REQUEST_TIMEOUT_MS);
    QNetworkReply* reply = m_network->get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply, version]() {
        reply->deleteLater();
        if (reply->error() != QNetworkReply::NoError) {
            retryOrFinish(reply->errorString());
            return;
        }
        VersionInfo info;
        info.version = version;
        info.files = parseFilesList(m_baseUrl, version, reply->readAll());
        finish(info);
    });
}

void UpdateService::retryOrFinish(const QString& reason) {
    qWarning() << "UpdateService: Attempt" << m_attempt << "/" << MAX_ATTEMPTS << "failed:" << reason;
    if (m_attempt < MAX_ATTEMPTS) {
        QTimer::singleShot(m_retryDelayMs, this, &UpdateService::startAttempt);
        return;
    }
    finish(std::nullopt);
}

void UpdateService::finish(const std::optional<VersionInfo>& info) {
    m_lastChecked = info;
    m_checking = false;
    CheckCallback callback = std::move(m_callback);
    m_callback = nullptr;
    if (info) {
        emit updateAvailable(info->version);
    }
    if (callback) {
        callback(info);
    }
}
