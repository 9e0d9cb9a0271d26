#include "frontend/ui/dialogs/AuthDialogBase.h"
#include "backend/auth/IAuthGateway.h"
#include "backend/auth/TimedRemoteOperation.h"
#include <QDebug>
#include <QLabel>
#include <QPushButton>
#include <QTimer>

namespace {
    const char* const ERROR_STYLE = "color: #d9534f;";
    const char* const SUCCESS_STYLE = "color: #2e9e4f;";
    const char* const NEUTRAL_STYLE = "color: palette(mid);";
}

AuthDialogBase::AuthDialogBase(IAuthGateway* gateway, int closeDelayMs, QWidget* parent)
    : QDialog(parent)
    , m_gateway(gateway)
    , m_operation(new TimedRemoteOperation(this))
    , m_statusLabel(new QLabel(this))
    , m_closeTimer(new QTimer(this))
    , m_closeDelayMs(closeDelayMs)
{
    m_statusLabel->setWordWrap(true);
    m_statusLabel->setObjectName(QStringLiteral("statusLabel"));
    m_closeTimer->setSingleShot(true);

    connect(m_operation, &TimedRemoteOperation::started, this, &AuthDialogBase::onStarted);
    connect(m_operation, &TimedRemoteOperation::resolved, this, &AuthDialogBase::onResolved);
    connect(m_closeTimer, &QTimer::timeout, this, &AuthDialogBase::onCloseDelayElapsed);
}

AuthDialogBase::~AuthDialogBase() = default;

QString AuthDialogBase::timeoutMessage() {
    return tr("Connection timed out: the network is slow or the server is not responding. "
              "Please check your network and try again.");
}

QString AuthDialogBase::transportMessage() {
    return tr("Network error: unable to reach the server. Please check your network.");
}

QString AuthDialogBase::cancelledMessage() {
    return tr("Request timed out: the server responded too slowly. Please try again later.");
}

void AuthDialogBase::setTimeoutMs(int timeoutMs) {
    m_operation->setTimeoutMs(timeoutMs);
}

int AuthDialogBase::timeoutMs() const {
    return m_operation->timeoutMs();
}

QString AuthDialogBase::statusText() const {
    return m_statusLabel->text();
}

void AuthDialogBase::setSubmitButton(QPushButton* button) {
    m_submitButton = button;
}

void AuthDialogBase::showStatus(const QString& text, StatusTone tone) {
    m_statusTone = tone;
    m_statusLabel->setText(text);
    m_statusLabel->setStyleSheet(styleSheetFor(tone));
}

QString AuthDialogBase::styleSheetFor(StatusTone tone) {
    switch (tone) {
    case StatusTone::Error: return QString::fromLatin1(ERROR_STYLE);
    case StatusTone::Success: return QString::fromLatin1(SUCCESS_STYLE);
    case StatusTone::Neutral: break;
    }
    return QString::fromLatin1(NEUTRAL_STYLE);
}

bool AuthDialogBase::submitRemote(const RemoteCall& call, const QString& progressText) {
    if (m_operation->isSubmitting()
        || m_dialogState == DialogState::Succeeded || m_dialogState == DialogState::Closing) {
        return false;
    }
    if (!m_gateway) {
        showStatus(unexpectedErrorText(tr("authentication service unavailable")), StatusTone::Error);
        m_dialogState = DialogState::Errored;
        return false;
    }
    showStatus(progressText, StatusTone::Neutral);
    return m_operation->start(call);
}

void AuthDialogBase::onStarted() {
    m_dialogState = DialogState::Submitting;
    setFormEnabled(false);
    if (m_submitButton) m_submitButton->setEnabled(false);
}

QString AuthDialogBase::messageFor(const RemoteOperationResult& result) const {
    switch (result.kind()) {
    case RemoteOperationResult::Kind::Success:
    case RemoteOperationResult::Kind::Failure:
        return result.message();
    case RemoteOperationResult::Kind::Timeout:
        return timeoutMessage();
    case RemoteOperationResult::Kind::Errored:
        switch (result.errorKind()) {
        case RemoteErrorKind::Transport: return transportMessage();
        case RemoteErrorKind::Cancelled: return cancelledMessage();
        case RemoteErrorKind::None:
        case RemoteErrorKind::Unexpected: break;
        }
        return unexpectedErrorText(result.message());
    }
    return unexpectedErrorText(result.message());
}

void AuthDialogBase::onResolved(const RemoteOperationResult& result) {
    switch (result.kind()) {
    case RemoteOperationResult::Kind::Success: m_dialogState = DialogState::Succeeded; break;
    case RemoteOperationResult::Kind::Failure: m_dialogState = DialogState::Failed; break;
    case RemoteOperationResult::Kind::Timeout: m_dialogState = DialogState::TimedOut; break;
    case RemoteOperationResult::Kind::Errored: m_dialogState = DialogState::Errored; break;
    }

    showStatus(messageFor(result), result.isSuccess() ? StatusTone::Success : StatusTone::Error);
    setFormEnabled(true);
    if (m_submitButton) m_submitButton->setEnabled(true);
    if (result.isErrored()) {
        qWarning() << metaObject()->className() << ": remote call errored:" << result.message();
    }

    emit resultShown(result);

    if (result.isSuccess()) {
        onSucceeded(result);
        m_closeTimer->start(m_closeDelayMs);
    }
}

void AuthDialogBase::onCloseDelayElapsed() {
    m_dialogState = DialogState::Closing;
    accept();
}
