#include "backend/auth/TimedRemoteOperation.h"
#include <QDebug>
#include <QPointer>
#include <exception>

TimedRemoteOperation::TimedRemoteOperation(QObject* parent)
    : QObject(parent)
    , m_timer(new QTimer(this))
{
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &TimedRemoteOperation::onTimeout);
}

void TimedRemoteOperation::setTimeoutMs(int timeoutMs) {
    m_timeoutMs = qMax(0, timeoutMs);
}

bool TimedRemoteOperation::start(const RemoteCall& call) {
    if (m_state == State::Submitting) {
        qWarning() << "TimedRemoteOperation: start() ignored, a submission is already racing";
        return false;
    }

    const quint64 generation = ++m_generation;
    m_state = State::Submitting;
    emit started();
    m_timer->start(m_timeoutMs);

    QPointer<TimedRemoteOperation> guard(this);
    const RemoteCallCompletion completion = [guard, generation](const RemoteCallOutcome& outcome) {
        if (!guard) return;
        // Always hop through the event loop so results land on the owning thread
        QMetaObject::invokeMethod(guard.data(), [guard, generation, outcome]() {
            if (guard) guard->handleCompletion(generation, outcome);
        }, Qt::QueuedConnection);
    };

    try {
        call(completion);
    } catch (const std::exception& e) {
        qWarning() << "TimedRemoteOperation: remote call threw while starting:" << e.what();
        resolve(RemoteOperationResult::errored(RemoteErrorKind::Unexpected, QString::fromUtf8(e.what())));
    } catch (...) {
        qWarning() << "TimedRemoteOperation: remote call threw a non-standard exception while starting";
        resolve(RemoteOperationResult::errored(RemoteErrorKind::Unexpected, QStringLiteral("unknown error")));
    }
    return true;
}

void TimedRemoteOperation::onTimeout() {
    if (m_state != State::Submitting) return;
    qDebug() << "TimedRemoteOperation: timed out after" << m_timeoutMs << "ms, remote call left running";
    resolve(RemoteOperationResult::timeout());
}

void TimedRemoteOperation::handleCompletion(quint64 generation, const RemoteCallOutcome& outcome) {
    if (generation != m_generation || m_state != State::Submitting) {
        qDebug() << "TimedRemoteOperation: discarding late result of submission" << generation;
        return;
    }

    if (outcome.isError()) {
        resolve(RemoteOperationResult::errored(outcome.error, outcome.message));
    } else if (outcome.success) {
        resolve(RemoteOperationResult::success(outcome.message));
    } else {
        resolve(RemoteOperationResult::failure(outcome.message));
    }
}

void TimedRemoteOperation::resolve(const RemoteOperationResult& result) {
    if (m_state != State::Submitting) return;
    m_timer->stop();

    switch (result.kind()) {
    case RemoteOperationResult::Kind::Success: m_state = State::Succeeded; break;
    case RemoteOperationResult::Kind::Failure: m_state = State::Failed; break;
    case RemoteOperationResult::Kind::Timeout: m_state = State::TimedOut; break;
    case RemoteOperationResult::Kind::Errored: m_state = State::Errored; break;
    }
    emit resolved(result);
}
