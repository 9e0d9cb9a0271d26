#ifndef REMOTEOPERATIONRESULT_H
#define REMOTEOPERATIONRESULT_H

#include <QMetaType>
#include <QString>
#include <functional>

// Error classes a remote call can report instead of a (success, message) pair.
enum class RemoteErrorKind {
    None,
    Transport,   // host unreachable, connection refused, DNS failure...
    Cancelled,   // request aborted or transfer timeout hit
    Unexpected   // anything else, including exceptions thrown while starting the call
};

// What a remote call hands back to its completion callback.
struct RemoteCallOutcome {
    bool success = false;
    QString message;
    RemoteErrorKind error = RemoteErrorKind::None;

    static RemoteCallOutcome reply(bool success, const QString& message) {
        RemoteCallOutcome outcome;
        outcome.success = success;
        outcome.message = message;
        return outcome;
    }

    static RemoteCallOutcome failed(RemoteErrorKind kind, const QString& detail) {
        RemoteCallOutcome outcome;
        outcome.error = kind;
        outcome.message = detail;
        return outcome;
    }

    bool isError() const { return error != RemoteErrorKind::None; }
};

using RemoteCallCompletion = std::function<void(const RemoteCallOutcome&)>;
// Starts the remote call; must eventually invoke the completion (from any thread).
using RemoteCall = std::function<void(const RemoteCallCompletion&)>;

/**
 * @brief Outcome of one timed submission, observed exactly once.
 */
class RemoteOperationResult {
public:
    enum class Kind {
        Success,
        Failure,
        Timeout,
        Errored
    };

    RemoteOperationResult() = default;

    static RemoteOperationResult success(const QString& message) {
        return RemoteOperationResult(Kind::Success, RemoteErrorKind::None, message);
    }
    static RemoteOperationResult failure(const QString& message) {
        return RemoteOperationResult(Kind::Failure, RemoteErrorKind::None, message);
    }
    static RemoteOperationResult timeout() {
        return RemoteOperationResult(Kind::Timeout, RemoteErrorKind::None, QString());
    }
    static RemoteOperationResult errored(RemoteErrorKind errorKind, const QString& detail) {
        return RemoteOperationResult(Kind::Errored, errorKind, detail);
    }

    Kind kind() const { return m_kind; }
    RemoteErrorKind errorKind() const { return m_errorKind; }
    QString message() const { return m_message; }

    bool isSuccess() const { return m_kind == Kind::Success; }
    bool isFailure() const { return m_kind == Kind::Failure; }
    bool isTimeout() const { return m_kind == Kind::Timeout; }
    bool isErrored() const { return m_kind == Kind::Errored; }

private:
    RemoteOperationResult(Kind kind, RemoteErrorKind errorKind, const QString& message)
        : m_kind(kind), m_errorKind(errorKind), m_message(message) {}

    Kind m_kind = Kind::Failure;
    RemoteErrorKind m_errorKind = RemoteErrorKind::None;
    QString m_message;
};

Q_DECLARE_METATYPE(RemoteOperationResult)

#endif // REMOTEOPERATIONRESULT_H
