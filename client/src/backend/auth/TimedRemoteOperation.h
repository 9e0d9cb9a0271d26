#ifndef TIMEDREMOTEOPERATION_H
#define TIMEDREMOTEOPERATION_H

#include <QObject>
#include <QTimer>
#include "backend/auth/RemoteOperationResult.h"

/**
 * @brief Races one asynchronous remote call against a single-shot timer.
 *
 * Per submission: Idle -> Submitting -> {Succeeded, Failed, TimedOut, Errored}.
 * resolved() fires exactly once per accepted start(). Whichever side finishes
 * first wins; the loser is ignored. The remote call is never cancelled when
 * the timer wins, its late completion is simply dropped.
 *
 * Completions may be invoked from any thread; they are queued onto the thread
 * owning this object before any state changes.
 */
class TimedRemoteOperation : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Submitting,
        Succeeded,
        Failed,
        TimedOut,
        Errored
    };

    static constexpr int DEFAULT_TIMEOUT_MS = 60000;

    explicit TimedRemoteOperation(QObject* parent = nullptr);
    ~TimedRemoteOperation() override = default;

    void setTimeoutMs(int timeoutMs);
    int timeoutMs() const { return m_timeoutMs; }

    // Returns false (and does nothing) while a previous submission is still racing.
    bool start(const RemoteCall& call);

    State state() const { return m_state; }
    bool isSubmitting() const { return m_state == State::Submitting; }

signals:
    void started();
    void resolved(const RemoteOperationResult& result);

private slots:
    void onTimeout();

private:
    void handleCompletion(quint64 generation, const RemoteCallOutcome& outcome);
    void resolve(const RemoteOperationResult& result);

    QTimer* m_timer;
    State m_state = State::Idle;
    int m_timeoutMs = DEFAULT_TIMEOUT_MS;
    quint64 m_generation = 0;
};

#endif // TIMEDREMOTEOPERATION_H
