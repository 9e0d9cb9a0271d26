#ifndef SHUTDOWNSEQUENCE_H
#define SHUTDOWNSEQUENCE_H

#include <QList>
#include <QString>
#include <QStringList>
#include <functional>

struct ShutdownStepResult {
    enum class Status {
        Ok,
        Skipped,   // collaborator absent, nothing to release
        Failed
    };

    Status status = Status::Ok;
    QString message;

    static ShutdownStepResult ok() { return ShutdownStepResult(); }
    static ShutdownStepResult skipped(const QString& reason = QString()) {
        ShutdownStepResult result;
        result.status = Status::Skipped;
        result.message = reason;
        return result;
    }
    static ShutdownStepResult failed(const QString& error) {
        ShutdownStepResult result;
        result.status = Status::Failed;
        result.message = error;
        return result;
    }
    // Convenience for collaborators reporting bool + error string
    static ShutdownStepResult fromBool(bool succeeded, const QString& error) {
        return succeeded ? ok() : failed(error);
    }
};

using ShutdownAction = std::function<ShutdownStepResult()>;

struct ShutdownStepOutcome {
    QString name;
    ShutdownStepResult result;
};

class ShutdownReport {
public:
    void append(const QString& name, const ShutdownStepResult& result) { m_steps.append({name, result}); }

    const QList<ShutdownStepOutcome>& steps() const { return m_steps; }
    QStringList executedStepNames() const;
    int failureCount() const;
    bool allSucceeded() const { return failureCount() == 0; }
    const ShutdownStepOutcome* find(const QString& name) const;

private:
    QList<ShutdownStepOutcome> m_steps;
};

/**
 * @brief Fixed, ordered list of cleanup actions run exactly once.
 *
 * Every step runs even when an earlier one fails or throws; failures are
 * collected into the returned report and logged, never rethrown.
 */
class ShutdownSequence {
public:
    ShutdownSequence() = default;

    void addStep(const QString& name, const ShutdownAction& action);
    int stepCount() const { return m_steps.size(); }
    QStringList stepNames() const;

    // Second and later calls are no-ops returning the first report.
    const ShutdownReport& run();
    bool hasRun() const { return m_hasRun; }
    const ShutdownReport& report() const { return m_report; }

private:
    static ShutdownStepResult runStep(const QString& name, const ShutdownAction& action);

    struct Step {
        QString name;
        ShutdownAction action;
    };

    QList<Step> m_steps;
    ShutdownReport m_report;
    bool m_hasRun = false;
};

#endif // SHUTDOWNSEQUENCE_H
