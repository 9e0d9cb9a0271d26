#include "backend/lifecycle/ShutdownSequence.h"
#include <QDebug>
#include <exception>

QStringList ShutdownReport::executedStepNames() const {
    QStringList names;
    for (const ShutdownStepOutcome& step : m_steps) {
        names.append(step.name);
    }
    return names;
}

int ShutdownReport::failureCount() const {
    int failures = 0;
    for (const ShutdownStepOutcome& step : m_steps) {
        if (step.result.status == ShutdownStepResult::Status::Failed) ++failures;
    }
    return failures;
}

const ShutdownStepOutcome* ShutdownReport::find(const QString& name) const {
    for (const ShutdownStepOutcome& step : m_steps) {
        if (step.name == name) return &step;
    }
    return nullptr;
}

void ShutdownSequence::addStep(const QString& name, const ShutdownAction& action) {
    if (m_hasRun) {
        qWarning() << "ShutdownSequence: Ignoring step" << name << "added after the sequence ran";
        return;
    }
    m_steps.append({name, action});
}

QStringList ShutdownSequence::stepNames() const {
    QStringList names;
    for (const Step& step : m_steps) {
        names.append(step.name);
    }
    return names;
}

const ShutdownReport& ShutdownSequence::run() {
    if (m_hasRun) {
        qWarning() << "ShutdownSequence: Already executed, not running again";
        return m_report;
    }
    m_hasRun = true;

    qDebug() << "ShutdownSequence: Running" << m_steps.size() << "steps";
    for (const Step& step : m_steps) {
        const ShutdownStepResult result = runStep(step.name, step.action);
        switch (result.status) {
        case ShutdownStepResult::Status::Ok:
            qDebug() << "ShutdownSequence: [ok]" << step.name;
            break;
        case ShutdownStepResult::Status::Skipped:
            qDebug() << "ShutdownSequence: [skipped]" << step.name << result.message;
            break;
        case ShutdownStepResult::Status::Failed:
            qWarning() << "ShutdownSequence: [failed]" << step.name << result.message;
            break;
        }
        m_report.append(step.name, result);
    }

    if (m_report.failureCount() > 0) {
        qWarning() << "ShutdownSequence: Completed with" << m_report.failureCount() << "failed step(s)";
    } else {
        qDebug() << "ShutdownSequence: Completed cleanly";
    }
    return m_report;
}

ShutdownStepResult ShutdownSequence::runStep(const QString& name, const ShutdownAction& action) {
    if (!action) {
        return ShutdownStepResult::skipped(QStringLiteral("no action"));
    }
    try {
        return action();
    } catch (const std::exception& e) {
        return ShutdownStepResult::failed(QString::fromUtf8(e.what()));
    } catch (...) {
        qWarning() << "ShutdownSequence: Step" << name << "threw a non-standard exception";
        return ShutdownStepResult::failed(QStringLiteral("unknown exception"));
    }
}
