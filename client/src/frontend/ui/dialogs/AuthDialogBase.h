#ifndef AUTHDIALOGBASE_H
#define AUTHDIALOGBASE_H

#include <QDialog>
#include <QString>
#include "backend/auth/RemoteOperationResult.h"

class QLabel;
class QPushButton;
class QTimer;
class IAuthGateway;
class TimedRemoteOperation;

/**
 * @brief Shared behaviour of the login and registration dialogs.
 *
 * Subclasses validate their form and hand a RemoteCall to submitRemote().
 * The base disables the form while the call races its timeout, renders the
 * single resolution into the status line, re-enables the form in every case
 * and, after a success, accepts the dialog once the close delay has elapsed.
 */
class AuthDialogBase : public QDialog {
    Q_OBJECT

public:
    enum class DialogState {
        Idle,
        Submitting,
        Succeeded,
        Failed,
        TimedOut,
        Errored,
        Closing
    };

    enum class StatusTone {
        Neutral,
        Error,
        Success
    };

    ~AuthDialogBase() override;

    void setTimeoutMs(int timeoutMs);
    int timeoutMs() const;
    void setCloseDelayMs(int delayMs) { m_closeDelayMs = delayMs; }
    int closeDelayMs() const { return m_closeDelayMs; }

    DialogState dialogState() const { return m_dialogState; }
    bool isSubmitting() const { return m_dialogState == DialogState::Submitting; }
    QString statusText() const;
    StatusTone statusTone() const { return m_statusTone; }
    QPushButton* submitButton() const { return m_submitButton; }

    static QString timeoutMessage();
    static QString transportMessage();
    static QString cancelledMessage();
    // Label colour shared by every status and hint line of the auth dialogs
    static QString styleSheetFor(StatusTone tone);

signals:
    void resultShown(const RemoteOperationResult& result);

protected:
    AuthDialogBase(IAuthGateway* gateway, int closeDelayMs, QWidget* parent = nullptr);

    IAuthGateway* gateway() const { return m_gateway; }
    void setSubmitButton(QPushButton* button);
    QLabel* statusLabel() const { return m_statusLabel; }

    void showStatus(const QString& text, StatusTone tone);
    void clearStatus() { showStatus(QString(), StatusTone::Neutral); }
    bool submitRemote(const RemoteCall& call, const QString& progressText);

    virtual void setFormEnabled(bool enabled) = 0;
    // "Login error: %1" style prefix for unexpected failures
    virtual QString unexpectedErrorText(const QString& detail) const = 0;
    virtual void onSucceeded(const RemoteOperationResult& result) { Q_UNUSED(result) }

private slots:
    void onStarted();
    void onResolved(const RemoteOperationResult& result);
    void onCloseDelayElapsed();

private:
    QString messageFor(const RemoteOperationResult& result) const;

    IAuthGateway* m_gateway;
    TimedRemoteOperation* m_operation;
    QLabel* m_statusLabel;
    QPushButton* m_submitButton = nullptr;
    QTimer* m_closeTimer;
    int m_closeDelayMs;
    DialogState m_dialogState = DialogState::Idle;
    StatusTone m_statusTone = StatusTone::Neutral;
};

#endif // AUTHDIALOGBASE_H
