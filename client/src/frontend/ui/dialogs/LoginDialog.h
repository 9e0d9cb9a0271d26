#ifndef LOGINDIALOG_H
#define LOGINDIALOG_H

#include "frontend/ui/dialogs/AuthDialogBase.h"

class QLineEdit;

// Sign-in form. Closes one second after a successful login.
class LoginDialog : public AuthDialogBase {
    Q_OBJECT

public:
    static constexpr int CLOSE_DELAY_MS = 1000;

    explicit LoginDialog(IAuthGateway* gateway, QWidget* parent = nullptr);
    ~LoginDialog() override = default;

    QLineEdit* usernameEdit() const { return m_usernameEdit; }
    QLineEdit* passwordEdit() const { return m_passwordEdit; }
    QPushButton* loginButton() const { return m_loginButton; }
    QPushButton* registerButton() const { return m_registerButton; }
    QString loggedInUsername() const { return m_loggedInUsername; }

public slots:
    void submit();
    void openRegistration();

protected:
    void setFormEnabled(bool enabled) override;
    QString unexpectedErrorText(const QString& detail) const override;
    void onSucceeded(const RemoteOperationResult& result) override;

private:
    QLineEdit* m_usernameEdit;
    QLineEdit* m_passwordEdit;
    QPushButton* m_loginButton;
    QPushButton* m_registerButton;
    QString m_pendingUsername;
    QString m_loggedInUsername;
};

#endif // LOGINDIALOG_H
