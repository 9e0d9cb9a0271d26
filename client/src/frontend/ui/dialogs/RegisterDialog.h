#ifndef REGISTERDIALOG_H
#define REGISTERDIALOG_H

#include "frontend/ui/dialogs/AuthDialogBase.h"
#include "backend/auth/CredentialValidator.h"

class QLineEdit;

// New account form. Closes two seconds after a successful registration.
class RegisterDialog : public AuthDialogBase {
    Q_OBJECT

public:
    static constexpr int CLOSE_DELAY_MS = 2000;

    explicit RegisterDialog(IAuthGateway* gateway, QWidget* parent = nullptr);
    ~RegisterDialog() override = default;

    QLineEdit* usernameEdit() const { return m_usernameEdit; }
    QLineEdit* emailEdit() const { return m_emailEdit; }
    QLineEdit* passwordEdit() const { return m_passwordEdit; }
    QLineEdit* confirmEdit() const { return m_confirmEdit; }
    QLabel* passwordHintLabel() const { return m_hintLabel; }
    PasswordMatchHint currentHint() const { return m_hint; }
    QString registeredUsername() const { return m_registeredUsername; }

public slots:
    void submit();

protected:
    void setFormEnabled(bool enabled) override;
    QString unexpectedErrorText(const QString& detail) const override;
    void onSucceeded(const RemoteOperationResult& result) override;

private slots:
    void updatePasswordHint();

private:
    void focusField(ValidationResult::Field field);

    QLineEdit* m_usernameEdit;
    QLineEdit* m_emailEdit;
    QLineEdit* m_passwordEdit;
    QLineEdit* m_confirmEdit;
    QLabel* m_hintLabel;
    QPushButton* m_registerButton;
    QPushButton* m_cancelButton;
    PasswordMatchHint m_hint = PasswordMatchHint::Empty;
    QString m_pendingUsername;
    QString m_registeredUsername;
};

#endif // REGISTERDIALOG_H
