#include "frontend/ui/dialogs/LoginDialog.h"
#include "frontend/ui/dialogs/RegisterDialog.h"
#include "backend/auth/CredentialValidator.h"
#include "backend/auth/IAuthGateway.h"
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

LoginDialog::LoginDialog(IAuthGateway* gateway, QWidget* parent)
    : AuthDialogBase(gateway, CLOSE_DELAY_MS, parent)
    , m_usernameEdit(new QLineEdit(this))
    , m_passwordEdit(new QLineEdit(this))
    , m_loginButton(new QPushButton(tr("Log in"), this))
    , m_registerButton(new QPushButton(tr("Create account"), this))
{
    setWindowTitle(tr("Log in"));
    setModal(true);

    m_passwordEdit->setEchoMode(QLineEdit::Password);

    auto* form = new QFormLayout();
    form->addRow(tr("Username"), m_usernameEdit);
    form->addRow(tr("Password"), m_passwordEdit);

    auto* buttons = new QHBoxLayout();
    buttons->addWidget(m_registerButton);
    buttons->addStretch();
    buttons->addWidget(m_loginButton);

    auto* layout = new QVBoxLayout(this);
    layout->addLayout(form);
    layout->addWidget(statusLabel());
    layout->addLayout(buttons);

    m_loginButton->setDefault(true);
    setSubmitButton(m_loginButton);

    connect(m_loginButton, &QPushButton::clicked, this, &LoginDialog::submit);
    connect(m_passwordEdit, &QLineEdit::returnPressed, this, &LoginDialog::submit);
    connect(m_registerButton, &QPushButton::clicked, this, &LoginDialog::openRegistration);
}

void LoginDialog::submit() {
    if (isSubmitting()) return;

    const QString username = m_usernameEdit->text().trimmed();
    const QString password = m_passwordEdit->text();
    const ValidationResult validation = CredentialValidator::validateLogin(username, password);
    if (!validation.ok) {
        showStatus(validation.message, StatusTone::Error);
        if (validation.field == ValidationResult::Field::Username) {
            m_usernameEdit->setFocus();
        } else {
            m_passwordEdit->setFocus();
        }
        return;
    }

    m_pendingUsername = username;
    IAuthGateway* auth = gateway();
    submitRemote([auth, username, password](const RemoteCallCompletion& completion) {
        auth->login(username, password, completion);
    }, tr("Logging in..."));
}

void LoginDialog::openRegistration() {
    RegisterDialog dialog(gateway(), this);
    dialog.usernameEdit()->setText(m_usernameEdit->text().trimmed());
    if (dialog.exec() == QDialog::Accepted) {
        m_usernameEdit->setText(dialog.registeredUsername());
        m_passwordEdit->clear();
        m_passwordEdit->setFocus();
        showStatus(tr("Account created, you can log in now"), StatusTone::Success);
    }
}

void LoginDialog::setFormEnabled(bool enabled) {
    m_usernameEdit->setEnabled(enabled);
    m_passwordEdit->setEnabled(enabled);
    m_registerButton->setEnabled(enabled);
}

QString LoginDialog::unexpectedErrorText(const QString& detail) const {
    return tr("Login error: %1").arg(detail);
}

void LoginDialog::onSucceeded(const RemoteOperationResult& result) {
    Q_UNUSED(result)
    m_loggedInUsername = m_pendingUsername;
}
