#include "frontend/ui/dialogs/RegisterDialog.h"
#include "backend/auth/IAuthGateway.h"
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

RegisterDialog::RegisterDialog(IAuthGateway* gateway, QWidget* parent)
    : AuthDialogBase(gateway, CLOSE_DELAY_MS, parent)
    , m_usernameEdit(new QLineEdit(this))
    , m_emailEdit(new QLineEdit(this))
    , m_passwordEdit(new QLineEdit(this))
    , m_confirmEdit(new QLineEdit(this))
    , m_hintLabel(new QLabel(this))
    , m_registerButton(new QPushButton(tr("Register"), this))
    , m_cancelButton(new QPushButton(tr("Cancel"), this))
{
    setWindowTitle(tr("Create account"));
    setModal(true);

    m_usernameEdit->setPlaceholderText(tr("3-20 letters, digits or underscores"));
    m_passwordEdit->setEchoMode(QLineEdit::Password);
    m_confirmEdit->setEchoMode(QLineEdit::Password);

    auto* form = new QFormLayout();
    form->addRow(tr("Username"), m_usernameEdit);
    form->addRow(tr("Email"), m_emailEdit);
    form->addRow(tr("Password"), m_passwordEdit);
    form->addRow(tr("Confirm password"), m_confirmEdit);
    form->addRow(QString(), m_hintLabel);

    auto* buttons = new QHBoxLayout();
    buttons->addStretch();
    buttons->addWidget(m_cancelButton);
    buttons->addWidget(m_registerButton);

    auto* layout = new QVBoxLayout(this);
    layout->addLayout(form);
    layout->addWidget(statusLabel());
    layout->addLayout(buttons);

    m_registerButton->setDefault(true);
    setSubmitButton(m_registerButton);

    connect(m_registerButton, &QPushButton::clicked, this, &RegisterDialog::submit);
    connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    connect(m_passwordEdit, &QLineEdit::textChanged, this, &RegisterDialog::updatePasswordHint);
    connect(m_confirmEdit, &QLineEdit::textChanged, this, &RegisterDialog::updatePasswordHint);
    connect(m_confirmEdit, &QLineEdit::returnPressed, this, &RegisterDialog::submit);

    updatePasswordHint();
}

void RegisterDialog::updatePasswordHint() {
    m_hint = CredentialValidator::passwordMatchHint(m_passwordEdit->text(), m_confirmEdit->text());
    m_hintLabel->setText(CredentialValidator::passwordMatchHintText(m_hint));
    switch (m_hint) {
    case PasswordMatchHint::Match: m_hintLabel->setStyleSheet(styleSheetFor(StatusTone::Success)); break;
    case PasswordMatchHint::Mismatch: m_hintLabel->setStyleSheet(styleSheetFor(StatusTone::Error)); break;
    case PasswordMatchHint::Empty:
    case PasswordMatchHint::Prompt: m_hintLabel->setStyleSheet(styleSheetFor(StatusTone::Neutral)); break;
    }
}

void RegisterDialog::focusField(ValidationResult::Field field) {
    switch (field) {
    case ValidationResult::Field::Username: m_usernameEdit->setFocus(); break;
    case ValidationResult::Field::Email: m_emailEdit->setFocus(); break;
    case ValidationResult::Field::Password: m_passwordEdit->setFocus(); break;
    case ValidationResult::Field::ConfirmPassword: m_confirmEdit->setFocus(); break;
    case ValidationResult::Field::None: break;
    }
}

void RegisterDialog::submit() {
    if (isSubmitting()) return;

    SessionCredentials credentials;
    credentials.username = m_usernameEdit->text().trimmed();
    credentials.email = m_emailEdit->text().trimmed();
    credentials.password = m_passwordEdit->text();

    const ValidationResult validation = CredentialValidator::validateRegistration(credentials, m_confirmEdit->text());
    if (!validation.ok) {
        showStatus(validation.message, StatusTone::Error);
        if (validation.field == ValidationResult::Field::ConfirmPassword && !m_confirmEdit->text().isEmpty()) {
            m_confirmEdit->clear();
        }
        focusField(validation.field);
        return;
    }

    m_pendingUsername = credentials.username;
    IAuthGateway* auth = gateway();
    submitRemote([auth, credentials](const RemoteCallCompletion& completion) {
        auth->registerAccount(credentials, completion);
    }, tr("Registering..."));
}

void RegisterDialog::setFormEnabled(bool enabled) {
    m_usernameEdit->setEnabled(enabled);
    m_emailEdit->setEnabled(enabled);
    m_passwordEdit->setEnabled(enabled);
    m_confirmEdit->setEnabled(enabled);
    m_cancelButton->setEnabled(enabled);
}

QString RegisterDialog::unexpectedErrorText(const QString& detail) const {
    return tr("Registration error: %1").arg(detail);
}

void RegisterDialog::onSucceeded(const RemoteOperationResult& result) {
    Q_UNUSED(result)
    m_registeredUsername = m_pendingUsername;
}
