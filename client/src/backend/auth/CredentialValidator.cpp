#include "backend/auth/CredentialValidator.h"
#include <QCoreApplication>
#include <QRegularExpression>

namespace CredentialValidator {

const char* const USERNAME_REQUIRED = "Please enter a username";
const char* const USERNAME_LENGTH = "Username length must be 3-20 characters";
const char* const USERNAME_CHARSET = "Username may only contain letters, digits and underscores";
const char* const EMAIL_REQUIRED = "Please enter an email address";
const char* const EMAIL_FORMAT = "Invalid email format";
const char* const PASSWORD_REQUIRED = "Please enter a password";
const char* const PASSWORD_LENGTH = "Password must be at least 6 characters";
const char* const CONFIRM_REQUIRED = "Please enter the password again";
const char* const PASSWORD_MISMATCH = "The two passwords do not match, please re-enter";

namespace {
    QString tr(const char* text) {
        return QCoreApplication::translate("CredentialValidator", text);
    }
}

bool isValidUsername(const QString& username) {
    static const QRegularExpression pattern(QStringLiteral("^[A-Za-z0-9_]+$"));
    return pattern.match(username).hasMatch();
}

bool isValidEmail(const QString& email) {
    static const QRegularExpression pattern(QStringLiteral("^[^@\\s]+@[^@\\s]+\\.[^@\\s]+$"));
    return pattern.match(email).hasMatch();
}

ValidationResult validateLogin(const QString& username, const QString& password) {
    if (username.isEmpty()) {
        return ValidationResult::invalid(ValidationResult::Field::Username, tr(USERNAME_REQUIRED));
    }
    if (password.isEmpty()) {
        return ValidationResult::invalid(ValidationResult::Field::Password, tr(PASSWORD_REQUIRED));
    }
    return ValidationResult::valid();
}

ValidationResult validateRegistration(const SessionCredentials& credentials, const QString& confirmPassword) {
    using Field = ValidationResult::Field;

    const QString& username = credentials.username;
    if (username.isEmpty()) {
        return ValidationResult::invalid(Field::Username, tr(USERNAME_REQUIRED));
    }
    if (username.length() < MIN_USERNAME_LENGTH || username.length() > MAX_USERNAME_LENGTH) {
        return ValidationResult::invalid(Field::Username, tr(USERNAME_LENGTH));
    }
    if (!isValidUsername(username)) {
        return ValidationResult::invalid(Field::Username, tr(USERNAME_CHARSET));
    }

    if (credentials.email.isEmpty()) {
        return ValidationResult::invalid(Field::Email, tr(EMAIL_REQUIRED));
    }
    if (!isValidEmail(credentials.email)) {
        return ValidationResult::invalid(Field::Email, tr(EMAIL_FORMAT));
    }

    if (credentials.password.isEmpty()) {
        return ValidationResult::invalid(Field::Password, tr(PASSWORD_REQUIRED));
    }
    if (credentials.password.length() < MIN_PASSWORD_LENGTH) {
        return ValidationResult::invalid(Field::Password, tr(PASSWORD_LENGTH));
    }

    if (confirmPassword.isEmpty()) {
        return ValidationResult::invalid(Field::ConfirmPassword, tr(CONFIRM_REQUIRED));
    }
    if (credentials.password != confirmPassword) {
        return ValidationResult::invalid(Field::ConfirmPassword, tr(PASSWORD_MISMATCH));
    }
    return ValidationResult::valid();
}

PasswordMatchHint passwordMatchHint(const QString& password, const QString& confirmPassword) {
    if (password.isEmpty() && confirmPassword.isEmpty()) {
        return PasswordMatchHint::Empty;
    }
    if (confirmPassword.isEmpty()) {
        return PasswordMatchHint::Prompt;
    }
    // An empty password against a typed confirmation counts as a mismatch
    return password == confirmPassword ? PasswordMatchHint::Match : PasswordMatchHint::Mismatch;
}

QString passwordMatchHintText(PasswordMatchHint hint) {
    switch (hint) {
    case PasswordMatchHint::Empty: return QString();
    case PasswordMatchHint::Prompt: return tr(CONFIRM_REQUIRED);
    case PasswordMatchHint::Match: return tr("✓ Passwords match");
    case PasswordMatchHint::Mismatch: return tr("✗ Passwords do not match");
    }
    return QString();
}

} // namespace CredentialValidator
