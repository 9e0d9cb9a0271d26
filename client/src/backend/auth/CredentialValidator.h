#ifndef CREDENTIALVALIDATOR_H
#define CREDENTIALVALIDATOR_H

#include <QString>

// Ephemeral form input; never persisted by the UI layer.
struct SessionCredentials {
    QString username;
    QString password;
    QString email;
};

struct ValidationResult {
    enum class Field {
        None,
        Username,
        Email,
        Password,
        ConfirmPassword
    };

    bool ok = true;
    Field field = Field::None;
    QString message;

    static ValidationResult valid() { return ValidationResult(); }
    static ValidationResult invalid(Field field, const QString& message) {
        ValidationResult result;
        result.ok = false;
        result.field = field;
        result.message = message;
        return result;
    }
};

enum class PasswordMatchHint {
    Empty,
    Prompt,
    Match,
    Mismatch
};

/**
 * Client-side checks run before any credential reaches the network.
 */
namespace CredentialValidator {

inline constexpr int MIN_USERNAME_LENGTH = 3;
inline constexpr int MAX_USERNAME_LENGTH = 20;
inline constexpr int MIN_PASSWORD_LENGTH = 6;

extern const char* const USERNAME_REQUIRED;
extern const char* const USERNAME_LENGTH;
extern const char* const USERNAME_CHARSET;
extern const char* const EMAIL_REQUIRED;
extern const char* const EMAIL_FORMAT;
extern const char* const PASSWORD_REQUIRED;
extern const char* const PASSWORD_LENGTH;
extern const char* const CONFIRM_REQUIRED;
extern const char* const PASSWORD_MISMATCH;

// Username is expected trimmed by the caller.
ValidationResult validateLogin(const QString& username, const QString& password);
ValidationResult validateRegistration(const SessionCredentials& credentials, const QString& confirmPassword);

bool isValidUsername(const QString& username);
bool isValidEmail(const QString& email);

PasswordMatchHint passwordMatchHint(const QString& password, const QString& confirmPassword);
QString passwordMatchHintText(PasswordMatchHint hint);

} // namespace CredentialValidator

#endif // CREDENTIALVALIDATOR_H
