#include "frontend/ui/dialogs/RegisterDialog.h"
#include "TestSupport.h"
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSignalSpy>
#include <gtest/gtest.h>

using State = AuthDialogBase::DialogState;

namespace {
void fillIn(RegisterDialog& dialog, const QString& username, const QString& email,
            const QString& password, const QString& confirm) {
    dialog.usernameEdit()->setText(username);
    dialog.emailEdit()->setText(email);
    dialog.passwordEdit()->setText(password);
    dialog.confirmEdit()->setText(confirm);
}
}

TEST(RegisterDialogTest, ShortUsernameIsRejectedLocally) {
    FakeAuthGateway gateway;
    RegisterDialog dialog(&gateway);
    fillIn(dialog, "ab", "ab@example.com", "secret1", "secret1");

    dialog.submit();

    EXPECT_EQ(gateway.registerCalls, 0);
    EXPECT_EQ(dialog.statusText(), QString(CredentialValidator::USERNAME_LENGTH));
    EXPECT_EQ(dialog.statusTone(), AuthDialogBase::StatusTone::Error);
    EXPECT_TRUE(dialog.submitButton()->isEnabled());
}

TEST(RegisterDialogTest, BadEmailIsRejectedLocally) {
    FakeAuthGateway gateway;
    RegisterDialog dialog(&gateway);
    fillIn(dialog, "valid_1", "not-an-email", "secret1", "secret1");

    dialog.submit();

    EXPECT_EQ(gateway.registerCalls, 0);
    EXPECT_EQ(dialog.statusText(), QString(CredentialValidator::EMAIL_FORMAT));
}

TEST(RegisterDialogTest, MismatchedConfirmationIsCleared) {
    FakeAuthGateway gateway;
    RegisterDialog dialog(&gateway);
    fillIn(dialog, "valid_1", "v@example.com", "secret1", "secret2");

    dialog.submit();

    EXPECT_EQ(gateway.registerCalls, 0);
    EXPECT_EQ(dialog.statusText(), QString(CredentialValidator::PASSWORD_MISMATCH));
    EXPECT_TRUE(dialog.confirmEdit()->text().isEmpty());
    EXPECT_EQ(dialog.passwordEdit()->text(), QString("secret1"));
}

TEST(RegisterDialogTest, HintFollowsTyping) {
    FakeAuthGateway gateway;
    RegisterDialog dialog(&gateway);
    EXPECT_EQ(dialog.currentHint(), PasswordMatchHint::Empty);
    EXPECT_TRUE(dialog.passwordHintLabel()->text().isEmpty());

    dialog.passwordEdit()->setText("secret1");
    EXPECT_EQ(dialog.currentHint(), PasswordMatchHint::Prompt);

    dialog.confirmEdit()->setText("secret");
    EXPECT_EQ(dialog.currentHint(), PasswordMatchHint::Mismatch);
    EXPECT_EQ(dialog.passwordHintLabel()->text(), CredentialValidator::passwordMatchHintText(PasswordMatchHint::Mismatch));

    dialog.confirmEdit()->setText("secret1");
    EXPECT_EQ(dialog.currentHint(), PasswordMatchHint::Match);
    EXPECT_EQ(dialog.passwordHintLabel()->text(), CredentialValidator::passwordMatchHintText(PasswordMatchHint::Match));

    dialog.passwordEdit()->clear();
    EXPECT_EQ(dialog.currentHint(), PasswordMatchHint::Mismatch);
}

TEST(RegisterDialogTest, HintUsesStatusColours) {
    FakeAuthGateway gateway;
    RegisterDialog dialog(&gateway);
    EXPECT_EQ(dialog.passwordHintLabel()->styleSheet(), AuthDialogBase::styleSheetFor(AuthDialogBase::StatusTone::Neutral));

    dialog.passwordEdit()->setText("secret1");
    dialog.confirmEdit()->setText("secret");
    EXPECT_EQ(dialog.passwordHintLabel()->styleSheet(), AuthDialogBase::styleSheetFor(AuthDialogBase::StatusTone::Error));

    dialog.confirmEdit()->setText("secret1");
    EXPECT_EQ(dialog.passwordHintLabel()->styleSheet(), AuthDialogBase::styleSheetFor(AuthDialogBase::StatusTone::Success));
}

TEST(RegisterDialogTest, GatewayReceivesTrimmedCredentials) {
    FakeAuthGateway gateway;
    gateway.mode = FakeAuthGateway::Mode::Never;
    RegisterDialog dialog(&gateway);
    fillIn(dialog, "  valid_1 ", " v@example.com  ", " secret1", " secret1");

    dialog.submit();

    ASSERT_EQ(gateway.registerCalls, 1);
    EXPECT_EQ(gateway.lastCredentials.username, QString("valid_1"));
    EXPECT_EQ(gateway.lastCredentials.email, QString("v@example.com"));
    // Passwords are sent exactly as typed
    EXPECT_EQ(gateway.lastCredentials.password, QString(" secret1"));
    EXPECT_EQ(dialog.statusText(), QString("Registering..."));
    EXPECT_FALSE(dialog.submitButton()->isEnabled());
    EXPECT_FALSE(dialog.emailEdit()->isEnabled());
}

TEST(RegisterDialogTest, ServerRejectionKeepsDialogOpen) {
    FakeAuthGateway gateway;
    gateway.outcome = RemoteCallOutcome::reply(false, "user exists");
    RegisterDialog dialog(&gateway);
    QSignalSpy accepted(&dialog, &QDialog::accepted);
    fillIn(dialog, "valid_1", "v@example.com", "secret1", "secret1");

    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.dialogState() == State::Failed; }));

    EXPECT_EQ(dialog.statusText(), QString("user exists"));
    EXPECT_TRUE(dialog.submitButton()->isEnabled());
    EXPECT_TRUE(dialog.usernameEdit()->isEnabled());
    EXPECT_TRUE(dialog.registeredUsername().isEmpty());

    spinFor(100);
    EXPECT_EQ(accepted.count(), 0);
}

TEST(RegisterDialogTest, SuccessClosesAfterDelay) {
    FakeAuthGateway gateway;
    gateway.outcome = RemoteCallOutcome::reply(true, "Registration successful!");
    gateway.delayMs = 200;
    RegisterDialog dialog(&gateway);
    EXPECT_EQ(dialog.closeDelayMs(), 2000);
    dialog.setCloseDelayMs(50);
    QSignalSpy accepted(&dialog, &QDialog::accepted);
    fillIn(dialog, "valid_1", "v@example.com", "secret1", "secret1");

    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.dialogState() == State::Succeeded; }));
    EXPECT_EQ(dialog.statusText(), QString("Registration successful!"));
    EXPECT_EQ(dialog.registeredUsername(), QString("valid_1"));
    EXPECT_TRUE(dialog.submitButton()->isEnabled());

    ASSERT_TRUE(waitUntil([&] { return accepted.count() == 1; }));
    EXPECT_EQ(dialog.result(), QDialog::Accepted);
}

TEST(RegisterDialogTest, ThrowingGatewayShowsRegistrationError) {
    FakeAuthGateway gateway;
    gateway.mode = FakeAuthGateway::Mode::Throw;
    RegisterDialog dialog(&gateway);
    fillIn(dialog, "valid_1", "v@example.com", "secret1", "secret1");

    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.dialogState() == State::Errored; }));
    EXPECT_EQ(dialog.statusText(), QString("Registration error: gateway exploded"));
    EXPECT_TRUE(dialog.submitButton()->isEnabled());
}
