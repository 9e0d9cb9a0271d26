#include "frontend/ui/dialogs/LoginDialog.h"
#include "backend/auth/CredentialValidator.h"
#include "TestSupport.h"
#include <QLineEdit>
#include <QPushButton>
#include <QSignalSpy>
#include <gtest/gtest.h>

using State = AuthDialogBase::DialogState;

namespace {
void fillIn(LoginDialog& dialog, const QString& username, const QString& password) {
    dialog.usernameEdit()->setText(username);
    dialog.passwordEdit()->setText(password);
}

bool controlsEnabled(const LoginDialog& dialog) {
    return dialog.usernameEdit()->isEnabled() && dialog.passwordEdit()->isEnabled()
        && dialog.loginButton()->isEnabled() && dialog.registerButton()->isEnabled();
}
}

TEST(LoginDialogTest, EmptyUsernameNeverReachesGateway) {
    FakeAuthGateway gateway;
    LoginDialog dialog(&gateway);
    fillIn(dialog, "   ", "secret1");

    dialog.submit();

    EXPECT_EQ(gateway.loginCalls, 0);
    EXPECT_EQ(dialog.statusText(), QString(CredentialValidator::USERNAME_REQUIRED));
    EXPECT_EQ(dialog.statusTone(), AuthDialogBase::StatusTone::Error);
    EXPECT_EQ(dialog.dialogState(), State::Idle);
    EXPECT_TRUE(controlsEnabled(dialog));
}

TEST(LoginDialogTest, EmptyPasswordNeverReachesGateway) {
    FakeAuthGateway gateway;
    LoginDialog dialog(&gateway);
    fillIn(dialog, "alice", "");

    dialog.submit();

    EXPECT_EQ(gateway.loginCalls, 0);
    EXPECT_EQ(dialog.statusText(), QString(CredentialValidator::PASSWORD_REQUIRED));
}

TEST(LoginDialogTest, ControlsDisabledWhileSubmitting) {
    FakeAuthGateway gateway;
    gateway.mode = FakeAuthGateway::Mode::Never;
    LoginDialog dialog(&gateway);
    fillIn(dialog, "  alice ", "secret1");

    dialog.submit();

    EXPECT_EQ(gateway.loginCalls, 1);
    EXPECT_EQ(gateway.lastUsername, QString("alice"));
    EXPECT_EQ(gateway.lastPassword, QString("secret1"));
    EXPECT_TRUE(dialog.isSubmitting());
    EXPECT_FALSE(dialog.loginButton()->isEnabled());
    EXPECT_FALSE(dialog.usernameEdit()->isEnabled());
    EXPECT_EQ(dialog.statusText(), QString("Logging in..."));

    // A second click while in flight is ignored
    dialog.submit();
    EXPECT_EQ(gateway.loginCalls, 1);
}

TEST(LoginDialogTest, ServerRejectionShowsMessageAndReenables) {
    FakeAuthGateway gateway;
    gateway.outcome = RemoteCallOutcome::reply(false, "Invalid username or password");
    LoginDialog dialog(&gateway);
    QSignalSpy shown(&dialog, &AuthDialogBase::resultShown);
    fillIn(dialog, "alice", "wrong1");

    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return shown.count() == 1; }));

    EXPECT_EQ(dialog.dialogState(), State::Failed);
    EXPECT_EQ(dialog.statusText(), QString("Invalid username or password"));
    EXPECT_EQ(dialog.statusTone(), AuthDialogBase::StatusTone::Error);
    EXPECT_TRUE(controlsEnabled(dialog));
    EXPECT_TRUE(dialog.loggedInUsername().isEmpty());

    // The user can retry right away
    gateway.outcome = RemoteCallOutcome::reply(true, "ok");
    dialog.submit();
    EXPECT_EQ(gateway.loginCalls, 2);
}

TEST(LoginDialogTest, SuccessClosesAfterDelay) {
    FakeAuthGateway gateway;
    gateway.outcome = RemoteCallOutcome::reply(true, "Login successful!");
    gateway.delayMs = 200;
    LoginDialog dialog(&gateway);
    dialog.setTimeoutMs(60000);
    dialog.setCloseDelayMs(50);
    QSignalSpy accepted(&dialog, &QDialog::accepted);
    fillIn(dialog, "alice", "secret1");

    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.dialogState() == State::Succeeded; }));

    EXPECT_EQ(dialog.statusText(), QString("Login successful!"));
    EXPECT_EQ(dialog.statusTone(), AuthDialogBase::StatusTone::Success);
    EXPECT_TRUE(controlsEnabled(dialog));
    EXPECT_EQ(dialog.loggedInUsername(), QString("alice"));
    EXPECT_EQ(accepted.count(), 0);

    ASSERT_TRUE(waitUntil([&] { return accepted.count() == 1; }));
    EXPECT_EQ(dialog.result(), QDialog::Accepted);
    EXPECT_EQ(dialog.dialogState(), State::Closing);

    dialog.submit();
    EXPECT_EQ(gateway.loginCalls, 1);
}

TEST(LoginDialogTest, DefaultCloseDelayIsOneSecond) {
    FakeAuthGateway gateway;
    LoginDialog dialog(&gateway);
    EXPECT_EQ(dialog.closeDelayMs(), 1000);
    EXPECT_EQ(dialog.timeoutMs(), 60000);
}

TEST(LoginDialogTest, TimeoutShowsMessageAndIgnoresLateReply) {
    FakeAuthGateway gateway;
    gateway.outcome = RemoteCallOutcome::reply(true, "too late");
    gateway.delayMs = 300;
    LoginDialog dialog(&gateway);
    dialog.setTimeoutMs(30);
    QSignalSpy shown(&dialog, &AuthDialogBase::resultShown);
    fillIn(dialog, "alice", "secret1");

    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return shown.count() == 1; }));

    EXPECT_EQ(dialog.dialogState(), State::TimedOut);
    EXPECT_EQ(dialog.statusText(), AuthDialogBase::timeoutMessage());
    EXPECT_TRUE(controlsEnabled(dialog));

    spinFor(400);
    EXPECT_EQ(shown.count(), 1);
    EXPECT_EQ(dialog.dialogState(), State::TimedOut);
    EXPECT_EQ(dialog.statusText(), AuthDialogBase::timeoutMessage());
    EXPECT_TRUE(dialog.loggedInUsername().isEmpty());
}

TEST(LoginDialogTest, UnresponsiveGatewayTimesOut) {
    FakeAuthGateway gateway;
    gateway.mode = FakeAuthGateway::Mode::Never;
    LoginDialog dialog(&gateway);
    dialog.setTimeoutMs(20);
    fillIn(dialog, "alice", "secret1");

    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.dialogState() == State::TimedOut; }));
    EXPECT_TRUE(dialog.loginButton()->isEnabled());
}

TEST(LoginDialogTest, ThrowingGatewayShowsLoginError) {
    FakeAuthGateway gateway;
    gateway.mode = FakeAuthGateway::Mode::Throw;
    LoginDialog dialog(&gateway);
    fillIn(dialog, "alice", "secret1");

    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.dialogState() == State::Errored; }));

    EXPECT_EQ(dialog.statusText(), QString("Login error: gateway exploded"));
    EXPECT_TRUE(controlsEnabled(dialog));
}

TEST(LoginDialogTest, TransportAndCancelledErrorsHaveFixedTexts) {
    FakeAuthGateway gateway;
    LoginDialog dialog(&gateway);
    fillIn(dialog, "alice", "secret1");

    gateway.outcome = RemoteCallOutcome::failed(RemoteErrorKind::Transport, "Connection refused");
    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.dialogState() == State::Errored; }));
    EXPECT_EQ(dialog.statusText(), AuthDialogBase::transportMessage());

    gateway.outcome = RemoteCallOutcome::failed(RemoteErrorKind::Cancelled, "Operation canceled");
    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.statusText() == AuthDialogBase::cancelledMessage(); }));
    EXPECT_EQ(dialog.dialogState(), State::Errored);

    gateway.outcome = RemoteCallOutcome::failed(RemoteErrorKind::Unexpected, "bad state");
    dialog.submit();
    ASSERT_TRUE(waitUntil([&] { return dialog.statusText() == QString("Login error: bad state"); }));
    EXPECT_TRUE(controlsEnabled(dialog));
}

TEST(LoginDialogTest, MissingGatewayReportsError) {
    LoginDialog dialog(nullptr);
    fillIn(dialog, "alice", "secret1");

    dialog.submit();

    EXPECT_EQ(dialog.dialogState(), State::Errored);
    EXPECT_TRUE(dialog.statusText().startsWith("Login error:"));
    EXPECT_TRUE(controlsEnabled(dialog));
}
