#include <QApplication>
#include <QNetworkProxyFactory>
#include <QSettings>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <gtest/gtest.h>
#include "backend/auth/RemoteOperationResult.h"

int main(int argc, char** argv) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QStandardPaths::setTestModeEnabled(true);

    QApplication app(argc, argv);
    app.setApplicationName("ProjecteurTests");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Projecteur");
    qRegisterMetaType<RemoteOperationResult>();

    // Keep QSettings writes away from the user's real configuration
    QTemporaryDir settingsDir;
    QSettings::setDefaultFormat(QSettings::IniFormat);
    QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, settingsDir.path());
    QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, settingsDir.path());

    // Loopback test servers must not be routed through an environment proxy
    QNetworkProxyFactory::setUseSystemConfiguration(false);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
