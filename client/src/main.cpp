#include <QApplication>
#include <QDebug>
#include "MainWindow.h"
#include "backend/auth/AuthService.h"
#include "backend/managers/app/SettingsManager.h"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("Projecteur");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Projecteur");
    app.setOrganizationDomain("projecteur.app");

    qRegisterMetaType<RemoteOperationResult>();

    SettingsManager settings;
    settings.loadSettings();

    // One session object for the whole run, handed to every window that needs it
    AuthService authService(settings.getServerUrl());

    MainWindow window(&authService, &settings);
    window.show();
    const int exitCode = app.exec();
    qDebug() << "Projecteur exiting with code" << exitCode;
    return exitCode;
}
