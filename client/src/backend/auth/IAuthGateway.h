#ifndef IAUTHGATEWAY_H
#define IAUTHGATEWAY_H

#include <QString>
#include "backend/auth/CredentialValidator.h"
#include "backend/auth/RemoteOperationResult.h"

// Remote account operations used by the login and registration dialogs.
class IAuthGateway {
public:
    virtual ~IAuthGateway() = default;

    virtual void login(const QString& username, const QString& password, const RemoteCallCompletion& completion) = 0;
    virtual void registerAccount(const SessionCredentials& credentials, const RemoteCallCompletion& completion) = 0;
};

#endif // IAUTHGATEWAY_H
