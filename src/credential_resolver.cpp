#include "credential_resolver.h"
#include "errors.h"
#include "logger.h"

namespace midea_dehumidifier {

ResolutionRequest make_resolution_request(const ApplianceAddress& address, const AuthInputs& inputs) {
    if (address.host.empty()) throw UsageError("Appliance address must not be empty");

    if (!inputs.token.empty()) {
        return DirectAuth{address, ApplianceCredentials{inputs.token, inputs.key}};
    }
    if (!inputs.key.empty()) {
        Logger::instance().warning("Appliance key given without a token, ignoring it");
    }
    if (inputs.cloud.usable()) {
        return CloudAuth{address, inputs.cloud};
    }
    throw MissingCredentials("Missing token/key or cloud credentials");
}

CredentialResolver::CredentialResolver(CloudSessionProvider& cloud,
                                       DiscoveryService& discovery,
                                       ApplianceConnector& connector)
    : cloud_(cloud), discovery_(discovery), connector_(connector) {}

std::unique_ptr<Appliance> CredentialResolver::resolve(const ResolutionRequest& request) {
    if (const auto* direct = std::get_if<DirectAuth>(&request)) {
        return resolve_direct(*direct);
    }
    return resolve_via_cloud(std::get<CloudAuth>(request));
}

std::unique_ptr<Appliance> CredentialResolver::resolve(const ApplianceAddress& address, const AuthInputs& inputs) {
    return resolve(make_resolution_request(address, inputs));
}

std::unique_ptr<Appliance> CredentialResolver::resolve_direct(const DirectAuth& request) {
    Logger::instance().debugf("Using supplied token/key for %s", request.address.to_string().c_str());
    std::unique_ptr<Appliance> appliance = connector_.connect(request.address, request.credentials);
    if (!appliance) throw IOError("Cannot connect to appliance at " + request.address.to_string());
    return appliance;
}

std::unique_ptr<Appliance> CredentialResolver::resolve_via_cloud(const CloudAuth& request) {
    Logger::instance().infof("Resolving credentials for %s through cloud account %s",
                             request.address.to_string().c_str(), request.credentials.account.c_str());

    // Session is dropped when this returns; nothing is cached between commands
    std::unique_ptr<CloudSession> session = cloud_.authenticate(request.credentials);
    if (!session) throw AuthError("Cloud login failed for account " + request.credentials.account);

    std::unique_ptr<Appliance> appliance = discovery_.discover_one(request.address, *session);
    if (!appliance) throw IOError("No appliance found at " + request.address.to_string());
    if (!appliance->credentials().complete())
        throw AuthError("Cloud returned no token/key for appliance at " + request.address.to_string());
    return appliance;
}

} // namespace midea_dehumidifier
