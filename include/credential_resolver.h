#pragma once

#include "appliance.h"
#include "cloud.h"
#include "data_structures.h"
#include "discovery.h"
#include <memory>
#include <string>
#include <variant>

namespace midea_dehumidifier {

// Token/key handed over by the caller, used as-is
struct DirectAuth {
    ApplianceAddress address;
    ApplianceCredentials credentials;
};

// Account credentials to exchange for the appliance's token/key
struct CloudAuth {
    ApplianceAddress address;
    CloudCredentials credentials;
};

using ResolutionRequest = std::variant<DirectAuth, CloudAuth>;

// Everything a caller may supply for one appliance, before deciding which
// resolution path applies
struct AuthInputs {
    std::string token;
    std::string key;
    CloudCredentials cloud;
};

// Picks the resolution path. A non-empty token always wins; a key without a
// token is not enough for direct access and falls through to the cloud.
// Throws MissingCredentials when neither path is usable.
ResolutionRequest make_resolution_request(const ApplianceAddress& address, const AuthInputs& inputs);

class CredentialResolver {
public:
    CredentialResolver(CloudSessionProvider& cloud, DiscoveryService& discovery, ApplianceConnector& connector);

    // At most one cloud authentication per call and no appliance traffic
    // beyond what the discovery probe needs to match the address.
    std::unique_ptr<Appliance> resolve(const ResolutionRequest& request);
    std::unique_ptr<Appliance> resolve(const ApplianceAddress& address, const AuthInputs& inputs);

private:
    std::unique_ptr<Appliance> resolve_direct(const DirectAuth& request);
    std::unique_ptr<Appliance> resolve_via_cloud(const CloudAuth& request);

    CloudSessionProvider& cloud_;
    DiscoveryService& discovery_;
    ApplianceConnector& connector_;
};

} // namespace midea_dehumidifier
