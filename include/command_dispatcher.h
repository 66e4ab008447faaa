#pragma once

#include "appliance.h"
#include "cloud.h"
#include "credential_resolver.h"
#include "data_structures.h"
#include "discovery.h"
#include "network_range.h"
#include <memory>
#include <variant>
#include <vector>

namespace midea_dehumidifier {

struct DiscoverCommand {
    std::vector<NetworkRange> networks;   // empty: all local ranges
    CloudCredentials credentials;
};

struct StatusCommand {
    ApplianceAddress address;
    AuthInputs auth;
};

struct SetCommand {
    ApplianceAddress address;
    AuthInputs auth;
    StateMutation mutation;
};

using CommandIntent = std::variant<DiscoverCommand, StatusCommand, SetCommand>;

// Throws MissingCredentials when the intent cannot be authenticated at all.
// Needs no backend, so it can run before one is set up.
void check_credentials(const CommandIntent& intent);

class CommandDispatcher {
public:
    // `app` fills in the app key/id of any cloud credentials that leave them empty
    CommandDispatcher(CloudSessionProvider& cloud,
                      DiscoveryService& discovery,
                      ApplianceConnector& connector,
                      const CloudAppConfig& app);

    // Every returned appliance carries a freshly read state
    std::vector<std::unique_ptr<Appliance>> dispatch(const CommandIntent& intent);

    std::vector<std::unique_ptr<Appliance>> discover(const DiscoverCommand& command);
    std::unique_ptr<Appliance> status(const StatusCommand& command);
    std::unique_ptr<Appliance> set(const SetCommand& command);

private:
    CloudCredentials with_app_defaults(const CloudCredentials& credentials) const;
    AuthInputs with_app_defaults(const AuthInputs& inputs) const;

    CloudSessionProvider& cloud_;
    DiscoveryService& discovery_;
    CloudAppConfig app_;
    CredentialResolver resolver_;
};

} // namespace midea_dehumidifier
