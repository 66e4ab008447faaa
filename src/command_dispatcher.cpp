#include "command_dispatcher.h"
#include "errors.h"
#include "logger.h"
#include <utility>

namespace midea_dehumidifier {

void check_credentials(const CommandIntent& intent) {
    if (const auto* discover_cmd = std::get_if<DiscoverCommand>(&intent)) {
        // Per-device keys only come from the cloud catalog, so no session, no discovery
        if (!discover_cmd->credentials.usable())
            throw MissingCredentials("Discovery requires cloud account and password");
        return;
    }

    const AuthInputs& auth = std::holds_alternative<StatusCommand>(intent)
        ? std::get<StatusCommand>(intent).auth
        : std::get<SetCommand>(intent).auth;
    if (auth.token.empty() && !auth.cloud.usable())
        throw MissingCredentials("Missing token/key or cloud credentials");
}

CommandDispatcher::CommandDispatcher(CloudSessionProvider& cloud,
                                     DiscoveryService& discovery,
                                     ApplianceConnector& connector,
                                     const CloudAppConfig& app)
    : cloud_(cloud), discovery_(discovery), app_(app), resolver_(cloud, discovery, connector) {}

std::vector<std::unique_ptr<Appliance>> CommandDispatcher::dispatch(const CommandIntent& intent) {
    if (const auto* discover_cmd = std::get_if<DiscoverCommand>(&intent)) {
        return discover(*discover_cmd);
    }

    std::vector<std::unique_ptr<Appliance>> result;
    if (const auto* status_cmd = std::get_if<StatusCommand>(&intent)) {
        result.push_back(status(*status_cmd));
    } else {
        result.push_back(set(std::get<SetCommand>(intent)));
    }
    return result;
}

std::vector<std::unique_ptr<Appliance>> CommandDispatcher::discover(const DiscoverCommand& command) {
    check_credentials(command);

    std::unique_ptr<CloudSession> session = cloud_.authenticate(with_app_defaults(command.credentials));
    if (!session) throw AuthError("Cloud login failed for account " + command.credentials.account);

    if (command.networks.empty()) {
        Logger::instance().info("Discovering appliances on all local networks");
    } else {
        for (const auto& network : command.networks) {
            Logger::instance().infof("Discovering appliances on %s", network.to_string().c_str());
        }
    }

    std::vector<std::unique_ptr<Appliance>> found = discovery_.discover(command.networks, *session);
    std::vector<std::unique_ptr<Appliance>> ready;
    ready.reserve(found.size());
    for (auto& appliance : found) {
        if (!appliance || !appliance->credentials().complete()) continue;
        try {
            appliance->refresh();
        } catch (const IOError& e) {
            Logger::instance().warningf("Dropping %s: %s", appliance->address().to_string().c_str(), e.what());
            continue;
        }
        ready.push_back(std::move(appliance));
    }
    Logger::instance().infof("Discovered %zu appliance(s)", ready.size());
    return ready;
}

std::unique_ptr<Appliance> CommandDispatcher::status(const StatusCommand& command) {
    std::unique_ptr<Appliance> appliance = resolver_.resolve(command.address, with_app_defaults(command.auth));
    appliance->refresh();
    return appliance;
}

std::unique_ptr<Appliance> CommandDispatcher::set(const SetCommand& command) {
    std::unique_ptr<Appliance> appliance = resolver_.resolve(command.address, with_app_defaults(command.auth));
    if (command.mutation.empty()) {
        Logger::instance().warning("No settings given, reading state only");
    } else {
        try {
            appliance->apply(command.mutation);
        } catch (const IOError& e) {
            // No rollback. The device is re-read so the log shows whatever part
            // of the update it took, and the failure still ends the command.
            Logger::instance().errorf("Update of %s failed: %s",
                                      appliance->address().to_string().c_str(), e.what());
            try {
                appliance->refresh();
                Logger::instance().warningf("State of %s after failed update: %s",
                                            appliance->address().to_string().c_str(),
                                            appliance->state().to_string().c_str());
            } catch (const IOError& reread) {
                Logger::instance().warningf("Could not re-read %s: %s",
                                            appliance->address().to_string().c_str(), reread.what());
            }
            throw;
        }
    }
    appliance->refresh();
    return appliance;
}

CloudCredentials CommandDispatcher::with_app_defaults(const CloudCredentials& credentials) const {
    CloudCredentials result = credentials;
    if (result.app.app_key.empty()) result.app.app_key = app_.app_key;
    if (result.app.app_id.empty()) result.app.app_id = app_.app_id;
    return result;
}

AuthInputs CommandDispatcher::with_app_defaults(const AuthInputs& inputs) const {
    AuthInputs result = inputs;
    result.cloud = with_app_defaults(inputs.cloud);
    return result;
}

} // namespace midea_dehumidifier
