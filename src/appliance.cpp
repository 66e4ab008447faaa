#include "appliance.h"
#include "errors.h"
#include "logger.h"

namespace midea_dehumidifier {

Appliance::Appliance(const ApplianceAddress& address, const ApplianceCredentials& credentials)
    : address_(address), credentials_(credentials), identified_(false), online_(false) {}

Appliance::Appliance(const ApplianceAddress& address,
                     const ApplianceIdentity& identity,
                     const std::string& model,
                     const std::string& ssid,
                     const ApplianceCredentials& credentials)
    : address_(address), identity_(identity), model_(model), ssid_(ssid),
      credentials_(credentials), identified_(true), online_(false) {}

void Appliance::refresh() {
    Logger::instance().debugf("Reading state of %s", address_.to_string().c_str());
    try {
        state_ = read_state();
    } catch (const IOError&) {
        online_ = false;
        throw;
    }
    online_ = true;
    Logger::instance().debugf("State of %s: %s", address_.to_string().c_str(), state_.to_string().c_str());
}

void Appliance::apply(const StateMutation& mutation) {
    Logger::instance().infof("Updating %s with %s", address_.to_string().c_str(), mutation.to_string().c_str());
    write_state(mutation);
}

void Appliance::identify(const ApplianceIdentity& identity, const std::string& model, const std::string& ssid) {
    if (identified_) return;
    identity_ = identity;
    model_ = model;
    ssid_ = ssid;
    identified_ = true;
}

} // namespace midea_dehumidifier
