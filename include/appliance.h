#pragma once

#include "data_structures.h"
#include <string>

namespace midea_dehumidifier {

// One physical dehumidifier. Concrete subclasses implement the wire protocol
// in read_state()/write_state(); this class owns the cached snapshot.
class Appliance {
public:
    Appliance(const ApplianceAddress& address, const ApplianceCredentials& credentials);
    Appliance(const ApplianceAddress& address,
              const ApplianceIdentity& identity,
              const std::string& model,
              const std::string& ssid,
              const ApplianceCredentials& credentials);
    virtual ~Appliance() = default;

    Appliance(const Appliance&) = delete;
    Appliance& operator=(const Appliance&) = delete;

    const ApplianceAddress& address() const { return address_; }
    const ApplianceIdentity& identity() const { return identity_; }
    const std::string& model() const { return model_; }
    const std::string& ssid() const { return ssid_; }
    const ApplianceCredentials& credentials() const { return credentials_; }
    bool online() const { return online_; }
    const ApplianceState& state() const { return state_; }

    // Reads the live state from the device and replaces the snapshot.
    // On failure the appliance is marked offline and IOError propagates.
    void refresh();

    // Sends a partial update. The snapshot is left untouched; call refresh()
    // to see what the device accepted.
    void apply(const StateMutation& mutation);

protected:
    virtual ApplianceState read_state() = 0;
    virtual void write_state(const StateMutation& mutation) = 0;

    // Fills identity for handles built from bare credentials; the first
    // successful contact wins and later calls are ignored.
    void identify(const ApplianceIdentity& identity, const std::string& model, const std::string& ssid);

private:
    ApplianceAddress address_;
    ApplianceIdentity identity_;
    std::string model_;
    std::string ssid_;
    ApplianceCredentials credentials_;
    bool identified_;
    bool online_;
    ApplianceState state_;
};

} // namespace midea_dehumidifier
