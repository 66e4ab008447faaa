#pragma once

#include "appliance.h"
#include "cloud.h"
#include "discovery.h"
#include "errors.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace midea_dehumidifier::test {

// Every collaborator call lands here, in order
struct CallLog {
    std::vector<std::string> events;
    int authenticate_calls = 0;
    int discover_calls = 0;
    int discover_one_calls = 0;
    int connect_calls = 0;
    int read_calls = 0;
    int write_calls = 0;

    int network_calls() const {
        return authenticate_calls + discover_calls + discover_one_calls + read_calls + write_calls;
    }
};

// Device side of a fake appliance
struct FakeDevice {
    ApplianceIdentity identity{"30786325577144", "000000P0000000Q1B88C29C963BA0000"};
    std::string model = "0xA1";
    std::string ssid = "midea_a1_0001";
    ApplianceCredentials credentials{"TOK", "KEY"};
    ApplianceState state{"Basement", 58, 50, 40, false, 1, false, true};
    bool reachable = true;
    bool fail_writes = false;
    bool fail_reads = false;
};

class FakeAppliance : public Appliance {
public:
    FakeAppliance(CallLog& log, std::shared_ptr<FakeDevice> device,
                  const ApplianceAddress& address, const ApplianceCredentials& credentials)
        : Appliance(address, credentials), log_(log), device_(std::move(device)) {}

    // Handle that already knows what it is talking to, as discovery returns it
    FakeAppliance(CallLog& log, std::shared_ptr<FakeDevice> device,
                  const ApplianceAddress& address, const ApplianceIdentity& identity,
                  const ApplianceCredentials& credentials)
        : Appliance(address, identity, device->model, device->ssid, credentials),
          log_(log), device_(std::move(device)) {}

protected:
    ApplianceState read_state() override {
        ++log_.read_calls;
        log_.events.push_back("read");
        check();
        if (device_->fail_reads) throw IOError("read timed out");
        identify(device_->identity, device_->model, device_->ssid);
        return device_->state;
    }

    void write_state(const StateMutation& mutation) override {
        ++log_.write_calls;
        log_.events.push_back("write");
        check();
        if (device_->fail_writes) throw IOError("write rejected");
        device_->state = mutation.applied_to(device_->state);
    }

private:
    void check() {
        if (!device_ || !device_->reachable) throw IOError("unreachable");
        if (device_->credentials.token != credentials().token || device_->credentials.key != credentials().key)
            throw IOError("bad token/key");
    }

    CallLog& log_;
    std::shared_ptr<FakeDevice> device_;
};

// Devices keyed by host
using FakeNetwork = std::map<std::string, std::shared_ptr<FakeDevice>>;

class FakeSession : public CloudSession {
public:
    FakeSession(std::string account, FakeNetwork& network) : account_(std::move(account)), network_(network) {}

    const std::string& account() const override { return account_; }

    std::optional<ApplianceCredentials> appliance_credentials(const std::string& appliance_id) override {
        for (const auto& entry : network_) {
            if (entry.second->identity.id == appliance_id) return entry.second->credentials;
        }
        return std::nullopt;
    }

private:
    std::string account_;
    FakeNetwork& network_;
};

class FakeCloudProvider : public CloudSessionProvider {
public:
    FakeCloudProvider(CallLog& log, FakeNetwork& network) : log_(log), network_(network) {}

    std::unique_ptr<CloudSession> authenticate(const CloudCredentials& credentials) override {
        ++log_.authenticate_calls;
        log_.events.push_back("authenticate");
        last_credentials = credentials;
        if (credentials.account != "acc" || credentials.password != "pw") throw AuthError("bad login");
        return std::make_unique<FakeSession>(credentials.account, network_);
    }

    std::optional<CloudCredentials> last_credentials;

private:
    CallLog& log_;
    FakeNetwork& network_;
};

class FakeDiscovery : public DiscoveryService {
public:
    FakeDiscovery(CallLog& log, FakeNetwork& network) : log_(log), network_(network) {}

    std::vector<std::unique_ptr<Appliance>> discover(const std::vector<NetworkRange>& networks,
                                                     CloudSession& session) override {
        ++log_.discover_calls;
        log_.events.push_back("discover");
        last_network_count = networks.size();
        std::vector<std::unique_ptr<Appliance>> found;
        for (const auto& entry : network_) {
            bool in_range = networks.empty();
            for (const auto& n : networks) in_range = in_range || n.contains(entry.first);
            if (!in_range || !entry.second->reachable) continue;
            auto credentials = session.appliance_credentials(entry.second->identity.id);
            if (!credentials) continue;
            found.push_back(std::make_unique<FakeAppliance>(
                log_, entry.second, ApplianceAddress{entry.first, 6444}, entry.second->identity, *credentials));
        }
        return found;
    }

    std::unique_ptr<Appliance> discover_one(const ApplianceAddress& address, CloudSession& session) override {
        ++log_.discover_one_calls;
        log_.events.push_back("discover_one");
        auto it = network_.find(address.host);
        if (it == network_.end() || !it->second->reachable) throw IOError("nothing at " + address.host);
        auto credentials = session.appliance_credentials(it->second->identity.id);
        if (!credentials) throw AuthError("no credentials");
        return std::make_unique<FakeAppliance>(log_, it->second, address, it->second->identity, *credentials);
    }

    size_t last_network_count = 0;

private:
    CallLog& log_;
    FakeNetwork& network_;
};

class FakeConnector : public ApplianceConnector {
public:
    FakeConnector(CallLog& log, FakeNetwork& network) : log_(log), network_(network) {}

    std::unique_ptr<Appliance> connect(const ApplianceAddress& address,
                                       const ApplianceCredentials& credentials) override {
        ++log_.connect_calls;
        log_.events.push_back("connect");
        auto it = network_.find(address.host);
        std::shared_ptr<FakeDevice> device = it == network_.end() ? nullptr : it->second;
        return std::make_unique<FakeAppliance>(log_, device, address, credentials);
    }

private:
    CallLog& log_;
    FakeNetwork& network_;
};

// Bundles the fakes with their shared log
struct FakeBackend {
    CallLog log;
    FakeNetwork network;
    FakeCloudProvider cloud{log, network};
    FakeDiscovery discovery{log, network};
    FakeConnector connector{log, network};

    FakeBackend() {
        network["10.0.0.5"] = std::make_shared<FakeDevice>();
    }
};

} // namespace midea_dehumidifier::test
