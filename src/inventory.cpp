#include "inventory.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <system_error>
#include <utility>

namespace midea_dehumidifier {

Inventory::Inventory(InventoryData data, std::string path)
    : data_(std::move(data)), path_(std::move(path)) {}

std::shared_ptr<Inventory> Inventory::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw IOError("Cannot open inventory file " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();

    InventoryData data;
    if (!extract_inventory(buffer.str(), data)) {
        Logger::instance().errorf("Failed to extract inventory from %s", path.c_str());
        throw IOError("Invalid inventory file " + path);
    }
    Logger::instance().debugf("Loaded %zu appliance(s) and %zu account(s) from %s",
                              data.appliances.size(), data.accounts.size(), path.c_str());
    return std::make_shared<Inventory>(std::move(data), path);
}

std::optional<AccountRecord> Inventory::find_account(const CloudCredentials& credentials) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(data_.accounts.begin(), data_.accounts.end(), [&](const AccountRecord& a) {
        return a.account == credentials.account && a.password == credentials.password &&
               a.app.app_key == credentials.app.app_key && a.app.app_id == credentials.app.app_id;
    });
    if (it == data_.accounts.end()) return std::nullopt;
    return *it;
}

std::optional<ApplianceRecord> Inventory::find_by_address(const ApplianceAddress& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(data_.appliances.begin(), data_.appliances.end(), [&](const ApplianceRecord& r) {
        return r.address.host == address.host && r.address.port == address.port;
    });
    if (it == data_.appliances.end()) return std::nullopt;
    return *it;
}

std::optional<ApplianceRecord> Inventory::find_by_id(const std::string& appliance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(data_.appliances.begin(), data_.appliances.end(),
                           [&](const ApplianceRecord& r) { return r.identity.id == appliance_id; });
    if (it == data_.appliances.end()) return std::nullopt;
    return *it;
}

std::vector<ApplianceRecord> Inventory::appliances() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.appliances;
}

void Inventory::update_state(const std::string& appliance_id, const StateMutation& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);
    InventoryData updated = data_;
    auto it = std::find_if(updated.appliances.begin(), updated.appliances.end(),
                           [&](const ApplianceRecord& r) { return r.identity.id == appliance_id; });
    if (it == updated.appliances.end()) throw IOError("Unknown appliance " + appliance_id);
    it->state = mutation.applied_to(it->state);

    // Memory only changes once the file holds the new state
    save(updated);
    data_ = std::move(updated);
}

void Inventory::save(const InventoryData& data) const {
    if (path_.empty()) return;

    // Written beside the original and renamed over it, so a failed write
    // never leaves a truncated inventory behind
    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) throw IOError("Cannot write inventory file " + tmp_path);
        out << serialize_inventory(data) << "\n";
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            throw IOError("Failed writing inventory file " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw IOError("Cannot replace inventory file " + path_ + ": " + ec.message());
    }
}

// -------------------------------------------------------------------------------------
// Cloud
// -------------------------------------------------------------------------------------

InventoryCloudSession::InventoryCloudSession(std::shared_ptr<Inventory> inventory, AccountRecord account)
    : inventory_(std::move(inventory)), account_(std::move(account)) {}

std::optional<ApplianceCredentials> InventoryCloudSession::appliance_credentials(const std::string& appliance_id) {
    const auto& owned = account_.appliance_ids;
    if (std::find(owned.begin(), owned.end(), appliance_id) == owned.end()) return std::nullopt;

    std::optional<ApplianceRecord> record = inventory_->find_by_id(appliance_id);
    if (!record || !record->credentials.complete()) return std::nullopt;
    return record->credentials;
}

InventoryCloudProvider::InventoryCloudProvider(std::shared_ptr<Inventory> inventory)
    : inventory_(std::move(inventory)) {}

std::unique_ptr<CloudSession> InventoryCloudProvider::authenticate(const CloudCredentials& credentials) {
    std::optional<AccountRecord> account = inventory_->find_account(credentials);
    if (!account) throw AuthError("Cloud login failed for account " + credentials.account);
    Logger::instance().infof("Cloud login successful for account %s", credentials.account.c_str());
    return std::make_unique<InventoryCloudSession>(inventory_, *account);
}

// -------------------------------------------------------------------------------------
// Appliance
// -------------------------------------------------------------------------------------

InventoryAppliance::InventoryAppliance(std::shared_ptr<Inventory> inventory,
                                       const ApplianceAddress& address,
                                       const ApplianceCredentials& credentials)
    : Appliance(address, credentials), inventory_(std::move(inventory)) {}

InventoryAppliance::InventoryAppliance(std::shared_ptr<Inventory> inventory,
                                       const ApplianceRecord& record,
                                       const ApplianceCredentials& credentials)
    : Appliance(record.address, record.identity, record.model, record.ssid, credentials),
      inventory_(std::move(inventory)) {}

ApplianceRecord InventoryAppliance::contact() {
    std::optional<ApplianceRecord> record = inventory_->find_by_address(address());
    if (!record || !record->reachable) throw IOError("Appliance at " + address().to_string() + " is unreachable");

    if (record->credentials.token != credentials().token || record->credentials.key != credentials().key)
        throw IOError("Appliance at " + address().to_string() + " rejected the token/key");

    identify(record->identity, record->model, record->ssid);
    return *record;
}

ApplianceState InventoryAppliance::read_state() {
    return contact().state;
}

void InventoryAppliance::write_state(const StateMutation& mutation) {
    ApplianceRecord record = contact();
    inventory_->update_state(record.identity.id, mutation);
}

// -------------------------------------------------------------------------------------
// Discovery
// -------------------------------------------------------------------------------------

InventoryDiscovery::InventoryDiscovery(std::shared_ptr<Inventory> inventory)
    : inventory_(std::move(inventory)) {}

std::vector<std::unique_ptr<Appliance>> InventoryDiscovery::discover(const std::vector<NetworkRange>& networks,
                                                                     CloudSession& session) {
    std::vector<ApplianceRecord> candidates;
    for (const auto& record : inventory_->appliances()) {
        bool in_range = networks.empty() ||
            std::any_of(networks.begin(), networks.end(),
                        [&](const NetworkRange& n) { return n.contains(record.address.host); });
        if (in_range) candidates.push_back(record);
    }

    // One probe per candidate address, all in flight at once
    std::vector<std::future<std::optional<ApplianceRecord>>> probes;
    probes.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        probes.push_back(std::async(std::launch::async, [this, candidate]() -> std::optional<ApplianceRecord> {
            std::optional<ApplianceRecord> reply = inventory_->find_by_address(candidate.address);
            if (!reply || !reply->reachable) return std::nullopt;
            return reply;
        }));
    }

    std::vector<std::unique_ptr<Appliance>> found;
    for (auto& probe : probes) {
        std::optional<ApplianceRecord> reply = probe.get();
        if (!reply) continue;

        std::optional<ApplianceCredentials> credentials = session.appliance_credentials(reply->identity.id);
        if (!credentials) {
            Logger::instance().debugf("No cloud credentials for appliance %s at %s, skipping",
                                      reply->identity.id.c_str(), reply->address.to_string().c_str());
            continue;
        }
        found.push_back(std::make_unique<InventoryAppliance>(inventory_, *reply, *credentials));
    }
    return found;
}

std::unique_ptr<Appliance> InventoryDiscovery::discover_one(const ApplianceAddress& address, CloudSession& session) {
    std::optional<ApplianceRecord> reply = inventory_->find_by_address(address);
    if (!reply || !reply->reachable) throw IOError("No appliance responded at " + address.to_string());

    std::optional<ApplianceCredentials> credentials = session.appliance_credentials(reply->identity.id);
    if (!credentials)
        throw AuthError("Account " + session.account() + " has no credentials for appliance " + reply->identity.id);
    return std::make_unique<InventoryAppliance>(inventory_, *reply, *credentials);
}

// -------------------------------------------------------------------------------------
// Direct connection
// -------------------------------------------------------------------------------------

InventoryConnector::InventoryConnector(std::shared_ptr<Inventory> inventory)
    : inventory_(std::move(inventory)) {}

std::unique_ptr<Appliance> InventoryConnector::connect(const ApplianceAddress& address,
                                                       const ApplianceCredentials& credentials) {
    return std::make_unique<InventoryAppliance>(inventory_, address, credentials);
}

} // namespace midea_dehumidifier
