#pragma once

#include "appliance.h"
#include "cloud.h"
#include "discovery.h"
#include "json_helpers.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace midea_dehumidifier {

// Appliances and cloud accounts described by a JSON file. Stands in for the
// cloud service and the appliances themselves; the state of an appliance is
// written back to the file whenever it changes.
class Inventory {
public:
    explicit Inventory(InventoryData data, std::string path = "");

    // Throws IOError when the file is missing or not a valid inventory
    static std::shared_ptr<Inventory> load(const std::string& path);

    std::optional<AccountRecord> find_account(const CloudCredentials& credentials) const;
    std::optional<ApplianceRecord> find_by_address(const ApplianceAddress& address) const;
    std::optional<ApplianceRecord> find_by_id(const std::string& appliance_id) const;
    std::vector<ApplianceRecord> appliances() const;

    // Applies the mutation to the stored state and persists the file
    void update_state(const std::string& appliance_id, const StateMutation& mutation);

private:
    // Caller holds mutex_
    void save(const InventoryData& data) const;

    mutable std::mutex mutex_;
    InventoryData data_;
    std::string path_;
};

class InventoryCloudSession : public CloudSession {
public:
    InventoryCloudSession(std::shared_ptr<Inventory> inventory, AccountRecord account);

    const std::string& account() const override { return account_.account; }
    std::optional<ApplianceCredentials> appliance_credentials(const std::string& appliance_id) override;

private:
    std::shared_ptr<Inventory> inventory_;
    AccountRecord account_;
};

class InventoryCloudProvider : public CloudSessionProvider {
public:
    explicit InventoryCloudProvider(std::shared_ptr<Inventory> inventory);

    std::unique_ptr<CloudSession> authenticate(const CloudCredentials& credentials) override;

private:
    std::shared_ptr<Inventory> inventory_;
};

class InventoryAppliance : public Appliance {
public:
    InventoryAppliance(std::shared_ptr<Inventory> inventory,
                       const ApplianceAddress& address,
                       const ApplianceCredentials& credentials);
    InventoryAppliance(std::shared_ptr<Inventory> inventory,
                       const ApplianceRecord& record,
                       const ApplianceCredentials& credentials);

protected:
    ApplianceState read_state() override;
    void write_state(const StateMutation& mutation) override;

private:
    ApplianceRecord contact();

    std::shared_ptr<Inventory> inventory_;
};

class InventoryDiscovery : public DiscoveryService {
public:
    explicit InventoryDiscovery(std::shared_ptr<Inventory> inventory);

    std::vector<std::unique_ptr<Appliance>> discover(const std::vector<NetworkRange>& networks,
                                                     CloudSession& session) override;
    std::unique_ptr<Appliance> discover_one(const ApplianceAddress& address, CloudSession& session) override;

private:
    std::shared_ptr<Inventory> inventory_;
};

class InventoryConnector : public ApplianceConnector {
public:
    explicit InventoryConnector(std::shared_ptr<Inventory> inventory);

    std::unique_ptr<Appliance> connect(const ApplianceAddress& address,
                                       const ApplianceCredentials& credentials) override;

private:
    std::shared_ptr<Inventory> inventory_;
};

} // namespace midea_dehumidifier
