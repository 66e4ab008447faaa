#pragma once

#include "data_structures.h"
#include <string>
#include <vector>

namespace midea_dehumidifier {

struct AccountRecord {
    std::string account;
    std::string password;
    CloudAppConfig app;
    std::vector<std::string> appliance_ids;
};

struct ApplianceRecord {
    ApplianceIdentity identity;
    std::string model;
    std::string ssid;
    ApplianceAddress address;
    ApplianceCredentials credentials;
    bool reachable = true;
    ApplianceState state;
};

struct InventoryData {
    std::vector<AccountRecord> accounts;
    std::vector<ApplianceRecord> appliances;
};

// Extract accounts and appliances from an inventory JSON document
bool extract_inventory(const std::string& json_str, InventoryData& inventory);

std::string serialize_inventory(const InventoryData& inventory);

} // namespace midea_dehumidifier
