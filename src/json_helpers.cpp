#include "json_helpers.h"
#include "constants.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace midea_dehumidifier {

namespace {

ApplianceState state_from_json(const json& j) {
    ApplianceState state;
    state.name             = j.value("name", std::string());
    state.is_on            = j.value("is_on", false);
    state.current_humidity = j.value("current_humidity", 0);
    state.target_humidity  = j.value("target_humidity", 0);
    state.fan_speed        = j.value("fan_speed", 0);
    state.tank_full        = j.value("tank_full", false);
    state.mode             = j.value("mode", 0);
    state.ion_mode         = j.value("ion_mode", false);
    return state;
}

json state_to_json(const ApplianceState& state) {
    return json{
        {"name", state.name},
        {"is_on", state.is_on},
        {"current_humidity", state.current_humidity},
        {"target_humidity", state.target_humidity},
        {"fan_speed", state.fan_speed},
        {"tank_full", state.tank_full},
        {"mode", state.mode},
        {"ion_mode", state.ion_mode},
    };
}

} // namespace

bool extract_inventory(const std::string& json_str, InventoryData& inventory) {
    try {
        json j = json::parse(json_str);

        if (!j.is_object() || !j.contains("appliances")) {
            return false;
        }

        inventory.accounts.clear();
        inventory.appliances.clear();

        for (const auto& item : j.value("accounts", json::array())) {
            AccountRecord acc;
            acc.account      = item.at("account").get<std::string>();
            acc.password     = item.at("password").get<std::string>();
            acc.app.app_key  = item.value("app_key", std::string(DEFAULT_APP_KEY));
            acc.app.app_id   = item.value("app_id", std::string(DEFAULT_APP_ID));
            acc.appliance_ids = item.value("appliances", std::vector<std::string>());
            inventory.accounts.push_back(acc);
        }

        for (const auto& item : j["appliances"]) {
            ApplianceRecord rec;
            rec.identity.id      = item.at("id").get<std::string>();
            rec.identity.serial  = item.value("sn", std::string());
            rec.model            = item.value("model", std::string());
            rec.ssid             = item.value("ssid", std::string());
            rec.address.host     = item.at("ip").get<std::string>();
            rec.address.port     = item.value("port", DEFAULT_APPLIANCE_PORT);
            rec.credentials.token = item.value("token", std::string());
            rec.credentials.key   = item.value("key", std::string());
            rec.reachable        = item.value("reachable", true);
            rec.state            = state_from_json(item.value("state", json::object()));
            inventory.appliances.push_back(rec);
        }

        return true;
    } catch (const std::exception& e) {
        return false;
    }
}

std::string serialize_inventory(const InventoryData& inventory) {
    json j;
    j["accounts"] = json::array();
    for (const auto& acc : inventory.accounts) {
        j["accounts"].push_back(json{
            {"account", acc.account},
            {"password", acc.password},
            {"app_key", acc.app.app_key},
            {"app_id", acc.app.app_id},
            {"appliances", acc.appliance_ids},
        });
    }
    j["appliances"] = json::array();
    for (const auto& rec : inventory.appliances) {
        j["appliances"].push_back(json{
            {"id", rec.identity.id},
            {"sn", rec.identity.serial},
            {"model", rec.model},
            {"ssid", rec.ssid},
            {"ip", rec.address.host},
            {"port", rec.address.port},
            {"token", rec.credentials.token},
            {"key", rec.credentials.key},
            {"reachable", rec.reachable},
            {"state", state_to_json(rec.state)},
        });
    }
    return j.dump(2);
}

} // namespace midea_dehumidifier
