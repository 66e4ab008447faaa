#pragma once

#include <optional>
#include <string>
#include <vector>

namespace midea_dehumidifier {

// Fan speed presets understood by dehumidifiers
constexpr int FAN_SPEED_LOW    = 40;
constexpr int FAN_SPEED_MEDIUM = 60;
constexpr int FAN_SPEED_HIGH   = 80;
constexpr int FAN_SPEED_AUTO   = 101;

// Dehumidifier operating modes
enum class DehumidifierMode {
    TARGET     = 1,
    CONTINUOUS = 2,
    SMART      = 3,
    DRY        = 4
};

struct ApplianceAddress {
    std::string host;
    int port = 0;

    // "10.0.0.5" or "10.0.0.5:6444"; throws UsageError when malformed
    static ApplianceAddress parse(const std::string& text);
    std::string to_string() const;
};

struct ApplianceIdentity {
    std::string id;
    std::string serial;
};

struct ApplianceCredentials {
    std::string token;
    std::string key;

    bool complete() const { return !token.empty() && !key.empty(); }
};

struct ApplianceState {
    std::string name;
    int current_humidity = 0;
    int target_humidity = 0;
    int fan_speed = 0;
    bool tank_full = false;
    int mode = 0;
    bool ion_mode = false;
    bool is_on = false;

    bool operator==(const ApplianceState& other) const;
    bool operator!=(const ApplianceState& other) const { return !(*this == other); }
    std::string to_string() const;
};

// Partial update of an appliance; absent fields keep their device value
struct StateMutation {
    std::optional<int> target_humidity;
    std::optional<int> fan_speed;
    std::optional<int> mode;
    std::optional<bool> ion_mode;
    std::optional<bool> is_on;

    bool empty() const;
    ApplianceState applied_to(const ApplianceState& state) const;
    std::string to_string() const;
};

struct CloudAppConfig {
    std::string app_key;
    std::string app_id;

    static CloudAppConfig defaults();
};

struct CloudCredentials {
    std::string account;
    std::string password;
    CloudAppConfig app;

    bool usable() const { return !account.empty() && !password.empty(); }
};

// Command line value parsers; all throw UsageError on bad input
int parse_humidity(const std::string& text);
int parse_fan_speed(const std::string& text);
int parse_mode(const std::string& text);
bool parse_switch(const std::string& text);

} // namespace midea_dehumidifier
