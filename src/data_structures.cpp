#include "data_structures.h"
#include "constants.h"
#include "errors.h"
#include <algorithm>
#include <cctype>

namespace midea_dehumidifier {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool parse_int(const std::string& text, int& value) {
    if (text.empty() || text.size() > 9) return false;
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
    value = std::stoi(text);
    return true;
}

std::string bool_str(bool value) {
    return value ? "true" : "false";
}

} // namespace

ApplianceAddress ApplianceAddress::parse(const std::string& text) {
    ApplianceAddress address{text, DEFAULT_APPLIANCE_PORT};
    size_t colon = text.rfind(':');
    if (colon != std::string::npos) {
        address.host = text.substr(0, colon);
        int port = 0;
        if (!parse_int(text.substr(colon + 1), port) || port < 1 || port > 65535)
            throw UsageError("Invalid appliance port in \"" + text + "\"");
        address.port = port;
    }
    if (address.host.empty()) throw UsageError("Appliance address must not be empty");
    return address;
}

std::string ApplianceAddress::to_string() const {
    return host + ":" + std::to_string(port);
}

bool ApplianceState::operator==(const ApplianceState& other) const {
    return name == other.name &&
           current_humidity == other.current_humidity &&
           target_humidity == other.target_humidity &&
           fan_speed == other.fan_speed &&
           tank_full == other.tank_full &&
           mode == other.mode &&
           ion_mode == other.ion_mode &&
           is_on == other.is_on;
}

std::string ApplianceState::to_string() const {
    std::string result;
    result += "{ name: " + name + ", ";
    result += "  is_on: " + bool_str(is_on) + ", ";
    result += "  current_humidity: " + std::to_string(current_humidity) + ", ";
    result += "  target_humidity: " + std::to_string(target_humidity) + ", ";
    result += "  fan_speed: " + std::to_string(fan_speed) + ", ";
    result += "  tank_full: " + bool_str(tank_full) + ", ";
    result += "  mode: " + std::to_string(mode) + ", ";
    result += "  ion_mode: " + bool_str(ion_mode) + " }";
    return result;
}

bool StateMutation::empty() const {
    return !target_humidity && !fan_speed && !mode && !ion_mode && !is_on;
}

ApplianceState StateMutation::applied_to(const ApplianceState& state) const {
    ApplianceState result = state;
    if (target_humidity) result.target_humidity = *target_humidity;
    if (fan_speed) result.fan_speed = *fan_speed;
    if (mode) result.mode = *mode;
    if (ion_mode) result.ion_mode = *ion_mode;
    if (is_on) result.is_on = *is_on;
    return result;
}

std::string StateMutation::to_string() const {
    std::string result;
    auto field = [&result](const std::string& name, const std::string& value) {
        result += result.empty() ? "{ " : ", ";
        result += name + ": " + value;
    };
    if (target_humidity) field("target_humidity", std::to_string(*target_humidity));
    if (fan_speed) field("fan_speed", std::to_string(*fan_speed));
    if (mode) field("mode", std::to_string(*mode));
    if (ion_mode) field("ion_mode", bool_str(*ion_mode));
    if (is_on) field("is_on", bool_str(*is_on));
    return result.empty() ? "{}" : result + " }";
}

CloudAppConfig CloudAppConfig::defaults() {
    return CloudAppConfig{DEFAULT_APP_KEY, DEFAULT_APP_ID};
}

int parse_humidity(const std::string& text) {
    int value = 0;
    if (!parse_int(text, value) || value > 100)
        throw UsageError("Target humidity must be an integer between 0 and 100, got \"" + text + "\"");
    return value;
}

int parse_fan_speed(const std::string& text) {
    std::string name = lower(text);
    if (name == "low") return FAN_SPEED_LOW;
    if (name == "medium" || name == "mid") return FAN_SPEED_MEDIUM;
    if (name == "high") return FAN_SPEED_HIGH;
    if (name == "auto") return FAN_SPEED_AUTO;
    int value = 0;
    if (!parse_int(text, value) || value < 1 || value > FAN_SPEED_AUTO)
        throw UsageError("Fan speed must be low, medium, high, auto or 1-101, got \"" + text + "\"");
    return value;
}

int parse_mode(const std::string& text) {
    std::string name = lower(text);
    if (name == "set" || name == "target") return static_cast<int>(DehumidifierMode::TARGET);
    if (name == "continuous") return static_cast<int>(DehumidifierMode::CONTINUOUS);
    if (name == "smart") return static_cast<int>(DehumidifierMode::SMART);
    if (name == "dry") return static_cast<int>(DehumidifierMode::DRY);
    int value = 0;
    if (!parse_int(text, value) ||
        value < static_cast<int>(DehumidifierMode::TARGET) || value > static_cast<int>(DehumidifierMode::DRY))
        throw UsageError("Mode must be set, continuous, smart, dry or 1-4, got \"" + text + "\"");
    return value;
}

bool parse_switch(const std::string& text) {
    std::string name = lower(text);
    if (name == "on" || name == "true" || name == "yes" || name == "1") return true;
    if (name == "off" || name == "false" || name == "no" || name == "0") return false;
    throw UsageError("Expected on/off, true/false, yes/no or 1/0, got \"" + text + "\"");
}

} // namespace midea_dehumidifier
