#include "output.h"
#include <sstream>

namespace midea_dehumidifier {

namespace {

const char* bool_str(bool value) {
    return value ? "true" : "false";
}

} // namespace

std::string format_appliance(const Appliance& appliance, bool show_credentials) {
    const ApplianceState& state = appliance.state();
    std::ostringstream out;
    out << "addr=" << appliance.address().to_string() << "\n";
    out << "        id      = " << appliance.identity().id << "\n";
    out << "        s/n     = " << appliance.identity().serial << "\n";
    out << "        model   = " << appliance.model() << "\n";
    out << "        ssid    = " << appliance.ssid() << "\n";
    out << "        online  = " << bool_str(appliance.online()) << "\n";
    out << "        name    = " << state.name << "\n";
    out << "        humid%  = " << state.current_humidity << "\n";
    out << "        target% = " << state.target_humidity << "\n";
    out << "        fan     = " << state.fan_speed << "\n";
    out << "        tank    = " << bool_str(state.tank_full) << "\n";
    out << "        mode    = " << state.mode << "\n";
    out << "        ion     = " << bool_str(state.ion_mode) << "\n";
    out << "        power   = " << bool_str(state.is_on) << "\n";
    if (show_credentials) {
        out << "        token   = " << appliance.credentials().token << "\n";
        out << "        key     = " << appliance.credentials().key << "\n";
    }
    return out.str();
}

void print_appliances(std::ostream& out,
                      const std::vector<std::unique_ptr<Appliance>>& appliances,
                      bool show_credentials) {
    for (const auto& appliance : appliances) {
        out << format_appliance(*appliance, show_credentials);
    }
    out.flush();
}

} // namespace midea_dehumidifier
