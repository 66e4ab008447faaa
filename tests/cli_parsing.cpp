#include "cli.h"
#include "errors.h"

#include <cassert>
#include <string>
#include <variant>
#include <vector>

using namespace midea_dehumidifier;

namespace {

bool usage_error(const std::vector<std::string>& args) {
    try {
        parse_command_line(args);
    } catch (const UsageError&) {
        return true;
    }
    return false;
}

void discover_command() {
    auto options = parse_command_line({"--log", "debug", "discover", "--account", "acc", "--password", "pw",
                                        "--network", "192.168.1.0/24", "10.0.0.0/8", "--credentials"});
    assert(options.log_level == LogLevel::DEBUG);
    assert(options.show_credentials);
    const auto& discover = std::get<DiscoverCommand>(options.intent);
    assert(discover.credentials.account == "acc");
    assert(discover.credentials.password == "pw");
    assert(discover.credentials.app.app_key.empty());
    assert(discover.networks.size() == 2);
    assert(discover.networks[1].to_string() == "10.0.0.0/8");

    auto no_networks = parse_command_line({"discover", "--account", "acc", "--password", "pw", "--appid", "1018"});
    const auto& all = std::get<DiscoverCommand>(no_networks.intent);
    assert(all.networks.empty());
    assert(all.credentials.app.app_id == "1018");
    assert(!no_networks.show_credentials);

    assert(usage_error({"discover", "--account", "acc"}));
    assert(usage_error({"discover", "--account", "acc", "--password", "pw", "--network"}));
    assert(usage_error({"discover", "--account", "acc", "--password", "pw", "--network", "300.0.0.0/8"}));
    assert(usage_error({"discover", "--account", "acc", "--password", "pw", "--ip", "10.0.0.5"}));
}

void status_command() {
    auto options = parse_command_line({"status", "--ip", "10.0.0.5", "--token", "", "--key", "",
                                       "--account", "acc", "--password", "pw"});
    const auto& status = std::get<StatusCommand>(options.intent);
    assert(status.address.host == "10.0.0.5");
    assert(status.address.port == 6444);
    assert(status.auth.token.empty());
    assert(status.auth.cloud.account == "acc");

    auto bare = parse_command_line({"status", "--ip=10.0.0.5:7000", "--token=T", "--key=K"});
    const auto& direct = std::get<StatusCommand>(bare.intent);
    assert(direct.address.port == 7000);
    assert(direct.auth.token == "T");
    assert(direct.auth.key == "K");
    assert(direct.auth.cloud.account.empty());

    assert(usage_error({"status"}));
    assert(usage_error({"status", "--ip"}));
    assert(usage_error({"status", "--ip", "10.0.0.5", "--humidity", "50"}));
}

void set_command() {
    auto options = parse_command_line({"set", "--ip", "10.0.0.5", "--token", "TOK", "--key", "KEY",
                                       "--humidity", "55", "--fan", "high", "--on", "off"});
    const auto& set = std::get<SetCommand>(options.intent);
    assert(set.auth.token == "TOK");
    assert(set.mutation.target_humidity == 55);
    assert(set.mutation.fan_speed == FAN_SPEED_HIGH);
    assert(set.mutation.is_on == false);
    assert(!set.mutation.mode);
    assert(!set.mutation.ion_mode);

    assert(usage_error({"set", "--ip", "10.0.0.5", "--humidity", "150"}));
    assert(usage_error({"set", "--ip", "10.0.0.5", "--ion", "sometimes"}));
}

void global_options() {
    auto help = parse_command_line({"--help"});
    assert(help.help);

    auto inventory = parse_command_line({"status", "--ip", "10.0.0.5", "--inventory", "/tmp/inv.json"});
    assert(inventory.inventory_path == "/tmp/inv.json");
    assert(inventory.log_level == LogLevel::WARNING);

    assert(usage_error({}));
    assert(usage_error({"reboot"}));
    assert(usage_error({"--log", "chatty", "status", "--ip", "10.0.0.5"}));
    assert(usage_error({"--account", "acc", "discover"}));
    assert(usage_error({"status", "--ip", "10.0.0.5", "extra"}));

    assert(usage_text("midea-dehumidifier").find("discover --account") != std::string::npos);
}

}  // namespace

int main() {
    discover_command();
    status_command();
    set_command();
    global_options();
    return 0;
}
