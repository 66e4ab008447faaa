#include "cli.h"
#include "errors.h"
#include <map>
#include <optional>
#include <set>

namespace midea_dehumidifier {

namespace {

const std::set<std::string> kAuthOptions = {
    "--ip", "--token", "--key", "--account", "--password", "--appkey", "--appid"};
const std::set<std::string> kSetOptions = {
    "--humidity", "--fan", "--mode", "--ion", "--on"};

bool is_option(const std::string& arg) {
    return arg.size() > 2 && arg.compare(0, 2, "--") == 0;
}

// Collected options of one sub-command
struct RawArgs {
    std::map<std::string, std::string> values;
    std::vector<std::string> networks;
    bool credentials = false;

    std::optional<std::string> get(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    std::string get_or(const std::string& name, const std::string& fallback) const {
        return get(name).value_or(fallback);
    }

    std::string required(const std::string& command, const std::string& name) const {
        auto value = get(name);
        if (!value) throw UsageError(command + ": the following argument is required: " + name);
        return *value;
    }
};

bool accepts(const std::string& command, const std::string& option) {
    if (command == "discover") {
        return option == "--account" || option == "--password" || option == "--appkey" || option == "--appid";
    }
    if (kAuthOptions.count(option)) return true;
    return command == "set" && kSetOptions.count(option);
}

CloudCredentials cloud_credentials(const RawArgs& raw) {
    CloudCredentials credentials;
    credentials.account = raw.get_or("--account", "");
    credentials.password = raw.get_or("--password", "");
    // Left empty when not given; the dispatcher fills in its configured defaults
    credentials.app.app_key = raw.get_or("--appkey", "");
    credentials.app.app_id = raw.get_or("--appid", "");
    return credentials;
}

AuthInputs auth_inputs(const RawArgs& raw) {
    AuthInputs inputs;
    inputs.token = raw.get_or("--token", "");
    inputs.key = raw.get_or("--key", "");
    inputs.cloud = cloud_credentials(raw);
    return inputs;
}

CommandIntent build_intent(const std::string& command, const RawArgs& raw) {
    if (command == "discover") {
        DiscoverCommand discover;
        raw.required(command, "--account");
        raw.required(command, "--password");
        discover.credentials = cloud_credentials(raw);
        for (const auto& network : raw.networks) {
            discover.networks.push_back(NetworkRange::parse(network));
        }
        return discover;
    }

    ApplianceAddress address = ApplianceAddress::parse(raw.required(command, "--ip"));
    if (command == "status") {
        return StatusCommand{address, auth_inputs(raw)};
    }

    SetCommand set{address, auth_inputs(raw), StateMutation{}};
    if (auto value = raw.get("--humidity")) set.mutation.target_humidity = parse_humidity(*value);
    if (auto value = raw.get("--fan")) set.mutation.fan_speed = parse_fan_speed(*value);
    if (auto value = raw.get("--mode")) set.mutation.mode = parse_mode(*value);
    if (auto value = raw.get("--ion")) set.mutation.ion_mode = parse_switch(*value);
    if (auto value = raw.get("--on")) set.mutation.is_on = parse_switch(*value);
    return set;
}

} // namespace

CliOptions parse_command_line(const std::vector<std::string>& args) {
    CliOptions options;
    std::string command;
    RawArgs raw;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inline_value;
        size_t eq = arg.find('=');
        if (is_option(arg) && eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        auto take_value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) throw UsageError("argument " + arg + ": expected one argument");
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--log") {
            options.log_level = parse_log_level(take_value());
        } else if (arg == "--inventory") {
            options.inventory_path = take_value();
        } else if (!is_option(arg)) {
            if (!command.empty()) throw UsageError("unrecognized argument: " + arg);
            if (arg != "discover" && arg != "status" && arg != "set")
                throw UsageError("invalid command: " + arg + " (choose from discover, status, set)");
            command = arg;
        } else if (command.empty()) {
            throw UsageError("unrecognized argument: " + arg);
        } else if (arg == "--credentials") {
            raw.credentials = true;
        } else if (command == "discover" && arg == "--network") {
            if (inline_value) {
                raw.networks.push_back(*inline_value);
                continue;
            }
            size_t before = raw.networks.size();
            while (i + 1 < args.size() && !is_option(args[i + 1])) {
                raw.networks.push_back(args[++i]);
            }
            if (raw.networks.size() == before) throw UsageError("argument --network: expected at least one argument");
        } else if (accepts(command, arg)) {
            raw.values[arg] = take_value();
        } else {
            throw UsageError(command + ": unrecognized argument: " + arg);
        }
    }

    if (options.help) return options;
    if (command.empty()) throw UsageError("a command is required (discover, status, set)");

    options.show_credentials = raw.credentials;
    options.intent = build_intent(command, raw);
    return options;
}

std::string usage_text(const std::string& program) {
    return "Discovers and manages Midea dehumidifiers on local network(s).\n"
           "\n"
           "Usage:\n"
           "  " + program + " [--log LEVEL] [--inventory FILE] discover --account A --password P\n"
           "        [--appkey K] [--appid I] [--credentials] [--network RANGE ...]\n"
           "  " + program + " [--log LEVEL] [--inventory FILE] status --ip ADDR\n"
           "        (--token T --key K | --account A --password P [--appkey K] [--appid I]) [--credentials]\n"
           "  " + program + " [--log LEVEL] [--inventory FILE] set --ip ADDR (auth as for status)\n"
           "        [--humidity H] [--fan F] [--mode M] [--ion on|off] [--on on|off] [--credentials]\n"
           "\n"
           "  --log LEVEL       debug, info, warning, error, critical or a number (default warning)\n"
           "  --inventory FILE  appliance inventory; defaults to $MIDEA_DH_INVENTORY\n"
           "  --fan             low, medium, high, auto or 1-101\n"
           "  --mode            set, continuous, smart, dry or 1-4\n";
}

} // namespace midea_dehumidifier
