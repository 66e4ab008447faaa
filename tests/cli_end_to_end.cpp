#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <sys/wait.h>

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

// Captures stdout only; stderr carries the log and goes to /dev/null unless asked for
CommandResult run_cli(const std::string& executable, const std::string& arguments, bool with_stderr = false,
                      const std::string& env_prefix = "") {
    const std::string command = env_prefix + "\"" + executable + "\" " + arguments + (with_stderr ? " 2>&1" : " 2>/dev/null");
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::filesystem::path write_inventory() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() / ("midea-dh-cli-" + std::to_string(stamp) + ".json");
    std::ofstream out(path);
    out << R"({
  "accounts": [{"account": "acc", "password": "pw", "appliances": ["30786325577144"]}],
  "appliances": [
    {"id": "30786325577144", "sn": "SN-BASEMENT", "model": "0xA1", "ssid": "midea_a1_0001",
     "ip": "10.0.0.5", "token": "TOK", "key": "KEY",
     "state": {"name": "Basement", "is_on": true, "current_humidity": 58, "target_humidity": 50,
               "fan_speed": 40, "tank_full": false, "mode": 1, "ion_mode": false}}
  ]
})";
    return path;
}

int fail(const std::string& step, const CommandResult& result) {
    std::cerr << "Failure on " << step << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
    return 1;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("MIDEA_DH_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "MIDEA_DH_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }

    const std::string executable = std::filesystem::path(executable_env).string();
    const auto inventory = write_inventory();
    const std::string inv = "--inventory \"" + inventory.string() + "\" ";

    try {
        const auto help = run_cli(executable, "--help");
        if (help.exit_code != 0 || !expect_contains(help.output, "discover --account")) {
            return fail("--help", help);
        }

        const auto cloud_status = run_cli(executable,
            inv + "status --ip 10.0.0.5 --token \"\" --key \"\" --account acc --password pw");
        if (cloud_status.exit_code != 0 || !expect_contains(cloud_status.output, "addr=10.0.0.5:6444") ||
            !expect_contains(cloud_status.output, "name    = Basement") ||
            expect_contains(cloud_status.output, "token")) {
            return fail("status via cloud", cloud_status);
        }

        const auto no_creds = run_cli(executable, inv + "status --ip 10.0.0.5 --token \"\" --key \"\"", true);
        if (no_creds.exit_code != 1 || expect_contains(no_creds.output, "addr=") ||
            !expect_contains(no_creds.output, "Missing token/key or cloud credentials")) {
            return fail("status without credentials", no_creds);
        }

        // Credentials are rejected before any inventory is looked at
        const auto no_creds_no_inventory = run_cli(executable,
            "--inventory /nonexistent/inventory.json status --ip 10.0.0.5 --token \"\" --key \"\"", true);
        if (no_creds_no_inventory.exit_code != 1 ||
            !expect_contains(no_creds_no_inventory.output, "Missing token/key or cloud credentials") ||
            expect_contains(no_creds_no_inventory.output, "inventory")) {
            return fail("status without credentials or inventory", no_creds_no_inventory);
        }

        const auto unset_inventory = run_cli(executable,
            "status --ip 10.0.0.5 --token \"\" --key \"\"", true, "env -u MIDEA_DH_INVENTORY ");
        if (unset_inventory.exit_code != 1 ||
            !expect_contains(unset_inventory.output, "Missing token/key or cloud credentials")) {
            return fail("status without credentials or configured inventory", unset_inventory);
        }

        const auto set = run_cli(executable, inv + "set --ip 10.0.0.5 --token TOK --key KEY --humidity 55 --credentials");
        if (set.exit_code != 0 || !expect_contains(set.output, "target% = 55") ||
            !expect_contains(set.output, "token   = TOK") || !expect_contains(set.output, "fan     = 40")) {
            return fail("set humidity", set);
        }

        const auto after = run_cli(executable, inv + "status --ip 10.0.0.5 --token TOK --key KEY");
        if (after.exit_code != 0 || !expect_contains(after.output, "target% = 55")) {
            return fail("status after set", after);
        }

        const auto discover = run_cli(executable, inv + "discover --account acc --password pw --network 10.0.0.0/24");
        if (discover.exit_code != 0 || !expect_contains(discover.output, "s/n     = SN-BASEMENT")) {
            return fail("discover", discover);
        }

        const auto discover_none = run_cli(executable, inv + "discover --account acc --password pw --network 172.16.0.0/12");
        if (discover_none.exit_code != 0 || !discover_none.output.empty()) {
            return fail("discover on empty range", discover_none);
        }

        const auto bad_login = run_cli(executable, inv + "discover --account acc --password nope");
        if (bad_login.exit_code != 1 || !bad_login.output.empty()) {
            return fail("discover with bad login", bad_login);
        }

        const auto bad_value = run_cli(executable, inv + "set --ip 10.0.0.5 --token TOK --key KEY --fan turbo", true);
        if (bad_value.exit_code != 2 || !expect_contains(bad_value.output, "Fan speed")) {
            return fail("set with bad fan speed", bad_value);
        }

        const auto no_inventory = run_cli(executable, "status --ip 10.0.0.5 --token TOK --key KEY", true);
        if (std::getenv("MIDEA_DH_INVENTORY") == nullptr &&
            (no_inventory.exit_code != 2 || !expect_contains(no_inventory.output, "MIDEA_DH_INVENTORY"))) {
            return fail("status without inventory", no_inventory);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Unexpected exception: " << ex.what() << std::endl;
        std::filesystem::remove(inventory);
        return 1;
    }

    std::filesystem::remove(inventory);
    return 0;
}
