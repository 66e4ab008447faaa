#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "cli.h"
#include "command_dispatcher.h"
#include "constants.h"
#include "errors.h"
#include "inventory.h"
#include "logger.h"
#include "output.h"

using namespace midea_dehumidifier;

namespace {

std::string inventory_path(const CliOptions& options) {
    if (!options.inventory_path.empty()) return options.inventory_path;
    const char* env = std::getenv(INVENTORY_ENV_VAR);
    if (env && *env) return env;
    throw UsageError(std::string("No appliance inventory given; use --inventory or set ") + INVENTORY_ENV_VAR);
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize the logger
    Logger::initialize();
    auto& logger = Logger::instance();

    const std::string program = argc > 0 ? argv[0] : "midea-dehumidifier";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    try {
        CliOptions options = parse_command_line(args);
        if (options.help) {
            std::cout << usage_text(program);
            return 0;
        }
        logger.set_level(options.log_level);

        // Credentials are checked before the backend is even located
        check_credentials(options.intent);

        std::shared_ptr<Inventory> inventory = Inventory::load(inventory_path(options));
        InventoryCloudProvider cloud{inventory};
        InventoryDiscovery discovery{inventory};
        InventoryConnector connector{inventory};

        CommandDispatcher dispatcher{cloud, discovery, connector, CloudAppConfig::defaults()};
        std::vector<std::unique_ptr<Appliance>> appliances = dispatcher.dispatch(options.intent);
        print_appliances(std::cout, appliances, options.show_credentials);
    }
    catch (const UsageError& e) {
        logger.errorf("Error: %s", e.what());
        std::cerr << usage_text(program);
        return 2;
    }
    catch (const std::exception& e) {
        logger.errorf("Error: %s", e.what());
        return 1;
    }

    return 0;
}
