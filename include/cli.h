#pragma once

#include "command_dispatcher.h"
#include "logger.h"
#include <string>
#include <vector>

namespace midea_dehumidifier {

struct CliOptions {
    LogLevel log_level = LogLevel::WARNING;
    bool show_credentials = false;
    bool help = false;
    std::string inventory_path;   // empty: fall back to the environment
    CommandIntent intent;
};

// `args` excludes the program name. Throws UsageError on any malformed input,
// including bad option values, so nothing runs with a half-parsed command.
CliOptions parse_command_line(const std::vector<std::string>& args);

std::string usage_text(const std::string& program);

} // namespace midea_dehumidifier
