#pragma once

#include "appliance.h"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace midea_dehumidifier {

// Fixed per-appliance text block; token and key only when asked for
std::string format_appliance(const Appliance& appliance, bool show_credentials = false);

void print_appliances(std::ostream& out,
                      const std::vector<std::unique_ptr<Appliance>>& appliances,
                      bool show_credentials);

} // namespace midea_dehumidifier
