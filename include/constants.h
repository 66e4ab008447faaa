#pragma once

namespace midea_dehumidifier {

// Application credentials the official mobile app registers with the cloud.
// The app id must correspond to the app key.
constexpr const char* DEFAULT_APP_KEY = "3742e9e5842d4ad59c2db887e12449f9";
constexpr const char* DEFAULT_APP_ID  = "1017";

constexpr int DEFAULT_APPLIANCE_PORT = 6444;

// Environment variable naming the appliance inventory file
constexpr const char* INVENTORY_ENV_VAR = "MIDEA_DH_INVENTORY";

} // namespace midea_dehumidifier
