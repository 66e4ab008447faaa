#pragma once

#include "appliance.h"
#include "cloud.h"
#include "network_range.h"
#include <memory>
#include <string>
#include <vector>

namespace midea_dehumidifier {

class DiscoveryService {
public:
    virtual ~DiscoveryService() = default;

    // Probes the given ranges (all local ranges when empty) and returns every
    // responding appliance whose credentials the session resolved. Silent
    // addresses are simply absent from the result.
    virtual std::vector<std::unique_ptr<Appliance>> discover(const std::vector<NetworkRange>& networks,
                                                             CloudSession& session) = 0;

    // Probes a single address. Throws IOError when nothing answers there and
    // AuthError when the cloud has no credentials for what answered.
    virtual std::unique_ptr<Appliance> discover_one(const ApplianceAddress& address, CloudSession& session) = 0;
};

// Builds a handle straight from a token/key pair. No traffic happens here;
// the wire protocol validates the pair on first use.
class ApplianceConnector {
public:
    virtual ~ApplianceConnector() = default;

    virtual std::unique_ptr<Appliance> connect(const ApplianceAddress& address,
                                               const ApplianceCredentials& credentials) = 0;
};

} // namespace midea_dehumidifier
