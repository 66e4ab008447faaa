#pragma once

#include "data_structures.h"
#include <memory>
#include <optional>
#include <string>

namespace midea_dehumidifier {

// Authenticated cloud context. Lives for a single command.
class CloudSession {
public:
    virtual ~CloudSession() = default;

    virtual const std::string& account() const = 0;

    // Token/key pair the cloud catalog holds for an appliance id, if any
    virtual std::optional<ApplianceCredentials> appliance_credentials(const std::string& appliance_id) = 0;
};

class CloudSessionProvider {
public:
    virtual ~CloudSessionProvider() = default;

    // Throws AuthError when the cloud rejects the credentials or cannot be reached
    virtual std::unique_ptr<CloudSession> authenticate(const CloudCredentials& credentials) = 0;
};

} // namespace midea_dehumidifier
