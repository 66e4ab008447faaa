#pragma once

#include <stdexcept>
#include <string>

namespace midea_dehumidifier {

class ApplianceError : public std::runtime_error {
public:
    explicit ApplianceError(const std::string& message) : std::runtime_error(message) {}
};

// Neither a usable token nor usable cloud account credentials were supplied.
// Raised before any network traffic.
class MissingCredentials : public ApplianceError {
public:
    explicit MissingCredentials(const std::string& message) : ApplianceError(message) {}
};

// Cloud authentication or credential lookup failed
class AuthError : public ApplianceError {
public:
    explicit AuthError(const std::string& message) : ApplianceError(message) {}
};

// Appliance unreachable, or it rejected the request
class IOError : public ApplianceError {
public:
    explicit IOError(const std::string& message) : ApplianceError(message) {}
};

// Malformed command line
class UsageError : public ApplianceError {
public:
    explicit UsageError(const std::string& message) : ApplianceError(message) {}
};

} // namespace midea_dehumidifier
