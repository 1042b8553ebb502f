#pragma once

#include <stdexcept>
#include <string>

namespace fanctl::core {

// Raised while loading or wiring the configuration. Fatal before the control loop starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

// Raised by a single runtime command. The request is rejected and no state changes.
class CommandError : public std::runtime_error {
public:
    explicit CommandError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace fanctl::core
