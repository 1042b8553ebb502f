#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "libcore/fan_registry.hpp"
#include "libcore/machine.hpp"

namespace fanctl::core {

class Fan;
class TemperatureFan;

struct ParsedCommand {
    std::string name;
    std::unordered_map<std::string, std::string> params;
};

// "M106 S128 T1" and "SET_FAN_SPEED FAN=aux SPEED=0.5" style lines. Names and keys are upper-cased.
ParsedCommand parse_command_line(const std::string &line);

// Routes runtime commands to fans. Failures throw CommandError and leave every fan untouched.
class FanCommands {
public:
    FanCommands(FanRegistry &registry, Machine &machine);

    void add_generic_fan(Fan &fan);
    void add_temperature_fan(TemperatureFan &fan);
    void set_status_provider(std::function<std::string()> provider);

    // Returns the text to report back; empty when the command has nothing to say.
    std::string execute(const std::string &line);

private:
    std::string cmd_m106(const ParsedCommand &cmd);
    std::string cmd_m107(const ParsedCommand &cmd);
    std::string cmd_set_fan_speed(const ParsedCommand &cmd);
    std::string cmd_set_temperature_fan_target(const ParsedCommand &cmd);
    std::string cmd_status(const ParsedCommand &cmd);

    FanRegistry &registry_;
    Machine &machine_;
    std::map<std::string, Fan *> generic_fans_;
    std::map<std::string, TemperatureFan *> temperature_fans_;
    std::function<std::string()> status_provider_;
};

} // namespace fanctl::core
