#include "libcore/fan_commands.hpp"

#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

#include "libcore/errors.hpp"
#include "libcore/fan.hpp"
#include "libcore/temperature_fan.hpp"

namespace fanctl::core {
namespace {

constexpr double kM106Scale = 255.0;

std::string to_upper(std::string s) {
    for (char &c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string number_text(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

const std::string *find_param(const ParsedCommand &cmd, const std::string &key) {
    const auto it = cmd.params.find(key);
    return it == cmd.params.end() ? nullptr : &it->second;
}

double get_float(const ParsedCommand &cmd,
                 const std::string &key,
                 std::optional<double> default_value,
                 std::optional<double> minval = std::nullopt,
                 std::optional<double> maxval = std::nullopt) {
    const std::string *raw = find_param(cmd, key);
    if (!raw) {
        if (!default_value) {
            throw CommandError("Error on '" + cmd.name + "': missing " + key);
        }
        return *default_value;
    }

    double v = 0.0;
    try {
        std::size_t idx = 0;
        v = std::stod(*raw, &idx);
        if (idx != raw->size() || !std::isfinite(v)) {
            throw CommandError("Unable to parse '" + *raw + "' as a float");
        }
    } catch (const std::logic_error &) {
        throw CommandError("Unable to parse '" + *raw + "' as a float");
    }

    if (minval && v < *minval) {
        throw CommandError("Error on '" + cmd.name + "': " + key + " must have minimum of " + number_text(*minval));
    }
    if (maxval && v > *maxval) {
        throw CommandError("Error on '" + cmd.name + "': " + key + " must have maximum of " + number_text(*maxval));
    }
    return v;
}

int get_int(const ParsedCommand &cmd, const std::string &key, int default_value) {
    const std::string *raw = find_param(cmd, key);
    if (!raw) {
        return default_value;
    }
    try {
        std::size_t idx = 0;
        const int v = std::stoi(*raw, &idx, 10);
        if (idx != raw->size()) {
            throw CommandError("Unable to parse '" + *raw + "' as a int");
        }
        return v;
    } catch (const std::logic_error &) {
        throw CommandError("Unable to parse '" + *raw + "' as a int");
    }
}

std::string get_string(const ParsedCommand &cmd, const std::string &key) {
    const std::string *raw = find_param(cmd, key);
    if (!raw || raw->empty()) {
        throw CommandError("Error on '" + cmd.name + "': missing " + key);
    }
    return *raw;
}

} // namespace

ParsedCommand parse_command_line(const std::string &line) {
    std::string text = line;
    const auto comment = text.find(';');
    if (comment != std::string::npos) {
        text = text.substr(0, comment);
    }

    ParsedCommand cmd;
    std::istringstream iss(text);
    std::string token;
    if (!(iss >> token)) {
        return cmd;
    }
    cmd.name = to_upper(token);

    while (iss >> token) {
        const std::size_t eq = token.find('=');
        if (eq != std::string::npos) {
            if (eq == 0) {
                throw CommandError("Malformed command '" + line + "'");
            }
            cmd.params[to_upper(token.substr(0, eq))] = token.substr(eq + 1);
            continue;
        }
        if (!std::isalpha(static_cast<unsigned char>(token[0]))) {
            throw CommandError("Malformed command '" + line + "'");
        }
        cmd.params[to_upper(token.substr(0, 1))] = token.substr(1);
    }
    return cmd;
}

FanCommands::FanCommands(FanRegistry &registry, Machine &machine) : registry_(registry), machine_(machine) {}

void FanCommands::add_generic_fan(Fan &fan) {
    generic_fans_[to_upper(fan.name())] = &fan;
}

void FanCommands::add_temperature_fan(TemperatureFan &fan) {
    temperature_fans_[to_upper(fan.name())] = &fan;
}

void FanCommands::set_status_provider(std::function<std::string()> provider) {
    status_provider_ = std::move(provider);
}

std::string FanCommands::execute(const std::string &line) {
    const ParsedCommand cmd = parse_command_line(line);
    if (cmd.name.empty()) {
        return {};
    }
    if (cmd.name == "STATUS") {
        return cmd_status(cmd);
    }
    if (machine_.is_shutdown()) {
        throw CommandError("Machine is shutdown");
    }
    if (cmd.name == "M106") {
        return cmd_m106(cmd);
    }
    if (cmd.name == "M107") {
        return cmd_m107(cmd);
    }
    if (cmd.name == "SET_FAN_SPEED") {
        return cmd_set_fan_speed(cmd);
    }
    if (cmd.name == "SET_TEMPERATURE_FAN_TARGET") {
        return cmd_set_temperature_fan_target(cmd);
    }
    throw CommandError("Unknown command:\"" + cmd.name + "\"");
}

std::string FanCommands::cmd_m106(const ParsedCommand &cmd) {
    const double raw = get_float(cmd, "S", kM106Scale, 0.0, kM106Scale);
    Fan &fan = registry_.lookup(get_int(cmd, "T", 0));
    // 0 < S < 1 is a fraction, anything else is on the 0..255 scale.
    const double value = (raw > 0.0 && raw < 1.0) ? raw : raw / kM106Scale;
    fan.set_speed_from_command(value);
    return {};
}

std::string FanCommands::cmd_m107(const ParsedCommand &cmd) {
    Fan &fan = registry_.lookup(get_int(cmd, "T", 0));
    fan.set_speed_from_command(0.0);
    return {};
}

std::string FanCommands::cmd_set_fan_speed(const ParsedCommand &cmd) {
    const std::string name = get_string(cmd, "FAN");
    const auto it = generic_fans_.find(to_upper(name));
    if (it == generic_fans_.end()) {
        throw CommandError("Unknown fan: " + name);
    }
    const double speed = get_float(cmd, "SPEED", 0.0, 0.0, 1.0);
    it->second->set_speed_from_command(speed);
    return {};
}

std::string FanCommands::cmd_set_temperature_fan_target(const ParsedCommand &cmd) {
    const std::string name = get_string(cmd, "TEMPERATURE_FAN");
    const auto it = temperature_fans_.find(to_upper(name));
    if (it == temperature_fans_.end()) {
        throw CommandError("Unknown temperature_fan: " + name);
    }
    TemperatureFan &fan = *it->second;

    const double target = get_float(cmd, "TARGET", fan.configured_target());
    const double min_speed = get_float(cmd, "MIN_SPEED", fan.min_speed());
    const double max_speed = get_float(cmd, "MAX_SPEED", fan.max_speed());

    fan.validate_target(target);
    fan.set_speed_bounds(min_speed, max_speed);
    fan.set_target(target);
    return {};
}

std::string FanCommands::cmd_status(const ParsedCommand & /* cmd */) {
    if (!status_provider_) {
        return {};
    }
    return status_provider_();
}

} // namespace fanctl::core
