#include "libcore/fan_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "libcore/config_spec.hpp"
#include "libcore/errors.hpp"

namespace fanctl::core {
namespace {

using Options = std::unordered_map<std::string, std::string>;

std::string trim(const std::string &s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    for (char &c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

int to_int(const std::string &in, const std::string &name) {
    try {
        std::size_t idx = 0;
        const long long v = std::stoll(in, &idx, 10);
        if (idx != in.size() || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            throw ConfigError("invalid integer for " + name + ": " + in);
        }
        return static_cast<int>(v);
    } catch (const std::logic_error &) {
        throw ConfigError("invalid integer for " + name + ": " + in);
    }
}

double to_double(const std::string &in, const std::string &name) {
    try {
        std::size_t idx = 0;
        const double v = std::stod(in, &idx);
        if (idx != in.size() || !std::isfinite(v)) {
            throw ConfigError("invalid number for " + name + ": " + in);
        }
        return v;
    } catch (const std::logic_error &) {
        throw ConfigError("invalid number for " + name + ": " + in);
    }
}

bool to_bool(const std::string &in, const std::string &name) {
    const std::string lower = to_lower(trim(in));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    throw ConfigError("invalid boolean for " + name + ": " + in);
}

Options parse_csv_pairs(const std::string &v, const std::string &section) {
    std::vector<std::string> tokens;
    std::string current;
    int brace_depth = 0;
    int bracket_depth = 0;
    bool in_quote = false;
    bool escape = false;
    char quote = '\0';

    for (char ch : v) {
        if (in_quote) {
            current.push_back(ch);
            if (escape) {
                escape = false;
                continue;
            }
            if (ch == '\\') {
                escape = true;
                continue;
            }
            if (ch == quote) {
                in_quote = false;
            }
            continue;
        }

        if (ch == '"' || ch == '\'') {
            in_quote = true;
            quote = ch;
            current.push_back(ch);
            continue;
        }
        if (ch == '{') {
            ++brace_depth;
        } else if (ch == '}' && brace_depth > 0) {
            --brace_depth;
        } else if (ch == '[') {
            ++bracket_depth;
        } else if (ch == ']' && bracket_depth > 0) {
            --bracket_depth;
        }

        if (ch == ',' && brace_depth == 0 && bracket_depth == 0) {
            tokens.push_back(trim(current));
            current.clear();
            continue;
        }

        current.push_back(ch);
    }
    tokens.push_back(trim(current));

    Options kv;
    for (const auto &token : tokens) {
        if (token.empty()) {
            continue;
        }
        const std::size_t eq = token.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 >= token.size()) {
            throw ConfigError("bad option in section '" + section + "': " + token);
        }
        const std::string k = trim(token.substr(0, eq));
        if (kv.count(k)) {
            throw ConfigError("option '" + k + "' repeated in section '" + section + "'");
        }
        kv[k] = trim(token.substr(eq + 1));
    }
    return kv;
}

// Reads options out of one section and remembers which keys were consumed.
class SectionReader {
public:
    SectionReader(std::string section, Options options)
        : section_(std::move(section)), options_(std::move(options)) {}

    const std::string &section() const {
        return section_;
    }

    bool has(const char *key) const {
        return options_.count(key) != 0;
    }

    std::string get_string(const StringFieldSpec &spec) {
        used_.insert(spec.key);
        const auto it = options_.find(spec.key);
        if (it == options_.end() || it->second.empty()) {
            if (spec.required) {
                throw ConfigError(missing(spec.key));
            }
            return spec.default_value;
        }
        return it->second;
    }

    bool get_bool(const BoolFieldSpec &spec, bool fallback) {
        used_.insert(spec.key);
        const auto it = options_.find(spec.key);
        if (it == options_.end()) {
            return fallback;
        }
        return to_bool(it->second, option_name(spec.key));
    }

    std::optional<int> get_optional_int(const IntFieldSpec &spec) {
        used_.insert(spec.key);
        const auto it = options_.find(spec.key);
        if (it == options_.end()) {
            return std::nullopt;
        }
        const int v = to_int(it->second, option_name(spec.key));
        check_int(spec, v);
        return v;
    }

    int get_int(const IntFieldSpec &spec) {
        const auto v = get_optional_int(spec);
        return v ? *v : spec.default_value;
    }

    double get_number(const NumberFieldSpec &spec, std::optional<double> fallback = std::nullopt) {
        used_.insert(spec.key);
        const auto it = options_.find(spec.key);
        double v = 0.0;
        if (it == options_.end()) {
            if (fallback) {
                return *fallback;
            }
            if (spec.required) {
                throw ConfigError(missing(spec.key));
            }
            v = spec.default_value;
        } else {
            v = to_double(it->second, option_name(spec.key));
        }
        check_number(spec, v);
        return v;
    }

    std::string get_choice(const EnumFieldSpec &spec) {
        used_.insert(spec.key);
        const auto it = options_.find(spec.key);
        std::string value;
        if (it == options_.end()) {
            if (spec.default_value == nullptr || *spec.default_value == '\0') {
                throw ConfigError(missing(spec.key));
            }
            value = spec.default_value;
        } else {
            value = to_lower(it->second);
        }
        for (std::size_t i = 0; i < spec.allowed_count; ++i) {
            if (value == spec.allowed_values[i]) {
                return value;
            }
        }
        throw ConfigError("Choice '" + value + "' for option '" + spec.key + "' in section '" + section_ +
                          "' is not a valid choice");
    }

    void check_unused() const {
        for (const auto &kv : options_) {
            if (!used_.count(kv.first)) {
                throw ConfigError("Option '" + kv.first + "' is not valid in section '" + section_ + "'");
            }
        }
    }

    void check_number(const NumberFieldSpec &spec, double v) const {
        if (spec.lower_kind == Bound::Inclusive && v < spec.lower) {
            throw ConfigError(option_name(spec.key) + " must have minimum of " + format_number(spec.lower));
        }
        if (spec.lower_kind == Bound::Exclusive && v <= spec.lower) {
            throw ConfigError(option_name(spec.key) + " must be above " + format_number(spec.lower));
        }
        if (spec.upper_kind == Bound::Inclusive && v > spec.upper) {
            throw ConfigError(option_name(spec.key) + " must have maximum of " + format_number(spec.upper));
        }
        if (spec.upper_kind == Bound::Exclusive && v >= spec.upper) {
            throw ConfigError(option_name(spec.key) + " must be below " + format_number(spec.upper));
        }
    }

private:
    std::string option_name(const std::string &key) const {
        return "Option '" + key + "' in section '" + section_ + "'";
    }

    std::string missing(const std::string &key) const {
        return option_name(key) + " must be specified";
    }

    void check_int(const IntFieldSpec &spec, int v) const {
        if (v < spec.min_value) {
            throw ConfigError(option_name(spec.key) + " must have minimum of " + std::to_string(spec.min_value));
        }
        if (spec.has_max && v > spec.max_value) {
            throw ConfigError(option_name(spec.key) + " must have maximum of " + std::to_string(spec.max_value));
        }
    }

    std::string section_;
    Options options_;
    std::set<std::string> used_;
};

void check_name(const std::string &name, const std::string &what) {
    static const std::regex kPattern(kNamePattern);
    if (!std::regex_match(name, kPattern)) {
        throw ConfigError("invalid " + what + " name: '" + name + "'");
    }
}

PwmPinType parse_pin_type(const std::string &v) {
    return v == "pwmchip" ? PwmPinType::PwmChip : PwmPinType::Hwmon;
}

TachLossAction parse_loss_action(const std::string &v) {
    if (v == "warning") {
        return TachLossAction::Warning;
    }
    if (v == "none") {
        return TachLossAction::None;
    }
    return TachLossAction::Shutdown;
}

ControlKind parse_control(const std::string &v) {
    if (v == "pid") {
        return ControlKind::Pid;
    }
    if (v == "slope") {
        return ControlKind::Slope;
    }
    return ControlKind::Watermark;
}

SlopeCurve parse_slope(const std::string &v) {
    if (v == "log") {
        return SlopeCurve::Log;
    }
    if (v == "exponential") {
        return SlopeCurve::Exponential;
    }
    return SlopeCurve::Linear;
}

std::vector<std::string> split_words(const std::string &v) {
    std::vector<std::string> out;
    std::istringstream iss(v);
    std::string word;
    while (iss >> word) {
        out.push_back(word);
    }
    return out;
}

FanConfig read_fan_options(SectionReader &r, const std::string &name, double default_shutdown_speed,
                           bool allow_slicer_number) {
    const ConfigSpec &spec = fanctl_config_spec();

    FanConfig fan;
    fan.section = r.section();
    fan.name = name;
    fan.pin = r.get_string(spec.pin);
    fan.pin_type = parse_pin_type(r.get_choice(spec.pin_type));
    fan.enable_pin = r.get_string(spec.enable_pin);
    fan.four_wire = r.get_bool(spec.four_wire, !fan.enable_pin.empty());
    fan.max_power = r.get_number(spec.max_power);
    fan.kick_start_time = r.get_number(spec.kick_start_time);
    fan.off_below = r.get_number(spec.off_below);
    fan.cycle_time = r.get_number(spec.cycle_time);
    fan.hardware_pwm = r.get_bool(spec.hardware_pwm, spec.hardware_pwm.default_value);
    fan.shutdown_speed = r.has(spec.shutdown_speed.key) ? r.get_number(spec.shutdown_speed) : default_shutdown_speed;
    if (allow_slicer_number) {
        fan.slicer_fan_number = r.get_optional_int(spec.slicer_fan_number);
    }
    fan.heaters = split_words(r.get_string(spec.heaters));

    const std::string tach_pin = r.get_string(spec.tachometer_pin);
    if (!tach_pin.empty()) {
        TachometerConfig tach;
        tach.pin = tach_pin;
        tach.ppr = r.get_int(spec.tachometer_ppr);
        tach.poll_interval = r.get_number(spec.tachometer_poll_interval);
        tach.loss_interval = r.get_number(spec.tach_loss_interval);
        tach.loss_action = parse_loss_action(r.get_choice(spec.tach_loss_action));
        tach.warning_repeat_interval = r.get_number(spec.tach_warning_repeat_interval, tach.loss_interval);
        fan.tachometer = tach;
    }
    return fan;
}

TemperatureFanConfig read_temperature_fan(SectionReader &r, const std::string &name) {
    const ConfigSpec &spec = fanctl_config_spec();

    TemperatureFanConfig tf;
    tf.fan = read_fan_options(r, name, 1.0, false);
    tf.sensor = r.get_string(spec.sensor);

    tf.min_temp = r.get_number(spec.min_temp);
    tf.max_temp = r.get_number(spec.max_temp);
    if (tf.max_temp <= tf.min_temp) {
        throw ConfigError("Option 'max_temp' in section '" + r.section() + "' must be above " +
                          format_number(tf.min_temp));
    }
    tf.min_temp_cutoff = r.get_number(spec.min_temp_cutoff);
    tf.target_temp = r.get_number(spec.target_temp, tf.max_temp > 40.0 ? 40.0 : tf.max_temp);
    if (tf.target_temp < tf.min_temp || tf.target_temp > tf.max_temp) {
        throw ConfigError("Option 'target_temp' in section '" + r.section() + "' must be between " +
                          format_number(tf.min_temp) + " and " + format_number(tf.max_temp));
    }
    tf.max_speed = r.get_number(spec.max_speed);
    tf.min_speed = r.get_number(spec.min_speed);

    tf.control = parse_control(r.get_choice(spec.control));
    switch (tf.control) {
    case ControlKind::Watermark:
        tf.max_delta = r.get_number(spec.max_delta);
        break;
    case ControlKind::Pid:
        tf.pid_kp = r.get_number(spec.pid_kp);
        tf.pid_ki = r.get_number(spec.pid_ki);
        tf.pid_kd = r.get_number(spec.pid_kd);
        tf.pid_deriv_time = r.get_number(spec.pid_deriv_time);
        break;
    case ControlKind::Slope:
        tf.slope = parse_slope(r.get_choice(spec.slope));
        break;
    }
    return tf;
}

SourceConfig read_source(SectionReader &r, const std::string &id, const Options &kv) {
    const ConfigSpec &spec = fanctl_config_spec();
    static constexpr StringFieldSpec kType = {"type", "", true, ""};
    static constexpr StringFieldSpec kPath = {"path", "", false, ""};
    static constexpr StringFieldSpec kObject = {"object", "", false, ""};
    static constexpr StringFieldSpec kMethod = {"method", "", false, ""};
    static constexpr StringFieldSpec kKey = {"key", "", false, ""};
    static constexpr StringFieldSpec kArgs = {"args", "{}", false, ""};

    SourceConfig src;
    src.id = id;
    src.type = to_lower(r.get_string(kType));
    src.poll_sec = r.get_int(spec.source_poll_sec);

    if (src.type == "sysfs") {
        if (!kv.count("path")) {
            throw ConfigError("SOURCE_" + id + " missing required field: path");
        }
        src.path = r.get_string(kPath);
    } else if (src.type == "ubus") {
        if (!kv.count("object") || !kv.count("method") || !kv.count("key")) {
            throw ConfigError("SOURCE_" + id + " missing required fields for ubus");
        }
        src.object = r.get_string(kObject);
        src.method = r.get_string(kMethod);
        src.key = r.get_string(kKey);
        src.args_json = r.get_string(kArgs);
    } else {
        throw ConfigError("unsupported source type for SOURCE_" + id + ": " + src.type);
    }
    return src;
}

bool starts_with(const std::string &s, const char *prefix, std::string &rest) {
    const std::string p(prefix);
    if (s.size() > p.size() && s.rfind(p, 0) == 0) {
        rest = s.substr(p.size());
        return true;
    }
    return false;
}

} // namespace

const char *to_string(PwmPinType type) {
    return type == PwmPinType::PwmChip ? "pwmchip" : "hwmon";
}

const char *to_string(TachLossAction action) {
    switch (action) {
    case TachLossAction::None:
        return "none";
    case TachLossAction::Warning:
        return "warning";
    case TachLossAction::Shutdown:
        break;
    }
    return "shutdown";
}

const char *to_string(ControlKind kind) {
    switch (kind) {
    case ControlKind::Pid:
        return "pid";
    case ControlKind::Slope:
        return "slope";
    case ControlKind::Watermark:
        break;
    }
    return "watermark";
}

const char *to_string(SlopeCurve curve) {
    switch (curve) {
    case SlopeCurve::Log:
        return "log";
    case SlopeCurve::Exponential:
        return "exponential";
    case SlopeCurve::Linear:
        break;
    }
    return "linear";
}

FanctlConfig parse_fanctl_config(std::istream &in) {
    const ConfigSpec &spec = fanctl_config_spec();

    std::map<std::string, std::string> plain;
    std::vector<std::pair<std::string, std::string>> generic_lines;
    std::vector<std::pair<std::string, std::string>> temperature_lines;
    std::vector<std::pair<std::string, std::string>> source_lines;
    std::optional<std::string> fan_line;

    std::string line;
    while (std::getline(in, line)) {
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("malformed config line: " + line);
        }

        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));

        std::string rest;
        if (key == "FAN") {
            if (fan_line) {
                throw ConfigError("FAN is defined more than once");
            }
            fan_line = value;
        } else if (starts_with(key, "FAN_GENERIC_", rest)) {
            generic_lines.emplace_back(rest, value);
        } else if (starts_with(key, "TEMPERATURE_FAN_", rest)) {
            temperature_lines.emplace_back(rest, value);
        } else if (starts_with(key, "SOURCE_", rest)) {
            source_lines.emplace_back(rest, value);
        } else {
            plain[key] = value;
        }
    }

    FanctlConfig cfg;
    cfg.interval_ms = spec.interval_ms.default_value;
    cfg.lookahead_ms = spec.lookahead_ms.default_value;
    cfg.status_interval_ms = spec.status_interval_ms.default_value;
    cfg.status_path = spec.status_path.default_value;
    cfg.command_path = spec.command_path.default_value;

    for (const auto &kv : plain) {
        if (kv.first == spec.interval_ms.key) {
            cfg.interval_ms = std::max(spec.interval_ms.min_value, to_int(kv.second, kv.first));
        } else if (kv.first == spec.lookahead_ms.key) {
            cfg.lookahead_ms = std::clamp(to_int(kv.second, kv.first), spec.lookahead_ms.min_value,
                                          spec.lookahead_ms.max_value);
        } else if (kv.first == spec.status_interval_ms.key) {
            cfg.status_interval_ms = std::max(spec.status_interval_ms.min_value, to_int(kv.second, kv.first));
        } else if (kv.first == spec.status_path.key) {
            cfg.status_path = kv.second;
        } else if (kv.first == spec.command_path.key) {
            cfg.command_path = kv.second;
        } else {
            throw ConfigError("unknown setting: " + kv.first);
        }
    }

    std::unordered_set<std::string> seen_sources;
    for (const auto &src_line : source_lines) {
        check_name(src_line.first, "SOURCE");
        const Options kv = parse_csv_pairs(src_line.second, "SOURCE_" + src_line.first);
        SectionReader r("SOURCE_" + src_line.first, kv);
        SourceConfig src = read_source(r, src_line.first, kv);
        r.check_unused();
        if (!seen_sources.insert(src.id).second) {
            throw ConfigError("duplicate SOURCE id: " + src.id);
        }
        cfg.sources.push_back(std::move(src));
    }

    if (fan_line) {
        SectionReader r("fan", parse_csv_pairs(*fan_line, "fan"));
        cfg.fan = read_fan_options(r, "fan", 0.0, false);
        r.check_unused();
    }

    std::unordered_set<std::string> seen_fans;
    if (cfg.fan) {
        seen_fans.insert(cfg.fan->name);
    }
    for (const auto &gen : generic_lines) {
        check_name(gen.first, "fan");
        const std::string section = "fan_generic " + gen.first;
        SectionReader r(section, parse_csv_pairs(gen.second, section));
        FanConfig fan = read_fan_options(r, gen.first, 0.0, true);
        r.check_unused();
        if (!seen_fans.insert(gen.first).second) {
            throw ConfigError("duplicate fan name: " + gen.first);
        }
        cfg.generic_fans.push_back(std::move(fan));
    }

    for (const auto &tl : temperature_lines) {
        check_name(tl.first, "temperature fan");
        const std::string section = "temperature_fan " + tl.first;
        SectionReader r(section, parse_csv_pairs(tl.second, section));
        TemperatureFanConfig tf = read_temperature_fan(r, tl.first);
        r.check_unused();
        if (!seen_sources.count(tf.sensor)) {
            throw ConfigError("Option 'sensor' in section '" + section + "' refers to unknown SOURCE: " + tf.sensor);
        }
        if (!seen_fans.insert(tl.first).second) {
            throw ConfigError("duplicate fan name: " + tl.first);
        }
        cfg.temperature_fans.push_back(std::move(tf));
    }

    if (!cfg.fan && cfg.generic_fans.empty() && cfg.temperature_fans.empty()) {
        throw ConfigError("no FAN, FAN_GENERIC_* or TEMPERATURE_FAN_* entries found in config");
    }

    return cfg;
}

FanctlConfig load_fanctl_config(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config: " + path);
    }
    return parse_fanctl_config(in);
}

namespace {

nlohmann::json fan_config_json(const FanConfig &fan) {
    nlohmann::json out = {
        {"section", fan.section},
        {"name", fan.name},
        {"pin", fan.pin},
        {"pin_type", to_string(fan.pin_type)},
        {"enable_pin", fan.enable_pin},
        {"four_wire", fan.four_wire ? 1 : 0},
        {"max_power", fan.max_power},
        {"kick_start_time", fan.kick_start_time},
        {"off_below", fan.off_below},
        {"cycle_time", fan.cycle_time},
        {"hardware_pwm", fan.hardware_pwm ? 1 : 0},
        {"shutdown_speed", fan.shutdown_speed},
        {"heaters", fan.heaters},
    };
    if (fan.slicer_fan_number) {
        out["slicer_fan_number"] = *fan.slicer_fan_number;
    }
    if (fan.tachometer) {
        const TachometerConfig &t = *fan.tachometer;
        out["tachometer"] = {
            {"pin", t.pin},
            {"ppr", t.ppr},
            {"poll_interval", t.poll_interval},
            {"loss_interval", t.loss_interval},
            {"loss_action", to_string(t.loss_action)},
            {"warning_repeat_interval", t.warning_repeat_interval},
        };
    }
    return out;
}

nlohmann::json number_spec_json(const NumberFieldSpec &f) {
    nlohmann::json out = {
        {"key", f.key},
        {"type", "float"},
        {"required", f.required ? 1 : 0},
        {"description", f.description},
    };
    if (!f.required) {
        out["default"] = f.default_value;
    }
    if (f.lower_kind != Bound::None) {
        out[f.lower_kind == Bound::Inclusive ? "min" : "above"] = f.lower;
    }
    if (f.upper_kind != Bound::None) {
        out[f.upper_kind == Bound::Inclusive ? "max" : "below"] = f.upper;
    }
    return out;
}

nlohmann::json int_spec_json(const IntFieldSpec &f) {
    nlohmann::json out = {
        {"key", f.key},
        {"type", "int"},
        {"default", f.default_value},
        {"min", f.min_value},
        {"description", f.description},
    };
    if (f.has_max) {
        out["max"] = f.max_value;
    }
    return out;
}

nlohmann::json string_spec_json(const StringFieldSpec &f) {
    return {
        {"key", f.key},
        {"type", "string"},
        {"default", f.default_value},
        {"required", f.required ? 1 : 0},
        {"description", f.description},
    };
}

nlohmann::json bool_spec_json(const BoolFieldSpec &f) {
    return {
        {"key", f.key},
        {"type", "bool"},
        {"default", f.default_value ? 1 : 0},
        {"description", f.description},
    };
}

nlohmann::json enum_spec_json(const EnumFieldSpec &f) {
    nlohmann::json values = nlohmann::json::array();
    for (std::size_t i = 0; i < f.allowed_count; ++i) {
        values.push_back(f.allowed_values[i]);
    }
    return {
        {"key", f.key},
        {"type", "enum"},
        {"default", f.default_value},
        {"values", values},
        {"description", f.description},
    };
}

} // namespace

std::string build_config_json(const FanctlConfig &cfg, const std::string &path) {
    nlohmann::json root = {
        {"ok", 1},
        {"path", path},
        {"interval_ms", cfg.interval_ms},
        {"lookahead_ms", cfg.lookahead_ms},
        {"status_interval_ms", cfg.status_interval_ms},
        {"status_path", cfg.status_path},
        {"command_path", cfg.command_path},
        {"fan", nullptr},
        {"fan_generic", nlohmann::json::array()},
        {"temperature_fan", nlohmann::json::array()},
        {"sources", nlohmann::json::array()},
    };

    if (cfg.fan) {
        root["fan"] = fan_config_json(*cfg.fan);
    }
    for (const auto &fan : cfg.generic_fans) {
        root["fan_generic"].push_back(fan_config_json(fan));
    }
    for (const auto &tf : cfg.temperature_fans) {
        nlohmann::json item = fan_config_json(tf.fan);
        item["sensor"] = tf.sensor;
        item["min_temp"] = tf.min_temp;
        item["max_temp"] = tf.max_temp;
        item["min_temp_cutoff"] = tf.min_temp_cutoff;
        item["target_temp"] = tf.target_temp;
        item["min_speed"] = tf.min_speed;
        item["max_speed"] = tf.max_speed;
        item["control"] = to_string(tf.control);
        switch (tf.control) {
        case ControlKind::Watermark:
            item["max_delta"] = tf.max_delta;
            break;
        case ControlKind::Pid:
            item["pid_Kp"] = tf.pid_kp;
            item["pid_Ki"] = tf.pid_ki;
            item["pid_Kd"] = tf.pid_kd;
            item["pid_deriv_time"] = tf.pid_deriv_time;
            break;
        case ControlKind::Slope:
            item["slope"] = to_string(tf.slope);
            break;
        }
        root["temperature_fan"].push_back(std::move(item));
    }
    for (const auto &src : cfg.sources) {
        root["sources"].push_back({
            {"id", src.id},
            {"type", src.type},
            {"path", src.path},
            {"object", src.object},
            {"method", src.method},
            {"key", src.key},
            {"args", src.args_json},
            {"poll", src.poll_sec},
        });
    }

    return root.dump();
}

std::string dump_config_schema_json() {
    const ConfigSpec &s = fanctl_config_spec();

    nlohmann::json fan_fields = nlohmann::json::array({
        string_spec_json(s.pin),
        enum_spec_json(s.pin_type),
        string_spec_json(s.enable_pin),
        bool_spec_json(s.four_wire),
        number_spec_json(s.max_power),
        number_spec_json(s.kick_start_time),
        number_spec_json(s.off_below),
        number_spec_json(s.cycle_time),
        bool_spec_json(s.hardware_pwm),
        number_spec_json(s.shutdown_speed),
        int_spec_json(s.slicer_fan_number),
        string_spec_json(s.heaters),
        string_spec_json(s.tachometer_pin),
        int_spec_json(s.tachometer_ppr),
        number_spec_json(s.tachometer_poll_interval),
        number_spec_json(s.tach_loss_interval),
        enum_spec_json(s.tach_loss_action),
        number_spec_json(s.tach_warning_repeat_interval),
    });

    nlohmann::json temperature_fields = nlohmann::json::array({
        string_spec_json(s.sensor),
        number_spec_json(s.min_temp),
        number_spec_json(s.max_temp),
        number_spec_json(s.min_temp_cutoff),
        number_spec_json(s.target_temp),
        number_spec_json(s.max_speed),
        number_spec_json(s.min_speed),
        enum_spec_json(s.control),
        number_spec_json(s.max_delta),
        number_spec_json(s.pid_kp),
        number_spec_json(s.pid_ki),
        number_spec_json(s.pid_kd),
        number_spec_json(s.pid_deriv_time),
        enum_spec_json(s.slope),
    });

    nlohmann::json source_types = nlohmann::json::array();
    for (std::size_t i = 0; i < s.source_type_count; ++i) {
        source_types.push_back(s.source_types[i]);
    }

    nlohmann::json root = {
        {"ok", 1},
        {"global",
         nlohmann::json::array({
             int_spec_json(s.interval_ms),
             int_spec_json(s.lookahead_ms),
             int_spec_json(s.status_interval_ms),
             string_spec_json(s.status_path),
             string_spec_json(s.command_path),
         })},
        {"fan", fan_fields},
        {"temperature_fan", temperature_fields},
        {"source",
         {
             {"types", source_types},
             {"poll", int_spec_json(s.source_poll_sec)},
         }},
        {"name_pattern", s.name_pattern},
    };
    return root.dump();
}

} // namespace fanctl::core
