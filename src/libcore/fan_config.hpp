#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace fanctl::core {

inline constexpr const char *kFixedPidfilePath = "/var/run/fanctl.pid";
inline constexpr const char *kDefaultConfigPath = "/etc/fanctl.conf";
inline constexpr const char *kDefaultStatusPath = "/var/run/fanctl.status.json";
inline constexpr const char *kDefaultCommandPath = "/var/run/fanctl.cmd";
inline constexpr const char *kNamePattern = "^[A-Za-z0-9_-]+$";

enum class PwmPinType {
    Hwmon,
    PwmChip,
};

enum class TachLossAction {
    None,
    Warning,
    Shutdown,
};

enum class ControlKind {
    Watermark,
    Pid,
    Slope,
};

enum class SlopeCurve {
    Linear,
    Log,
    Exponential,
};

struct TachometerConfig {
    std::string pin;
    int ppr = 2;
    double poll_interval = 0.0015;
    double loss_interval = 3.0;
    TachLossAction loss_action = TachLossAction::Shutdown;
    double warning_repeat_interval = 3.0;
};

struct FanConfig {
    // "fan", "fan_generic <name>" or "temperature_fan <name>"
    std::string section;
    std::string name;

    std::string pin;
    PwmPinType pin_type = PwmPinType::Hwmon;
    std::string enable_pin;
    bool four_wire = false;

    double max_power = 1.0;
    double kick_start_time = 0.1;
    double off_below = 0.0;
    double cycle_time = 0.010;
    bool hardware_pwm = false;
    double shutdown_speed = 0.0;

    std::optional<int> slicer_fan_number;
    std::vector<std::string> heaters;
    std::optional<TachometerConfig> tachometer;
};

struct TemperatureFanConfig {
    FanConfig fan;
    std::string sensor;

    double min_temp = 0.0;
    double max_temp = 0.0;
    double min_temp_cutoff = 0.0;
    double target_temp = 0.0;
    double max_speed = 1.0;
    double min_speed = 0.3;

    ControlKind control = ControlKind::Watermark;
    double max_delta = 2.0;
    double pid_kp = 0.0;
    double pid_ki = 0.0;
    double pid_kd = 0.0;
    double pid_deriv_time = 2.0;
    SlopeCurve slope = SlopeCurve::Linear;
};

struct SourceConfig {
    std::string id;
    std::string type;

    std::string path;

    std::string object;
    std::string method;
    std::string key;
    std::string args_json;

    int poll_sec = 0;
};

struct FanctlConfig {
    int interval_ms = 0;
    int lookahead_ms = 0;
    int status_interval_ms = 0;
    std::string status_path;
    std::string command_path;

    std::optional<FanConfig> fan;
    std::vector<FanConfig> generic_fans;
    std::vector<TemperatureFanConfig> temperature_fans;
    std::vector<SourceConfig> sources;
};

FanctlConfig parse_fanctl_config(std::istream &in);
FanctlConfig load_fanctl_config(const std::string &path);
std::string build_config_json(const FanctlConfig &cfg, const std::string &path);
std::string dump_config_schema_json();

const char *to_string(PwmPinType type);
const char *to_string(TachLossAction action);
const char *to_string(ControlKind kind);
const char *to_string(SlopeCurve curve);

} // namespace fanctl::core
