#include "libcore/config_spec.hpp"

#include "libcore/fan_config.hpp"

namespace fanctl::core {

const ConfigSpec &fanctl_config_spec() {
    static constexpr const char *kPinTypeValues[] = {"hwmon", "pwmchip"};
    static constexpr const char *kTachLossActionValues[] = {"shutdown", "warning", "none"};
    static constexpr const char *kControlValues[] = {"watermark", "pid", "slope"};
    static constexpr const char *kSlopeValues[] = {"linear", "log", "exponential"};
    static constexpr const char *kSourceTypes[] = {"sysfs", "ubus"};

    static constexpr ConfigSpec kSpec = {
        {"INTERVAL_MS", 50, 5, 0, false, "Main control loop tick in milliseconds"},
        {"LOOKAHEAD_MS", 100, 0, 5000, true, "Lead time applied to direct speed requests"},
        {"STATUS_INTERVAL_MS", 1000, 100, 0, false, "Runtime status file refresh interval"},
        {"STATUS_PATH", kDefaultStatusPath, false, "Runtime status JSON path"},
        {"COMMAND_PATH", kDefaultCommandPath, false, "Command FIFO path"},

        {"pin", "", true, "PWM output: hwmon pwm file or /sys/class/pwm channel directory"},
        {"pin_type", "hwmon", kPinTypeValues, 2, "PWM output backend"},
        {"enable_pin", "", false, "GPIO value file driven high while the fan runs"},
        {"four_wire", false, "Fan has built-in PWM circuitry (default: enable_pin is set)"},
        {"max_power", 1.0, false, Bound::Exclusive, 0.0, Bound::Inclusive, 1.0, "Maximum duty sent to hardware"},
        {"kick_start_time", 0.1, false, Bound::Inclusive, 0.0, Bound::None, 0.0,
         "Seconds of full power before settling on a low duty"},
        {"off_below", 0.0, false, Bound::Inclusive, 0.0, Bound::Inclusive, 1.0,
         "Requested speeds below this turn the fan off"},
        {"cycle_time", 0.010, false, Bound::Exclusive, 0.0, Bound::None, 0.0, "PWM period in seconds"},
        {"hardware_pwm", false, "Request a hardware PWM channel"},
        {"shutdown_speed", 0.0, false, Bound::Inclusive, 0.0, Bound::Inclusive, 1.0,
         "Speed applied when the machine shuts down (temperature fans default to 1)"},
        {"slicer_fan_number", 0, 1, 0, false, "Index for M106/M107 T<n> routing"},
        {"heaters", "", false, "Space separated heaters cooled by this fan"},

        {"tachometer_pin", "", false, "Cumulative pulse count file"},
        {"tachometer_ppr", 2, 1, 0, false, "Tachometer pulses per revolution"},
        {"tachometer_poll_interval", 0.0015, false, Bound::Exclusive, 0.0, Bound::None, 0.0,
         "Tachometer poll interval in seconds"},
        {"tach_loss_interval", 3.0, false, Bound::Exclusive, 0.0, Bound::Exclusive, 10.0,
         "Seconds of zero RPM while commanded on before the loss action runs"},
        {"tach_loss_action", "shutdown", kTachLossActionValues, 3, "Action on tach signal loss"},
        {"tach_warning_repeat_interval", 3.0, false, Bound::Exclusive, -1.0, Bound::None, 0.0,
         "Seconds between repeated warnings, 0 warns once (default: tach_loss_interval)"},

        {"sensor", "", true, "SOURCE id feeding a temperature fan"},
        {"min_temp", 0.0, true, Bound::Inclusive, -273.15, Bound::None, 0.0, "Minimum valid sensor temperature"},
        {"max_temp", 0.0, true, Bound::None, 0.0, Bound::None, 0.0, "Maximum valid sensor temperature"},
        {"min_temp_cutoff", 0.0, false, Bound::None, 0.0, Bound::Inclusive, 65.0,
         "Below this temperature the fan is off"},
        {"target_temp", 40.0, false, Bound::None, 0.0, Bound::None, 0.0,
         "Target temperature (default: 40 or max_temp when lower)"},
        {"max_speed", 1.0, false, Bound::Exclusive, 0.0, Bound::Inclusive, 1.0, "Maximum temperature fan speed"},
        {"min_speed", 0.3, false, Bound::Inclusive, 0.0, Bound::Inclusive, 1.0, "Minimum temperature fan speed"},
        {"control", "", kControlValues, 3, "Temperature control algorithm"},
        {"max_delta", 2.0, false, Bound::Exclusive, 0.0, Bound::None, 0.0, "Watermark hysteresis half width"},
        {"pid_Kp", 0.0, true, Bound::None, 0.0, Bound::None, 0.0, "PID proportional gain (0..255 scale)"},
        {"pid_Ki", 0.0, true, Bound::None, 0.0, Bound::None, 0.0, "PID integral gain (0..255 scale)"},
        {"pid_Kd", 0.0, true, Bound::None, 0.0, Bound::None, 0.0, "PID derivative gain (0..255 scale)"},
        {"pid_deriv_time", 2.0, false, Bound::Exclusive, 0.0, Bound::None, 0.0,
         "Derivative smoothing window in seconds"},
        {"slope", "", kSlopeValues, 3, "Slope curve"},

        {"poll", 1, 1, 0, false, "Source polling interval in seconds"},
        kNamePattern,
        kSourceTypes,
        2,
    };

    return kSpec;
}

} // namespace fanctl::core
