#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "libcore/command_queue.hpp"
#include "libcore/fan_config.hpp"
#include "libcore/output_pins.hpp"

namespace fanctl::core {

inline constexpr double kFanMinTime = 0.100;

class FanTachometer;

struct FanStatus {
    double speed = 0.0;
    std::optional<double> rpm;
    std::optional<double> temperature;
    std::optional<double> target;
};

// Turns a requested speed into scheduled PWM (and enable pin) commands.
//
// A 3-wire fan gets no reliable rotation under 20% duty, so requests are remapped onto
// 0.2..1.0 and anything that lands on 0.2 is sent as off. A low target reached from a
// standstill is preceded by a full power kick of kick_start_time seconds. Consecutive
// commands are at least kFanMinTime apart.
class Fan {
public:
    Fan(const FanConfig &cfg, PwmSink &pwm, DigitalSink *enable_pin, LookaheadQueue &lookahead);
    ~Fan();

    Fan(const Fan &) = delete;
    Fan &operator=(const Fan &) = delete;

    void set_speed(double print_time, double value);
    void set_speed_from_command(double value);
    void handle_request_restart(double print_time);
    FanStatus get_status() const;

    void attach_tachometer(std::unique_ptr<FanTachometer> tachometer);
    FanTachometer *tachometer() const;

    const std::string &section() const;
    const std::string &name() const;
    const std::vector<std::string> &heater_names() const;
    std::optional<int> slicer_fan_number() const;
    double last_value() const;
    double last_command_time() const;
    double max_power() const;
    bool is_four_wire() const;

private:
    std::string section_;
    std::string name_;
    std::vector<std::string> heater_names_;
    std::optional<int> slicer_fan_number_;

    PwmSink &pwm_;
    DigitalSink *enable_pin_ = nullptr;
    LookaheadQueue &lookahead_;
    std::unique_ptr<FanTachometer> tachometer_;

    double max_power_ = 1.0;
    double kick_start_time_ = 0.0;
    double off_below_ = 0.0;
    bool four_wire_ = false;

    double last_value_ = 0.0;
    double last_command_time_ = 0.0;
};

} // namespace fanctl::core
