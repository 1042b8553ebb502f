#include "libcore/fan.hpp"

#include <algorithm>
#include <utility>

#include "libcore/fan_tachometer.hpp"

namespace fanctl::core {

Fan::Fan(const FanConfig &cfg, PwmSink &pwm, DigitalSink *enable_pin, LookaheadQueue &lookahead)
    : section_(cfg.section.empty() ? cfg.name : cfg.section),
      name_(cfg.name),
      heater_names_(cfg.heaters),
      slicer_fan_number_(cfg.slicer_fan_number),
      pwm_(pwm),
      enable_pin_(enable_pin),
      lookahead_(lookahead),
      max_power_(cfg.max_power),
      kick_start_time_(cfg.kick_start_time),
      off_below_(cfg.off_below),
      four_wire_(cfg.four_wire) {
    pwm_.configure(cfg.cycle_time, cfg.hardware_pwm);
    const double shutdown_power = std::max(0.0, std::min(max_power_, cfg.shutdown_speed));
    pwm_.set_initial(0.0, shutdown_power);
}

Fan::~Fan() = default;

void Fan::set_speed(double print_time, double value) {
    double fan_speed = value;
    if (!four_wire_) {
        fan_speed = 0.2 + 0.8 * value;
        if (fan_speed <= 0.2) {
            fan_speed = 0.0;
        }
    }
    if (value < off_below_) {
        fan_speed = 0.0;
    }
    fan_speed = std::max(0.0, std::min(max_power_, fan_speed * max_power_));
    if (value == last_value_) {
        return;
    }

    print_time = std::max(last_command_time_ + kFanMinTime, print_time);
    if (enable_pin_) {
        if (value > 0.0 && last_value_ == 0.0) {
            enable_pin_->schedule(print_time, true);
        } else if (value == 0.0 && last_value_ > 0.0) {
            enable_pin_->schedule(print_time, false);
        }
    }
    if (fan_speed > 0.0 && fan_speed < max_power_ && kick_start_time_ > 0.0 &&
        (last_value_ == 0.0 || fan_speed - last_value_ > 0.5)) {
        pwm_.schedule(print_time, max_power_);
        print_time += kick_start_time_;
    }
    pwm_.schedule(print_time, fan_speed);
    last_command_time_ = print_time;
    // Status reports the request, not the hardware scaling.
    last_value_ = value;
}

void Fan::set_speed_from_command(double value) {
    lookahead_.register_callback([this, value](double print_time) {
        set_speed(print_time, value);
    });
}

void Fan::handle_request_restart(double print_time) {
    set_speed(print_time, 0.0);
}

FanStatus Fan::get_status() const {
    FanStatus status;
    status.speed = last_value_;
    if (tachometer_) {
        status.rpm = tachometer_->rpm();
    }
    return status;
}

void Fan::attach_tachometer(std::unique_ptr<FanTachometer> tachometer) {
    tachometer_ = std::move(tachometer);
}

FanTachometer *Fan::tachometer() const {
    return tachometer_.get();
}

const std::string &Fan::section() const {
    return section_;
}

const std::string &Fan::name() const {
    return name_;
}

const std::vector<std::string> &Fan::heater_names() const {
    return heater_names_;
}

std::optional<int> Fan::slicer_fan_number() const {
    return slicer_fan_number_;
}

double Fan::last_value() const {
    return last_value_;
}

double Fan::last_command_time() const {
    return last_command_time_;
}

double Fan::max_power() const {
    return max_power_;
}

bool Fan::is_four_wire() const {
    return four_wire_;
}

} // namespace fanctl::core
