#include "libcore/temperature_fan.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "libcore/errors.hpp"

namespace fanctl::core {
namespace {

std::string fixed1(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

} // namespace

TemperatureFan::TemperatureFan(const TemperatureFanConfig &cfg, std::unique_ptr<Fan> fan, Machine &machine,
                               double speed_delay)
    : name_(cfg.fan.name),
      sensor_(cfg.sensor),
      fan_(std::move(fan)),
      machine_(machine),
      min_temp_(cfg.min_temp),
      max_temp_(cfg.max_temp),
      min_temp_cutoff_(cfg.min_temp_cutoff),
      target_temp_conf_(cfg.target_temp),
      target_temp_(cfg.target_temp),
      min_speed_(cfg.min_speed),
      max_speed_(cfg.max_speed),
      speed_delay_(speed_delay) {
    if (min_temp_ > kAmbientTemp * 0.9) {
        std::ostringstream oss;
        oss << "!!!Warning: Minimum temp of " << std::fixed << std::setprecision(3) << min_temp_
            << " on temperature_fan " << name_ << " is close to or above room temperature. ADC Shutdown likely!";
        machine_.respond_raw(oss.str());
    }
    control_ = make_temperature_control(cfg, *this);
}

TemperatureFan::~TemperatureFan() = default;

void TemperatureFan::temperature_callback(double read_time, double temp, double eventtime) {
    if (temp < min_temp_ || temp > max_temp_) {
        machine_.invoke_shutdown("temperature_fan " + name_ + ": temperature " + fixed1(temp) + " out of range (" +
                                 fixed1(min_temp_) + ":" + fixed1(max_temp_) + ")");
        return;
    }
    last_temp_ = temp;
    if (const auto speed = control_->on_sample(read_time, temp)) {
        set_speed(std::max(read_time, eventtime), *speed);
    }
}

void TemperatureFan::set_speed(double eventtime, double value) {
    if (value <= 0.0) {
        value = 0.0;
    } else if (value < min_speed_) {
        value = min_speed_;
    }
    if (target_temp_ <= 0.0) {
        value = 0.0;
    }
    if ((eventtime < next_speed_time_ || last_speed_value_ == 0.0) &&
        std::abs(value - last_speed_value_) < 0.05) {
        // No significant change, suppress the update.
        return;
    }
    const double speed_time = eventtime + speed_delay_;
    next_speed_time_ = speed_time + 0.75 * kMaxFanTime;
    last_speed_value_ = value;
    fan_->set_speed(speed_time, value);
}

void TemperatureFan::validate_target(double degrees) const {
    if (degrees != 0.0 && (degrees < min_temp_ || degrees > max_temp_)) {
        throw CommandError("Requested temperature (" + fixed1(degrees) + ") out of range (" + fixed1(min_temp_) +
                           ":" + fixed1(max_temp_) + ")");
    }
}

void TemperatureFan::set_target(double degrees) {
    validate_target(degrees);
    target_temp_ = degrees;
}

void TemperatureFan::set_speed_bounds(double min_speed, double max_speed) {
    if (min_speed < 0.0 || min_speed > 1.0) {
        throw CommandError("Requested min speed (" + fixed1(min_speed) + ") out of range (0.0 : 1.0)");
    }
    if (max_speed < 0.0 || max_speed > 1.0) {
        throw CommandError("Requested max speed (" + fixed1(max_speed) + ") out of range (0.0 : 1.0)");
    }
    if (min_speed > max_speed) {
        throw CommandError("Requested min speed (" + fixed1(min_speed) + ") is greater than max speed (" +
                           fixed1(max_speed) + ")");
    }
    min_speed_ = min_speed;
    max_speed_ = max_speed;
}

void TemperatureFan::track_target(double degrees) {
    target_temp_ = degrees;
}

FanStatus TemperatureFan::get_status() const {
    FanStatus status = fan_->get_status();
    status.temperature = std::round(last_temp_ * 100.0) / 100.0;
    status.target = target_temp_;
    return status;
}

const std::string &TemperatureFan::name() const {
    return name_;
}

const std::string &TemperatureFan::sensor() const {
    return sensor_;
}

Fan &TemperatureFan::fan() {
    return *fan_;
}

const Fan &TemperatureFan::fan() const {
    return *fan_;
}

TemperatureControl &TemperatureFan::control() {
    return *control_;
}

double TemperatureFan::last_temp() const {
    return last_temp_;
}

double TemperatureFan::target_temp() const {
    return target_temp_;
}

double TemperatureFan::configured_target() const {
    return target_temp_conf_;
}

double TemperatureFan::min_speed() const {
    return min_speed_;
}

double TemperatureFan::max_speed() const {
    return max_speed_;
}

double TemperatureFan::min_temp() const {
    return min_temp_;
}

double TemperatureFan::max_temp() const {
    return max_temp_;
}

double TemperatureFan::min_temp_cutoff() const {
    return min_temp_cutoff_;
}

double TemperatureFan::speed_delay() const {
    return speed_delay_;
}

} // namespace fanctl::core
