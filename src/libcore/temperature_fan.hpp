#pragma once

#include <memory>
#include <optional>
#include <string>

#include "libcore/fan.hpp"
#include "libcore/fan_config.hpp"
#include "libcore/machine.hpp"
#include "libcore/temp_control.hpp"

namespace fanctl::core {

inline constexpr double kMaxFanTime = 5.0;

// A fan driven by a temperature sensor through one of the control algorithms.
class TemperatureFan {
public:
    // speed_delay is the lead between handling a sample and its PWM change landing.
    TemperatureFan(const TemperatureFanConfig &cfg, std::unique_ptr<Fan> fan, Machine &machine, double speed_delay);
    ~TemperatureFan();

    TemperatureFan(const TemperatureFan &) = delete;
    TemperatureFan &operator=(const TemperatureFan &) = delete;

    // read_time is when the sensor took the sample, eventtime when the loop handed it over.
    void temperature_callback(double read_time, double temp, double eventtime);
    void set_speed(double eventtime, double value);

    void validate_target(double degrees) const;
    void set_target(double degrees);
    void set_speed_bounds(double min_speed, double max_speed);
    // Display-only target used by controls without a setpoint.
    void track_target(double degrees);

    FanStatus get_status() const;

    const std::string &name() const;
    const std::string &sensor() const;
    Fan &fan();
    const Fan &fan() const;
    TemperatureControl &control();

    double last_temp() const;
    double target_temp() const;
    double configured_target() const;
    double min_speed() const;
    double max_speed() const;
    double min_temp() const;
    double max_temp() const;
    double min_temp_cutoff() const;
    double speed_delay() const;

private:
    std::string name_;
    std::string sensor_;
    std::unique_ptr<Fan> fan_;
    Machine &machine_;

    double min_temp_ = 0.0;
    double max_temp_ = 0.0;
    double min_temp_cutoff_ = 0.0;
    double target_temp_conf_ = 0.0;
    double target_temp_ = 0.0;
    double min_speed_ = 0.0;
    double max_speed_ = 1.0;
    double speed_delay_ = 0.0;

    double last_temp_ = 0.0;
    double next_speed_time_ = 0.0;
    double last_speed_value_ = 0.0;

    std::unique_ptr<TemperatureControl> control_;
};

} // namespace fanctl::core
