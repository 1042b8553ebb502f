#pragma once

#include <memory>
#include <optional>

#include "libcore/fan_config.hpp"

namespace fanctl::core {

class TemperatureFan;

inline constexpr double kAmbientTemp = 25.0;
inline constexpr double kPidParamBase = 255.0;
inline constexpr double kMaxTempBuffer = 0.8;
inline constexpr double kSlopeHysteresis = 0.5;

class TemperatureControl {
public:
    virtual ~TemperatureControl() = default;

    // Desired fan speed for a sample, or nullopt to keep the current output.
    virtual std::optional<double> on_sample(double read_time, double temp) = 0;
};

class ControlBangBang : public TemperatureControl {
public:
    ControlBangBang(const TemperatureFan &fan, double max_delta);

    std::optional<double> on_sample(double read_time, double temp) override;
    bool heating() const;

private:
    const TemperatureFan &fan_;
    double max_delta_ = 2.0;
    bool heating_ = false;
};

// Cooling PID. The bounded control output is subtracted from max_speed, and the integral
// only advances while the output is not saturated.
class ControlPid : public TemperatureControl {
public:
    ControlPid(const TemperatureFan &fan, double kp, double ki, double kd, double min_deriv_time);

    std::optional<double> on_sample(double read_time, double temp) override;

    double prev_temp() const;
    double prev_temp_time() const;
    double prev_temp_deriv() const;
    double prev_temp_integ() const;

private:
    const TemperatureFan &fan_;
    double kp_ = 0.0;
    double ki_ = 0.0;
    double kd_ = 0.0;
    double min_deriv_time_ = 2.0;

    double prev_temp_ = kAmbientTemp;
    double prev_temp_time_ = 0.0;
    double prev_temp_deriv_ = 0.0;
    double prev_temp_integ_ = 0.0;
};

class ControlSlope : public TemperatureControl {
public:
    ControlSlope(TemperatureFan &fan, SlopeCurve curve);

    std::optional<double> on_sample(double read_time, double temp) override;

    double min_temp() const;
    double max_temp() const;
    double curve_speed(double temp) const;

private:
    TemperatureFan &fan_;
    SlopeCurve curve_ = SlopeCurve::Linear;
    double min_temp_ = 0.0;
    double max_temp_ = 0.0;
};

std::unique_ptr<TemperatureControl> make_temperature_control(const TemperatureFanConfig &cfg, TemperatureFan &fan);

} // namespace fanctl::core
