#include "libcore/temp_control.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "libcore/errors.hpp"
#include "libcore/temperature_fan.hpp"

namespace fanctl::core {

ControlBangBang::ControlBangBang(const TemperatureFan &fan, double max_delta) : fan_(fan), max_delta_(max_delta) {}

std::optional<double> ControlBangBang::on_sample(double /* read_time */, double temp) {
    if (temp < fan_.min_temp_cutoff()) {
        return 0.0;
    }
    const double target = fan_.target_temp();
    if (heating_ && temp >= target + max_delta_) {
        heating_ = false;
    } else if (!heating_ && temp <= target - max_delta_) {
        heating_ = true;
    }
    return heating_ ? 0.0 : fan_.max_speed();
}

bool ControlBangBang::heating() const {
    return heating_;
}

ControlPid::ControlPid(const TemperatureFan &fan, double kp, double ki, double kd, double min_deriv_time)
    : fan_(fan),
      kp_(kp / kPidParamBase),
      ki_(ki / kPidParamBase),
      kd_(kd / kPidParamBase),
      min_deriv_time_(min_deriv_time) {}

std::optional<double> ControlPid::on_sample(double read_time, double temp) {
    if (temp < fan_.min_temp_cutoff()) {
        return 0.0;
    }
    const double max_speed = fan_.max_speed();
    const double time_diff = read_time - prev_temp_time_;

    const double temp_diff = temp - prev_temp_;
    double temp_deriv = 0.0;
    if (time_diff >= min_deriv_time_) {
        temp_deriv = temp_diff / time_diff;
    } else {
        temp_deriv = (prev_temp_deriv_ * (min_deriv_time_ - time_diff) + temp_diff) / min_deriv_time_;
    }

    const double temp_err = fan_.target_temp() - temp;
    const double temp_integ_max = ki_ != 0.0 ? max_speed / ki_ : 0.0;
    const double temp_integ = std::max(0.0, std::min(temp_integ_max, prev_temp_integ_ + temp_err * time_diff));

    const double co = kp_ * temp_err + ki_ * temp_integ - kd_ * temp_deriv;
    const double bounded_co = std::max(0.0, std::min(max_speed, co));

    prev_temp_ = temp;
    prev_temp_time_ = read_time;
    prev_temp_deriv_ = temp_deriv;
    if (co == bounded_co) {
        prev_temp_integ_ = temp_integ;
    }
    return std::max(fan_.min_speed(), max_speed - bounded_co);
}

double ControlPid::prev_temp() const {
    return prev_temp_;
}

double ControlPid::prev_temp_time() const {
    return prev_temp_time_;
}

double ControlPid::prev_temp_deriv() const {
    return prev_temp_deriv_;
}

double ControlPid::prev_temp_integ() const {
    return prev_temp_integ_;
}

ControlSlope::ControlSlope(TemperatureFan &fan, SlopeCurve curve)
    : fan_(fan), curve_(curve), min_temp_(fan.min_temp()), max_temp_(fan.max_temp() * kMaxTempBuffer) {
    // A floor far below room temperature flattens the whole curve.
    const double cutoff = fan.min_temp_cutoff();
    if (min_temp_ < kAmbientTemp || min_temp_ < cutoff) {
        min_temp_ = cutoff > kAmbientTemp ? cutoff : kAmbientTemp;
    }
    if (max_temp_ <= min_temp_) {
        std::ostringstream oss;
        oss << "temperature_fan " << fan.name() << ": slope range is empty (max_temp*" << kMaxTempBuffer << "="
            << max_temp_ << " <= " << min_temp_ << ")";
        throw ConfigError(oss.str());
    }
}

std::optional<double> ControlSlope::on_sample(double /* read_time */, double temp) {
    const double cutoff = fan_.min_temp_cutoff();
    if (temp < cutoff - kSlopeHysteresis) {
        return 0.0;
    }
    if (temp <= cutoff + kSlopeHysteresis) {
        return std::nullopt;
    }
    const double clamped = std::max(min_temp_, std::min(temp, max_temp_));
    fan_.track_target(std::trunc(clamped * 10.0) / 10.0);
    return std::max(fan_.min_speed(), curve_speed(clamped));
}

double ControlSlope::min_temp() const {
    return min_temp_;
}

double ControlSlope::max_temp() const {
    return max_temp_;
}

double ControlSlope::curve_speed(double temp) const {
    const double span = fan_.max_speed() - fan_.min_speed();
    const double range = max_temp_ - min_temp_;
    switch (curve_) {
    case SlopeCurve::Log:
        // Offset by one so the curve starts at log(1) = 0.
        return span * std::log(temp - min_temp_ + 1.0) / std::log(range + 1.0);
    case SlopeCurve::Exponential: {
        const double normalized = (temp - min_temp_) / range;
        return span * normalized * normalized;
    }
    case SlopeCurve::Linear:
        break;
    }
    return span * (temp - min_temp_) / range;
}

std::unique_ptr<TemperatureControl> make_temperature_control(const TemperatureFanConfig &cfg, TemperatureFan &fan) {
    switch (cfg.control) {
    case ControlKind::Pid:
        return std::make_unique<ControlPid>(fan, cfg.pid_kp, cfg.pid_ki, cfg.pid_kd, cfg.pid_deriv_time);
    case ControlKind::Slope:
        return std::make_unique<ControlSlope>(fan, cfg.slope);
    case ControlKind::Watermark:
        break;
    }
    return std::make_unique<ControlBangBang>(fan, cfg.max_delta);
}

} // namespace fanctl::core
