#include "libcore/fan_tachometer.hpp"

#include <sstream>

#include "libcore/errors.hpp"
#include "libcore/fan.hpp"

namespace fanctl::core {
namespace {

std::string seconds_text(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace

FanTachometer::FanTachometer(const TachometerConfig &cfg, const Fan &fan, Machine &machine)
    : fan_(fan),
      machine_(machine),
      ppr_(cfg.ppr > 0 ? cfg.ppr : 1),
      poll_interval_(cfg.poll_interval),
      loss_interval_(cfg.loss_interval),
      warning_repeat_interval_(cfg.warning_repeat_interval),
      loss_action_(cfg.loss_action) {}

double FanTachometer::sample(double frequency, double eventtime) {
    const double rpm = frequency * 30.0 / static_cast<double>(ppr_);
    rpm_ = rpm;

    if (rpm > 0.0) {
        loss_since_.reset();
    } else if (fan_.last_value() > 0.0) {
        if (!loss_since_) {
            // Zero RPM counts only once the last commanded duty is on the pin.
            if (eventtime >= fan_.last_command_time()) {
                loss_since_ = eventtime;
            }
        } else if (eventtime - *loss_since_ > loss_interval_) {
            run_loss_action(eventtime);
        }
    } else {
        loss_since_.reset();
    }
    return rpm;
}

void FanTachometer::handle_connect() const {
    if (!fan_.heater_names().empty() && loss_action_ != TachLossAction::Shutdown) {
        throw ConfigError(fan_.name() + " controls a heater so must have a tach_loss_action of 'shutdown'");
    }
}

std::optional<double> FanTachometer::rpm() const {
    return rpm_;
}

std::optional<double> FanTachometer::loss_since() const {
    return loss_since_;
}

TachLossAction FanTachometer::loss_action() const {
    return loss_action_;
}

double FanTachometer::poll_interval() const {
    return poll_interval_;
}

double FanTachometer::loss_interval() const {
    return loss_interval_;
}

void FanTachometer::run_loss_action(double eventtime) {
    switch (loss_action_) {
    case TachLossAction::Shutdown:
        machine_.invoke_shutdown("Tach signal lost on " + fan_.name() + " for longer than " +
                                 seconds_text(loss_interval_) + " seconds.");
        break;
    case TachLossAction::Warning:
        warning(eventtime);
        break;
    case TachLossAction::None:
        break;
    }
}

void FanTachometer::warning(double eventtime) {
    if (last_warning_time_) {
        if (warning_repeat_interval_ == 0.0) {
            return;
        }
        if (eventtime - *last_warning_time_ < warning_repeat_interval_) {
            return;
        }
    }
    machine_.respond_raw("!! Warning: " + fan_.name() + " has lost tach signal for longer than " +
                         seconds_text(loss_interval_) + " seconds!");
    last_warning_time_ = eventtime;
}

} // namespace fanctl::core
