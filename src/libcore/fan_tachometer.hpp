#pragma once

#include <optional>
#include <string>

#include "libcore/fan_config.hpp"
#include "libcore/machine.hpp"

namespace fanctl::core {

class Fan;

class FanTachometer {
public:
    FanTachometer(const TachometerConfig &cfg, const Fan &fan, Machine &machine);

    // Converts a pulse frequency to RPM and runs the tach loss state machine.
    double sample(double frequency, double eventtime);

    // Rejects any loss action other than shutdown on a fan that cools a heater.
    void handle_connect() const;

    std::optional<double> rpm() const;
    std::optional<double> loss_since() const;
    TachLossAction loss_action() const;
    double poll_interval() const;
    double loss_interval() const;

private:
    void run_loss_action(double eventtime);
    void warning(double eventtime);

    const Fan &fan_;
    Machine &machine_;
    int ppr_ = 2;
    double poll_interval_ = 0.0;
    double loss_interval_ = 0.0;
    double warning_repeat_interval_ = 0.0;
    TachLossAction loss_action_ = TachLossAction::Shutdown;

    std::optional<double> rpm_;
    std::optional<double> loss_since_;
    std::optional<double> last_warning_time_;
};

} // namespace fanctl::core
