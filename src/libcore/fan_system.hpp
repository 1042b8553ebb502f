#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "libcore/command_queue.hpp"
#include "libcore/fan.hpp"
#include "libcore/fan_commands.hpp"
#include "libcore/fan_config.hpp"
#include "libcore/fan_registry.hpp"
#include "libcore/machine.hpp"
#include "libcore/output_pins.hpp"
#include "libcore/temperature_fan.hpp"

namespace fanctl::core {

// Tachometers report once per counter window.
inline constexpr double kTachReportTime = FrequencyCounter::kSampleTime;

// Every fan of one configuration, wired to its hardware and command front end.
//
// build() creates the objects, connect() runs the checks that need the whole set
// (tach policy vs. heater role, slicer fan numbers). Both throw ConfigError.
class FanSystem {
public:
    FanSystem(Machine &machine, LookaheadQueue &lookahead, HardwareFactory &hardware);
    ~FanSystem();

    FanSystem(const FanSystem &) = delete;
    FanSystem &operator=(const FanSystem &) = delete;

    void build(const FanctlConfig &cfg);
    void connect();
    void on_restart(double print_time);

    void on_temperature_sample(const std::string &source_id, double read_time, double temp, double eventtime);
    void poll_tachometers(double eventtime);

    std::vector<std::pair<std::string, FanStatus>> collect_status() const;

    FanCommands &commands();
    FanRegistry &registry();
    Fan *primary_fan() const;
    const std::vector<std::unique_ptr<Fan>> &generic_fans() const;
    const std::vector<std::unique_ptr<TemperatureFan>> &temperature_fans() const;

private:
    struct TachBinding {
        FanTachometer *tachometer = nullptr;
        FrequencyInput *input = nullptr;
        double next_sample_time = 0.0;
    };

    std::unique_ptr<Fan> make_fan(const FanConfig &cfg);

    Machine &machine_;
    LookaheadQueue &lookahead_;
    HardwareFactory &hardware_;
    FanRegistry registry_;
    FanCommands commands_;

    std::unique_ptr<Fan> primary_;
    std::vector<std::unique_ptr<Fan>> generic_fans_;
    std::vector<std::unique_ptr<TemperatureFan>> temperature_fans_;
    std::vector<TachBinding> tachs_;
    bool built_ = false;
    bool connected_ = false;
};

} // namespace fanctl::core
