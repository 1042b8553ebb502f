#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "libcore/fan_config.hpp"
#include "libcore/machine.hpp"
#include "libcore/output_pins.hpp"

namespace fanctl::test {

struct PwmWrite {
    double time = 0.0;
    double duty = 0.0;
};

class FakePwm : public core::PwmSink {
public:
    void configure(double cycle_time, bool hardware_pwm) override {
        this->cycle_time = cycle_time;
        this->hardware_pwm = hardware_pwm;
    }

    void set_initial(double value, double shutdown_value) override {
        initial = value;
        shutdown = shutdown_value;
    }

    void schedule(double print_time, double duty) override {
        writes.push_back(PwmWrite{print_time, duty});
    }

    double cycle_time = 0.0;
    bool hardware_pwm = false;
    double initial = -1.0;
    double shutdown = -1.0;
    std::vector<PwmWrite> writes;
};

class FakeDigital : public core::DigitalSink {
public:
    void schedule(double print_time, bool level) override {
        writes.emplace_back(print_time, level);
    }

    std::vector<std::pair<double, bool>> writes;
};

class FakeFrequency : public core::FrequencyInput {
public:
    double read_frequency(double /* eventtime */) override {
        return frequency;
    }

    double frequency = 0.0;
};

class FakeMachine : public core::Machine {
public:
    void invoke_shutdown(const std::string &reason) override {
        shutdown_reasons.push_back(reason);
    }

    void respond_raw(const std::string &msg) override {
        responses.push_back(msg);
    }

    bool is_shutdown() const override {
        return !shutdown_reasons.empty();
    }

    std::vector<std::string> shutdown_reasons;
    std::vector<std::string> responses;
};

// Hands out fakes and keeps them inspectable after the fans take references.
class FakeHardware : public core::HardwareFactory {
public:
    core::PwmSink &make_pwm(const core::FanConfig &fan) override {
        pwms.emplace_back(fan.name, std::make_unique<FakePwm>());
        return *pwms.back().second;
    }

    core::DigitalSink &make_digital(const std::string &path) override {
        digitals.emplace_back(path, std::make_unique<FakeDigital>());
        return *digitals.back().second;
    }

    core::FrequencyInput &make_frequency_input(const core::TachometerConfig &tach) override {
        inputs.emplace_back(tach.pin, std::make_unique<FakeFrequency>());
        return *inputs.back().second;
    }

    FakePwm &pwm(const std::string &fan_name) {
        for (auto &p : pwms) {
            if (p.first == fan_name) {
                return *p.second;
            }
        }
        throw std::out_of_range("no pwm for " + fan_name);
    }

    std::vector<std::pair<std::string, std::unique_ptr<FakePwm>>> pwms;
    std::vector<std::pair<std::string, std::unique_ptr<FakeDigital>>> digitals;
    std::vector<std::pair<std::string, std::unique_ptr<FakeFrequency>>> inputs;
};

inline core::FanConfig make_fan_config(const std::string &name) {
    core::FanConfig cfg;
    cfg.section = name;
    cfg.name = name;
    cfg.pin = "/sys/class/hwmon/hwmon0/pwm1";
    cfg.kick_start_time = 0.0;
    return cfg;
}

inline core::TemperatureFanConfig make_temperature_fan_config(const std::string &name, core::ControlKind control) {
    core::TemperatureFanConfig cfg;
    cfg.fan = make_fan_config(name);
    cfg.fan.section = "temperature_fan " + name;
    cfg.fan.four_wire = true;
    cfg.fan.shutdown_speed = 1.0;
    cfg.sensor = "cpu";
    cfg.min_temp = 0.0;
    cfg.max_temp = 100.0;
    cfg.target_temp = 60.0;
    cfg.control = control;
    return cfg;
}

} // namespace fanctl::test
