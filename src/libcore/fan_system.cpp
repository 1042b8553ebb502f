#include "libcore/fan_system.hpp"

#include <algorithm>
#include <utility>

#include "libcore/errors.hpp"
#include "libcore/fan_tachometer.hpp"

namespace fanctl::core {

FanSystem::FanSystem(Machine &machine, LookaheadQueue &lookahead, HardwareFactory &hardware)
    : machine_(machine), lookahead_(lookahead), hardware_(hardware), commands_(registry_, machine) {}

FanSystem::~FanSystem() = default;

std::unique_ptr<Fan> FanSystem::make_fan(const FanConfig &cfg) {
    PwmSink &pwm = hardware_.make_pwm(cfg);
    DigitalSink *enable_pin = nullptr;
    if (!cfg.enable_pin.empty()) {
        enable_pin = &hardware_.make_digital(cfg.enable_pin);
    }
    auto fan = std::make_unique<Fan>(cfg, pwm, enable_pin, lookahead_);
    if (cfg.tachometer) {
        fan->attach_tachometer(std::make_unique<FanTachometer>(*cfg.tachometer, *fan, machine_));
        tachs_.push_back(TachBinding{fan->tachometer(), &hardware_.make_frequency_input(*cfg.tachometer), 0.0});
    }
    return fan;
}

void FanSystem::build(const FanctlConfig &cfg) {
    if (built_) {
        throw ConfigError("fan system is already built");
    }

    if (cfg.fan) {
        primary_ = make_fan(*cfg.fan);
        registry_.set_primary(*primary_);
    }

    for (const auto &fan_cfg : cfg.generic_fans) {
        generic_fans_.push_back(make_fan(fan_cfg));
        commands_.add_generic_fan(*generic_fans_.back());
    }

    for (const auto &tf_cfg : cfg.temperature_fans) {
        const auto src = std::find_if(cfg.sources.begin(), cfg.sources.end(), [&](const SourceConfig &s) {
            return s.id == tf_cfg.sensor;
        });
        if (src == cfg.sources.end()) {
            throw ConfigError("temperature_fan " + tf_cfg.fan.name + ": unknown sensor '" + tf_cfg.sensor + "'");
        }
        temperature_fans_.push_back(
            std::make_unique<TemperatureFan>(tf_cfg, make_fan(tf_cfg.fan), machine_, lookahead_.lead_time()));
        commands_.add_temperature_fan(*temperature_fans_.back());
    }

    built_ = true;
}

void FanSystem::connect() {
    if (!built_ || connected_) {
        throw ConfigError("fan system must be built once before connect");
    }
    for (const auto &binding : tachs_) {
        binding.tachometer->handle_connect();
    }
    for (auto &fan : generic_fans_) {
        if (const auto index = fan->slicer_fan_number()) {
            registry_.add_fan(*index, *fan);
        }
    }
    connected_ = true;
}

void FanSystem::on_restart(double print_time) {
    if (primary_) {
        primary_->handle_request_restart(print_time);
    }
    for (auto &fan : generic_fans_) {
        fan->handle_request_restart(print_time);
    }
    for (auto &tf : temperature_fans_) {
        tf->fan().handle_request_restart(print_time);
    }
}

void FanSystem::on_temperature_sample(const std::string &source_id, double read_time, double temp,
                                      double eventtime) {
    for (auto &tf : temperature_fans_) {
        if (machine_.is_shutdown()) {
            return;
        }
        if (tf->sensor() == source_id) {
            tf->temperature_callback(read_time, temp, eventtime);
        }
    }
}

void FanSystem::poll_tachometers(double eventtime) {
    for (auto &binding : tachs_) {
        if (machine_.is_shutdown()) {
            return;
        }
        const double frequency = binding.input->read_frequency(eventtime);
        if (eventtime < binding.next_sample_time) {
            continue;
        }
        binding.next_sample_time = eventtime + kTachReportTime;
        binding.tachometer->sample(frequency, eventtime);
    }
}

std::vector<std::pair<std::string, FanStatus>> FanSystem::collect_status() const {
    std::vector<std::pair<std::string, FanStatus>> out;
    if (primary_) {
        out.emplace_back(primary_->name(), primary_->get_status());
    }
    for (const auto &fan : generic_fans_) {
        out.emplace_back(fan->name(), fan->get_status());
    }
    for (const auto &tf : temperature_fans_) {
        out.emplace_back(tf->name(), tf->get_status());
    }
    return out;
}

FanCommands &FanSystem::commands() {
    return commands_;
}

FanRegistry &FanSystem::registry() {
    return registry_;
}

Fan *FanSystem::primary_fan() const {
    return primary_.get();
}

const std::vector<std::unique_ptr<Fan>> &FanSystem::generic_fans() const {
    return generic_fans_;
}

const std::vector<std::unique_ptr<TemperatureFan>> &FanSystem::temperature_fans() const {
    return temperature_fans_;
}

} // namespace fanctl::core
