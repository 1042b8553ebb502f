#include "libcore/output_pins.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "libcore/sysfs_io.hpp"

namespace fanctl::core {
namespace {

constexpr int kHwmonPwmMax = 255;

} // namespace

SysfsPwmPin::SysfsPwmPin(std::string path, PwmPinType type, CommandQueue &queue, bool debug)
    : path_(std::move(path)), type_(type), queue_(queue), debug_(debug) {}

void SysfsPwmPin::configure(double cycle_time, bool hardware_pwm) {
    if (type_ == PwmPinType::Hwmon) {
        if (debug_) {
            std::cerr << "pwm[" << path_ << "] hwmon output, cycle_time=" << cycle_time
                      << " hardware_pwm=" << (hardware_pwm ? 1 : 0) << " left to the driver\n";
        }
        return;
    }

    period_ns_ = std::max(1LL, std::llround(cycle_time * 1e9));
    const std::string period_path = path_ + "/period";
    if (!try_write_int(period_path, period_ns_)) {
        // The kernel refuses a period shorter than the current duty cycle.
        if (!try_write_int(path_ + "/duty_cycle", 0) || !try_write_int(period_path, period_ns_)) {
            throw std::runtime_error("cannot set PWM period on " + period_path);
        }
    }
    if (debug_) {
        std::cerr << "pwm[" << path_ << "] period=" << period_ns_ << "ns\n";
    }
}

void SysfsPwmPin::set_initial(double value, double shutdown_value) {
    shutdown_value_ = shutdown_value;
    write_duty(value);
}

void SysfsPwmPin::schedule(double print_time, double duty) {
    queue_.push(print_time, [this, duty]() {
        write_duty(duty);
    });
}

void SysfsPwmPin::apply_shutdown() {
    write_duty(shutdown_value_);
}

const std::string &SysfsPwmPin::path() const {
    return path_;
}

PwmPinType SysfsPwmPin::type() const {
    return type_;
}

double SysfsPwmPin::last_duty() const {
    return last_duty_;
}

void SysfsPwmPin::write_duty(double duty) {
    const double bounded = std::clamp(duty, 0.0, 1.0);
    if (type_ == PwmPinType::Hwmon) {
        const long long raw = std::llround(bounded * kHwmonPwmMax);
        if (!try_write_int(path_, raw)) {
            throw std::runtime_error("Error writing PWM value to " + path_);
        }
    } else {
        const long long raw = std::llround(bounded * static_cast<double>(period_ns_));
        if (!try_write_int(path_ + "/duty_cycle", raw)) {
            throw std::runtime_error("Error writing PWM duty cycle to " + path_);
        }
        if (!enabled_) {
            if (!try_write_int(path_ + "/enable", 1)) {
                throw std::runtime_error("Error enabling PWM channel " + path_);
            }
            enabled_ = true;
        }
    }
    last_duty_ = bounded;
    if (debug_) {
        std::cerr << "pwm[" << path_ << "]=" << bounded << "\n";
    }
}

SysfsDigitalPin::SysfsDigitalPin(std::string path, CommandQueue &queue, bool debug)
    : path_(std::move(path)), queue_(queue), debug_(debug) {}

void SysfsDigitalPin::schedule(double print_time, bool level) {
    queue_.push(print_time, [this, level]() {
        write_now(level);
    });
}

void SysfsDigitalPin::write_now(bool level) {
    if (!try_write_int(path_, level ? 1 : 0)) {
        throw std::runtime_error("Error writing digital output " + path_);
    }
    if (debug_) {
        std::cerr << "gpio[" << path_ << "]=" << (level ? 1 : 0) << "\n";
    }
}

const std::string &SysfsDigitalPin::path() const {
    return path_;
}

FrequencyCounter::FrequencyCounter(std::string path, double sample_time)
    : path_(std::move(path)), sample_time_(sample_time > 0.0 ? sample_time : kSampleTime) {}

double FrequencyCounter::read_frequency(double eventtime) {
    if (const auto count = try_read_int(path_)) {
        update(eventtime, *count);
    }
    return frequency_;
}

void FrequencyCounter::update(double eventtime, long long count) {
    if (!window_count_ || count < *window_count_) {
        window_count_ = count;
        window_start_ = eventtime;
        return;
    }
    const double elapsed = eventtime - window_start_;
    if (elapsed < sample_time_) {
        return;
    }
    frequency_ = static_cast<double>(count - *window_count_) / elapsed;
    window_count_ = count;
    window_start_ = eventtime;
}

double FrequencyCounter::frequency() const {
    return frequency_;
}

SysfsHardware::SysfsHardware(CommandQueue &queue, bool debug) : queue_(queue), debug_(debug) {}

PwmSink &SysfsHardware::make_pwm(const FanConfig &fan) {
    pwm_pins_.push_back(std::make_unique<SysfsPwmPin>(fan.pin, fan.pin_type, queue_, debug_));
    return *pwm_pins_.back();
}

DigitalSink &SysfsHardware::make_digital(const std::string &path) {
    auto pin = std::make_unique<SysfsDigitalPin>(path, queue_, debug_);
    pin->write_now(false);
    digital_pins_.push_back(std::move(pin));
    return *digital_pins_.back();
}

FrequencyInput &SysfsHardware::make_frequency_input(const TachometerConfig &tach) {
    counters_.push_back(std::make_unique<FrequencyCounter>(tach.pin));
    return *counters_.back();
}

void SysfsHardware::apply_shutdown_all() {
    for (auto &pin : pwm_pins_) {
        try {
            pin->apply_shutdown();
        } catch (const std::exception &e) {
            std::cerr << "fanctl: " << e.what() << '\n';
        }
    }
}

const std::vector<std::unique_ptr<SysfsPwmPin>> &SysfsHardware::pwm_pins() const {
    return pwm_pins_;
}

PwmOwnershipGuard::PwmOwnershipGuard(const std::vector<const FanConfig *> &fans, bool debug) : debug_(debug) {
    for (const FanConfig *fan : fans) {
        if (fan->pin_type != PwmPinType::Hwmon) {
            continue;
        }
        Claim claim;
        claim.pwm_path = fan->pin;
        claim.enable_path = fan->pin + "_enable";
        if (!file_exists(claim.enable_path)) {
            continue;
        }
        claim.orig_enable = try_read_int(claim.enable_path);
        if (!try_write_int(claim.enable_path, 1)) {
            release();
            throw std::runtime_error("failed to enable manual PWM mode on " + claim.enable_path);
        }
        if (debug_) {
            std::cerr << "Set " << claim.enable_path << " to 1 (was "
                      << (claim.orig_enable ? std::to_string(*claim.orig_enable) : "<unknown>") << ")\n";
        }
        claims_.push_back(std::move(claim));
    }
}

PwmOwnershipGuard::~PwmOwnershipGuard() {
    release();
}

void PwmOwnershipGuard::hold_manual() {
    for (const auto &claim : claims_) {
        std::cerr << "fanctl: leaving " << claim.enable_path << " in manual mode\n";
    }
    claims_.clear();
}

std::size_t PwmOwnershipGuard::claimed() const {
    return claims_.size();
}

void PwmOwnershipGuard::release() {
    for (const auto &claim : claims_) {
        const long long restore = claim.orig_enable.value_or(0);
        if (debug_) {
            std::cerr << "Restoring " << claim.enable_path << " to " << restore << "\n";
        }
        if (!try_write_int(claim.enable_path, restore)) {
            // Left in manual mode: run it at full speed rather than at whatever we wrote last.
            std::cerr << "fanctl: cannot restore " << claim.enable_path << ", forcing full speed\n";
            (void)try_write_int(claim.pwm_path, kHwmonPwmMax);
        }
    }
    claims_.clear();
}

} // namespace fanctl::core
