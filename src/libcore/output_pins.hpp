#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "libcore/command_queue.hpp"
#include "libcore/fan_config.hpp"

namespace fanctl::core {

class PwmSink {
public:
    virtual ~PwmSink() = default;
    virtual void configure(double cycle_time, bool hardware_pwm) = 0;
    virtual void set_initial(double value, double shutdown_value) = 0;
    virtual void schedule(double print_time, double duty) = 0;
};

class DigitalSink {
public:
    virtual ~DigitalSink() = default;
    virtual void schedule(double print_time, bool level) = 0;
};

class FrequencyInput {
public:
    virtual ~FrequencyInput() = default;
    // Pulses per second measured over the most recent complete sample window.
    virtual double read_frequency(double eventtime) = 0;
};

// PWM output on a hwmon pwmN file (0..255) or a /sys/class/pwm channel directory.
// Scheduled writes land in the command queue and hit sysfs when their time comes.
class SysfsPwmPin : public PwmSink {
public:
    SysfsPwmPin(std::string path, PwmPinType type, CommandQueue &queue, bool debug);

    void configure(double cycle_time, bool hardware_pwm) override;
    void set_initial(double value, double shutdown_value) override;
    void schedule(double print_time, double duty) override;

    void apply_shutdown();
    const std::string &path() const;
    PwmPinType type() const;
    double last_duty() const;

private:
    void write_duty(double duty);

    std::string path_;
    PwmPinType type_;
    CommandQueue &queue_;
    bool debug_ = false;
    long long period_ns_ = 0;
    double shutdown_value_ = 0.0;
    double last_duty_ = 0.0;
    bool enabled_ = false;
};

// GPIO value file, written "1" or "0" at the scheduled time.
class SysfsDigitalPin : public DigitalSink {
public:
    SysfsDigitalPin(std::string path, CommandQueue &queue, bool debug);

    void schedule(double print_time, bool level) override;
    void write_now(bool level);
    const std::string &path() const;

private:
    std::string path_;
    CommandQueue &queue_;
    bool debug_ = false;
};

// Frequency from a cumulative pulse count file, measured over fixed sample windows.
class FrequencyCounter : public FrequencyInput {
public:
    static constexpr double kSampleTime = 1.0;

    explicit FrequencyCounter(std::string path, double sample_time = kSampleTime);

    double read_frequency(double eventtime) override;
    void update(double eventtime, long long count);
    double frequency() const;

private:
    std::string path_;
    double sample_time_ = kSampleTime;
    std::optional<long long> window_count_;
    double window_start_ = 0.0;
    double frequency_ = 0.0;
};

// Puts every hwmon PWM output in manual mode and hands it back to its previous mode on exit.
class PwmOwnershipGuard {
public:
    PwmOwnershipGuard(const std::vector<const FanConfig *> &fans, bool debug);
    ~PwmOwnershipGuard();

    PwmOwnershipGuard(const PwmOwnershipGuard &) = delete;
    PwmOwnershipGuard &operator=(const PwmOwnershipGuard &) = delete;

    // Leaves every output in manual mode so the shutdown duty stays on the pin.
    void hold_manual();
    std::size_t claimed() const;

private:
    struct Claim {
        std::string pwm_path;
        std::string enable_path;
        std::optional<long long> orig_enable;
    };

    void release();

    bool debug_ = false;
    std::vector<Claim> claims_;
};

class HardwareFactory {
public:
    virtual ~HardwareFactory() = default;
    virtual PwmSink &make_pwm(const FanConfig &fan) = 0;
    virtual DigitalSink &make_digital(const std::string &path) = 0;
    virtual FrequencyInput &make_frequency_input(const TachometerConfig &tach) = 0;
};

// Owns the sysfs pins of a running daemon.
class SysfsHardware : public HardwareFactory {
public:
    SysfsHardware(CommandQueue &queue, bool debug);

    PwmSink &make_pwm(const FanConfig &fan) override;
    DigitalSink &make_digital(const std::string &path) override;
    FrequencyInput &make_frequency_input(const TachometerConfig &tach) override;

    // Drive every PWM output to its shutdown value right now.
    void apply_shutdown_all();
    const std::vector<std::unique_ptr<SysfsPwmPin>> &pwm_pins() const;

private:
    CommandQueue &queue_;
    bool debug_ = false;
    std::vector<std::unique_ptr<SysfsPwmPin>> pwm_pins_;
    std::vector<std::unique_ptr<SysfsDigitalPin>> digital_pins_;
    std::vector<std::unique_ptr<FrequencyCounter>> counters_;
};

} // namespace fanctl::core
