#pragma once

#include <chrono>
#include <string>

namespace fanctl::core {

class Machine {
public:
    virtual ~Machine() = default;

    // Terminal halt of the whole machine. Never returns control to a retry path.
    virtual void invoke_shutdown(const std::string &reason) = 0;
    virtual void respond_raw(const std::string &msg) = 0;
    virtual bool is_shutdown() const = 0;
};

// Seconds on the monotonic machine timeline, counted from construction.
class MachineClock {
public:
    MachineClock() : start_(std::chrono::steady_clock::now()) {}

    double monotonic() const {
        return to_machine_time(std::chrono::steady_clock::now());
    }

    double to_machine_time(std::chrono::steady_clock::time_point ts) const {
        return std::chrono::duration<double>(ts - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace fanctl::core
