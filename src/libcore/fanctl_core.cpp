#include "libcore/fanctl_core.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "libcore/command_queue.hpp"
#include "libcore/errors.hpp"
#include "libcore/fan_config.hpp"
#include "libcore/fan_system.hpp"
#include "libcore/machine.hpp"
#include "libcore/output_pins.hpp"
#include "libcore/runtime_status.hpp"
#include "libcore/sysfs_io.hpp"
#include "libcore/temp_source.hpp"

namespace {

using namespace fanctl::core;

volatile std::sig_atomic_t g_stop = 0;

constexpr std::size_t kMaxCommandLine = 4096;

void on_signal(int /* sig */) {
    g_stop = 1;
}

std::optional<pid_t> try_read_pid(const std::string &path) {
    const auto pid = try_read_int(path);
    if (!pid || *pid <= 0 || *pid > static_cast<long long>(std::numeric_limits<pid_t>::max())) {
        return std::nullopt;
    }
    return static_cast<pid_t>(*pid);
}

class InstanceLock {
public:
    explicit InstanceLock(const std::string &pidfile) : lockfile_(pidfile + ".lock") {
        fd_ = ::open(lockfile_.c_str(), O_CREAT | O_RDWR, 0644);
        if (fd_ < 0) {
            throw std::runtime_error("cannot open lock file " + lockfile_ + ": " + std::strerror(errno));
        }

        if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            std::string msg = "cannot acquire lock " + lockfile_ + ": " + std::strerror(errno);
            if (const auto existing_pid = try_read_pid(pidfile)) {
                msg += " (fanctl already running as pid " + std::to_string(*existing_pid) + ")";
            }
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error(msg);
        }
    }

    ~InstanceLock() {
        if (fd_ >= 0) {
            (void)::flock(fd_, LOCK_UN);
            (void)::close(fd_);
        }
    }

    InstanceLock(const InstanceLock &) = delete;
    InstanceLock &operator=(const InstanceLock &) = delete;

private:
    int fd_ = -1;
    std::string lockfile_;
};

class PidfileGuard {
public:
    explicit PidfileGuard(std::string pidfile) : pidfile_(std::move(pidfile)) {
        std::ofstream pid(pidfile_);
        if (!pid) {
            throw std::runtime_error("cannot create pidfile: " + pidfile_);
        }
        pid << ::getpid() << '\n';
        if (!pid.good()) {
            throw std::runtime_error("cannot write pidfile: " + pidfile_);
        }
    }

    ~PidfileGuard() {
        (void)::unlink(pidfile_.c_str());
    }

    PidfileGuard(const PidfileGuard &) = delete;
    PidfileGuard &operator=(const PidfileGuard &) = delete;

private:
    std::string pidfile_;
};

class RuntimeStatusGuard {
public:
    explicit RuntimeStatusGuard(std::string path) : path_(std::move(path)) {}

    ~RuntimeStatusGuard() {
        (void)::unlink(path_.c_str());
    }

    bool write(const std::string &payload) const {
        return write_runtime_status_file(path_, payload);
    }

    const std::string &path() const {
        return path_;
    }

    RuntimeStatusGuard(const RuntimeStatusGuard &) = delete;
    RuntimeStatusGuard &operator=(const RuntimeStatusGuard &) = delete;

private:
    std::string path_;
};

// Named pipe the command front end reads. A private writer end keeps reads from seeing EOF
// between clients.
class CommandFifo {
public:
    explicit CommandFifo(std::string path) : path_(std::move(path)) {
        struct stat st {};
        if (::stat(path_.c_str(), &st) == 0) {
            if (!S_ISFIFO(st.st_mode)) {
                throw std::runtime_error("command path exists and is not a fifo: " + path_);
            }
        } else if (::mkfifo(path_.c_str(), 0600) != 0) {
            throw std::runtime_error("cannot create command fifo " + path_ + ": " + std::strerror(errno));
        }

        read_fd_ = ::open(path_.c_str(), O_RDONLY | O_NONBLOCK);
        if (read_fd_ < 0) {
            const std::string err = std::strerror(errno);
            (void)::unlink(path_.c_str());
            throw std::runtime_error("cannot open command fifo " + path_ + ": " + err);
        }
        write_fd_ = ::open(path_.c_str(), O_WRONLY | O_NONBLOCK);
    }

    ~CommandFifo() {
        if (write_fd_ >= 0) {
            (void)::close(write_fd_);
        }
        if (read_fd_ >= 0) {
            (void)::close(read_fd_);
        }
        (void)::unlink(path_.c_str());
    }

    CommandFifo(const CommandFifo &) = delete;
    CommandFifo &operator=(const CommandFifo &) = delete;

    std::vector<std::string> read_lines() {
        char buf[512];
        while (true) {
            const ssize_t n = ::read(read_fd_, buf, sizeof(buf));
            if (n > 0) {
                pending_.append(buf, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                throw std::runtime_error("cannot read command fifo " + path_ + ": " + std::strerror(errno));
            }
            break;
        }

        std::vector<std::string> lines;
        std::size_t start = 0;
        for (std::size_t nl = pending_.find('\n'); nl != std::string::npos; nl = pending_.find('\n', start)) {
            lines.push_back(pending_.substr(start, nl - start));
            start = nl + 1;
        }
        pending_.erase(0, start);
        if (pending_.size() > kMaxCommandLine) {
            std::cerr << "!! command line too long, discarded\n";
            pending_.clear();
        }
        return lines;
    }

private:
    std::string path_;
    int read_fd_ = -1;
    int write_fd_ = -1;
    std::string pending_;
};

// Shutdown discards every pending hardware command and parks each output at its shutdown value.
class DaemonMachine : public Machine {
public:
    DaemonMachine(CommandQueue &queue, SysfsHardware &hardware) : queue_(queue), hardware_(hardware) {}

    void invoke_shutdown(const std::string &reason) override {
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        reason_ = reason;
        std::cerr << "fanctl: shutdown: " << reason << "\n";
        queue_.clear();
        hardware_.apply_shutdown_all();
    }

    void respond_raw(const std::string &msg) override {
        std::cerr << msg << "\n";
    }

    bool is_shutdown() const override {
        return shutdown_;
    }

    const std::string &shutdown_reason() const {
        return reason_;
    }

private:
    CommandQueue &queue_;
    SysfsHardware &hardware_;
    bool shutdown_ = false;
    std::string reason_;
};

std::vector<const FanConfig *> all_fans(const FanctlConfig &cfg) {
    std::vector<const FanConfig *> fans;
    if (cfg.fan) {
        fans.push_back(&*cfg.fan);
    }
    for (const auto &fan : cfg.generic_fans) {
        fans.push_back(&fan);
    }
    for (const auto &tf : cfg.temperature_fans) {
        fans.push_back(&tf.fan);
    }
    return fans;
}

void check_output_paths(const FanctlConfig &cfg) {
    for (const FanConfig *fan : all_fans(cfg)) {
        const std::string duty_path = fan->pin_type == PwmPinType::Hwmon ? fan->pin : fan->pin + "/duty_cycle";
        if (::access(duty_path.c_str(), W_OK) != 0) {
            throw std::runtime_error("PWM path is not writable: " + duty_path);
        }
        if (!fan->enable_pin.empty() && ::access(fan->enable_pin.c_str(), W_OK) != 0) {
            throw std::runtime_error("enable pin is not writable: " + fan->enable_pin);
        }
        if (fan->tachometer && ::access(fan->tachometer->pin.c_str(), R_OK) != 0) {
            throw std::runtime_error("tachometer count is not readable: " + fan->tachometer->pin);
        }
    }
}

void handle_command(FanCommands &commands, const std::string &line, bool debug) {
    if (debug) {
        std::cerr << "command: " << line << "\n";
    }
    try {
        const std::string response = commands.execute(line);
        if (!response.empty()) {
            std::cerr << "// " << response << "\n";
        }
    } catch (const CommandError &e) {
        std::cerr << "!! " << e.what() << "\n";
    }
}

int run_daemon(const FanctlConfig &cfg, bool debug) {
    check_output_paths(cfg);

    InstanceLock instance_lock(kFixedPidfilePath);
    PidfileGuard pidfile_guard(kFixedPidfilePath);
    PwmOwnershipGuard pwm_guard(all_fans(cfg), debug);
    RuntimeStatusGuard status_guard(cfg.status_path);
    CommandFifo fifo(cfg.command_path);

    const MachineClock clock;
    CommandQueue queue;
    SysfsHardware hardware(queue, debug);
    DaemonMachine machine(queue, hardware);
    LookaheadQueue lookahead(static_cast<double>(cfg.lookahead_ms) / 1000.0);

    FanSystem fans(machine, lookahead, hardware);
    fans.build(cfg);
    fans.connect();

    SourceManager mgr;
    for (const auto &src : cfg.sources) {
        mgr.add(make_temp_source(src));
    }

    auto build_status = [&]() {
        RuntimeStatus status;
        status.machine_time = clock.monotonic();
        status.shutdown = machine.is_shutdown();
        status.shutdown_reason = machine.shutdown_reason();
        status.fans = fans.collect_status();
        status.sources = collect_source_telemetry(mgr);
        return build_runtime_status_json(status);
    };
    fans.commands().set_status_provider(build_status);

    auto publish_status = [&]() {
        if (!status_guard.write(build_status()) && debug) {
            std::cerr << "warning: failed to write runtime status to " << status_guard.path() << "\n";
        }
    };

    std::vector<std::uint64_t> seen_samples(mgr.sources().size(), 0);
    const double status_interval = static_cast<double>(cfg.status_interval_ms) / 1000.0;
    double next_status_time = 0.0;

    mgr.start(debug);
    std::cerr << "Starting fan control...\n";

    bool hardware_failed = false;
    try {
        while (!g_stop && !machine.is_shutdown()) {
            for (const auto &line : fifo.read_lines()) {
                handle_command(fans.commands(), line, debug);
            }

            const double now = clock.monotonic();
            lookahead.flush(now);

            const auto &sources = mgr.sources();
            for (std::size_t i = 0; i < sources.size() && !machine.is_shutdown(); ++i) {
                const SourceSnapshot snap = sources[i]->snapshot();
                if (snap.good_count == seen_samples[i] || !snap.last_good_sample) {
                    continue;
                }
                seen_samples[i] = snap.good_count;
                fans.on_temperature_sample(sources[i]->id(),
                                             clock.to_machine_time(snap.last_good_sample->sample_ts),
                                             static_cast<double>(snap.last_good_sample->temp_mC) / 1000.0, now);
            }

            fans.poll_tachometers(now);
            if (!machine.is_shutdown()) {
                queue.run_due(now);
            }

            if (now >= next_status_time) {
                publish_status();
                next_status_time = now + status_interval;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(cfg.interval_ms));
        }
    } catch (const std::exception &e) {
        hardware_failed = true;
        machine.invoke_shutdown(std::string("hardware error: ") + e.what());
    }

    if (machine.is_shutdown()) {
        // Shutdown duty stays on the pins only in manual mode; failed pins go back to the kernel.
        if (!hardware_failed) {
            pwm_guard.hold_manual();
        }
        mgr.stop();
        publish_status();
        return 1;
    }

    std::cerr << "Stopping fan control...\n";
    mgr.stop();
    const double now = clock.monotonic();
    lookahead.flush(now);
    fans.on_restart(std::max(now, lookahead.last_print_time()));
    queue.drain_all();
    return 0;
}

std::string pick_config_path(const std::vector<std::string> &args, std::size_t offset) {
    if (args.size() > offset) {
        return args[offset];
    }
    return kDefaultConfigPath;
}

} // namespace

namespace fanctl::core {

int run(const std::vector<std::string> &args) {
    const bool debug = []() {
        const auto d = std::getenv("DEBUG");
        return d && *d && std::string(d) != "0";
    }();

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGHUP, on_signal);
    std::signal(SIGQUIT, on_signal);

    try {
        if (args.size() > 1 && args[1] == "--validate-config") {
            const std::string config = pick_config_path(args, 2);
            (void)load_fanctl_config(config);
            std::cerr << "fanctl: config validation passed for " << config << "\n";
            return 0;
        }
        if (args.size() > 1 && args[1] == "--dump-config-json") {
            const std::string config = pick_config_path(args, 2);
            std::cout << build_config_json(load_fanctl_config(config), config) << '\n';
            return 0;
        }
        if (args.size() > 1 && args[1] == "--dump-schema-json") {
            std::cout << dump_config_schema_json() << '\n';
            return 0;
        }

        const std::string config = pick_config_path(args, 1);
        std::cerr << "Loading fan configuration from " << config << " ...\n";

        g_stop = 0;
        return run_daemon(load_fanctl_config(config), debug);
    } catch (const std::exception &e) {
        std::cerr << "fanctl: " << e.what() << '\n';
        return 1;
    }
}

} // namespace fanctl::core
