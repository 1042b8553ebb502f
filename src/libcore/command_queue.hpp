#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <vector>

namespace fanctl::core {

struct ScheduledCommand {
    double print_time = 0.0;
    std::uint64_t seq = 0;
    std::function<void()> action;
};

// Hardware effects keyed by machine time. Entries with equal time run in insertion order.
class CommandQueue {
public:
    void push(double print_time, std::function<void()> action);
    std::size_t run_due(double now);
    std::size_t drain_all();
    void clear();
    bool empty() const;
    std::size_t size() const;
    std::optional<double> next_time() const;

private:
    struct Later {
        bool operator()(const ScheduledCommand &lhs, const ScheduledCommand &rhs) const {
            if (lhs.print_time != rhs.print_time) {
                return lhs.print_time > rhs.print_time;
            }
            return lhs.seq > rhs.seq;
        }
    };

    std::priority_queue<ScheduledCommand, std::vector<ScheduledCommand>, Later> queue_;
    std::uint64_t next_seq_ = 0;
};

// Direct speed requests wait here until the next flush assigns them a print time.
class LookaheadQueue {
public:
    explicit LookaheadQueue(double lead_time);

    void register_callback(std::function<void(double)> callback);
    void flush(double now);
    bool empty() const;
    double lead_time() const;
    double last_print_time() const;

private:
    double lead_time_ = 0.0;
    double last_print_time_ = 0.0;
    std::vector<std::function<void(double)>> pending_;
};

} // namespace fanctl::core
