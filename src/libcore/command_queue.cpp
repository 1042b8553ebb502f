#include "libcore/command_queue.hpp"

#include <algorithm>
#include <utility>

namespace fanctl::core {

void CommandQueue::push(double print_time, std::function<void()> action) {
    queue_.push(ScheduledCommand{print_time, next_seq_++, std::move(action)});
}

std::size_t CommandQueue::run_due(double now) {
    std::size_t count = 0;
    while (!queue_.empty() && queue_.top().print_time <= now) {
        ScheduledCommand cmd = queue_.top();
        queue_.pop();
        if (cmd.action) {
            cmd.action();
        }
        ++count;
    }
    return count;
}

std::size_t CommandQueue::drain_all() {
    std::size_t count = 0;
    while (!queue_.empty()) {
        ScheduledCommand cmd = queue_.top();
        queue_.pop();
        if (cmd.action) {
            cmd.action();
        }
        ++count;
    }
    return count;
}

void CommandQueue::clear() {
    queue_ = {};
}

bool CommandQueue::empty() const {
    return queue_.empty();
}

std::size_t CommandQueue::size() const {
    return queue_.size();
}

std::optional<double> CommandQueue::next_time() const {
    if (queue_.empty()) {
        return std::nullopt;
    }
    return queue_.top().print_time;
}

LookaheadQueue::LookaheadQueue(double lead_time) : lead_time_(std::max(0.0, lead_time)) {}

void LookaheadQueue::register_callback(std::function<void(double)> callback) {
    pending_.push_back(std::move(callback));
}

void LookaheadQueue::flush(double now) {
    if (pending_.empty()) {
        return;
    }
    const double print_time = std::max(now + lead_time_, last_print_time_);
    last_print_time_ = print_time;

    std::vector<std::function<void(double)>> callbacks;
    callbacks.swap(pending_);
    for (auto &cb : callbacks) {
        cb(print_time);
    }
}

bool LookaheadQueue::empty() const {
    return pending_.empty();
}

double LookaheadQueue::lead_time() const {
    return lead_time_;
}

double LookaheadQueue::last_print_time() const {
    return last_print_time_;
}

} // namespace fanctl::core
