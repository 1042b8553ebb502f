#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "libcore/fan_config.hpp"

namespace fanctl::core {

struct TempSample {
    bool ok = false;
    int temp_mC = 0;
    std::chrono::steady_clock::time_point sample_ts;
    std::string error;
};

struct SourceSnapshot {
    bool has_polled = false;
    std::uint64_t good_count = 0;
    std::optional<TempSample> last_sample;
    std::optional<TempSample> last_good_sample;
};

// A reply key naming milli-Celsius ("temp_mC") carries mC, anything else carries Celsius.
bool key_is_millicelsius(std::string_view key);

// "48.5", "48.5 C", "48500 mC"; an explicit unit wins over the key convention.
std::optional<int> parse_temperature_text(std::string_view text, bool millicelsius);

class ITempSource {
public:
    virtual ~ITempSource() = default;
    virtual const std::string &id() const = 0;
    virtual std::chrono::seconds poll_interval() const = 0;
    virtual void sample() = 0;
    virtual void publish_failure(const std::string &error) = 0;
    virtual SourceSnapshot snapshot() const = 0;
};

// Sample bookkeeping shared by the concrete sources. Snapshots are safe across threads.
class PolledTempSource : public ITempSource {
public:
    PolledTempSource(std::string id, std::chrono::seconds poll_interval);

    const std::string &id() const override;
    std::chrono::seconds poll_interval() const override;
    void publish_failure(const std::string &error) override;
    SourceSnapshot snapshot() const override;

protected:
    void store_sample(TempSample sample);

private:
    std::string id_;
    std::chrono::seconds poll_interval_;
    mutable std::mutex sample_mutex_;
    std::optional<TempSample> last_sample_;
    std::optional<TempSample> last_good_sample_;
    std::uint64_t good_count_ = 0;
    bool has_polled_ = false;
};

class SysfsTempSource : public PolledTempSource {
public:
    SysfsTempSource(std::string id, std::string path, std::chrono::seconds poll_interval);

    void sample() override;

private:
    std::string path_;
};

class UbusTempSource : public PolledTempSource {
public:
    UbusTempSource(std::string id,
                   std::string object,
                   std::string method,
                   std::string key,
                   std::string args_json,
                   std::chrono::seconds poll_interval);

    void sample() override;

private:
    std::string object_;
    std::string method_;
    std::string key_;
    std::string args_json_;
    int ubus_timeout_ms_ = 2000;
};

std::unique_ptr<ITempSource> make_temp_source(const SourceConfig &src);

// One polling thread per source. The main loop only reads snapshots.
class SourceManager {
public:
    SourceManager() = default;
    ~SourceManager();

    SourceManager(const SourceManager &) = delete;
    SourceManager &operator=(const SourceManager &) = delete;

    void add(std::unique_ptr<ITempSource> source);
    void start(bool debug);
    void stop();
    const std::vector<std::unique_ptr<ITempSource>> &sources() const;

private:
    void poll_loop(ITempSource &source, bool debug);
    // True once stop() has been called.
    bool wait_for_stop(std::chrono::steady_clock::time_point deadline);

    std::vector<std::unique_ptr<ITempSource>> sources_;
    std::vector<std::thread> workers_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool running_ = false;
};

} // namespace fanctl::core
