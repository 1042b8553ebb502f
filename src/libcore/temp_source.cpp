#include "libcore/temp_source.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "libcore/sysfs_io.hpp"

extern "C" {
#include <libubox/blobmsg.h>
#include <libubus.h>
}

namespace fanctl::core {
namespace {

constexpr int kMaxUbusArgsDepth = 16;

bool contains_ci(std::string_view haystack, std::string_view needle) {
    if (needle.size() > haystack.size()) {
        return false;
    }
    for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        bool match = true;
        for (std::size_t j = 0; j < needle.size() && match; ++j) {
            match = std::tolower(static_cast<unsigned char>(haystack[i + j])) ==
                    std::tolower(static_cast<unsigned char>(needle[j]));
        }
        if (match) {
            return true;
        }
    }
    return false;
}

std::optional<int> scale_to_mc(double value, bool millicelsius) {
    const double scaled = millicelsius ? value : value * 1000.0;
    if (!std::isfinite(scaled) || scaled < static_cast<double>(std::numeric_limits<int>::min()) ||
        scaled > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(std::lround(scaled));
}

} // namespace

bool key_is_millicelsius(std::string_view key) {
    return contains_ci(key, "mc");
}

std::optional<int> parse_temperature_text(std::string_view text, bool millicelsius) {
    std::size_t pos = 0;
    while (pos < text.size() && !std::isdigit(static_cast<unsigned char>(text[pos])) && text[pos] != '-' &&
           text[pos] != '+') {
        ++pos;
    }
    if (pos == text.size()) {
        return std::nullopt;
    }

    double value = 0.0;
    std::size_t used = 0;
    try {
        value = std::stod(std::string(text.substr(pos)), &used);
    } catch (const std::logic_error &) {
        return std::nullopt;
    }

    const std::string_view unit = text.substr(pos + used);
    if (contains_ci(unit, "mc")) {
        millicelsius = true;
    } else if (contains_ci(unit, "c")) {
        millicelsius = false;
    }
    return scale_to_mc(value, millicelsius);
}

namespace {

std::optional<int> blob_attr_to_temp_mc(struct blob_attr *attr, bool millicelsius) {
    switch (blobmsg_type(attr)) {
    case BLOBMSG_TYPE_INT8:
        return scale_to_mc(static_cast<double>(blobmsg_get_u8(attr)), millicelsius);
    case BLOBMSG_TYPE_INT16:
        return scale_to_mc(static_cast<double>(static_cast<std::int16_t>(blobmsg_get_u16(attr))), millicelsius);
    case BLOBMSG_TYPE_INT32:
        return scale_to_mc(static_cast<double>(static_cast<std::int32_t>(blobmsg_get_u32(attr))), millicelsius);
    case BLOBMSG_TYPE_INT64:
        return scale_to_mc(static_cast<double>(static_cast<std::int64_t>(blobmsg_get_u64(attr))), millicelsius);
    case BLOBMSG_TYPE_DOUBLE:
        return scale_to_mc(blobmsg_get_double(attr), millicelsius);
    case BLOBMSG_TYPE_STRING:
        return parse_temperature_text(blobmsg_get_string(attr), millicelsius);
    default:
        return std::nullopt;
    }
}

class UbusContextGuard {
public:
    UbusContextGuard() : ctx_(ubus_connect(nullptr)) {}

    ~UbusContextGuard() {
        if (ctx_) {
            ubus_free(ctx_);
        }
    }

    UbusContextGuard(const UbusContextGuard &) = delete;
    UbusContextGuard &operator=(const UbusContextGuard &) = delete;

    bool valid() const {
        return ctx_ != nullptr;
    }

    struct ubus_context *get() const {
        return ctx_;
    }

private:
    struct ubus_context *ctx_ = nullptr;
};

class BlobBufGuard {
public:
    BlobBufGuard() {
        blob_buf_init(&buf_, 0);
    }

    ~BlobBufGuard() {
        blob_buf_free(&buf_);
    }

    BlobBufGuard(const BlobBufGuard &) = delete;
    BlobBufGuard &operator=(const BlobBufGuard &) = delete;

    struct blob_buf *get() {
        return &buf_;
    }

private:
    struct blob_buf buf_ {};
};

// Appends one JSON value to a blobmsg buffer. Throws on values blobmsg cannot carry.
void add_blobmsg_value(struct blob_buf *buf, const char *name, const nlohmann::json &value, int depth) {
    if (depth > kMaxUbusArgsDepth) {
        throw std::runtime_error("ubus args json nesting is too deep");
    }

    if (value.is_object() || value.is_array()) {
        const bool table = value.is_object();
        void *cookie = table ? blobmsg_open_table(buf, name) : blobmsg_open_array(buf, name);
        if (!cookie) {
            throw std::runtime_error("failed to open ubus container field");
        }
        for (auto it = value.begin(); it != value.end(); ++it) {
            add_blobmsg_value(buf, table ? it.key().c_str() : nullptr, it.value(), depth + 1);
        }
        if (table) {
            blobmsg_close_table(buf, cookie);
        } else {
            blobmsg_close_array(buf, cookie);
        }
        return;
    }

    int rc = 0;
    if (value.is_boolean()) {
        rc = blobmsg_add_u8(buf, name, value.get<bool>() ? 1 : 0);
    } else if (value.is_number_integer()) {
        const long long v = value.get<long long>();
        if (v >= std::numeric_limits<std::int32_t>::min() && v <= std::numeric_limits<std::int32_t>::max()) {
            rc = blobmsg_add_u32(buf, name, static_cast<std::uint32_t>(static_cast<std::int32_t>(v)));
        } else {
            rc = blobmsg_add_u64(buf, name, static_cast<std::uint64_t>(v));
        }
    } else if (value.is_number_float()) {
        rc = blobmsg_add_double(buf, name, value.get<double>());
    } else if (value.is_string()) {
        rc = blobmsg_add_string(buf, name, value.get_ref<const std::string &>().c_str());
    } else {
        throw std::runtime_error("ubus args json contains an unsupported value");
    }
    if (rc != 0) {
        throw std::runtime_error("failed to add ubus argument field");
    }
}

void fill_ubus_args(struct blob_buf *buf, const std::string &args_json) {
    const nlohmann::json parsed = nlohmann::json::parse(args_json);
    if (!parsed.is_object()) {
        throw std::runtime_error("ubus args json must be an object");
    }
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        add_blobmsg_value(buf, it.key().c_str(), it.value(), 1);
    }
}

struct UbusReply {
    std::string key;
    bool has_reply = false;
    std::optional<int> temp_mC;
    std::string error;
};

void on_ubus_reply(struct ubus_request *req, int /* type */, struct blob_attr *msg) {
    if (!req || !req->priv) {
        return;
    }
    auto &reply = *static_cast<UbusReply *>(req->priv);
    reply.has_reply = true;
    if (!msg) {
        reply.error = "empty ubus reply";
        return;
    }

    struct blobmsg_policy policy[2] {};
    policy[0].name = reply.key.c_str();
    policy[0].type = BLOBMSG_TYPE_UNSPEC;
    policy[1].name = "error";
    policy[1].type = BLOBMSG_TYPE_STRING;

    struct blob_attr *tb[2] {};
    blobmsg_parse(policy, 2, tb, blob_data(msg), blob_len(msg));

    if (tb[0]) {
        reply.temp_mC = blob_attr_to_temp_mc(tb[0], key_is_millicelsius(reply.key));
        if (!reply.temp_mC) {
            reply.error = "ubus key is not a temperature value: " + reply.key;
        }
        return;
    }
    if (tb[1]) {
        reply.error = "ubus error: " + std::string(blobmsg_get_string(tb[1]));
        return;
    }
    reply.error = "ubus key not found: " + reply.key;
}

} // namespace

PolledTempSource::PolledTempSource(std::string id, std::chrono::seconds poll_interval)
    : id_(std::move(id)), poll_interval_(poll_interval) {
    if (poll_interval_ < std::chrono::seconds(1)) {
        poll_interval_ = std::chrono::seconds(1);
    }
}

const std::string &PolledTempSource::id() const {
    return id_;
}

std::chrono::seconds PolledTempSource::poll_interval() const {
    return poll_interval_;
}

void PolledTempSource::store_sample(TempSample sample) {
    std::lock_guard<std::mutex> guard(sample_mutex_);
    last_sample_ = std::move(sample);
    if (last_sample_ && last_sample_->ok) {
        last_good_sample_ = last_sample_;
        ++good_count_;
    }
    has_polled_ = true;
}

void PolledTempSource::publish_failure(const std::string &error) {
    TempSample sample;
    sample.ok = false;
    sample.sample_ts = std::chrono::steady_clock::now();
    sample.error = error;
    store_sample(std::move(sample));
}

SourceSnapshot PolledTempSource::snapshot() const {
    std::lock_guard<std::mutex> guard(sample_mutex_);
    return SourceSnapshot{has_polled_, good_count_, last_sample_, last_good_sample_};
}

SysfsTempSource::SysfsTempSource(std::string id, std::string path, std::chrono::seconds poll_interval)
    : PolledTempSource(std::move(id), poll_interval), path_(std::move(path)) {}

void SysfsTempSource::sample() {
    TempSample s;
    s.sample_ts = std::chrono::steady_clock::now();

    const auto v = try_read_int(path_);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
        s.ok = false;
        s.error = "cannot read " + path_;
        store_sample(std::move(s));
        return;
    }

    s.ok = true;
    s.temp_mC = static_cast<int>(*v);
    store_sample(std::move(s));
}

UbusTempSource::UbusTempSource(std::string id,
                               std::string object,
                               std::string method,
                               std::string key,
                               std::string args_json,
                               std::chrono::seconds poll_interval)
    : PolledTempSource(std::move(id), poll_interval),
      object_(std::move(object)),
      method_(std::move(method)),
      key_(std::move(key)),
      args_json_(std::move(args_json)) {
    if (args_json_.empty()) {
        args_json_ = "{}";
    }
    ubus_timeout_ms_ = static_cast<int>(this->poll_interval().count()) * 1000;
    if (ubus_timeout_ms_ < 1000) {
        ubus_timeout_ms_ = 1000;
    }
    if (ubus_timeout_ms_ > 10000) {
        ubus_timeout_ms_ = 10000;
    }
}

void UbusTempSource::sample() {
    TempSample s;
    s.sample_ts = std::chrono::steady_clock::now();

    UbusContextGuard ctx;
    if (!ctx.valid()) {
        s.error = "ubus connect failed";
        store_sample(std::move(s));
        return;
    }

    uint32_t object_id = 0;
    int rc = ubus_lookup_id(ctx.get(), object_.c_str(), &object_id);
    if (rc != UBUS_STATUS_OK) {
        s.error = "ubus object lookup failed for " + object_ + ": " + ubus_strerror(rc);
        store_sample(std::move(s));
        return;
    }

    BlobBufGuard request;
    try {
        fill_ubus_args(request.get(), args_json_);
    } catch (const std::exception &e) {
        s.error = std::string("invalid ubus args: ") + e.what();
        store_sample(std::move(s));
        return;
    }

    UbusReply reply;
    reply.key = key_;
    rc = ubus_invoke(ctx.get(), object_id, method_.c_str(), request.get()->head, on_ubus_reply, &reply,
                     ubus_timeout_ms_);
    if (rc != UBUS_STATUS_OK) {
        s.error = "ubus call failed for " + object_ + "." + method_ + ": " + ubus_strerror(rc);
        store_sample(std::move(s));
        return;
    }
    if (!reply.has_reply || !reply.temp_mC) {
        s.error = reply.error.empty() ? ("ubus key not found or invalid: " + key_) : reply.error;
        store_sample(std::move(s));
        return;
    }

    s.ok = true;
    s.temp_mC = *reply.temp_mC;
    store_sample(std::move(s));
}

std::unique_ptr<ITempSource> make_temp_source(const SourceConfig &src) {
    if (src.type == "sysfs") {
        return std::make_unique<SysfsTempSource>(src.id, src.path, std::chrono::seconds(src.poll_sec));
    }
    if (src.type == "ubus") {
        return std::make_unique<UbusTempSource>(
            src.id, src.object, src.method, src.key, src.args_json, std::chrono::seconds(src.poll_sec));
    }
    throw std::runtime_error("unsupported source type: " + src.type);
}

namespace {

void log_sample(const ITempSource &source) {
    const SourceSnapshot snap = source.snapshot();
    if (!snap.last_sample) {
        return;
    }
    if (snap.last_sample->ok) {
        std::cerr << "source[" << source.id() << "]=" << snap.last_sample->temp_mC << "mC\n";
    } else {
        std::cerr << "source[" << source.id() << "] error: " << snap.last_sample->error << "\n";
    }
}

} // namespace

SourceManager::~SourceManager() {
    stop();
}

void SourceManager::add(std::unique_ptr<ITempSource> source) {
    if (source) {
        sources_.push_back(std::move(source));
    }
}

void SourceManager::start(bool debug) {
    {
        std::lock_guard<std::mutex> guard(stop_mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }

    workers_.reserve(sources_.size());
    for (auto &source : sources_) {
        ITempSource &src = *source;
        try {
            workers_.emplace_back([this, &src, debug]() {
                poll_loop(src, debug);
            });
        } catch (const std::system_error &) {
            stop();
            throw;
        }
    }
}

void SourceManager::stop() {
    {
        std::lock_guard<std::mutex> guard(stop_mutex_);
        running_ = false;
    }
    stop_cv_.notify_all();

    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

const std::vector<std::unique_ptr<ITempSource>> &SourceManager::sources() const {
    return sources_;
}

bool SourceManager::wait_for_stop(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return stop_cv_.wait_until(lock, deadline, [this]() {
        return !running_;
    });
}

void SourceManager::poll_loop(ITempSource &source, bool debug) {
    const auto interval = source.poll_interval();
    auto deadline = std::chrono::steady_clock::now();

    do {
        try {
            source.sample();
        } catch (const std::exception &e) {
            source.publish_failure(std::string("sampling exception: ") + e.what());
        }
        if (debug) {
            log_sample(source);
        }

        deadline += interval;
        const auto now = std::chrono::steady_clock::now();
        if (deadline <= now) {
            // A slow sample skips the ticks it overran.
            deadline += interval * ((now - deadline) / interval + 1);
        }
    } while (!wait_for_stop(deadline));
}

} // namespace fanctl::core
