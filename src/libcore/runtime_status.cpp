#include "libcore/runtime_status.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>

#include <nlohmann/json.hpp>

namespace fanctl::core {
namespace {

nlohmann::json optional_number(const std::optional<double> &value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

} // namespace

std::vector<SourceTelemetry> collect_source_telemetry(const SourceManager &mgr) {
    const auto now = std::chrono::steady_clock::now();
    std::vector<SourceTelemetry> telemetry;
    telemetry.reserve(mgr.sources().size());

    for (const auto &source : mgr.sources()) {
        SourceTelemetry item;
        item.id = source->id();
        const SourceSnapshot snap = source->snapshot();
        item.has_polled = snap.has_polled;

        if (snap.last_sample) {
            item.ok = snap.last_sample->ok;
            item.error = snap.last_sample->error;
        } else if (item.has_polled) {
            item.error = "no sample";
        }
        if (snap.last_good_sample) {
            item.temp_mC = snap.last_good_sample->temp_mC;
            item.age_sec = static_cast<int>(
                std::chrono::duration_cast<std::chrono::seconds>(now - snap.last_good_sample->sample_ts).count());
        }
        telemetry.push_back(std::move(item));
    }
    return telemetry;
}

std::string build_runtime_status_json(const RuntimeStatus &status) {
    const std::time_t now = std::time(nullptr);
    nlohmann::json root = {
        {"ok", status.shutdown ? 0 : 1},
        {"timestamp", static_cast<long long>(now)},
        {"machine_time", status.machine_time},
        {"shutdown", status.shutdown ? 1 : 0},
        {"shutdown_reason", status.shutdown_reason},
        {"fans", nlohmann::json::object()},
        {"sources", nlohmann::json::array()},
    };

    for (const auto &entry : status.fans) {
        const FanStatus &fan = entry.second;
        nlohmann::json item = {
            {"speed", fan.speed},
            {"rpm", optional_number(fan.rpm)},
        };
        if (fan.temperature) {
            item["temperature"] = *fan.temperature;
        }
        if (fan.target) {
            item["target"] = *fan.target;
        }
        root["fans"][entry.first] = std::move(item);
    }

    for (const auto &s : status.sources) {
        root["sources"].push_back({
            {"id", s.id},
            {"has_polled", s.has_polled ? 1 : 0},
            {"ok", s.ok ? 1 : 0},
            {"temp_mC", s.temp_mC},
            {"age_s", s.age_sec},
            {"error", s.error},
        });
    }

    return root.dump();
}

bool write_runtime_status_file(const std::string &path, const std::string &payload) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp);
        if (!out) {
            return false;
        }
        out << payload << '\n';
        if (!out.good()) {
            return false;
        }
    }
    return std::rename(tmp.c_str(), path.c_str()) == 0;
}

} // namespace fanctl::core
