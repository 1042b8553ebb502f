#pragma once

#include <string>
#include <utility>
#include <vector>

#include "libcore/fan.hpp"
#include "libcore/temp_source.hpp"

namespace fanctl::core {

struct SourceTelemetry {
    std::string id;
    bool has_polled = false;
    bool ok = false;
    int temp_mC = 0;
    int age_sec = 0;
    std::string error;
};

struct RuntimeStatus {
    double machine_time = 0.0;
    bool shutdown = false;
    std::string shutdown_reason;
    std::vector<std::pair<std::string, FanStatus>> fans;
    std::vector<SourceTelemetry> sources;
};

std::vector<SourceTelemetry> collect_source_telemetry(const SourceManager &mgr);

std::string build_runtime_status_json(const RuntimeStatus &status);

// Writes through a temporary file and renames, so readers never see a partial document.
bool write_runtime_status_file(const std::string &path, const std::string &payload);

} // namespace fanctl::core
