#pragma once

#include <optional>
#include <string>

namespace fanctl::core {

bool file_exists(const std::string &path);
std::optional<long long> try_read_int(const std::string &path);
bool try_write_int(const std::string &path, long long value);

} // namespace fanctl::core
