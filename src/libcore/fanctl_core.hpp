#pragma once

#include <string>
#include <vector>

namespace fanctl::core {

// Entry point of the fanctl binary. Returns the process exit status.
int run(const std::vector<std::string> &args);

} // namespace fanctl::core
