#include "libcore/fan_registry.hpp"

#include <string>

#include "libcore/errors.hpp"

namespace fanctl::core {

void FanRegistry::set_primary(Fan &fan) {
    if (fans_.count(0)) {
        throw ConfigError("Slicer fan 0 is already defined");
    }
    fans_[0] = &fan;
}

void FanRegistry::add_fan(int index, Fan &fan) {
    if (index == 0) {
        throw ConfigError("Slicer fan number cannot be 0.\nSlicer fan 0 is defined by the FAN entry.");
    }
    if (index < 0) {
        throw ConfigError("Slicer fan number " + std::to_string(index) + " is invalid");
    }
    if (fans_.count(index)) {
        throw ConfigError("Slicer fan number " + std::to_string(index) + " is already defined");
    }
    fans_[index] = &fan;
}

Fan &FanRegistry::lookup(int index) const {
    const auto it = fans_.find(index);
    if (it == fans_.end()) {
        throw CommandError("T" + std::to_string(index) + " is an invalid fan number");
    }
    return *it->second;
}

bool FanRegistry::contains(int index) const {
    return fans_.count(index) != 0;
}

std::size_t FanRegistry::size() const {
    return fans_.size();
}

} // namespace fanctl::core
