#pragma once

#include <cstddef>
#include <map>

namespace fanctl::core {

class Fan;

// Slicer fan numbers (M106/M107 T<n>) to fans. Index 0 belongs to the primary fan.
class FanRegistry {
public:
    void set_primary(Fan &fan);
    void add_fan(int index, Fan &fan);
    Fan &lookup(int index) const;
    bool contains(int index) const;
    std::size_t size() const;

private:
    std::map<int, Fan *> fans_;
};

} // namespace fanctl::core
