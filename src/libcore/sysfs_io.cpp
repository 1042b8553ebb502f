#include "libcore/sysfs_io.hpp"

#include <fstream>

#include <sys/stat.h>

namespace fanctl::core {

bool file_exists(const std::string &path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0;
}

std::optional<long long> try_read_int(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    long long value = 0;
    in >> value;
    if (in.fail()) {
        return std::nullopt;
    }
    return value;
}

bool try_write_int(const std::string &path, long long value) {
    std::ofstream out(path);
    if (!out) {
        return false;
    }
    out << value << '\n';
    return out.good();
}

} // namespace fanctl::core
