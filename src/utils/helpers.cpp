#include "helpers.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

std::string get_extension(const std::string& filename) {
    size_t base = filename.find_last_of("/\\");
    base = (base == std::string::npos) ? 0 : base + 1;

    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot < base || dot + 1 == filename.size()) {
        return "";
    }
    return to_lower(filename.substr(dot));
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool bytes_at(const std::vector<uint8_t>& blob, size_t offset,
              const std::vector<uint8_t>& pattern) {
    if (offset > blob.size() || blob.size() - offset < pattern.size()) {
        return false;
    }
    return std::equal(pattern.begin(), pattern.end(), blob.begin() + offset);
}

// needle must be lowercase
bool contains_nocase(const std::vector<uint8_t>& blob, size_t limit,
                     const std::string& needle) {
    const size_t end = std::min(limit, blob.size());
    if (needle.empty() || needle.size() > end) {
        return false;
    }
    auto first = blob.begin();
    auto last = blob.begin() + end;
    auto it = std::search(first, last, needle.begin(), needle.end(),
                          [](uint8_t b, char n) {
                              return std::tolower(b) == static_cast<unsigned char>(n);
                          });
    return it != last;
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"Bytes", "KB", "MB", "GB", "TB"};
    if (bytes == 0) return "0 Bytes";

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " " << units[0];
    } else {
        oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    }
    return oss.str();
}

std::string hex_prefix(const std::vector<uint8_t>& blob, size_t count) {
    std::ostringstream oss;
    const size_t n = std::min(count, blob.size());
    for (size_t i = 0; i < n; ++i) {
        if (i) oss << ' ';
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(blob[i]);
    }
    return oss.str();
}
