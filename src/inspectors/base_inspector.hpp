#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct InspectionResult {
    bool readable = false;        // false: corrupt or unsupported, nothing measured
    bool limitExceeded = false;   // stopped early at the limit
    uint64_t expandedBytes = 0;
    uint64_t entries = 0;
    std::string info;
};

// Measures how large an archive becomes once expanded, without keeping or
// writing the expanded data.
class BaseInspector {
public:
    virtual ~BaseInspector() = default;
    virtual std::string name() const = 0;
    virtual std::string mimeType() const = 0;
    virtual InspectionResult inspect(const std::vector<std::uint8_t>& blob, uint64_t limit) = 0;
};
