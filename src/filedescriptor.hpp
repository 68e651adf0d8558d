#pragma once
#include <string>
#include <vector>
#include <cstdint>

// One uploaded file as handed over by the receiving layer. Scanning never
// modifies it.
struct FileDescriptor {
    std::string originalName;
    std::string declaredMimeType;
    std::uint64_t sizeBytes = 0;
    std::vector<std::uint8_t> content;
};
