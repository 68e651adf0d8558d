#pragma once

#include "filedescriptor.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

inline std::vector<uint8_t> bytes(std::initializer_list<int> values)
{
    std::vector<uint8_t> out;
    for (int v : values) {
        out.push_back(static_cast<uint8_t>(v));
    }
    return out;
}

inline std::vector<uint8_t> text_bytes(const std::string& s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Pads to at least 12 bytes so type detection runs.
inline std::vector<uint8_t> padded(std::vector<uint8_t> head, size_t size = 16)
{
    if (head.size() < size) {
        head.resize(size, 0x00);
    }
    return head;
}

inline FileDescriptor make_file(const std::string& name,
                                std::vector<uint8_t> content,
                                uint64_t size = 1024,
                                const std::string& mime = "application/octet-stream")
{
    FileDescriptor file;
    file.originalName = name;
    file.declaredMimeType = mime;
    file.sizeBytes = size;
    file.content = std::move(content);
    return file;
}

inline std::vector<uint8_t> jpeg_bytes()
{
    return padded(bytes({ 0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00 }), 64);
}

inline std::vector<uint8_t> png_bytes()
{
    return padded(bytes({ 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
                          0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R' }), 64);
}
