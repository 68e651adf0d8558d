#pragma once
#include <cstdint>
#include <vector>
#include <string>

#define UPLOADGUARD_DEFAULT_MAX_SIZE (100ULL * 1024 * 1024)
#define UPLOADGUARD_DEFAULT_MAX_EXPANDED_SIZE (1024ULL * 1024 * 1024)
#define UPLOADGUARD_DEFAULT_CONTENT_WINDOW 8192

//
// Extension of the last path component, lowercased, dot included.
// "" when the name has no dot or ends with one.
//
std::string get_extension(const std::string& filename);

std::string to_lower(std::string s);

//
// Byte pattern helpers
//
bool bytes_at(const std::vector<uint8_t>& blob, size_t offset,
              const std::vector<uint8_t>& pattern);
bool contains_nocase(const std::vector<uint8_t>& blob, size_t limit,
                     const std::string& needle);

std::string format_bytes(uint64_t bytes);
std::string hex_prefix(const std::vector<uint8_t>& blob, size_t count);
