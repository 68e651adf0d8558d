#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Throws std::runtime_error when the file cannot be read.
std::vector<uint8_t> readFile(const std::string& path);
