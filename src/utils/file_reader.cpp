#include "file_reader.hpp"
#include <fstream>
#include <stdexcept>

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Error while reading " + path);
    }
    return data;
}
