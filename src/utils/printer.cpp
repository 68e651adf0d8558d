#include<iostream>
#include "printer.hpp"
#include "logger.hpp"
#include <cjson/cJSON.h>
#include <fstream>
#include <stdexcept>

namespace {

cJSON* build_json_report(const ScanReport& r) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "file", r.path.c_str());
    cJSON_AddStringToObject(item, "storage_name", r.storageName.c_str());
    cJSON_AddStringToObject(item, "detected_type", r.detectedType.c_str());
    cJSON_AddNumberToObject(item, "size", static_cast<double>(r.size));
    cJSON_AddStringToObject(item, "status", r.passed ? "pass" : "rejected");

    cJSON* errorArray = cJSON_CreateArray();
    for (const auto& error : r.errors) {
        cJSON_AddItemToArray(errorArray, cJSON_CreateString(error.c_str()));
    }
    cJSON_AddItemToObject(item, "errors", errorArray);
    return item;
}

} // namespace

std::string reportsToJson(const std::vector<ScanReport>& reports) {
    cJSON* root = cJSON_CreateArray();
    for (const auto& r : reports) {
        cJSON_AddItemToArray(root, build_json_report(r));
    }

    char* jsonStr = cJSON_Print(root);
    cJSON_Delete(root);
    if (!jsonStr) {
        throw std::runtime_error("cJSON_Print failed");
    }
    std::string json(jsonStr);
    cJSON_free(jsonStr);
    return json;
}

void dumpJson(const std::vector<ScanReport>& reports, const std::string& filename) {
    std::ofstream outFile(filename, std::ios::binary);
    if (!outFile.is_open()) {
        throw std::runtime_error("Cannot write JSON report to " + filename);
    }
    const std::string json = reportsToJson(reports);
    outFile.write(json.data(), static_cast<std::streamsize>(json.size()));
    Logger::debug("Wrote JSON report to " + filename);
}

void printReport(const ScanReport& report) {
    std::cout << "* " << report.path << "\n";
    if (report.passed) {
        std::cout << "└── " << ansi::bold << ansi::green << "PASS" << ansi::reset;
    } else {
        std::cout << "└── " << ansi::bold << ansi::red << "REJECTED" << ansi::reset;
    }
    std::cout << " (" << report.detectedType << ", " << report.size << " bytes)\n";

    for (size_t i = 0; i < report.errors.size(); ++i) {
        const bool last = i + 1 == report.errors.size();
        std::cout << "    " << (last ? "└── " : "├── ")
                  << ansi::yellow << report.errors[i] << ansi::reset << "\n";
    }
    std::cout << "    " << ansi::gray << "Storage name: " << report.storageName
              << ansi::reset << "\n";
}

void printSummary(const std::vector<ScanReport>& reports) {
    size_t passed = 0;
    for (const auto& r : reports) {
        if (r.passed) ++passed;
    }
    std::cout << ansi::cyan << passed << "/" << reports.size() << " file(s) passed"
              << ansi::reset << "\n";
}
