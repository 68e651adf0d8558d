#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct ScanReport {
    std::string path;
    std::string storageName;    // sanitized
    std::string detectedType;
    uint64_t size = 0;
    bool passed = false;
    std::vector<std::string> errors;
};

void printReport(const ScanReport& report);
void printSummary(const std::vector<ScanReport>& reports);
std::string reportsToJson(const std::vector<ScanReport>& reports);
void dumpJson(const std::vector<ScanReport>& reports, const std::string& filename);
