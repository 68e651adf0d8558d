#include "batch.hpp"
#include "file_type_detector.hpp"
#include "utils/file_reader.hpp"
#include "utils/filename.hpp"
#include "logger.hpp"
#include <algorithm>
#include <deque>
#include <filesystem>
#include <future>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace {

FileDescriptor describe(const std::string& path, const std::string& declaredType) {
    FileDescriptor file;
    file.originalName = fs::path(path).filename().string();
    file.declaredMimeType = declaredType;
    file.content = readFile(path);
    file.sizeBytes = file.content.size();
    return file;
}

void collect(std::future<bool>& pending, ScanReport& report) {
    try {
        report.passed = pending.get();
    } catch (const SecurityError& e) {
        report.passed = false;
        report.errors = e.errors();
    }
}

} // namespace

size_t default_parallel_scans() {
    return std::max<size_t>(2, std::thread::hardware_concurrency());
}

std::vector<ScanReport> scanFiles(const Scanner& scanner,
                                  const std::vector<std::string>& paths,
                                  const std::string& declaredType,
                                  size_t maxInFlight) {
    maxInFlight = std::max<size_t>(1, maxInFlight);
    Logger::debug("Scanning " + std::to_string(paths.size()) + " file(s), " +
                  std::to_string(maxInFlight) + " at a time");

    std::vector<ScanReport> reports;
    reports.reserve(paths.size());
    std::deque<std::pair<size_t, std::future<bool>>> pending;

    for (const auto& path : paths) {
        if (pending.size() >= maxInFlight) {
            collect(pending.front().second, reports[pending.front().first]);
            pending.pop_front();
        }

        FileDescriptor file = describe(path, declaredType);

        ScanReport report;
        report.path = path;
        report.storageName = sanitizeFilename(file.originalName);
        report.detectedType = detectFileType(file.content);
        report.size = file.sizeBytes;
        reports.push_back(report);

        pending.emplace_back(reports.size() - 1, scanner.scanAsync(std::move(file)));
    }

    for (auto& entry : pending) {
        collect(entry.second, reports[entry.first]);
    }
    return reports;
}
