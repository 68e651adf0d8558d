#include "checks.hpp"
#include "file_type_detector.hpp"
#include "inspector_registry.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <sstream>
#include <iomanip>

namespace {
// Highly compressible but small archives (sparse logs, blank images) are
// normal; the ratio only counts once the expanded size is worth worrying about.
constexpr uint64_t RATIO_FLOOR_BYTES = 1024 * 1024;
}

void SizeCheck::check(const FileDescriptor& file, ScanErrors& errors) const {
    if (file.sizeBytes > config.maxSizeBytes) {
        errors.add("File size " + std::to_string(file.sizeBytes) +
                   " bytes exceeds security limit of " +
                   std::to_string(config.maxSizeBytes) + " bytes");
    }

    if (config.inspectArchives) {
        checkExpansion(file, errors);
    }
}

void SizeCheck::checkExpansion(const FileDescriptor& file, ScanErrors& errors) const {
    const std::string detected = detectFileType(file.content);
    auto inspector = InspectorRegistry::instance().createFor(detected);
    if (!inspector) {
        return;
    }

    InspectionResult result = inspector->inspect(file.content, config.maxExpandedBytes);
    Logger::debug(inspector->name() + " inspection: " + result.info + ", expanded=" +
                  std::to_string(result.expandedBytes));
    if (!result.readable) {
        Logger::warn("Could not inspect " + inspector->name() + " archive '" +
                     file.originalName + "': " + result.info);
        return;
    }

    if (result.limitExceeded) {
        errors.add("Archive expands beyond " + std::to_string(config.maxExpandedBytes) +
                   " bytes (" + format_bytes(config.maxExpandedBytes) + ")");
        return;
    }

    if (result.expandedBytes < RATIO_FLOOR_BYTES || file.content.empty()) {
        return;
    }
    const double ratio = static_cast<double>(result.expandedBytes) /
                         static_cast<double>(file.content.size());
    if (ratio > config.maxCompressionRatio) {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1)
            << "Archive compression ratio " << ratio
            << " exceeds limit " << config.maxCompressionRatio;
        errors.add(msg.str());
    }
}
