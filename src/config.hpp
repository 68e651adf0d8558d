#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "helpers.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// upload.security.custom_scanner
struct CustomScannerConfig {
    std::string type = "clamav";
    std::string host = "localhost";
    uint16_t port = 3310;
    int timeoutMs = 60000;
};

// upload.security
struct SecurityConfig {
    uint64_t maxSizeBytes = UPLOADGUARD_DEFAULT_MAX_SIZE;
    bool validateSignatures = true;
    size_t contentScanBytes = UPLOADGUARD_DEFAULT_CONTENT_WINDOW;

    bool inspectArchives = true;
    uint64_t maxExpandedBytes = UPLOADGUARD_DEFAULT_MAX_EXPANDED_SIZE;
    double maxCompressionRatio = 100.0;

    std::optional<CustomScannerConfig> customScanner;
};

// Reads {"upload": {"security": {...}}} from a JSON document. Keys that are
// absent keep their defaults.
SecurityConfig parseSecurityConfig(const std::string& json);
SecurityConfig loadSecurityConfig(const std::string& path);

// UPLOAD_SECURITY_* variables take precedence over file values.
void applyEnvironment(SecurityConfig& config);
