#include "config.hpp"
#include "logger.hpp"
#include <cjson/cJSON.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

const cJSON* child(const cJSON* object, const char* key) {
    if (!object || !cJSON_IsObject(object)) return nullptr;
    return cJSON_GetObjectItemCaseSensitive(object, key);
}

uint64_t readSize(const cJSON* item, const std::string& key) {
    if (!cJSON_IsNumber(item) || item->valuedouble < 0 ||
        item->valuedouble != std::floor(item->valuedouble) ||
        item->valuedouble > static_cast<double>(std::numeric_limits<int64_t>::max())) {
        throw ConfigError("upload.security." + key + " must be a non-negative integer");
    }
    return static_cast<uint64_t>(item->valuedouble);
}

bool readBool(const cJSON* item, const std::string& key) {
    if (!cJSON_IsBool(item)) {
        throw ConfigError("upload.security." + key + " must be a boolean");
    }
    return cJSON_IsTrue(item);
}

std::string readString(const cJSON* item, const std::string& key) {
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        throw ConfigError("upload.security." + key + " must be a string");
    }
    return item->valuestring;
}

uint16_t checkedPort(uint64_t value, const std::string& key) {
    if (value == 0 || value > 65535) {
        throw ConfigError(key + " must be a TCP port (1-65535)");
    }
    return static_cast<uint16_t>(value);
}

CustomScannerConfig readScanner(const cJSON* node) {
    if (!cJSON_IsObject(node)) {
        throw ConfigError("upload.security.custom_scanner must be null or an object");
    }
    CustomScannerConfig scanner;
    if (const cJSON* item = child(node, "type")) {
        scanner.type = readString(item, "custom_scanner.type");
    }
    if (const cJSON* item = child(node, "host")) {
        scanner.host = readString(item, "custom_scanner.host");
    }
    if (const cJSON* item = child(node, "port")) {
        scanner.port = checkedPort(readSize(item, "custom_scanner.port"),
                                   "upload.security.custom_scanner.port");
    }
    if (const cJSON* item = child(node, "timeout")) {
        uint64_t timeout = readSize(item, "custom_scanner.timeout");
        if (timeout == 0 || timeout > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigError("upload.security.custom_scanner.timeout out of range");
        }
        scanner.timeoutMs = static_cast<int>(timeout);
    }
    return scanner;
}

uint64_t envSize(const char* name, const std::string& value) {
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(value, &used);
        if (used != value.size() || value.find('-') != std::string::npos) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " is not a valid integer: " + value);
    }
}

bool envBool(const std::string& value) {
    std::string v = to_lower(value);
    return !(v == "0" || v == "false" || v == "no" || v == "off" || v.empty());
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

SecurityConfig parseSecurityConfig(const std::string& json) {
    JsonPtr root(cJSON_Parse(json.c_str()), cJSON_Delete);
    if (!root) {
        const char* where = cJSON_GetErrorPtr();
        std::string near = where ? std::string(where).substr(0, 20) : "";
        throw ConfigError("Malformed configuration JSON near: " + near);
    }

    SecurityConfig config;
    const cJSON* security = child(child(root.get(), "upload"), "security");
    if (!security) {
        Logger::debug("No upload.security section, using defaults");
        return config;
    }

    if (const cJSON* item = child(security, "max_size")) {
        config.maxSizeBytes = readSize(item, "max_size");
    }
    if (const cJSON* item = child(security, "validate_signatures")) {
        config.validateSignatures = readBool(item, "validate_signatures");
    }
    if (const cJSON* item = child(security, "content_scan_bytes")) {
        config.contentScanBytes = static_cast<size_t>(readSize(item, "content_scan_bytes"));
    }
    if (const cJSON* archive = child(security, "archive")) {
        if (const cJSON* item = child(archive, "inspect")) {
            config.inspectArchives = readBool(item, "archive.inspect");
        }
        if (const cJSON* item = child(archive, "max_expanded_size")) {
            config.maxExpandedBytes = readSize(item, "archive.max_expanded_size");
        }
        if (const cJSON* item = child(archive, "max_ratio")) {
            if (!cJSON_IsNumber(item) || item->valuedouble <= 0) {
                throw ConfigError("upload.security.archive.max_ratio must be a positive number");
            }
            config.maxCompressionRatio = item->valuedouble;
        }
    }

    const cJSON* scanner = child(security, "custom_scanner");
    if (scanner && !cJSON_IsNull(scanner)) {
        config.customScanner = readScanner(scanner);
    }
    return config;
}

SecurityConfig loadSecurityConfig(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConfigError("Cannot open configuration file " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    Logger::debug("Loaded configuration from " + path);
    return parseSecurityConfig(contents.str());
}

void applyEnvironment(SecurityConfig& config) {
    if (const char* v = env("UPLOAD_SECURITY_MAX_SIZE")) {
        config.maxSizeBytes = envSize("UPLOAD_SECURITY_MAX_SIZE", v);
    }
    if (const char* v = env("UPLOAD_SECURITY_VALIDATE_SIGNATURES")) {
        config.validateSignatures = envBool(v);
    }

    const char* enabled = env("UPLOAD_SECURITY_CUSTOM_SCANNER");
    if (!enabled) {
        return;
    }
    if (!envBool(enabled)) {
        config.customScanner.reset();
        return;
    }

    CustomScannerConfig scanner = config.customScanner.value_or(CustomScannerConfig{});
    if (const char* v = env("UPLOAD_SECURITY_SCANNER_TYPE")) {
        scanner.type = v;
    }
    if (const char* v = env("UPLOAD_SECURITY_SCANNER_HOST")) {
        scanner.host = v;
    }
    if (const char* v = env("UPLOAD_SECURITY_SCANNER_PORT")) {
        scanner.port = checkedPort(envSize("UPLOAD_SECURITY_SCANNER_PORT", v),
                                   "UPLOAD_SECURITY_SCANNER_PORT");
    }
    if (const char* v = env("UPLOAD_SECURITY_SCANNER_TIMEOUT")) {
        uint64_t timeout = envSize("UPLOAD_SECURITY_SCANNER_TIMEOUT", v);
        if (timeout == 0 || timeout > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigError("UPLOAD_SECURITY_SCANNER_TIMEOUT out of range");
        }
        scanner.timeoutMs = static_cast<int>(timeout);
    }
    config.customScanner = scanner;
}
