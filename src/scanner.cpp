#include "scanner.hpp"
#include "adapter_registry.hpp"
#include "checks/checks.hpp"
#include "logger.hpp"
#include <chrono>

namespace {
const char* const SCAN_FAILED = "File security scan failed";
}

Scanner::Scanner(SecurityConfig config)
    : Scanner(config, nullptr) {
    if (config_.customScanner) {
        adapter = AdapterRegistry::instance().create(*config_.customScanner);
        if (!adapter) {
            throw ConfigError("Unknown custom scanner type: " + config_.customScanner->type);
        }
        Logger::debug("Custom scanner enabled: " + adapter->name());
    }
}

Scanner::Scanner(SecurityConfig config, std::unique_ptr<ScannerAdapter> adapter)
    : config_(std::move(config)), adapter(std::move(adapter)) {
    // Fixed order; messages come out in this order.
    checks.push_back(std::make_unique<SignatureCheck>(config_.validateSignatures));
    checks.push_back(std::make_unique<ExtensionCheck>());
    checks.push_back(std::make_unique<ContentCheck>(config_.contentScanBytes));
    checks.push_back(std::make_unique<SizeCheck>(config_));
}

bool Scanner::scan(const FileDescriptor& file) const {
    CancelToken never;
    return scan(file, never);
}

bool Scanner::scan(const FileDescriptor& file, const CancelToken& cancel) const {
    Logger::debug("Scanner::scan '" + file.originalName + "' (" +
                  std::to_string(file.sizeBytes) + " bytes, " + file.declaredMimeType + ")");
    auto start = std::chrono::high_resolution_clock::now();

    ScanErrors errors;
    runChecks(file, errors);

    if (adapter) {
        runCustomScanner(file, errors, cancel);
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    Logger::debug("Scan of '" + file.originalName + "' took " + std::to_string(elapsed) + "us");

    if (!errors.empty()) {
        Logger::info("Rejected '" + file.originalName + "': " +
                     std::to_string(errors.size()) + " problem(s)");
    }
    errors.raiseIfAny(SCAN_FAILED);
    return true;
}

std::future<bool> Scanner::scanAsync(FileDescriptor file, std::shared_ptr<CancelToken> cancel) const {
    if (!cancel) {
        cancel = std::make_shared<CancelToken>();
    }
    return std::async(std::launch::async,
                      [this, file = std::move(file), cancel]() {
                          return scan(file, *cancel);
                      });
}

void Scanner::runChecks(const FileDescriptor& file, ScanErrors& errors) const {
    for (const auto& check : checks) {
        const size_t before = errors.size();
        try {
            check->check(file, errors);
        } catch (const std::exception& e) {
            // A stage that cannot finish is a failed stage, not a pass.
            Logger::error("Check " + check->name() + " aborted: " + e.what());
            errors.add("Security check " + check->name() + " could not complete: " + e.what());
        }
        if (errors.size() > before) {
            Logger::debug(check->name() + ": " + std::to_string(errors.size() - before) + " error(s)");
        }
    }
}

// Fail-fast: an infection or an unusable scanner ends the scan here, with the
// local findings attached.
void Scanner::runCustomScanner(const FileDescriptor& file, ScanErrors& errors,
                               const CancelToken& cancel) const {
    ScanVerdict verdict;
    try {
        verdict = adapter->scan(file, cancel);
    } catch (const ExternalScannerError& e) {
        Logger::error("Custom scanner " + adapter->name() + " failed: " + e.what());
        errors.add(std::string("Custom scanner failed: ") + e.what());
        throw SecurityError(SCAN_FAILED, errors.list());
    } catch (const std::exception& e) {
        Logger::error("Custom scanner " + adapter->name() + " aborted: " + e.what());
        errors.add(std::string("Custom scanner failed: ") + e.what());
        throw SecurityError(SCAN_FAILED, errors.list());
    }

    if (verdict.infected) {
        Logger::info("Custom scanner " + adapter->name() + " flagged '" +
                     file.originalName + "': " + verdict.threat);
        errors.add("Virus detected: " + verdict.threat);
        throw SecurityError(SCAN_FAILED, errors.list());
    }
}
