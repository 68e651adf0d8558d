#pragma once
#include "checks/base_check.hpp"
#include "adapters/scanner_adapter.hpp"
#include "config.hpp"
#include "filedescriptor.hpp"
#include "securityerror.hpp"
#include <future>
#include <memory>
#include <vector>

// Runs every check over one file and either passes it or throws a
// SecurityError listing every problem found. Safe to share between threads:
// scan() does not modify the scanner.
class Scanner {
public:
    // Throws ConfigError when customScanner names an unknown adapter type.
    explicit Scanner(SecurityConfig config = SecurityConfig{});
    Scanner(SecurityConfig config, std::unique_ptr<ScannerAdapter> adapter);

    bool scan(const FileDescriptor& file) const;
    bool scan(const FileDescriptor& file, const CancelToken& cancel) const;

    // The scanner must outlive the returned future.
    std::future<bool> scanAsync(FileDescriptor file,
                                std::shared_ptr<CancelToken> cancel = nullptr) const;

    const SecurityConfig& config() const { return config_; }
    bool hasCustomScanner() const { return adapter != nullptr; }

private:
    void runChecks(const FileDescriptor& file, ScanErrors& errors) const;
    void runCustomScanner(const FileDescriptor& file, ScanErrors& errors,
                          const CancelToken& cancel) const;

    SecurityConfig config_;
    std::vector<std::unique_ptr<BaseCheck>> checks;
    std::unique_ptr<ScannerAdapter> adapter;
};
