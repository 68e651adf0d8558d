#pragma once
#include <stdexcept>
#include <string>
#include <vector>

using ScanError = std::string;

// Raised by scan() when at least one check failed. Carries every message in
// the order the checks produced them.
class SecurityError : public std::runtime_error {
public:
    SecurityError(const std::string& message, std::vector<ScanError> errors)
        : std::runtime_error(message), errors_(std::move(errors)) {}

    const std::vector<ScanError>& errors() const noexcept { return errors_; }

private:
    std::vector<ScanError> errors_;
};

// An external scanner reported an infection, could not be reached, or did not
// answer in time.
class ExternalScannerError : public std::runtime_error {
public:
    explicit ExternalScannerError(const std::string& message)
        : std::runtime_error(message) {}
};

// Collects the messages of every non-fail-fast stage. The scanner makes the
// single raise-or-pass decision once all stages have appended.
class ScanErrors {
public:
    void add(ScanError message) { errors_.push_back(std::move(message)); }
    bool empty() const noexcept { return errors_.empty(); }
    size_t size() const noexcept { return errors_.size(); }
    const std::vector<ScanError>& list() const noexcept { return errors_; }

    // Throws SecurityError when anything was collected.
    void raiseIfAny(const std::string& message) const;

private:
    std::vector<ScanError> errors_;
};
