#pragma once
#include <atomic>
#include <string>
#include "filedescriptor.hpp"

struct ScanVerdict {
    bool infected = false;
    std::string threat;
};

// Shared between the caller and an in-flight adapter call.
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool isCancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// An external scanning service. Implementations throw ExternalScannerError
// when they cannot produce a verdict; they never report clean in that case.
class ScannerAdapter {
public:
    virtual ~ScannerAdapter() = default;
    virtual std::string name() const = 0;
    virtual ScanVerdict scan(const FileDescriptor& file, const CancelToken& cancel) = 0;
};
