#pragma once
#include "scanner_adapter.hpp"
#include "config.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Streams the file to a ClamAV daemon with the INSTREAM command and parses
// the one-line reply. The whole exchange is bounded by the configured timeout.
class ClamdScannerAdapter : public ScannerAdapter {
public:
    explicit ClamdScannerAdapter(const CustomScannerConfig& config);
    std::string name() const override { return "clamav"; }
    ScanVerdict scan(const FileDescriptor& file, const CancelToken& cancel) override;

    // "stream: OK", "stream: Eicar-Signature FOUND", "... ERROR"
    static ScanVerdict parseReply(const std::string& reply);

    static constexpr size_t CHUNK_SIZE = 64 * 1024;

private:
    using Clock = std::chrono::steady_clock;

    int connectTo(Clock::time_point deadline, const CancelToken& cancel) const;
    void waitFor(int fd, short events, Clock::time_point deadline,
                 const CancelToken& cancel, const char* what) const;
    void sendAll(int fd, const uint8_t* data, size_t len,
                 Clock::time_point deadline, const CancelToken& cancel) const;
    std::string readReply(int fd, Clock::time_point deadline, const CancelToken& cancel) const;

    std::string host;
    uint16_t port;
    std::chrono::milliseconds timeout;
};
