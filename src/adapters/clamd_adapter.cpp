#include "clamd_adapter.hpp"
#include "adapter_registration.hpp"
#include "securityerror.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

// Closes the descriptor on every exit path.
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() { if (fd_ >= 0) ::close(fd_); }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    int get() const { return fd_; }
    int release() { int fd = fd_; fd_ = -1; return fd; }

private:
    int fd_;
};

// Poll in short slices so a cancel is noticed promptly.
constexpr int POLL_SLICE_MS = 100;
constexpr size_t MAX_REPLY_BYTES = 4096;

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ClamdScannerAdapter::ClamdScannerAdapter(const CustomScannerConfig& config)
    : host(config.host), port(config.port), timeout(config.timeoutMs) {}

ScanVerdict ClamdScannerAdapter::scan(const FileDescriptor& file, const CancelToken& cancel) {
    const auto deadline = Clock::now() + timeout;
    Logger::debug("clamd: scanning '" + file.originalName + "' via " + host + ":" +
                  std::to_string(port));

    SocketHandle sock(connectTo(deadline, cancel));

    static const char command[] = "zINSTREAM";
    sendAll(sock.get(), reinterpret_cast<const uint8_t*>(command), sizeof(command), deadline, cancel);

    size_t offset = 0;
    while (offset < file.content.size()) {
        const size_t len = std::min(CHUNK_SIZE, file.content.size() - offset);
        const uint8_t header[4] = {
            static_cast<uint8_t>((len >> 24) & 0xFF),
            static_cast<uint8_t>((len >> 16) & 0xFF),
            static_cast<uint8_t>((len >> 8) & 0xFF),
            static_cast<uint8_t>(len & 0xFF),
        };
        sendAll(sock.get(), header, sizeof(header), deadline, cancel);
        sendAll(sock.get(), file.content.data() + offset, len, deadline, cancel);
        offset += len;
    }
    const uint8_t terminator[4] = {0, 0, 0, 0};
    sendAll(sock.get(), terminator, sizeof(terminator), deadline, cancel);

    const std::string reply = readReply(sock.get(), deadline, cancel);
    Logger::debug("clamd: reply '" + reply + "'");
    return parseReply(reply);
}

ScanVerdict ClamdScannerAdapter::parseReply(const std::string& raw) {
    const std::string reply = trim(raw);
    if (reply.empty()) {
        throw ExternalScannerError("clamd closed the connection without a verdict");
    }
    if (endsWith(reply, "ERROR")) {
        throw ExternalScannerError("clamd error: " + reply);
    }

    const size_t colon = reply.find(':');
    const std::string status = trim(colon == std::string::npos ? reply : reply.substr(colon + 1));

    if (status == "OK") {
        return {};
    }
    if (endsWith(status, " FOUND")) {
        ScanVerdict verdict;
        verdict.infected = true;
        verdict.threat = trim(status.substr(0, status.size() - 6));
        return verdict;
    }
    throw ExternalScannerError("Unexpected clamd reply: " + reply);
}

int ClamdScannerAdapter::connectTo(Clock::time_point deadline, const CancelToken& cancel) const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &addresses);
    if (rc != 0) {
        throw ExternalScannerError("Cannot resolve clamd host " + host + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(addresses, ::freeaddrinfo);

    std::string lastError = "no usable address";
    for (addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
        SocketHandle sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.get() < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        int flags = ::fcntl(sock.get(), F_GETFL, 0);
        if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
            lastError = std::strerror(errno);
            continue;
        }

        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                lastError = std::strerror(errno);
                continue;
            }
            waitFor(sock.get(), POLLOUT, deadline, cancel, "connect");
            int soError = 0;
            socklen_t len = sizeof(soError);
            if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0) {
                lastError = std::strerror(soError ? soError : errno);
                continue;
            }
        }

        return sock.release();
    }

    throw ExternalScannerError("Cannot connect to clamd at " + host + ":" + service + ": " + lastError);
}

void ClamdScannerAdapter::waitFor(int fd, short events, Clock::time_point deadline,
                                  const CancelToken& cancel, const char* what) const {
    while (true) {
        if (cancel.isCancelled()) {
            throw ExternalScannerError(std::string("clamd ") + what + " cancelled");
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) {
            throw ExternalScannerError(std::string("clamd ") + what + " timed out");
        }

        pollfd pfd{fd, events, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw ExternalScannerError(std::string("clamd poll failed: ") + std::strerror(errno));
        }
        if (rc > 0) {
            return;
        }
    }
}

void ClamdScannerAdapter::sendAll(int fd, const uint8_t* data, size_t len,
                                  Clock::time_point deadline, const CancelToken& cancel) const {
    size_t sent = 0;
    while (sent < len) {
        waitFor(fd, POLLOUT, deadline, cancel, "send");
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw ExternalScannerError(std::string("clamd send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

std::string ClamdScannerAdapter::readReply(int fd, Clock::time_point deadline,
                                           const CancelToken& cancel) const {
    std::string reply;
    char buffer[512];
    while (reply.size() < MAX_REPLY_BYTES) {
        waitFor(fd, POLLIN, deadline, cancel, "reply");
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw ExternalScannerError(std::string("clamd recv failed: ") + std::strerror(errno));
        }
        if (n == 0) {
            break;
        }
        reply.append(buffer, static_cast<size_t>(n));
        // z-prefixed commands terminate the reply with NUL
        size_t nul = reply.find('\0');
        if (nul != std::string::npos) {
            reply.resize(nul);
            break;
        }
    }
    return reply;
}

REGISTER_SCANNER_ADAPTER(ClamdScannerAdapter, "clamav")
