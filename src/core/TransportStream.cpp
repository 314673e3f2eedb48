/**
 * @file TransportStream.cpp
 * @brief Plain and TLS byte streams for the HTTP fingerprint probe
 */

#include "lanmonitor/TransportStream.h"
#include "lanmonitor/TlsSocket.h"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>

namespace LanMonitor {

namespace {

constexpr size_t READ_CHUNK = 8192;

class PlainStream final : public TransportStream {
public:
    explicit PlainStream(int fd) : m_fd(fd) {}

    bool writeAll(const std::string& data, std::string& errorMsg) override {
        size_t offset = 0;
        while (offset < data.size()) {
            const ssize_t n = ::send(m_fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                errorMsg = std::string("send: ") + std::strerror(errno);
                return false;
            }
            offset += static_cast<size_t>(n);
        }
        return true;
    }

    size_t readSome(uint8_t* buffer, size_t size, std::string& errorMsg) override {
        ssize_t n;
        do {
            n = ::recv(m_fd, buffer, size, 0);
        } while (n < 0 && errno == EINTR);

        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        // SO_RCVTIMEO expiry surfaces as EAGAIN.
        errorMsg = (errno == EAGAIN || errno == EWOULDBLOCK)
                       ? std::string("read timed out")
                       : std::string("recv: ") + std::strerror(errno);
        return 0;
    }

    void close() override { ::shutdown(m_fd, SHUT_RDWR); }
    bool isTls() const override { return false; }

private:
    int m_fd;
};

class TlsStream final : public TransportStream {
public:
    explicit TlsStream(std::unique_ptr<TlsSocket> session) : m_session(std::move(session)) {}

    bool writeAll(const std::string& data, std::string& errorMsg) override {
        return m_session->sendExact(reinterpret_cast<const uint8_t*>(data.data()), data.size(), errorMsg);
    }

    size_t readSome(uint8_t* buffer, size_t size, std::string& errorMsg) override {
        return m_session->recv(buffer, size, errorMsg);
    }

    void close() override { m_session->shutdown(); }
    bool isTls() const override { return true; }

private:
    std::unique_ptr<TlsSocket> m_session;
};

}  // namespace

std::unique_ptr<TransportStream> TransportStream::plain(int fd) {
    return std::make_unique<PlainStream>(fd);
}

std::unique_ptr<TransportStream> TransportStream::tls(int fd, const std::string& serverName,
                                                      std::string& errorMsg) {
    auto session = std::make_unique<TlsSocket>(fd);
    if (!session->connect(serverName, errorMsg)) {
        return nullptr;
    }
    return std::make_unique<TlsStream>(std::move(session));
}

bool TransportStream::readUntil(std::string& out, size_t maxBytes,
                                std::chrono::steady_clock::time_point deadline,
                                const CompletePredicate& isComplete,
                                std::string& errorMsg) {
    uint8_t chunk[READ_CHUNK];
    while (out.size() < maxBytes && std::chrono::steady_clock::now() < deadline) {
        std::string readError;
        const size_t n = readSome(chunk, sizeof(chunk), readError);
        if (n == 0) {
            if (out.empty() && !readError.empty()) {
                errorMsg = readError;
                return false;
            }
            break;
        }
        out.append(reinterpret_cast<const char*>(chunk), n);
        if (isComplete && isComplete(out)) {
            break;
        }
    }
    return true;
}

}  // namespace LanMonitor
