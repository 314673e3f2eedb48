/**
 * @file SocketHandle.h
 * @brief Move-only owner of a POSIX socket descriptor.
 */

#pragma once

#include <unistd.h>

namespace LanMonitor {

constexpr int INVALID_SOCKET_FD = -1;

class SocketHandle {
public:
    SocketHandle() = default;
    explicit SocketHandle(int fd) : m_fd(fd) {}

    ~SocketHandle() { reset(); }

    // Prevent copying
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    SocketHandle(SocketHandle&& other) noexcept : m_fd(other.m_fd) {
        other.m_fd = INVALID_SOCKET_FD;
    }

    SocketHandle& operator=(SocketHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_fd = other.m_fd;
            other.m_fd = INVALID_SOCKET_FD;
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool valid() const { return m_fd != INVALID_SOCKET_FD; }

    /// Close the owned descriptor (if any) and take ownership of fd.
    void reset(int fd = INVALID_SOCKET_FD) {
        if (m_fd != INVALID_SOCKET_FD) {
            ::close(m_fd);
        }
        m_fd = fd;
    }

    int release() {
        const int fd = m_fd;
        m_fd = INVALID_SOCKET_FD;
        return fd;
    }

private:
    int m_fd = INVALID_SOCKET_FD;
};

}  // namespace LanMonitor
