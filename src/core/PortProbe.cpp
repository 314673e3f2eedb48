/**
 * @file PortProbe.cpp
 * @brief TCP connect probe against a table of well-known ports
 */

#include "lanmonitor/PortProbe.h"
#include "lanmonitor/SocketHandle.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>

namespace LanMonitor {

const std::vector<KnownPort>& PortProbe::commonPorts() {
    static const std::vector<KnownPort> ports = {
        {22, "ssh"},          {23, "telnet"},    {53, "dns"},        {80, "http"},
        {443, "https"},       {445, "smb"},      {548, "afp"},       {631, "ipp"},
        {3389, "rdp"},        {5000, "upnp"},    {5001, "synology"}, {7000, "airtunes"},
        {8080, "http-alt"},   {8443, "https-alt"}, {9100, "jetdirect"}, {32400, "plex"},
        {49152, "upnp"},      {62078, "iphone-sync"},
    };
    return ports;
}

std::string PortProbe::serviceName(uint16_t port) {
    for (const auto& known : commonPorts()) {
        if (known.port == port) {
            return known.service;
        }
    }
    return {};
}

std::vector<int> PortProbe::scan(const std::string& ip,
                                 const std::vector<uint16_t>& ports,
                                 std::chrono::milliseconds timeout) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return {};
    }

    struct Attempt {
        uint16_t port;
        SocketHandle sock;
        bool open = false;
        bool pending = false;
    };
    std::vector<Attempt> attempts;
    attempts.reserve(ports.size());

    for (uint16_t port : ports) {
        Attempt a{port, SocketHandle(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0))};
        if (!a.sock.valid()) {
            continue;
        }
        addr.sin_port = htons(port);
        if (::connect(a.sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
            a.open = true;
        } else if (errno == EINPROGRESS) {
            a.pending = true;
        }
        attempts.push_back(std::move(a));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        std::vector<pollfd> pfds;
        std::vector<Attempt*> owners;
        for (auto& a : attempts) {
            if (a.pending) {
                pfds.push_back(pollfd{a.sock.get(), POLLOUT, 0});
                owners.push_back(&a);
            }
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (pfds.empty() || left.count() <= 0) {
            break;
        }

        const int ready = ::poll(pfds.data(), pfds.size(), static_cast<int>(left.count()));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready <= 0) {
            break;
        }

        for (size_t i = 0; i < pfds.size(); ++i) {
            if (pfds[i].revents == 0) {
                continue;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            owners[i]->pending = false;
            if (getsockopt(pfds[i].fd, SOL_SOCKET, SO_ERROR, &soError, &len) == 0 && soError == 0) {
                owners[i]->open = true;
            }
        }
    }

    std::vector<int> open;
    for (const auto& a : attempts) {
        if (a.open) {
            open.push_back(a.port);
        }
    }
    return open;
}

std::vector<int> PortProbe::scanCommon(const std::string& ip, std::chrono::milliseconds timeout) {
    std::vector<uint16_t> ports;
    for (const auto& known : commonPorts()) {
        ports.push_back(known.port);
    }
    return scan(ip, ports, timeout);
}

}  // namespace LanMonitor
