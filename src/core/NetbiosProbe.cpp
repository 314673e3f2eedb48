/**
 * @file NetbiosProbe.cpp
 * @brief NetBIOS node status (NBSTAT) query for Windows and Samba host names
 */

#include "lanmonitor/NetbiosProbe.h"
#include "lanmonitor/config.h"
#include "lanmonitor/SocketHandle.h"
#include "lanmonitor/StringUtils.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>

namespace LanMonitor {

namespace {
constexpr size_t NAME_COUNT_OFFSET = 56;
constexpr size_t NAME_ENTRY_SIZE = 18;
constexpr size_t NETBIOS_NAME_LENGTH = 15;
constexpr uint16_t NBSTAT_TYPE = 0x0021;
constexpr uint8_t NAME_TYPE_WORKSTATION = 0x00;
constexpr uint8_t NAME_TYPE_FILE_SERVER = 0x20;
}  // namespace

std::vector<uint8_t> NetbiosProbe::buildStatusQuery() {
    std::vector<uint8_t> packet = {
        0x00, 0x01,   // transaction id
        0x00, 0x00,   // flags
        0x00, 0x01,   // questions
        0x00, 0x00,   // answers
        0x00, 0x00,   // authority
        0x00, 0x00,   // additional
    };

    // "*" padded with NULs to 16 bytes, first-level encoded (nibble + 'A').
    std::string name(16, '\0');
    name[0] = '*';
    packet.push_back(0x20);
    for (unsigned char c : name) {
        packet.push_back(static_cast<uint8_t>(((c >> 4) & 0x0F) + 0x41));
        packet.push_back(static_cast<uint8_t>((c & 0x0F) + 0x41));
    }
    packet.push_back(0x00);

    packet.push_back(static_cast<uint8_t>(NBSTAT_TYPE >> 8));
    packet.push_back(static_cast<uint8_t>(NBSTAT_TYPE & 0xFF));
    packet.push_back(0x00);   // class IN
    packet.push_back(0x01);
    return packet;
}

std::optional<std::string> NetbiosProbe::parseStatusReply(const uint8_t* data, size_t len) {
    if (!data || len <= NAME_COUNT_OFFSET) {
        return std::nullopt;
    }

    const size_t count = data[NAME_COUNT_OFFSET];
    size_t offset = NAME_COUNT_OFFSET + 1;
    for (size_t i = 0; i < count && offset + NAME_ENTRY_SIZE <= len; ++i, offset += NAME_ENTRY_SIZE) {
        std::string name;
        for (size_t k = 0; k < NETBIOS_NAME_LENGTH; ++k) {
            const auto c = static_cast<unsigned char>(data[offset + k]);
            if (c < 0x80) {
                name.push_back(static_cast<char>(c));
            }
        }
        name = StringUtils::trim(name);
        const uint8_t type = data[offset + NETBIOS_NAME_LENGTH];

        if ((type == NAME_TYPE_WORKSTATION || type == NAME_TYPE_FILE_SERVER) && !name.empty() && name != "*") {
            return name;
        }
    }
    return std::nullopt;
}

std::optional<std::string> NetbiosProbe::query(const std::string& ip, std::chrono::milliseconds timeout) {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(NETBIOS_NS_PORT);
    if (inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) {
        return std::nullopt;
    }

    SocketHandle sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        return std::nullopt;
    }

    const std::vector<uint8_t> packet = buildStatusQuery();
    if (::sendto(sock.get(), packet.data(), packet.size(), 0,
                 reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
        return std::nullopt;
    }

    pollfd pfd{};
    pfd.fd = sock.get();
    pfd.events = POLLIN;
    int ready = 0;
    do {
        ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (ready < 0 && errno == EINTR);
    if (ready <= 0) {
        return std::nullopt;
    }

    uint8_t buf[1024];
    const ssize_t n = ::recv(sock.get(), buf, sizeof(buf), 0);
    if (n <= 0) {
        return std::nullopt;
    }
    return parseStatusReply(buf, static_cast<size_t>(n));
}

}  // namespace LanMonitor
