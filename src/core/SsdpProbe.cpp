/**
 * @file SsdpProbe.cpp
 * @brief Unicast SSDP M-SEARCH and UPnP device description fetch
 */

#include "lanmonitor/SsdpProbe.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/HttpClient.h"
#include "lanmonitor/SocketHandle.h"
#include "lanmonitor/StringUtils.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <regex>
#include <utility>

namespace LanMonitor {

namespace {

std::string decodeXmlEntities(const std::string& s) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&apos;", "'"}, {"&amp;", "&"},
    };
    std::string out = s;
    for (const auto& entity : entities) {
        size_t pos = 0;
        const std::string from = entity.first;
        const std::string to = entity.second;
        while ((pos = out.find(from, pos)) != std::string::npos) {
            out.replace(pos, from.size(), to);
            pos += to.size();
        }
    }
    return out;
}

/// Text of the first <name> element (any namespace prefix) inside xml.
std::optional<std::string> elementText(const std::string& xml, const std::string& name) {
    const std::regex pattern("<(?:[A-Za-z0-9_]+:)?" + name + "(?:\\s[^>]*)?>([^<]*)<");
    std::smatch match;
    if (!std::regex_search(xml, match, pattern)) {
        return std::nullopt;
    }
    std::string text = StringUtils::trim(decodeXmlEntities(match[1].str()));
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

}  // namespace

std::string SsdpProbe::buildSearchRequest() {
    return std::string("M-SEARCH * HTTP/1.1\r\n") +
           "HOST: " + SSDP_MULTICAST_ADDR + ":" + std::to_string(SSDP_PORT) + "\r\n" +
           "MAN: \"ssdp:discover\"\r\n"
           "MX: 1\r\n"
           "ST: ssdp:all\r\n"
           "\r\n";
}

std::map<std::string, std::string> SsdpProbe::parseResponseHeaders(const std::string& response) {
    std::map<std::string, std::string> headers;
    for (const auto& line : StringUtils::splitLines(response)) {
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        headers[StringUtils::toLower(StringUtils::trim(line.substr(0, colon)))] =
            StringUtils::trim(line.substr(colon + 1));
    }
    return headers;
}

std::optional<UpnpDescription> SsdpProbe::parseDescription(const std::string& xml) {
    static const std::regex deviceOpen("<(?:[A-Za-z0-9_]+:)?device(?:\\s[^>]*)?>");
    std::smatch match;
    if (!std::regex_search(xml, match, deviceOpen)) {
        return std::nullopt;
    }

    // Embedded devices follow the root device's own fields, so the first
    // occurrence of each element belongs to the root device.
    const std::string device = match.suffix().str();
    UpnpDescription out;
    out.friendlyName = elementText(device, "friendlyName");
    out.manufacturer = elementText(device, "manufacturer");
    out.modelName = elementText(device, "modelName");
    out.modelDescription = elementText(device, "modelDescription");
    out.deviceType = elementText(device, "deviceType");
    return out;
}

std::optional<SsdpResult> SsdpProbe::probe(const std::string& ip,
                                           std::chrono::milliseconds wait,
                                           std::chrono::milliseconds descriptionTimeout) {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(SSDP_PORT);
    if (inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) {
        return std::nullopt;
    }

    SocketHandle sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        return std::nullopt;
    }

    const std::string request = buildSearchRequest();
    if (::sendto(sock.get(), request.data(), request.size(), 0,
                 reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
        return std::nullopt;
    }

    const auto deadline = std::chrono::steady_clock::now() + wait;
    std::optional<SsdpResult> result;
    while (!result) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            break;
        }

        pollfd pfd{sock.get(), POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready <= 0) {
            break;
        }

        char buf[4096];
        sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        const ssize_t n = ::recvfrom(sock.get(), buf, sizeof(buf), 0,
                                     reinterpret_cast<sockaddr*>(&from), &fromLen);
        if (n <= 0 || from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        result = SsdpResult{};
        result->headers = parseResponseHeaders(std::string(buf, static_cast<size_t>(n)));
    }

    if (!result) {
        return std::nullopt;
    }

    const auto location = result->headers.find("location");
    if (location != result->headers.end() && !location->second.empty()) {
        HttpClient::Options options;
        options.timeout = descriptionTimeout;
        HttpResponse response;
        std::string errorMsg;
        if (!HttpClient::get(location->second, options, response, errorMsg)) {
            LOG_DEBUG("[SSDP] Description fetch failed for " << ip << ": " << errorMsg);
        } else if (response.status == 200) {
            result->description = parseDescription(response.body);
        }
    }
    return result;
}

}  // namespace LanMonitor
