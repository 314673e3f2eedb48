/**
 * @file SsdpProbe.h
 * @brief Unicast SSDP M-SEARCH and UPnP device description fetch
 */

#pragma once

#include "config.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace LanMonitor {

/**
 * @struct UpnpDescription
 * @brief Root device fields of a UPnP description document
 */
struct UpnpDescription {
    std::optional<std::string> friendlyName;
    std::optional<std::string> manufacturer;
    std::optional<std::string> modelName;
    std::optional<std::string> modelDescription;
    std::optional<std::string> deviceType;
};

struct SsdpResult {
    std::map<std::string, std::string> headers;   ///< lowercase keys
    std::optional<UpnpDescription> description;
};

class SsdpProbe {
public:
    static std::string buildSearchRequest();

    /// Header lines of an SSDP reply, keys lowercased, values trimmed.
    static std::map<std::string, std::string> parseResponseHeaders(const std::string& response);

    /**
     * @brief Extract the first <device> element's fields.
     * @return std::nullopt when the document has no device element
     */
    static std::optional<UpnpDescription> parseDescription(const std::string& xml);

    /**
     * @brief Send M-SEARCH to ip:1900 and use the first reply from that host.
     *
     * When the reply carries a LOCATION header the description document is
     * fetched with descriptionTimeout. Failures of that fetch leave
     * description unset.
     * @return std::nullopt when the host did not answer within wait
     */
    static std::optional<SsdpResult> probe(const std::string& ip,
                                           std::chrono::milliseconds wait =
                                               std::chrono::milliseconds(SSDP_WAIT_MS),
                                           std::chrono::milliseconds descriptionTimeout =
                                               std::chrono::milliseconds(PROBE_TIMEOUT_MS));
};

}  // namespace LanMonitor
