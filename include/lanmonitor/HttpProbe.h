/**
 * @file HttpProbe.h
 * @brief Web interface fingerprint: Server header and HTML title
 */

#pragma once

#include "config.h"
#include "HttpClient.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace LanMonitor {

struct HttpFingerprint {
    std::string url;
    std::string server;                  ///< empty when the header is absent
    std::optional<std::string> title;
};

class HttpProbe {
public:
    /// http://ip/, https://ip/, http://ip:8080/, http://ip:8443/ in that order.
    static std::vector<std::string> candidateUrls(const std::string& ip);

    /// Trimmed text of the first <title> element (case-insensitive).
    static std::optional<std::string> extractTitle(const std::string& html);

    /// Fingerprint of a 200 response, std::nullopt for any other status.
    static std::optional<HttpFingerprint> fingerprint(const HttpResponse& response);

    /**
     * @brief Try each candidate URL and stop at the first 200 response.
     * @param timeout Applied to each URL separately
     */
    static std::optional<HttpFingerprint> probe(const std::string& ip,
                                                std::chrono::milliseconds timeout =
                                                    std::chrono::milliseconds(PROBE_TIMEOUT_MS));
};

}  // namespace LanMonitor
