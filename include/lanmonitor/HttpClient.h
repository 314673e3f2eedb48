/**
 * @file HttpClient.h
 * @brief Small blocking HTTP/1.1 GET client for banner and description fetches
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace LanMonitor {

/**
 * @struct HttpUrl
 * @brief Decomposed http:// or https:// URL
 */
struct HttpUrl {
    std::string scheme;     ///< "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string path = "/"; ///< path plus query

    bool isTls() const { return scheme == "https"; }

    /// Host header value (port omitted when it is the scheme default).
    std::string hostHeader() const;

    std::string toString() const;

    static std::optional<HttpUrl> parse(const std::string& url);
};

/**
 * @struct HttpResponse
 * @brief Status, headers (lowercase keys) and decoded body
 */
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string url;        ///< URL that produced this response, after redirects

    /// Header value by case-insensitive name, empty when absent.
    std::string header(const std::string& name) const;
};

/**
 * @class HttpClient
 * @brief One-request-per-connection GET with redirects, chunked decoding and TLS
 *
 * Certificates are not verified. Bodies larger than maxBodyBytes are
 * truncated rather than rejected.
 */
class HttpClient {
public:
    struct Options {
        std::chrono::milliseconds timeout{PROBE_TIMEOUT_MS};
        int maxRedirects = 5;
        size_t maxBodyBytes = HTTP_MAX_RESPONSE_BYTES;
    };

    /**
     * @brief Fetch url, following redirects.
     * @return false on connection, TLS or protocol error (errorMsg set)
     */
    static bool get(const std::string& url, HttpResponse& response, std::string& errorMsg);
    static bool get(const std::string& url, const Options& options,
                    HttpResponse& response, std::string& errorMsg);

    //=========================================================================
    // Parsing (exposed for tests)
    //=========================================================================

    /**
     * @brief Parse a complete raw response (status line, headers, body).
     *
     * A chunked body is decoded; Content-Length truncates the body.
     */
    static bool parseResponse(const std::string& raw, HttpResponse& response, std::string& errorMsg);

    /// Decode a chunked transfer-encoded body; nullopt when malformed.
    static std::optional<std::string> decodeChunked(const std::string& body);

    /// Resolve a Location header against the URL that returned it.
    static std::optional<HttpUrl> resolveRedirect(const HttpUrl& base, const std::string& location);

private:
    static bool fetchOnce(const HttpUrl& url, const Options& options,
                          std::string& raw, std::string& errorMsg);
};

}  // namespace LanMonitor
