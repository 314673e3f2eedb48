/**
 * @file HttpClient.cpp
 * @brief Small blocking HTTP/1.1 GET client for banner and description fetches
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/HttpClient.h"
#include "lanmonitor/NetUtils.h"
#include "lanmonitor/StringUtils.h"
#include "lanmonitor/TransportStream.h"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <vector>

namespace LanMonitor {

namespace {
constexpr size_t MAX_HEADER_BYTES = 64 * 1024;

uint16_t defaultPort(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

/// Expected total response size once the header block is known, if any.
std::optional<size_t> expectedSize(const std::string& raw) {
    const size_t headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return std::nullopt;
    }
    for (const auto& line : StringUtils::splitLines(raw.substr(0, headerEnd))) {
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (StringUtils::toLower(StringUtils::trim(line.substr(0, colon))) == "content-length") {
            const std::string value = StringUtils::trim(line.substr(colon + 1));
            if (StringUtils::isAllDigits(value)) {
                return headerEnd + 4 + static_cast<size_t>(std::strtoull(value.c_str(), nullptr, 10));
            }
        }
    }
    return std::nullopt;
}
}  // namespace

//=============================================================================
// HttpUrl
//=============================================================================

std::string HttpUrl::hostHeader() const {
    if (port == defaultPort(scheme)) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

std::string HttpUrl::toString() const {
    return scheme + "://" + hostHeader() + path;
}

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }

    HttpUrl out;
    out.scheme = StringUtils::toLower(url.substr(0, schemeEnd));
    if (out.scheme != "http" && out.scheme != "https") {
        return std::nullopt;
    }

    const size_t authorityStart = schemeEnd + 3;
    const size_t pathStart = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart, pathStart == std::string::npos
                                                           ? std::string::npos
                                                           : pathStart - authorityStart);
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    out.port = defaultPort(out.scheme);
    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        const std::string portText = authority.substr(colon + 1);
        if (!StringUtils::isAllDigits(portText) || portText.size() > 5) {
            return std::nullopt;
        }
        const unsigned long port = std::strtoul(portText.c_str(), nullptr, 10);
        if (port == 0 || port > 65535) {
            return std::nullopt;
        }
        out.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    out.host = authority;

    if (pathStart != std::string::npos) {
        std::string rest = url.substr(pathStart);
        const size_t hash = rest.find('#');
        if (hash != std::string::npos) {
            rest = rest.substr(0, hash);
        }
        if (rest.empty() || rest[0] != '/') {
            rest = "/" + rest;
        }
        out.path = rest;
    }
    return out;
}

//=============================================================================
// HttpResponse
//=============================================================================

std::string HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(StringUtils::toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

//=============================================================================
// HttpClient: Requests
//=============================================================================

bool HttpClient::get(const std::string& url, HttpResponse& response, std::string& errorMsg) {
    return get(url, Options{}, response, errorMsg);
}

bool HttpClient::get(const std::string& url, const Options& options,
                     HttpResponse& response, std::string& errorMsg) {
    std::optional<HttpUrl> current = HttpUrl::parse(url);
    if (!current) {
        errorMsg = "Invalid URL: " + url;
        return false;
    }

    for (int hop = 0; hop <= options.maxRedirects; ++hop) {
        std::string raw;
        if (!fetchOnce(*current, options, raw, errorMsg)) {
            return false;
        }

        HttpResponse parsed;
        if (!parseResponse(raw, parsed, errorMsg)) {
            return false;
        }
        parsed.url = current->toString();

        const bool isRedirect = parsed.status == 301 || parsed.status == 302 ||
                                parsed.status == 303 || parsed.status == 307 ||
                                parsed.status == 308;
        const std::string location = parsed.header("location");
        if (!isRedirect || location.empty()) {
            if (parsed.body.size() > options.maxBodyBytes) {
                parsed.body.resize(options.maxBodyBytes);
            }
            response = std::move(parsed);
            return true;
        }

        std::optional<HttpUrl> next = resolveRedirect(*current, location);
        if (!next) {
            errorMsg = "Unusable redirect target: " + location;
            return false;
        }
        current = std::move(next);
    }

    errorMsg = "Too many redirects";
    return false;
}

bool HttpClient::fetchOnce(const HttpUrl& url, const Options& options,
                           std::string& raw, std::string& errorMsg) {
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;

    SocketHandle sock = NetUtils::connectTcp(url.host, url.port, options.timeout,
                                             options.timeout, errorMsg);
    if (!sock.valid()) {
        return false;
    }

    std::unique_ptr<TransportStream> stream = url.isTls()
        ? TransportStream::tls(sock.get(), url.host, errorMsg)
        : TransportStream::plain(sock.get());
    if (!stream) {
        return false;
    }

    const std::string request =
        "GET " + url.path + " HTTP/1.1\r\n"
        "Host: " + url.hostHeader() + "\r\n"
        "User-Agent: LanMonitor/1.0\r\n"
        "Accept: */*\r\n"
        "Connection: close\r\n\r\n";
    if (!stream->writeAll(request, errorMsg)) {
        return false;
    }

    auto complete = [](const std::string& received) {
        const std::optional<size_t> expected = expectedSize(received);
        return expected && received.size() >= *expected;
    };
    if (!stream->readUntil(raw, MAX_HEADER_BYTES + options.maxBodyBytes, deadline, complete, errorMsg)) {
        return false;
    }

    stream->close();
    if (raw.empty()) {
        errorMsg = "Empty response from " + url.toString();
        return false;
    }
    return true;
}

//=============================================================================
// HttpClient: Parsing
//=============================================================================

bool HttpClient::parseResponse(const std::string& raw, HttpResponse& response, std::string& errorMsg) {
    size_t headerEnd = raw.find("\r\n\r\n");
    size_t bodyStart = headerEnd + 4;
    if (headerEnd == std::string::npos) {
        headerEnd = raw.find("\n\n");
        bodyStart = headerEnd + 2;
    }
    if (headerEnd == std::string::npos) {
        // Headers only, connection closed before the blank line.
        headerEnd = raw.size();
        bodyStart = raw.size();
    }

    const std::vector<std::string> lines = StringUtils::splitLines(raw.substr(0, headerEnd));
    if (lines.empty() || !StringUtils::startsWith(lines[0], "HTTP/")) {
        errorMsg = "Not an HTTP response";
        return false;
    }

    const size_t space = lines[0].find(' ');
    const std::string statusText = space == std::string::npos ? std::string()
                                                              : lines[0].substr(space + 1, 3);
    if (statusText.size() != 3 || !StringUtils::isAllDigits(statusText)) {
        errorMsg = "Malformed status line: " + lines[0];
        return false;
    }

    HttpResponse out;
    out.status = std::atoi(statusText.c_str());
    for (size_t i = 1; i < lines.size(); ++i) {
        const size_t colon = lines[i].find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = StringUtils::toLower(StringUtils::trim(lines[i].substr(0, colon)));
        if (!key.empty() && out.headers.find(key) == out.headers.end()) {
            out.headers[key] = StringUtils::trim(lines[i].substr(colon + 1));
        }
    }

    out.body = raw.substr(std::min(bodyStart, raw.size()));
    if (StringUtils::containsIgnoreCase(out.header("transfer-encoding"), "chunked")) {
        std::optional<std::string> decoded = decodeChunked(out.body);
        if (!decoded) {
            errorMsg = "Malformed chunked body";
            return false;
        }
        out.body = std::move(*decoded);
    } else {
        const std::string length = out.header("content-length");
        if (StringUtils::isAllDigits(length)) {
            const size_t declared = static_cast<size_t>(std::strtoull(length.c_str(), nullptr, 10));
            if (out.body.size() > declared) {
                out.body.resize(declared);
            }
        }
    }

    response = std::move(out);
    return true;
}

std::optional<std::string> HttpClient::decodeChunked(const std::string& body) {
    std::string out;
    size_t pos = 0;
    for (;;) {
        const size_t lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            // Truncated stream: keep what was decoded so far.
            return out;
        }
        std::string sizeText = body.substr(pos, lineEnd - pos);
        const size_t ext = sizeText.find(';');
        if (ext != std::string::npos) {
            sizeText = sizeText.substr(0, ext);
        }
        sizeText = StringUtils::trim(sizeText);
        if (sizeText.empty() ||
            sizeText.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
            return std::nullopt;
        }

        const size_t chunkSize = static_cast<size_t>(std::strtoull(sizeText.c_str(), nullptr, 16));
        if (chunkSize == 0) {
            return out;
        }
        const size_t dataStart = lineEnd + 2;
        if (dataStart + chunkSize > body.size()) {
            out.append(body, dataStart, std::string::npos);
            return out;
        }
        out.append(body, dataStart, chunkSize);
        pos = dataStart + chunkSize + 2;
    }
}

std::optional<HttpUrl> HttpClient::resolveRedirect(const HttpUrl& base, const std::string& location) {
    const std::string target = StringUtils::trim(location);
    if (target.find("://") != std::string::npos) {
        return HttpUrl::parse(target);
    }
    if (StringUtils::startsWith(target, "//")) {
        return HttpUrl::parse(base.scheme + ":" + target);
    }

    HttpUrl next = base;
    if (StringUtils::startsWith(target, "/")) {
        next.path = target;
    } else {
        const size_t query = base.path.find('?');
        const std::string basePath = base.path.substr(0, query);
        const size_t slash = basePath.rfind('/');
        next.path = basePath.substr(0, slash + 1) + target;
    }
    return next;
}

}  // namespace LanMonitor
