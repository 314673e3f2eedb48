/**
 * @file HttpProbe.cpp
 * @brief Web interface fingerprint: Server header and HTML title
 */

#include "lanmonitor/HttpProbe.h"
#include "lanmonitor/StringUtils.h"

#include <regex>

namespace LanMonitor {

std::vector<std::string> HttpProbe::candidateUrls(const std::string& ip) {
    return {
        "http://" + ip + "/",
        "https://" + ip + "/",
        "http://" + ip + ":8080/",
        "http://" + ip + ":8443/",
    };
}

std::optional<std::string> HttpProbe::extractTitle(const std::string& html) {
    static const std::regex titlePattern("<title[^>]*>([^<]+)</title>", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(html, match, titlePattern)) {
        return std::nullopt;
    }
    std::string title = StringUtils::trim(match[1].str());
    if (title.empty()) {
        return std::nullopt;
    }
    return title;
}

std::optional<HttpFingerprint> HttpProbe::fingerprint(const HttpResponse& response) {
    if (response.status != 200) {
        return std::nullopt;
    }
    HttpFingerprint out;
    out.url = response.url;
    out.server = response.header("server");
    out.title = extractTitle(response.body);
    return out;
}

std::optional<HttpFingerprint> HttpProbe::probe(const std::string& ip, std::chrono::milliseconds timeout) {
    HttpClient::Options options;
    options.timeout = timeout;

    for (const auto& url : candidateUrls(ip)) {
        HttpResponse response;
        std::string errorMsg;
        if (!HttpClient::get(url, options, response, errorMsg)) {
            continue;
        }
        std::optional<HttpFingerprint> result = fingerprint(response);
        if (result) {
            return result;
        }
    }
    return std::nullopt;
}

}  // namespace LanMonitor
