/**
 * @file MdnsResolver.cpp
 * @brief DNS-SD service records, per-address aggregation and the external browser
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/MdnsResolver.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/DeviceClassifier.h"
#include "lanmonitor/NetUtils.h"
#include "lanmonitor/StringUtils.h"
#include "lanmonitor/ThreadSafeLog.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <iterator>
#include <regex>

namespace LanMonitor {

namespace {
    #define LogMdns(msg) LanMonitor::ThreadSafeLog::log(msg)

// Instance names that are identifiers rather than names.
const std::vector<std::string> kNoisePrefixes = {
    "_", "E9E96E", "636E5CDF", "408ACAAF", "C06BB", "a2eda", "googlerpc", "LG_SMART", "LG-SN"};
const std::vector<std::string> kNoiseSuffixes = {"-0000000"};

// TXT payloads of these services carry protocol versions in "model"/"md".
const std::vector<std::string> kModelUnreliableServices = {"_raop._tcp", "_airplay._tcp", "airtunes"};

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

/// Digits, dots and commas only ("1,2", "3.4.1").
bool isNumericLooking(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0 || c == '.' || c == ',';
    });
}

bool isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        size_t extra = 0;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(bytes[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

std::string latin1ToUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

void flushEscapedBytes(std::string& buffer, std::string& out) {
    if (buffer.empty()) {
        return;
    }
    out += isValidUtf8(buffer) ? buffer : latin1ToUtf8(buffer);
    buffer.clear();
}

bool keepsAddress(const std::string& ip, const std::optional<std::set<std::string>>& targets) {
    return !targets || targets->count(ip) > 0;
}

}  // namespace

//=============================================================================
// ServiceRecord
//=============================================================================

std::string ServiceRecord::describe() const {
    return MdnsResolver::decodeMdnsString(name) + " (" + type + ")";
}

//=============================================================================
// HostMdnsInfo
//=============================================================================

void HostMdnsInfo::addService(const ServiceRecord& record) {
    services.push_back(record);

    if (!record.hostname.empty()) {
        std::string host = record.hostname;
        while (!host.empty() && host.back() == '.') {
            host.pop_back();
        }
        host = MdnsResolver::decodeMdnsString(host);
        if (!host.empty()) {
            hostnames.insert(host);
        }
    }

    if (!record.name.empty()) {
        const std::string decoded = MdnsResolver::decodeMdnsString(record.name);
        if (!decoded.empty()) {
            serviceNames.insert(decoded);
        }
    }

    const auto& txt = record.txt;
    const std::string typeLower = StringUtils::toLower(record.type);
    const std::string nameLower = StringUtils::toLower(record.name);
    const bool modelUnreliable = std::any_of(
        kModelUnreliableServices.begin(), kModelUnreliableServices.end(), [&](const std::string& s) {
            return StringUtils::contains(typeLower, s) || StringUtils::contains(nameLower, s);
        });

    if (!model && !modelUnreliable) {
        for (const char* key : {"model", "md"}) {
            const auto it = txt.find(key);
            if (it == txt.end()) {
                continue;
            }
            const std::string& value = it->second;
            if (value.size() > 1 && !StringUtils::startsWith(value, "0,") && !isNumericLooking(value)) {
                model = value;
                break;
            }
        }
    }

    if (!model) {
        const auto it = txt.find("am");
        if (it != txt.end() && it->second.size() > 2) {
            model = it->second;
        }
    }

    if (!manufacturer) {
        for (const char* key : {"vendor", "manufacturer"}) {
            const auto it = txt.find(key);
            if (it != txt.end() && !it->second.empty() && !StringUtils::isAllDigits(it->second)) {
                manufacturer = it->second;
                break;
            }
        }
    }

    if (!model) {
        const auto it = txt.find("rpMd");
        if (it != txt.end() && !it->second.empty()) {
            model = it->second;
        }
    }

    // Cast devices publish their user-visible name in "fn".
    const auto fn = txt.find("fn");
    if (fn != txt.end() && !fn->second.empty()) {
        serviceNames.insert(fn->second);
    }

    if (!deviceClass) {
        deviceClass = DeviceClassifier::classifyMdnsServiceType(record.type);
    }
    if (model) {
        if (auto byModel = DeviceClassifier::classifyMdnsModel(*model)) {
            deviceClass = byModel;
        }
    }
    if (!deviceClass && manufacturer) {
        deviceClass = DeviceClassifier::classifyMdnsManufacturer(*manufacturer);
    }
}

std::optional<std::string> HostMdnsInfo::primaryHostname() const {
    if (hostnames.empty()) {
        return std::nullopt;
    }
    for (const auto& h : hostnames) {
        if (!StringUtils::endsWith(h, ".local")) {
            return h;
        }
    }
    return *std::min_element(hostnames.begin(), hostnames.end(),
                             [](const std::string& a, const std::string& b) { return a.size() < b.size(); });
}

std::optional<std::string> HostMdnsInfo::friendlyName() const {
    static const std::regex macFragment(R"(\d+-\d+-\d+-\d+)");

    std::vector<std::string> good;
    for (const auto& n : serviceNames) {
        const bool noisy =
            std::any_of(kNoisePrefixes.begin(), kNoisePrefixes.end(),
                        [&n](const std::string& p) { return StringUtils::startsWith(n, p); }) ||
            std::any_of(kNoiseSuffixes.begin(), kNoiseSuffixes.end(),
                        [&n](const std::string& s) { return StringUtils::endsWith(n, s); });
        if (noisy) {
            continue;
        }
        if (n.size() > 20 && std::count(n.begin(), n.end(), '-') >= 4) {
            continue;  // UUID
        }
        if (std::regex_search(n, macFragment)) {
            continue;
        }
        if (StringUtils::contains(n, "\\")) {
            continue;
        }
        if (n.size() < 2 || n.size() > 50) {
            continue;
        }
        good.push_back(n);
    }

    auto shortest = [](const std::vector<std::string>& names) {
        return *std::min_element(names.begin(), names.end(),
                                 [](const std::string& a, const std::string& b) { return a.size() < b.size(); });
    };

    if (!good.empty()) {
        std::vector<std::string> spaced;
        std::copy_if(good.begin(), good.end(), std::back_inserter(spaced), [](const std::string& n) {
            return StringUtils::contains(n, " ") && n.size() < 30;
        });
        return spaced.empty() ? shortest(good) : shortest(spaced);
    }

    for (const auto& h : hostnames) {
        std::string name = h;
        for (size_t pos = name.find(".local"); pos != std::string::npos; pos = name.find(".local")) {
            name.erase(pos, 6);
        }
        if (!name.empty() && name.front() != '_') {
            return name;
        }
    }
    return std::nullopt;
}

std::vector<std::string> HostMdnsInfo::serviceStrings() const {
    std::vector<std::string> out;
    for (const auto& s : services) {
        std::string d = s.describe();
        if (std::find(out.begin(), out.end(), d) == out.end()) {
            out.push_back(std::move(d));
        }
    }
    return out;
}

//=============================================================================
// MdnsResolver
//=============================================================================

MdnsResolver::MdnsResolver(std::string interfaceName, BrowseRunner runner)
    : m_interfaceName(std::move(interfaceName))
    , m_runner(std::move(runner))
{
    if (!m_runner) {
        m_runner = [] {
            return ProcessRunner::run({"avahi-browse", "-ratpck"},
                                      std::chrono::seconds(MDNS_BROWSE_TIMEOUT_S));
        };
    }
}

MdnsHostMap MdnsResolver::browse(const std::optional<std::set<std::string>>& targets) {
    ProcessResult result;
    try {
        result = m_runner();
    } catch (const std::exception& e) {
        LOG_ERROR("[MdnsResolver] Browse error: " << e.what());
        return cachedFor(targets);
    }

    if (!result.launched) {
        LOG_DEBUG("[MdnsResolver] Service browser unavailable: " << result.errorMsg);
        return {};
    }
    if (result.timedOut) {
        LOG_WARNING("[MdnsResolver] Service browse timed out");
        LogMdns("mDNS browse timed out, reusing previous result");
        return cachedFor(targets);
    }

    MdnsHostMap hosts = parseBrowseOutput(result.output, targets, m_interfaceName);
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        m_lastResult = hosts;
    }
    LOG_DEBUG("[MdnsResolver] " << hosts.size() << " hosts advertise services");
    return hosts;
}

MdnsHostMap MdnsResolver::cachedFor(const std::optional<std::set<std::string>>& targets) const {
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    MdnsHostMap out;
    for (const auto& entry : m_lastResult) {
        if (keepsAddress(entry.first, targets)) {
            out.insert(entry);
        }
    }
    return out;
}

//=============================================================================
// Parsing
//=============================================================================

MdnsHostMap MdnsResolver::parseBrowseOutput(const std::string& output,
                                            const std::optional<std::set<std::string>>& targets,
                                            const std::string& interfaceName) {
    MdnsHostMap hosts;
    for (const auto& rawLine : StringUtils::splitLines(output)) {
        const std::string line = StringUtils::trim(rawLine);
        if (!StringUtils::startsWith(line, "=")) {
            continue;
        }

        const auto record = parseServiceLine(line);
        if (!record) {
            continue;
        }
        if (!interfaceName.empty() && record->interfaceName != interfaceName) {
            continue;
        }
        if (!record->isIpv4()) {
            continue;
        }
        const std::string& ip = record->address;
        if (!keepsAddress(ip, targets) || NetUtils::isLoopbackOrLinkLocal(ip)) {
            continue;
        }

        HostMdnsInfo& host = hosts[ip];
        host.ip = ip;
        host.addService(*record);
    }
    return hosts;
}

std::optional<ServiceRecord> MdnsResolver::parseServiceLine(const std::string& line) {
    const std::vector<std::string> parts = StringUtils::split(line, ';');
    if (parts.size() < 9) {
        return std::nullopt;
    }

    ServiceRecord record;
    record.interfaceName = parts[1];
    record.protocol = parts[2];
    record.name = parts[3];
    record.type = parts[4];
    record.domain = parts[5];
    record.hostname = parts[6];
    record.address = parts[7];

    const std::string portText = StringUtils::trim(parts[8]);
    char* end = nullptr;
    const long port = std::strtol(portText.c_str(), &end, 10);
    if (!portText.empty() && end && *end == '\0' && port >= 0 && port <= 65535) {
        record.port = static_cast<uint16_t>(port);
    }

    if (parts.size() > 9) {
        std::string blob = parts[9];
        for (size_t i = 10; i < parts.size(); ++i) {
            blob += ';';
            blob += parts[i];
        }
        record.txt = parseTxtRecord(blob);
    }
    return record;
}

std::map<std::string, std::string> MdnsResolver::parseTxtRecord(const std::string& blob) {
    static const std::regex quotedToken(R"re("([^"]+)")re");
    static const std::regex bareToken(R"((\w+)=([^\s"]+))");

    std::map<std::string, std::string> records;

    for (auto it = std::sregex_iterator(blob.begin(), blob.end(), quotedToken);
         it != std::sregex_iterator(); ++it) {
        const std::string token = (*it)[1].str();
        const size_t eq = token.find('=');
        if (eq == std::string::npos) {
            records[StringUtils::trim(token)] = "true";
        } else {
            records[StringUtils::trim(token.substr(0, eq))] = StringUtils::trim(token.substr(eq + 1));
        }
    }

    // Bare key=value tokens: a key must not directly follow a quote or a word character.
    size_t pos = 0;
    while (pos < blob.size()) {
        if (pos > 0 && (blob[pos - 1] == '"' || isWordChar(blob[pos - 1]))) {
            ++pos;
            continue;
        }
        std::smatch m;
        auto flags = std::regex_constants::match_continuous;
        if (pos > 0) {
            flags |= std::regex_constants::match_prev_avail;
        }
        if (std::regex_search(blob.begin() + static_cast<std::ptrdiff_t>(pos), blob.end(), m, bareToken, flags)) {
            records.emplace(m[1].str(), m[2].str());
            pos += static_cast<size_t>(m.length(0));
        } else {
            ++pos;
        }
    }

    return records;
}

std::string MdnsResolver::decodeMdnsString(const std::string& s) {
    std::string decoded;
    std::string pending;

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '\\' && i + 3 < s.size() &&
            std::isdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isdigit(static_cast<unsigned char>(s[i + 2])) &&
            std::isdigit(static_cast<unsigned char>(s[i + 3]))) {
            const int value = std::stoi(s.substr(i + 1, 3));
            if (value < 256) {
                pending.push_back(static_cast<char>(value));
                i += 4;
                continue;
            }
        }
        flushEscapedBytes(pending, decoded);
        decoded.push_back(s[i]);
        ++i;
    }
    flushEscapedBytes(pending, decoded);

    std::string cleaned;
    cleaned.reserve(decoded.size());
    for (char c : decoded) {
        const auto u = static_cast<unsigned char>(c);
        if (u >= 0x20 || c == '\t' || c == '\n') {
            cleaned.push_back(c);
        }
    }
    return StringUtils::trim(cleaned);
}

}  // namespace LanMonitor
