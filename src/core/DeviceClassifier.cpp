/**
 * @file DeviceClassifier.cpp
 * @brief Ordered (predicate, classification) tables for device-class heuristics
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/DeviceClassifier.h"
#include "lanmonitor/StringUtils.h"

#include <algorithm>
#include <initializer_list>

namespace LanMonitor {

namespace {

//=============================================================================
// Predicate builders
//=============================================================================

using Needles = std::vector<std::string>;

std::function<bool(const std::string&)> containsAny(Needles needles) {
    return [needles](const std::string& s) {
        return std::any_of(needles.begin(), needles.end(),
                           [&s](const std::string& n) { return StringUtils::contains(s, n); });
    };
}

std::function<bool(const std::string&)> containsAll(Needles needles) {
    return [needles](const std::string& s) {
        return std::all_of(needles.begin(), needles.end(),
                           [&s](const std::string& n) { return StringUtils::contains(s, n); });
    };
}

std::function<bool(const std::string&)> startsWithAny(Needles prefixes) {
    return [prefixes](const std::string& s) {
        return std::any_of(prefixes.begin(), prefixes.end(),
                           [&s](const std::string& p) { return StringUtils::startsWith(s, p); });
    };
}

std::function<bool(const std::string&)> either(std::function<bool(const std::string&)> a,
                                               std::function<bool(const std::string&)> b) {
    return [a, b](const std::string& s) { return a(s) || b(s); };
}

/// True if any element of the list contains any needle.
std::function<bool(const std::vector<std::string>&)> anyElementContains(Needles needles) {
    auto test = containsAny(std::move(needles));
    return [test](const std::vector<std::string>& list) {
        return std::any_of(list.begin(), list.end(), test);
    };
}

std::function<bool(const std::vector<int>&)> hasAnyPort(std::initializer_list<int> ports) {
    std::vector<int> wanted(ports);
    return [wanted](const std::vector<int>& open) {
        return std::any_of(wanted.begin(), wanted.end(), [&open](int p) {
            return std::find(open.begin(), open.end(), p) != open.end();
        });
    };
}

struct VendorSubject {
    std::string vendor;        ///< lowercased
    std::string mdnsServices;  ///< all mDNS service strings, lowercased, joined
};

struct HttpSubject {
    std::string title;   ///< lowercased
    std::string server;  ///< lowercased
};

//=============================================================================
// mDNS tables
//=============================================================================

const RuleTable<std::string>& mdnsServiceTypeRules() {
    static const RuleTable<std::string> table = {
        {containsAny({"_hap._tcp", "_homekit"}), "HomeKit Device"},
        {containsAny({"_airplay", "_raop"}), "AirPlay Device"},
        {containsAny({"_googlecast"}), "Chromecast"},
        {containsAny({"_printer", "_ipp", "_pdl"}), "Printer"},
        {containsAny({"_smb"}), "File Server (SMB)"},
        {containsAny({"_afp"}), "File Server (AFP)"},
        {containsAny({"_ssh", "_sftp"}), "SSH Server"},
        {containsAny({"_http"}), "Web Server"},
        {containsAny({"_matter"}), "Matter Device"},
        {containsAny({"_spotify"}), "Spotify Connect"},
        {containsAny({"_sonos"}), "Sonos Speaker"},
        {containsAny({"_lg-smart"}), "LG Smart Device"},
        {containsAny({"_meshcop", "_trel"}), "Thread Border Router"},
        {containsAny({"_companion-link"}), "Apple Device"},
        {containsAny({"_sleep-proxy"}), "Sleep Proxy (Apple)"},
    };
    return table;
}

const RuleTable<std::string>& mdnsModelRules() {
    static const RuleTable<std::string> table = {
        {containsAny({"appletv"}), "Apple TV"},
        {containsAny({"macbook"}), "MacBook"},
        {containsAny({"imac"}), "iMac"},
        {containsAll({"mac", "pro"}), "Mac Pro"},
        {containsAll({"mac", "mini"}), "Mac mini"},
        {containsAny({"homepod"}), "HomePod"},
        {containsAny({"iphone"}), "iPhone"},
        {containsAny({"ipad"}), "iPad"},
        {either(containsAny({"xserve"}), startsWithAny({"ds"})), "NAS"},
        {containsAny({"nvr"}), "NVR (Security Camera Recorder)"},
        {containsAny({"nanoleaf"}), "Nanoleaf Light"},
        {either(containsAny({"meross"}), startsWithAny({"mss", "msg"})), "Meross Smart Device"},
        {containsAny({"eufy"}), "Eufy Device"},
        {containsAny({"scrypted"}), "Scrypted Server"},
        {containsAny({"lg sn", "lg soundbar"}), "LG Soundbar"},
    };
    return table;
}

const RuleTable<std::string>& mdnsManufacturerRules() {
    static const RuleTable<std::string> table = {
        {containsAny({"synology"}), "Synology NAS"},
        {containsAny({"apple"}), "Apple Device"},
        {containsAny({"lg"}), "LG Device"},
    };
    return table;
}

//=============================================================================
// Enrichment tables
//=============================================================================

const RuleTable<std::vector<std::string>>& serviceRules() {
    static const RuleTable<std::vector<std::string>> table = {
        {anyElementContains({"airplay", "raop"}), "Apple TV / AirPlay"},
        {anyElementContains({"homekit"}), "HomeKit Device"},
        {anyElementContains({"googlecast", "chromecast"}), "Chromecast"},
        {anyElementContains({"printer", "ipp", "_pdl"}), "Printer"},
        {anyElementContains({"scanner"}), "Scanner"},
        {anyElementContains({"spotify"}), "Spotify Connect Device"},
        {anyElementContains({"sonos"}), "Sonos Speaker"},
        {anyElementContains({"hue"}), "Philips Hue"},
        {anyElementContains({"smb", "afp", "nfs"}), "NAS / File Server"},
    };
    return table;
}

const RuleTable<std::vector<int>>& portRules() {
    static const RuleTable<std::vector<int>> table = {
        {hasAnyPort({9100, 631}), "Printer"},
        {hasAnyPort({32400}), "Plex Media Server"},
        {hasAnyPort({5001}), "Synology NAS"},
        {hasAnyPort({445, 3389}), "Windows PC"},
        {hasAnyPort({548}), "Mac"},
        {hasAnyPort({62078}), "iPhone/iPad"},
        {[](const std::vector<int>& open) {
             return hasAnyPort({22})(open) && !hasAnyPort({80, 443})(open);
         },
         "Linux Server"},
    };
    return table;
}

/// Keyword rules shared by the vendor and manufacturer tiers.
const RuleTable<std::string>& vendorKeywordRules() {
    static const RuleTable<std::string> table = {
        {containsAny({"apple"}), "Apple Device"},
        {containsAny({"samsung"}), "Samsung Device"},
        {containsAny({"google"}), "Google Device"},
        {containsAny({"amazon"}), "Amazon Device"},
        {containsAny({"sonos"}), "Sonos Speaker"},
        {containsAny({"roku"}), "Roku"},
        {containsAny({"netgear", "tp-link", "asus", "linksys", "ubiquiti", "cisco"}), "Network Equipment"},
        {containsAny({"raspberry"}), "Raspberry Pi"},
        {containsAny({"espressif", "tuya"}), "IoT Device"},
    };
    return table;
}

const RuleTable<VendorSubject>& vendorRules() {
    static const RuleTable<VendorSubject> table = [] {
        RuleTable<VendorSubject> rules;
        // Philips counts as Hue only when a Hue service was advertised.
        for (const auto& rule : vendorKeywordRules()) {
            if (rule.classification == "Network Equipment") {
                rules.push_back({[](const VendorSubject& s) {
                                     return StringUtils::contains(s.vendor, "philips") &&
                                            StringUtils::contains(s.mdnsServices, "hue");
                                 },
                                 "Philips Hue"});
            }
            auto matches = rule.matches;
            rules.push_back({[matches](const VendorSubject& s) { return matches(s.vendor); },
                             rule.classification});
        }
        return rules;
    }();
    return table;
}

const RuleTable<std::string>& upnpRules() {
    // Matched case-sensitively against the raw deviceType URN.
    static const RuleTable<std::string> table = {
        {containsAny({"MediaRenderer"}), "Media Renderer"},
        {containsAny({"MediaServer"}), "Media Server"},
        {containsAny({"InternetGateway"}), "Router"},
    };
    return table;
}

const RuleTable<HttpSubject>& httpRules() {
    auto title = [](Needles n) {
        auto test = containsAny(std::move(n));
        return [test](const HttpSubject& s) { return test(s.title); };
    };
    auto server = [](Needles n) {
        auto test = containsAny(std::move(n));
        return [test](const HttpSubject& s) { return test(s.server); };
    };

    static const RuleTable<HttpSubject> table = {
        {title({"synology"}), "Synology NAS"},
        {title({"router", "gateway"}), "Router"},
        {title({"printer"}), "Printer"},
        {title({"unifi"}), "Ubiquiti UniFi"},
        {title({"plex"}), "Plex Media Server"},
        {title({"home assistant"}), "Home Assistant"},
        {title({"pi-hole"}), "Pi-hole"},
        {server({"synology"}), "Synology NAS"},
        {server({"nginx", "apache"}), "Web Server"},
        {server({"lighttpd"}), "Embedded Device"},
    };
    return table;
}

std::vector<std::string> lowered(const std::vector<std::string>& in) {
    std::vector<std::string> out;
    out.reserve(in.size());
    for (const auto& s : in) {
        out.push_back(StringUtils::toLower(s));
    }
    return out;
}

std::string joinedLower(const std::vector<std::string>& in) {
    std::string out;
    for (const auto& s : in) {
        out += StringUtils::toLower(s);
        out += '\n';
    }
    return out;
}

}  // namespace

//=============================================================================
// mDNS tiers
//=============================================================================

std::optional<std::string> DeviceClassifier::classifyMdnsServiceType(const std::string& serviceType) {
    return firstMatch(mdnsServiceTypeRules(), StringUtils::toLower(serviceType));
}

std::optional<std::string> DeviceClassifier::classifyMdnsModel(const std::string& model) {
    return firstMatch(mdnsModelRules(), StringUtils::toLower(model));
}

std::optional<std::string> DeviceClassifier::classifyMdnsManufacturer(const std::string& manufacturer) {
    return firstMatch(mdnsManufacturerRules(), StringUtils::toLower(manufacturer));
}

//=============================================================================
// Enrichment tiers
//=============================================================================

std::optional<std::string> DeviceClassifier::classifyServices(const std::vector<std::string>& services,
                                                              const std::vector<std::string>& mdnsServices) {
    std::vector<std::string> all = lowered(services);
    for (const auto& s : mdnsServices) {
        all.push_back(StringUtils::toLower(s));
    }
    return firstMatch(serviceRules(), all);
}

std::optional<std::string> DeviceClassifier::classifyPorts(const std::vector<int>& openPorts) {
    return firstMatch(portRules(), openPorts);
}

std::optional<std::string> DeviceClassifier::classifyVendor(const std::string& vendor,
                                                            const std::vector<std::string>& mdnsServices) {
    if (vendor.empty()) {
        return std::nullopt;
    }
    return firstMatch(vendorRules(), VendorSubject{StringUtils::toLower(vendor), joinedLower(mdnsServices)});
}

std::optional<std::string> DeviceClassifier::classifyHttp(const std::string& title, const std::string& server) {
    if (title.empty() && server.empty()) {
        return std::nullopt;
    }
    return firstMatch(httpRules(), HttpSubject{StringUtils::toLower(title), StringUtils::toLower(server)});
}

std::optional<std::string> DeviceClassifier::classify(const ClassificationSignals& signals) {
    if (auto c = classifyServices(signals.services, signals.mdnsServices)) {
        return c;
    }
    if (auto c = classifyPorts(signals.openPorts)) {
        return c;
    }
    if (auto c = classifyVendor(signals.vendor, signals.mdnsServices)) {
        return c;
    }
    if (!signals.model.empty()) {
        if (auto c = classifyMdnsModel(signals.model)) {
            return c;
        }
    }
    if (!signals.manufacturer.empty()) {
        if (auto c = classifyMdnsManufacturer(signals.manufacturer)) {
            return c;
        }
        if (auto c = firstMatch(vendorKeywordRules(), StringUtils::toLower(signals.manufacturer))) {
            return c;
        }
    }
    if (!signals.upnpDeviceType.empty()) {
        if (auto c = firstMatch(upnpRules(), signals.upnpDeviceType)) {
            return c;
        }
    }
    return classifyHttp(signals.httpTitle, signals.httpServer);
}

}  // namespace LanMonitor
