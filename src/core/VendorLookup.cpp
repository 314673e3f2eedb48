/**
 * @file VendorLookup.cpp
 * @brief MAC prefix (OUI) to manufacturer lookup
 */

#include "lanmonitor/VendorLookup.h"
#include "lanmonitor/AtomicFile.h"

#include <cctype>

namespace LanMonitor {

namespace {

struct BuiltinOui {
    const char* prefix;
    const char* vendor;
};

// Common consumer and home-network vendors.
const BuiltinOui kBuiltinOuis[] = {
    {"000393", "Apple"},
    {"000502", "Apple"},
    {"000A27", "Apple"},
    {"000A95", "Apple"},
    {"000D93", "Apple"},
    {"0010FA", "Apple"},
    {"001124", "Apple"},
    {"001451", "Apple"},
    {"0016CB", "Apple"},
    {"0017F2", "Apple"},
    {"0019E3", "Apple"},
    {"001B63", "Apple"},
    {"001CB3", "Apple"},
    {"001D4F", "Apple"},
    {"001E52", "Apple"},
    {"001EC2", "Apple"},
    {"001F5B", "Apple"},
    {"001FF3", "Apple"},
    {"0021E9", "Apple"},
    {"002241", "Apple"},
    {"002312", "Apple"},
    {"002332", "Apple"},
    {"00236C", "Apple"},
    {"0023DF", "Apple"},
    {"002436", "Apple"},
    {"002500", "Apple"},
    {"00254B", "Apple"},
    {"0025BC", "Apple"},
    {"002608", "Apple"},
    {"00264A", "Apple"},
    {"0026B0", "Apple"},
    {"0026BB", "Apple"},
    {"001247", "Samsung"},
    {"0012FB", "Samsung"},
    {"001377", "Samsung"},
    {"0015B9", "Samsung"},
    {"001632", "Samsung"},
    {"0017C9", "Samsung"},
    {"0017D5", "Samsung"},
    {"0018AF", "Samsung"},
    {"001A8A", "Samsung"},
    {"001D25", "Samsung"},
    {"001DF6", "Samsung"},
    {"001E7D", "Samsung"},
    {"002119", "Samsung"},
    {"00214C", "Samsung"},
    {"0021D1", "Samsung"},
    {"0021D2", "Samsung"},
    {"002454", "Samsung"},
    {"002490", "Samsung"},
    {"002491", "Samsung"},
    {"0024E9", "Samsung"},
    {"002566", "Samsung"},
    {"002567", "Samsung"},
    {"002637", "Samsung"},
    {"00265D", "Samsung"},
    {"001A11", "Google"},
    {"3C5AB4", "Google"},
    {"546009", "Google"},
    {"94EB2C", "Google"},
    {"F4F5D8", "Google"},
    {"F4F5E8", "Google"},
    {"00FC8B", "Amazon"},
    {"0C47C9", "Amazon"},
    {"102C6B", "Amazon"},
    {"18742E", "Amazon"},
    {"34D270", "Amazon"},
    {"40B4CD", "Amazon"},
    {"44650D", "Amazon"},
    {"50DCE7", "Amazon"},
    {"6837E9", "Amazon"},
    {"6854FD", "Amazon"},
    {"74C246", "Amazon"},
    {"84D6D0", "Amazon"},
    {"A002DC", "Amazon"},
    {"AC63BE", "Amazon"},
    {"B47C9C", "Amazon"},
    {"CC9EA2", "Amazon"},
    {"F0272D", "Amazon"},
    {"FC65DE", "Amazon"},
    {"000E58", "Sonos"},
    {"347E5C", "Sonos"},
    {"48A6B8", "Sonos"},
    {"5CAAFD", "Sonos"},
    {"7828CA", "Sonos"},
    {"949F3E", "Sonos"},
    {"B8E937", "Sonos"},
    {"B827EB", "Raspberry Pi"},
    {"DCA632", "Raspberry Pi"},
    {"E45F01", "Raspberry Pi"},
    {"083AF2", "Espressif"},
    {"240AC4", "Espressif"},
    {"2462AB", "Espressif"},
    {"246F28", "Espressif"},
    {"2CF432", "Espressif"},
    {"30AEA4", "Espressif"},
    {"3C71BF", "Espressif"},
    {"40F520", "Espressif"},
    {"483FDA", "Espressif"},
    {"4C11AE", "Espressif"},
    {"5CCF7F", "Espressif"},
    {"600194", "Espressif"},
    {"68C63A", "Espressif"},
    {"807D3A", "Espressif"},
    {"840D8E", "Espressif"},
    {"84CCA8", "Espressif"},
    {"84F3EB", "Espressif"},
    {"8CAAB5", "Espressif"},
    {"9097D5", "Espressif"},
    {"94B97E", "Espressif"},
    {"98CDAC", "Espressif"},
    {"A020A6", "Espressif"},
    {"A47B9D", "Espressif"},
    {"A4CF12", "Espressif"},
    {"AC67B2", "Espressif"},
    {"B4E62D", "Espressif"},
    {"BCDDC2", "Espressif"},
    {"C44F33", "Espressif"},
    {"C82B96", "Espressif"},
    {"CC50E3", "Espressif"},
    {"D8A01D", "Espressif"},
    {"D8BFC0", "Espressif"},
    {"DC4F22", "Espressif"},
    {"ECFABC", "Espressif"},
    {"F4CFA2", "Espressif"},
    {"001788", "Philips Hue"},
    {"ECB5FA", "Philips Hue"},
    {"00156D", "Ubiquiti"},
    {"002722", "Ubiquiti"},
    {"0418D6", "Ubiquiti"},
    {"18E829", "Ubiquiti"},
    {"245A4C", "Ubiquiti"},
    {"44D9E7", "Ubiquiti"},
    {"687251", "Ubiquiti"},
    {"7483C2", "Ubiquiti"},
    {"788A20", "Ubiquiti"},
    {"802AA8", "Ubiquiti"},
    {"B4FBE4", "Ubiquiti"},
    {"DC9FDB", "Ubiquiti"},
    {"E063DA", "Ubiquiti"},
    {"F09FC2", "Ubiquiti"},
    {"FCECDA", "Ubiquiti"},
    {"003192", "TP-Link"},
    {"14CC20", "TP-Link"},
    {"14EBB6", "TP-Link"},
    {"18A6F7", "TP-Link"},
    {"1C3BF3", "TP-Link"},
    {"30B5C2", "TP-Link"},
    {"503EAA", "TP-Link"},
    {"54C80F", "TP-Link"},
    {"6032B1", "TP-Link"},
    {"647002", "TP-Link"},
    {"6C5AB0", "TP-Link"},
    {"7844FD", "TP-Link"},
    {"90F652", "TP-Link"},
    {"98DAC4", "TP-Link"},
    {"A0F3C1", "TP-Link"},
    {"B04E26", "TP-Link"},
    {"C025E9", "TP-Link"},
    {"C46E1F", "TP-Link"},
    {"D46E0E", "TP-Link"},
    {"D807B6", "TP-Link"},
    {"E894F6", "TP-Link"},
    {"EC086B", "TP-Link"},
    {"F4EC38", "TP-Link"},
    {"F81A67", "TP-Link"},
    {"001132", "Synology"},
};

}  // namespace

std::string VendorLookup::normalizePrefix(const std::string& mac) {
    std::string out;
    out.reserve(mac.size());
    for (unsigned char c : mac) {
        if (c == ':' || c == '-' || c == '.' || std::isspace(c)) {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

bool VendorLookup::loadFromFile(const std::filesystem::path& path, std::string& errorMsg) {
    std::string content;
    if (!readWholeFile(path, content, errorMsg)) {
        return false;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        errorMsg = std::string("OUI database parse error: ") + e.what();
        return false;
    }

    return loadFromJson(j, errorMsg);
}

bool VendorLookup::loadFromJson(const nlohmann::json& j, std::string& errorMsg) {
    errorMsg.clear();
    if (!j.is_array()) {
        errorMsg = "OUI database must be a JSON array";
        return false;
    }

    for (const auto& entry : j) {
        if (!entry.is_object()) {
            continue;
        }
        if (!entry.contains("macPrefix") || !entry["macPrefix"].is_string()) {
            continue;
        }
        if (!entry.contains("vendorName") || !entry["vendorName"].is_string()) {
            continue;
        }
        addEntry(entry["macPrefix"].get<std::string>(), entry["vendorName"].get<std::string>());
    }
    return true;
}

void VendorLookup::addEntry(const std::string& prefix, const std::string& vendor) {
    const std::string key = normalizePrefix(prefix);
    if (key.empty() || vendor.empty()) {
        return;
    }
    m_prefixes[key] = vendor;
}

std::optional<std::string> VendorLookup::lookup(const std::string& mac) const {
    const std::string hex = normalizePrefix(mac);
    if (hex.size() < 6) {
        return std::nullopt;
    }

    if (!m_prefixes.empty()) {
        for (size_t length : {6, 7, 8, 9}) {
            if (hex.size() < length) {
                break;
            }
            auto it = m_prefixes.find(hex.substr(0, length));
            if (it != m_prefixes.end()) {
                return it->second;
            }
        }
    }

    return lookupBuiltin(mac);
}

std::optional<std::string> VendorLookup::lookupBuiltin(const std::string& mac) {
    const std::string hex = normalizePrefix(mac);
    if (hex.size() < 6) {
        return std::nullopt;
    }
    const std::string oui = hex.substr(0, 6);
    for (const auto& entry : kBuiltinOuis) {
        if (oui == entry.prefix) {
            return std::string(entry.vendor);
        }
    }
    return std::nullopt;
}

}  // namespace LanMonitor
