/**
 * @file VendorLookup.h
 * @brief MAC prefix (OUI) to manufacturer lookup
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace LanMonitor {

/**
 * @brief Prefix to vendor table.
 *
 * The primary table is loaded once at startup from a JSON document of the form
 * [{"macPrefix":"00:00:0C","vendorName":"Cisco Systems, Inc"}, ...]. Prefixes
 * may be 24-bit OUIs (6 hex digits) or longer MA-M / MA-S sub-blocks (7 to 9).
 *
 * Lookups never fail: an unknown prefix yields std::nullopt. When the primary
 * table has no match a small built-in table of common consumer vendors is
 * consulted.
 *
 * Thread Safety: const methods are safe to call concurrently once loading is
 * complete.
 */
class VendorLookup {
public:
    VendorLookup() = default;

    /**
     * @brief Load the primary table from a JSON file.
     * @return false on I/O or parse error (the table is left unchanged)
     */
    bool loadFromFile(const std::filesystem::path& path, std::string& errorMsg);

    /**
     * @brief Load the primary table from an already parsed JSON array.
     *
     * Entries missing either field are skipped.
     * @return false if j is not an array
     */
    bool loadFromJson(const nlohmann::json& j, std::string& errorMsg);

    /// Add a single primary entry; prefix may use any separator style.
    void addEntry(const std::string& prefix, const std::string& vendor);

    /**
     * @brief Resolve the vendor of a MAC address in any common separator style.
     *
     * Tries the first 6, 7, 8 and 9 hex digits against the primary table, then
     * the built-in table.
     */
    std::optional<std::string> lookup(const std::string& mac) const;

    /// Built-in table only.
    static std::optional<std::string> lookupBuiltin(const std::string& mac);

    size_t size() const { return m_prefixes.size(); }

    /// Uppercase hex digits with separators removed.
    static std::string normalizePrefix(const std::string& mac);

private:
    std::unordered_map<std::string, std::string> m_prefixes;
};

}  // namespace LanMonitor
