/**
 * @file MdnsResolver.h
 * @brief DNS-SD service records, per-address aggregation and the external browser
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "ProcessRunner.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace LanMonitor {

//=============================================================================
// ServiceRecord Structure
//=============================================================================

/**
 * @struct ServiceRecord
 * @brief One resolved service instance
 */
struct ServiceRecord {
    std::string interfaceName;
    std::string protocol;                     ///< "IPv4" or "IPv6"
    std::string name;                         ///< instance name, still escaped
    std::string type;                         ///< e.g. "_airplay._tcp"
    std::string domain;
    std::string hostname;
    std::string address;
    uint16_t port = 0;
    std::map<std::string, std::string> txt;

    bool isIpv4() const { return protocol == "IPv4"; }

    /// "<name> (<type>)" with the name decoded.
    std::string describe() const;
};

//=============================================================================
// HostMdnsInfo Structure
//=============================================================================

/**
 * @struct HostMdnsInfo
 * @brief Everything advertised by one IPv4 address
 */
struct HostMdnsInfo {
    std::string ip;
    std::set<std::string> hostnames;
    std::vector<ServiceRecord> services;
    std::set<std::string> serviceNames;       ///< candidate friendly names
    std::optional<std::string> model;
    std::optional<std::string> manufacturer;
    std::optional<std::string> deviceClass;

    /**
     * @brief Fold one record into this host.
     *
     * Adds the hostname and instance name, then derives model, manufacturer
     * and device class from the TXT attributes and service type. Fields that
     * are already set are kept, except that a recognised model overrides the
     * device class.
     */
    void addService(const ServiceRecord& record);

    /// First non-".local" hostname, else the shortest one.
    std::optional<std::string> primaryHostname() const;

    /**
     * @brief Most human-looking name for the host.
     *
     * Instance names that look like identifiers (UUIDs, MAC fragments, known
     * vendor noise) are dropped. A short name containing a space is preferred,
     * then the shortest remaining one, then a hostname without ".local".
     */
    std::optional<std::string> friendlyName() const;

    /// describe() of every service, de-duplicated, in arrival order.
    std::vector<std::string> serviceStrings() const;
};

using MdnsHostMap = std::map<std::string, HostMdnsInfo>;

//=============================================================================
// MdnsResolver Class
//=============================================================================

/**
 * @class MdnsResolver
 * @brief Runs the external DNS-SD browser and aggregates its output by address
 *
 * The browser is invoked as `avahi-browse -ratpck`; only resolved ('=') lines
 * are used. The last successful result is kept and served again, filtered to
 * the new targets, when a later browse times out.
 *
 * Thread Safety: browse() may be called from several threads.
 */
class MdnsResolver {
public:
    using BrowseRunner = std::function<ProcessResult()>;

    /**
     * @param interfaceName Only keep records seen on this interface (empty = all)
     * @param runner Replaces the subprocess invocation (tests)
     */
    explicit MdnsResolver(std::string interfaceName = {}, BrowseRunner runner = {});

    /**
     * @brief Browse and aggregate.
     * @param targets Keep only these addresses; std::nullopt keeps everything
     * @return Empty when the browser is not installed
     */
    MdnsHostMap browse(const std::optional<std::set<std::string>>& targets);

    //=========================================================================
    // Parsing (exposed for tests)
    //=========================================================================

    static MdnsHostMap parseBrowseOutput(const std::string& output,
                                         const std::optional<std::set<std::string>>& targets,
                                         const std::string& interfaceName = {});

    /// Parse one "=;iface;proto;name;type;domain;host;addr;port;txt" line.
    static std::optional<ServiceRecord> parseServiceLine(const std::string& line);

    /**
     * @brief Parse a TXT blob of quoted or bare key=value tokens.
     *
     * A quoted token without '=' is a flag and maps to "true". Bare tokens
     * never replace a key already taken from a quoted token.
     */
    static std::map<std::string, std::string> parseTxtRecord(const std::string& blob);

    /**
     * @brief Undo the browser's \DDD decimal byte escapes.
     *
     * Runs of escaped bytes are decoded as UTF-8, or as Latin-1 when they are
     * not valid UTF-8. Control characters other than tab and newline are
     * removed and the result is trimmed.
     */
    static std::string decodeMdnsString(const std::string& s);

private:
    MdnsHostMap cachedFor(const std::optional<std::set<std::string>>& targets) const;

    std::string m_interfaceName;
    BrowseRunner m_runner;

    mutable std::mutex m_cacheMutex;
    MdnsHostMap m_lastResult;
};

}  // namespace LanMonitor
