/**
 * @file DeviceClassifier.h
 * @brief Ordered (predicate, classification) tables for device-class heuristics
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace LanMonitor {

//=============================================================================
// Rule Tables
//=============================================================================

/**
 * @brief One row of a classification table.
 *
 * Subjects handed to matches() are already lowercased by the caller.
 */
template <typename Subject>
struct ClassificationRule {
    std::function<bool(const Subject&)> matches;
    std::string classification;
};

template <typename Subject>
using RuleTable = std::vector<ClassificationRule<Subject>>;

/**
 * @brief Classification of the first row whose predicate holds.
 */
template <typename Subject>
std::optional<std::string> firstMatch(const RuleTable<Subject>& table, const Subject& subject) {
    for (const auto& rule : table) {
        if (rule.matches(subject)) {
            return rule.classification;
        }
    }
    return std::nullopt;
}

//=============================================================================
// ClassificationSignals
//=============================================================================

/**
 * @struct ClassificationSignals
 * @brief Everything the enrichment probes learned that hints at a device class
 */
struct ClassificationSignals {
    std::vector<std::string> services;        ///< port service names and mDNS service strings
    std::vector<std::string> mdnsServices;    ///< "<name> (<type>)" strings only
    std::vector<int> openPorts;
    std::string vendor;
    std::string model;
    std::string manufacturer;
    std::string upnpDeviceType;
    std::string httpServer;
    std::string httpTitle;
};

//=============================================================================
// DeviceClassifier Class
//=============================================================================

/**
 * @class DeviceClassifier
 * @brief Best-guess device class from heterogeneous probe signals
 *
 * Precedence (first non-empty tier wins): service signature, open-port
 * signature, vendor keyword, model keyword, manufacturer keyword, UPnP device
 * type, HTTP title/Server header.
 *
 * The mDNS-specific tables are evaluated per advertised service while the
 * resolver aggregates records for one address.
 */
class DeviceClassifier {
public:
    static std::optional<std::string> classify(const ClassificationSignals& signals);

    /// Class implied by a DNS-SD service type such as "_hap._tcp".
    static std::optional<std::string> classifyMdnsServiceType(const std::string& serviceType);

    /// Model-derived override (MacBook, AppleTV, DS-series NAS, ...).
    static std::optional<std::string> classifyMdnsModel(const std::string& model);

    /// Manufacturer-derived fallback used when no service type matched.
    static std::optional<std::string> classifyMdnsManufacturer(const std::string& manufacturer);

    //=========================================================================
    // Individual tiers (exposed for tests)
    //=========================================================================

    static std::optional<std::string> classifyServices(const std::vector<std::string>& services,
                                                       const std::vector<std::string>& mdnsServices);
    static std::optional<std::string> classifyPorts(const std::vector<int>& openPorts);
    static std::optional<std::string> classifyVendor(const std::string& vendor,
                                                     const std::vector<std::string>& mdnsServices);
    static std::optional<std::string> classifyHttp(const std::string& title, const std::string& server);
};

}  // namespace LanMonitor
