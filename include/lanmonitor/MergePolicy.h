/**
 * @file MergePolicy.h
 * @brief Declarative per-field rules for folding a scan observation into a stored device
 */

#pragma once

#include "Device.h"

#include <optional>
#include <string>
#include <vector>

namespace LanMonitor {

enum class MergeRule {
    OverwriteAlways,    ///< replace whenever a value was observed
    FillIfEmpty,        ///< only set a field that is empty
    FillIfLocalDomain   ///< FillIfEmpty, or replace a ".local" value
};

/**
 * @struct DeviceObservation
 * @brief Best values for one device from one cycle's discovery and enrichment
 */
struct DeviceObservation {
    std::string macAddress;
    std::string ipAddress;
    std::optional<std::string> hostname;
    std::optional<std::string> vendor;
    std::optional<std::string> manufacturer;
    std::optional<std::string> model;
    std::optional<std::string> friendlyName;
    std::optional<std::string> deviceType;
    std::optional<std::string> openPorts;     ///< JSON array text
    std::optional<std::string> services;      ///< JSON array text
    std::optional<double> responseTimeMs;
    std::string scanMethod;
};

/**
 * @brief One row of the merge table.
 */
struct FieldMergeRule {
    const char* name;
    std::optional<std::string> Device::*deviceField;
    std::optional<std::string> DeviceObservation::*observedField;
    MergeRule rule;
};

class MergePolicy {
public:
    /**
     * @brief Table applied to devices seen again:
     * hostname fill-if-local-domain; vendor, manufacturer, model, friendly
     * name, device type fill-if-empty; open ports and services overwrite.
     */
    static const std::vector<FieldMergeRule>& defaultRules();

    /**
     * @brief Decide one field.
     * @return true if current was changed
     */
    static bool applyRule(MergeRule rule,
                          std::optional<std::string>& current,
                          const std::optional<std::string>& observed);

    /**
     * @brief Apply every rule of the table to device.
     * @return Names of the fields that changed
     */
    static std::vector<std::string> apply(Device& device, const DeviceObservation& observation,
                                          const std::vector<FieldMergeRule>& rules = defaultRules());

    /// Fresh device record for a MAC never seen before.
    static Device createDevice(const DeviceObservation& observation);
};

}  // namespace LanMonitor
