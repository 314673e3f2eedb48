/**
 * @file MergePolicy.cpp
 * @brief Declarative per-field rules for folding a scan observation into a stored device
 */

#include "lanmonitor/MergePolicy.h"
#include "lanmonitor/StringUtils.h"

namespace LanMonitor {

namespace {
bool isEmpty(const std::optional<std::string>& value) {
    return !value || value->empty();
}
}  // namespace

const std::vector<FieldMergeRule>& MergePolicy::defaultRules() {
    static const std::vector<FieldMergeRule> rules = {
        {"hostname", &Device::hostname, &DeviceObservation::hostname, MergeRule::FillIfLocalDomain},
        {"vendor", &Device::vendor, &DeviceObservation::vendor, MergeRule::FillIfEmpty},
        {"manufacturer", &Device::manufacturer, &DeviceObservation::manufacturer, MergeRule::FillIfEmpty},
        {"model", &Device::model, &DeviceObservation::model, MergeRule::FillIfEmpty},
        {"friendly_name", &Device::friendlyName, &DeviceObservation::friendlyName, MergeRule::FillIfEmpty},
        {"device_type", &Device::deviceType, &DeviceObservation::deviceType, MergeRule::FillIfEmpty},
        {"open_ports", &Device::openPorts, &DeviceObservation::openPorts, MergeRule::OverwriteAlways},
        {"services", &Device::services, &DeviceObservation::services, MergeRule::OverwriteAlways},
    };
    return rules;
}

bool MergePolicy::applyRule(MergeRule rule,
                            std::optional<std::string>& current,
                            const std::optional<std::string>& observed) {
    if (isEmpty(observed) || current == observed) {
        return false;
    }

    switch (rule) {
        case MergeRule::OverwriteAlways:
            break;
        case MergeRule::FillIfEmpty:
            if (!isEmpty(current)) {
                return false;
            }
            break;
        case MergeRule::FillIfLocalDomain:
            if (!isEmpty(current) && !StringUtils::endsWith(*current, ".local")) {
                return false;
            }
            break;
    }

    current = observed;
    return true;
}

std::vector<std::string> MergePolicy::apply(Device& device, const DeviceObservation& observation,
                                            const std::vector<FieldMergeRule>& rules) {
    std::vector<std::string> changed;
    for (const auto& r : rules) {
        if (applyRule(r.rule, device.*(r.deviceField), observation.*(r.observedField))) {
            changed.push_back(r.name);
        }
    }
    return changed;
}

Device MergePolicy::createDevice(const DeviceObservation& observation) {
    Device d;
    d.macAddress = observation.macAddress;
    d.ipAddress = observation.ipAddress;
    for (const auto& r : defaultRules()) {
        if (!isEmpty(observation.*(r.observedField))) {
            d.*(r.deviceField) = observation.*(r.observedField);
        }
    }
    d.isOnline = true;
    d.isKnown = false;
    d.missedScans = 0;
    return d;
}

}  // namespace LanMonitor
