#include <gtest/gtest.h>

#include "lanmonitor/MergePolicy.h"

using namespace LanMonitor;

namespace {

std::optional<std::string> opt(const char* value) {
    return std::string(value);
}

DeviceObservation observation() {
    DeviceObservation o;
    o.macAddress = "aa:bb:cc:dd:ee:01";
    o.ipAddress = "192.168.1.20";
    o.hostname = "laptop.lan";
    o.vendor = "Dell";
    o.manufacturer = "Dell Inc.";
    o.model = "XPS 13";
    o.friendlyName = "Work Laptop";
    o.deviceType = "Windows PC";
    o.openPorts = "[445,3389]";
    o.services = "[\"smb\",\"rdp\"]";
    o.scanMethod = "arp+enhanced";
    return o;
}

}  // namespace

TEST(MergePolicyTest, ObservedNothingNeverChangesAField) {
    for (MergeRule rule : {MergeRule::OverwriteAlways, MergeRule::FillIfEmpty, MergeRule::FillIfLocalDomain}) {
        std::optional<std::string> current = opt("kept");
        EXPECT_FALSE(MergePolicy::applyRule(rule, current, std::nullopt));
        EXPECT_FALSE(MergePolicy::applyRule(rule, current, opt("")));
        EXPECT_EQ(current, opt("kept"));
    }
}

TEST(MergePolicyTest, OverwriteAlwaysReplacesDifferentValues) {
    std::optional<std::string> current = opt("[22]");
    EXPECT_TRUE(MergePolicy::applyRule(MergeRule::OverwriteAlways, current, opt("[22,80]")));
    EXPECT_EQ(current, opt("[22,80]"));
    EXPECT_FALSE(MergePolicy::applyRule(MergeRule::OverwriteAlways, current, opt("[22,80]")));
}

TEST(MergePolicyTest, FillIfEmptyOnlySetsEmptyFields) {
    std::optional<std::string> unset;
    EXPECT_TRUE(MergePolicy::applyRule(MergeRule::FillIfEmpty, unset, opt("Acme")));
    EXPECT_EQ(unset, opt("Acme"));

    std::optional<std::string> blank = opt("");
    EXPECT_TRUE(MergePolicy::applyRule(MergeRule::FillIfEmpty, blank, opt("Acme")));

    std::optional<std::string> set = opt("Acme");
    EXPECT_FALSE(MergePolicy::applyRule(MergeRule::FillIfEmpty, set, opt("Other")));
    EXPECT_EQ(set, opt("Acme"));
}

TEST(MergePolicyTest, FillIfLocalDomainReplacesMdnsNames) {
    std::optional<std::string> hostname = opt("foo.local");
    EXPECT_TRUE(MergePolicy::applyRule(MergeRule::FillIfLocalDomain, hostname, opt("foo.lan")));
    EXPECT_EQ(hostname, opt("foo.lan"));

    // A real name is not replaced by anything.
    EXPECT_FALSE(MergePolicy::applyRule(MergeRule::FillIfLocalDomain, hostname, opt("bar.local")));
    EXPECT_FALSE(MergePolicy::applyRule(MergeRule::FillIfLocalDomain, hostname, opt("bar.lan")));
    EXPECT_EQ(hostname, opt("foo.lan"));

    std::optional<std::string> mdnsOnly = opt("old.local");
    EXPECT_TRUE(MergePolicy::applyRule(MergeRule::FillIfLocalDomain, mdnsOnly, opt("new.local")));
    EXPECT_EQ(mdnsOnly, opt("new.local"));
}

TEST(MergePolicyTest, CreateDeviceCopiesObservedFields) {
    const Device d = MergePolicy::createDevice(observation());

    EXPECT_EQ(d.id, 0);
    EXPECT_EQ(d.macAddress, "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(d.ipAddress, "192.168.1.20");
    EXPECT_EQ(d.hostname, opt("laptop.lan"));
    EXPECT_EQ(d.vendor, opt("Dell"));
    EXPECT_EQ(d.deviceType, opt("Windows PC"));
    EXPECT_EQ(d.openPorts, opt("[445,3389]"));
    EXPECT_TRUE(d.isOnline);
    EXPECT_FALSE(d.isKnown);
    EXPECT_EQ(d.missedScans, 0);
}

TEST(MergePolicyTest, ApplyKeepsCuratedFieldsAndRefreshesPorts) {
    Device d;
    d.macAddress = "aa:bb:cc:dd:ee:01";
    d.hostname = "laptop.local";
    d.vendor = "Dell";
    d.model = "Precision";
    d.customName = "Alice's laptop";
    d.openPorts = "[22]";

    const auto changed = MergePolicy::apply(d, observation());

    EXPECT_EQ(d.hostname, opt("laptop.lan"));
    EXPECT_EQ(d.vendor, opt("Dell"));
    EXPECT_EQ(d.model, opt("Precision"));
    EXPECT_EQ(d.manufacturer, opt("Dell Inc."));
    EXPECT_EQ(d.openPorts, opt("[445,3389]"));
    EXPECT_EQ(d.customName, opt("Alice's laptop"));

    const std::vector<std::string> expected = {
        "hostname", "manufacturer", "friendly_name", "device_type", "open_ports", "services"};
    EXPECT_EQ(changed, expected);
}

TEST(MergePolicyTest, CustomRuleTable) {
    const std::vector<FieldMergeRule> rules = {
        {"vendor", &Device::vendor, &DeviceObservation::vendor, MergeRule::OverwriteAlways},
    };
    Device d;
    d.vendor = "Unknown";
    d.hostname = "keep.local";

    const auto changed = MergePolicy::apply(d, observation(), rules);

    EXPECT_EQ(changed, (std::vector<std::string>{"vendor"}));
    EXPECT_EQ(d.vendor, opt("Dell"));
    EXPECT_EQ(d.hostname, opt("keep.local"));
}
