/**
 * @file host_enricher_test.cpp
 * @brief Merge order, concurrency cap and time boxes of HostEnricher
 */

#include <gtest/gtest.h>

#include "lanmonitor/HostEnricher.h"

#include <algorithm>
#include <atomic>
#include <thread>

using namespace LanMonitor;

namespace {

class FakeProbes : public HostProbes {
public:
    std::vector<std::string> names;
    std::vector<int> ports;
    std::optional<SsdpResult> ssdp;
    std::optional<std::string> netbios;
    std::optional<HttpFingerprint> http;
    MdnsHostMap mdns;
    ServiceRecordMap fallback;
    std::vector<std::string> reverse;

    bool throwOnPorts = false;
    std::chrono::milliseconds resolveDelay{0};

    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<int> resolveCalls{0};
    std::atomic<int> fallbackCalls{0};
    std::atomic<int> reverseCalls{0};

    std::vector<std::string> resolveNames(const std::string&) override {
        const int now = ++active;
        int seen = maxActive.load();
        while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
        }
        if (resolveDelay.count() > 0) {
            std::this_thread::sleep_for(resolveDelay);
        }
        ++resolveCalls;
        --active;
        return names;
    }

    std::vector<int> scanPorts(const std::string&, std::chrono::milliseconds) override {
        if (throwOnPorts) {
            throw std::runtime_error("connect storm");
        }
        return ports;
    }

    std::optional<SsdpResult> probeSsdp(const std::string&, std::chrono::milliseconds) override {
        return ssdp;
    }

    std::optional<std::string> probeNetbios(const std::string&, std::chrono::milliseconds) override {
        return netbios;
    }

    std::optional<HttpFingerprint> probeHttp(const std::string&, std::chrono::milliseconds) override {
        return http;
    }

    MdnsHostMap browseMdns(const std::set<std::string>&) override {
        return mdns;
    }

    ServiceRecordMap browseFallback(const std::set<std::string>&) override {
        ++fallbackCalls;
        return fallback;
    }

    std::vector<std::string> mdnsReverseQuery(const std::string&, std::chrono::milliseconds) override {
        ++reverseCalls;
        return reverse;
    }
};

EnrichmentOptions quickOptions(size_t concurrency = 4) {
    EnrichmentOptions options;
    options.hostConcurrency = concurrency;
    options.probeTimeout = std::chrono::milliseconds(500);
    options.hostTimeoutMultiplier = 4;
    return options;
}

std::vector<EnrichmentTarget> targets(size_t count) {
    std::vector<EnrichmentTarget> out;
    for (size_t i = 0; i < count; ++i) {
        out.push_back({"10.0.0." + std::to_string(i + 1), std::nullopt, std::nullopt});
    }
    return out;
}

bool containsName(const HostEnrichment& info, const std::string& name) {
    return std::find(info.hostnames.begin(), info.hostnames.end(), name) != info.hostnames.end();
}

}  // namespace

TEST(HostEnricherTest, RequiresProbes) {
    EXPECT_THROW(HostEnricher(nullptr, nullptr, nullptr), std::invalid_argument);
}

TEST(HostEnricherTest, EmptyTargetListDoesNothing) {
    auto probes = std::make_shared<FakeProbes>();
    HostEnricher enricher(probes, nullptr, nullptr, quickOptions());

    EXPECT_TRUE(enricher.enrich({}).empty());
    EXPECT_EQ(probes->fallbackCalls.load(), 0);
}

TEST(HostEnricherTest, MergesProbeResultsInOrder) {
    auto probes = std::make_shared<FakeProbes>();
    probes->names = {"printer.lan"};
    probes->ports = {9100, 12345};
    SsdpResult ssdp;
    ssdp.headers["server"] = "Linux UPnP/1.0";
    UpnpDescription desc;
    desc.friendlyName = "Office Printer";
    desc.manufacturer = "Brother";
    desc.modelName = "HL-L2350DW";
    desc.deviceType = "urn:schemas-upnp-org:device:Printer:1";
    ssdp.description = desc;
    probes->ssdp = ssdp;
    probes->netbios = "BRN001122";
    probes->http = HttpFingerprint{"http://10.0.0.1/", "debut/1.20", std::string("Brother HL")};

    HostEnricher enricher(probes, nullptr, nullptr, quickOptions());
    auto results = enricher.enrich(targets(1));

    ASSERT_EQ(results.size(), 1u);
    const HostEnrichment& info = results[0];
    EXPECT_EQ(info.ip, "10.0.0.1");
    ASSERT_EQ(info.hostnames.size(), 3u);
    EXPECT_EQ(info.hostnames[0], "printer.lan");
    EXPECT_EQ(info.hostnames[1], "Office Printer");
    EXPECT_EQ(info.hostnames[2], "BRN001122");
    EXPECT_EQ(info.primaryHostname(), std::optional<std::string>("printer.lan"));

    EXPECT_EQ(info.openPorts, (std::vector<int>{9100, 12345}));
    EXPECT_EQ(info.services, (std::vector<std::string>{"jetdirect"}));
    EXPECT_EQ(info.manufacturer, std::optional<std::string>("Brother"));
    EXPECT_EQ(info.model, std::optional<std::string>("HL-L2350DW"));
    EXPECT_EQ(info.upnpInfo.at("device_type"), "urn:schemas-upnp-org:device:Printer:1");
    EXPECT_EQ(info.ssdpInfo.at("server"), "Linux UPnP/1.0");
    EXPECT_EQ(info.httpInfo.at("server"), "debut/1.20");
    EXPECT_EQ(info.httpInfo.at("title"), "Brother HL");
    EXPECT_EQ(info.deviceClass, std::optional<std::string>("Printer"));
}

TEST(HostEnricherTest, AggregatedMdnsSeedsRecordAndSkipsPerHostQuery) {
    auto probes = std::make_shared<FakeProbes>();
    HostMdnsInfo tv;
    tv.ip = "10.0.0.1";
    tv.hostnames = {"tv.local"};
    tv.serviceNames = {"Living Room TV"};
    tv.model = "AppleTV11,1";
    tv.deviceClass = "Apple TV";
    probes->mdns["10.0.0.1"] = tv;
    probes->mdns["10.9.9.9"] = HostMdnsInfo{};
    probes->names = {"tv.lan"};
    probes->ports = {22};

    HostEnricher enricher(probes, nullptr, nullptr, quickOptions());
    auto results = enricher.enrich(targets(1));

    ASSERT_EQ(results.size(), 1u);
    const HostEnrichment& info = results[0];
    EXPECT_EQ(info.friendlyName, std::optional<std::string>("Living Room TV"));
    ASSERT_GE(info.hostnames.size(), 3u);
    EXPECT_EQ(info.hostnames[0], "Living Room TV");
    EXPECT_TRUE(containsName(info, "tv.local"));
    EXPECT_TRUE(containsName(info, "tv.lan"));
    EXPECT_EQ(info.deviceClass, std::optional<std::string>("Apple TV"));
    EXPECT_EQ(info.model, std::optional<std::string>("AppleTV11,1"));

    EXPECT_EQ(probes->fallbackCalls.load(), 0);
    EXPECT_EQ(probes->reverseCalls.load(), 0);
}

TEST(HostEnricherTest, FallbackCacheServesHostsWithoutAggregatedData) {
    auto probes = std::make_shared<FakeProbes>();
    ServiceRecord record;
    record.protocol = "IPv4";
    record.name = "Kitchen Speaker";
    record.type = "_sonos._tcp";
    record.hostname = "sonos-kitchen.local.";
    record.address = "10.0.0.1";
    record.txt["model"] = "One SL";
    probes->fallback["10.0.0.1"] = {record};

    auto cache = std::make_shared<ServiceCache>();
    HostEnricher enricher(probes, cache, nullptr, quickOptions());
    auto results = enricher.enrich(targets(2));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(probes->fallbackCalls.load(), 1);

    const HostEnrichment& speaker = results[0];
    EXPECT_EQ(speaker.mdnsServices, (std::vector<std::string>{"Kitchen Speaker (_sonos._tcp)"}));
    EXPECT_TRUE(containsName(speaker, "sonos-kitchen.local"));
    EXPECT_EQ(speaker.model, std::optional<std::string>("One SL"));

    // The second host had no cached records and fell back to the unicast query.
    EXPECT_EQ(probes->reverseCalls.load(), 1);
    EXPECT_FALSE(cache->isOpen());
}

TEST(HostEnricherTest, ThrowingProbeContributesNothing) {
    auto probes = std::make_shared<FakeProbes>();
    probes->throwOnPorts = true;
    probes->names = {"nas.lan"};

    HostEnricher enricher(probes, nullptr, nullptr, quickOptions());
    auto results = enricher.enrich(targets(1));

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].openPorts.empty());
    EXPECT_EQ(results[0].hostnames, (std::vector<std::string>{"nas.lan"}));
}

TEST(HostEnricherTest, VendorFromDiscoveryIsKeptAndMissingVendorIsLookedUp) {
    auto probes = std::make_shared<FakeProbes>();
    auto vendors = std::make_shared<VendorLookup>();
    vendors->addEntry("AA:BB:CC", "Acme Widgets");

    HostEnricher enricher(probes, nullptr, vendors, quickOptions());
    std::vector<EnrichmentTarget> list = {
        {"10.0.0.1", std::string("aa:bb:cc:00:00:01"), std::string("Known Vendor")},
        {"10.0.0.2", std::string("aa:bb:cc:00:00:02"), std::nullopt},
    };
    auto results = enricher.enrich(list);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].vendor, std::optional<std::string>("Known Vendor"));
    EXPECT_EQ(results[1].vendor, std::optional<std::string>("Acme Widgets"));
}

TEST(HostEnricherTest, NeverExceedsHostConcurrency) {
    auto probes = std::make_shared<FakeProbes>();
    probes->resolveDelay = std::chrono::milliseconds(10);

    HostEnricher enricher(probes, nullptr, nullptr, quickOptions(4));
    auto results = enricher.enrich(targets(50));

    EXPECT_EQ(results.size(), 50u);
    EXPECT_EQ(probes->resolveCalls.load(), 50);
    EXPECT_LE(probes->maxActive.load(), 4);
    EXPECT_GE(probes->maxActive.load(), 1);

    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].ip, "10.0.0." + std::to_string(i + 1));
    }
}

TEST(HostEnricherTest, AbandonedProbesKeepTheirHostSlot) {
    auto probes = std::make_shared<FakeProbes>();
    probes->resolveDelay = std::chrono::milliseconds(300);
    probes->ports = {22};

    EnrichmentOptions options = quickOptions(4);
    options.probeTimeout = std::chrono::milliseconds(50);
    options.hostTimeoutMultiplier = 2;
    HostEnricher enricher(probes, nullptr, nullptr, options);

    const auto start = std::chrono::steady_clock::now();
    auto results = enricher.enrich(targets(20));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    // Every host still reports what finished before its own deadline.
    ASSERT_EQ(results.size(), 20u);
    for (const auto& info : results) {
        EXPECT_TRUE(info.hostnames.empty());
        EXPECT_EQ(info.openPorts, (std::vector<int>{22}));
    }

    // Stalled name lookups never outnumber the host slots, so the fifth
    // wave of hosts had to wait for the first four lookups to return.
    EXPECT_LE(probes->maxActive.load(), 4);
    EXPECT_GE(elapsed, std::chrono::milliseconds(4 * 300 - 50));

    // Slots come back once the last lookups return.
    const auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (enricher.freeProbeSlots() < 4 && std::chrono::steady_clock::now() < giveUp) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_EQ(enricher.freeProbeSlots(), 4u);
}

TEST(HostEnricherTest, BatchTimeBoxDropsUnfinishedHosts) {
    auto probes = std::make_shared<FakeProbes>();
    probes->resolveDelay = std::chrono::milliseconds(300);

    EnrichmentOptions options = quickOptions(1);
    options.probeTimeout = std::chrono::milliseconds(1000);
    HostEnricher enricher(probes, nullptr, nullptr, options);

    const auto start = std::chrono::steady_clock::now();
    auto results = enricher.enrich(targets(10), std::chrono::milliseconds(500));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(results.size(), 10u);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(HostEnricherTest, HostDeadlineAbandonsSlowProbe) {
    auto probes = std::make_shared<FakeProbes>();
    probes->resolveDelay = std::chrono::milliseconds(800);
    probes->ports = {80};

    EnrichmentOptions options = quickOptions(1);
    options.probeTimeout = std::chrono::milliseconds(100);
    options.hostTimeoutMultiplier = 2;
    HostEnricher enricher(probes, nullptr, nullptr, options);

    auto results = enricher.enrich(targets(1));

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].hostnames.empty());
    EXPECT_EQ(results[0].openPorts, (std::vector<int>{80}));
}

TEST(HostEnricherTest, FromServiceRecordsPrefersMdOverModel) {
    ServiceRecord a;
    a.name = "Den";
    a.type = "_googlecast._tcp";
    a.hostname = "den.local.";
    a.txt["model"] = "generic";
    a.txt["md"] = "Chromecast Ultra";
    ServiceRecord b = a;

    MdnsProbeResult result = HostEnricher::fromServiceRecords({a, b});
    EXPECT_EQ(result.services, (std::vector<std::string>{"Den (_googlecast._tcp)"}));
    EXPECT_EQ(result.hostnames, (std::vector<std::string>{"den.local"}));
    EXPECT_EQ(result.model, std::optional<std::string>("Chromecast Ultra"));
}

TEST(HostEnricherTest, PrimaryHostnamePrefersNonLocalThenNetbios) {
    HostEnrichment info;
    EXPECT_FALSE(info.primaryHostname());

    info.netbiosName = "DESKTOP-1";
    EXPECT_EQ(info.primaryHostname(), std::optional<std::string>("DESKTOP-1"));

    info.addHostname("desk.local");
    EXPECT_EQ(info.primaryHostname(), std::optional<std::string>("desk.local"));

    info.addHostname("desk.lan");
    info.addHostname("desk.lan");
    info.addHostname("");
    EXPECT_EQ(info.hostnames.size(), 2u);
    EXPECT_EQ(info.primaryHostname(), std::optional<std::string>("desk.lan"));
}
