/**
 * @file SubnetDiscovery.cpp
 * @brief Multi-technique host discovery for one IPv4 subnet
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/SubnetDiscovery.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/StringUtils.h"
#include "lanmonitor/ThreadSafeLog.h"

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace LanMonitor {

namespace {
    #define LogDiscovery(msg) LanMonitor::ThreadSafeLog::log(msg)

/**
 * @brief Run fn(item) for every item on detached threads and wait up to timeout.
 *
 * Items that have not finished by the deadline keep their `missing` value;
 * their threads run to completion on their own (each call is bounded by its
 * own timeout) and only touch the shared state they co-own.
 */
template <typename Result>
std::vector<Result> runDetachedBatch(const std::vector<std::string>& items,
                                     std::function<Result(const std::string&)> fn,
                                     std::chrono::milliseconds timeout,
                                     Result missing)
{
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        size_t remaining = 0;
        std::vector<Result> results;
    };

    auto state = std::make_shared<State>();
    state->remaining = items.size();
    state->results.assign(items.size(), missing);

    for (size_t i = 0; i < items.size(); ++i) {
        try {
            std::thread([state, fn, item = items[i], i, missing]() {
                Result r = missing;
                try {
                    r = fn(item);
                } catch (const std::exception&) {
                    // Transient failure: no information for this item
                }
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->results[i] = r;
                    --state->remaining;
                }
                state->cv.notify_all();
            }).detach();
        } catch (const std::system_error& e) {
            LOG_WARNING("[SubnetDiscovery] Cannot start worker: " << e.what());
            std::lock_guard<std::mutex> lock(state->mutex);
            --state->remaining;
        }
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait_for(lock, timeout, [&state] { return state->remaining == 0; });
    return state->results;
}

template <typename Fn>
std::vector<DiscoveredHost> guardTechnique(const char* name, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        LOG_WARNING("[SubnetDiscovery] " << name << " failed: " << e.what());
        LogDiscovery(std::string("Discovery technique '") + name + "' failed: " + e.what());
    }
    return {};
}

std::vector<DiscoveredHost> keepInNetwork(std::vector<DiscoveredHost> hosts, const Ipv4Network& net) {
    std::vector<DiscoveredHost> out;
    out.reserve(hosts.size());
    for (auto& h : hosts) {
        const auto addr = NetUtils::parseIpv4(h.ip);
        if (addr && net.contains(*addr)) {
            out.push_back(std::move(h));
        }
    }
    return out;
}

bool isUnusableMac(const std::string& mac) {
    return mac.empty() || mac == "ff:ff:ff:ff:ff:ff" || mac == "00:00:00:00:00:00";
}

}  // namespace

//=============================================================================
// Constructor
//=============================================================================

SubnetDiscovery::SubnetDiscovery(std::shared_ptr<DiscoveryBackend> backend,
                                 std::shared_ptr<const VendorLookup> vendors,
                                 DiscoveryOptions options)
    : m_backend(std::move(backend))
    , m_vendors(std::move(vendors))
    , m_options(options)
{
    if (!m_backend) {
        throw std::invalid_argument("SubnetDiscovery requires a backend");
    }
}

//=============================================================================
// SubnetDiscovery: discover()
//=============================================================================

std::vector<DiscoveredHost> SubnetDiscovery::discover(const std::string& cidr) {
    const auto parsed = NetUtils::parseCidr(cidr);
    if (!parsed) {
        throw std::invalid_argument("Invalid subnet: " + cidr);
    }
    const Ipv4Network net = *parsed;

    // All four techniques run concurrently; precedence is applied at merge time.
    auto arpFuture = std::async(std::launch::async, [this, net] {
        return guardTechnique("ARP broadcast", [&] { return runArpBroadcast(net); });
    });
    auto sweepFuture = std::async(std::launch::async, [this, net] {
        return guardTechnique("ARP sweep utility", [&] { return runArpSweepTool(net); });
    });
    auto cacheFuture = std::async(std::launch::async, [this, net] {
        return guardTechnique("neighbor cache", [&] { return runNeighborCache(net); });
    });
    auto pingFuture = std::async(std::launch::async, [this, net] {
        return guardTechnique("ping sweep", [&] { return runPingSweep(net); });
    });

    std::vector<std::vector<DiscoveredHost>> ordered;
    ordered.push_back(arpFuture.get());
    ordered.push_back(sweepFuture.get());
    ordered.push_back(cacheFuture.get());
    ordered.push_back(pingFuture.get());

    std::vector<DiscoveredHost> merged;
    std::unordered_set<std::string> seen;
    for (auto& batch : ordered) {
        for (auto& host : batch) {
            const std::string mac = NetUtils::normalizeMac(host.mac);
            if (isUnusableMac(mac) || seen.count(mac) > 0) {
                continue;
            }
            seen.insert(mac);
            host.mac = mac;
            if (host.vendor && host.vendor->empty()) {
                host.vendor.reset();
            }
            if (!host.vendor && m_vendors) {
                host.vendor = m_vendors->lookup(mac);
            }
            merged.push_back(std::move(host));
        }
    }

    if (m_options.resolveHostnames) {
        resolveHostnames(merged);
    }

    LOG_DEBUG("[SubnetDiscovery] " << net.toString() << ": " << merged.size() << " hosts ("
              << ordered[0].size() << " arp, " << ordered[1].size() << " sweep, "
              << ordered[2].size() << " cache, " << ordered[3].size() << " after ping)");
    return merged;
}

//=============================================================================
// Techniques
//=============================================================================

std::vector<DiscoveredHost> SubnetDiscovery::runArpBroadcast(const Ipv4Network& net) {
    std::vector<DiscoveredHost> out;
    std::unordered_set<std::string> seen;

    for (uint32_t attempt = 0; attempt < m_options.arpRetries; ++attempt) {
        try {
            for (auto& host : m_backend->arpBroadcastSweep(net, m_options.arpTimeout)) {
                const std::string mac = NetUtils::normalizeMac(host.mac);
                if (mac.empty() || !seen.insert(mac).second) {
                    continue;
                }
                host.mac = mac;
                host.method = DiscoveryMethod::ARP_BROADCAST;
                out.push_back(std::move(host));
            }
        } catch (const std::exception& e) {
            LOG_DEBUG("[SubnetDiscovery] ARP attempt " << (attempt + 1) << " failed: " << e.what());
            if (attempt + 1 == m_options.arpRetries && out.empty()) {
                throw;
            }
        }

        if (attempt + 1 < m_options.arpRetries) {
            std::this_thread::sleep_for(m_options.arpRetryDelay);
        }
    }

    return keepInNetwork(std::move(out), net);
}

std::vector<DiscoveredHost> SubnetDiscovery::runArpSweepTool(const Ipv4Network& net) {
    const auto output = m_backend->runArpSweepTool(net);
    if (!output) {
        LOG_DEBUG("[SubnetDiscovery] ARP sweep utility not installed, skipping");
        return {};
    }
    return keepInNetwork(parseArpSweepOutput(*output, m_vendors.get()), net);
}

std::vector<DiscoveredHost> SubnetDiscovery::runNeighborCache(const Ipv4Network& net) {
    return keepInNetwork(parseNeighborCache(m_backend->readNeighborCache()), net);
}

std::vector<DiscoveredHost> SubnetDiscovery::runPingSweep(const Ipv4Network& net) {
    pingSweep(net);
    return runNeighborCache(net);
}

void SubnetDiscovery::pingSweep(const Ipv4Network& net) {
    const std::vector<std::string> hosts = NetUtils::hostAddresses(net, m_options.pingMaxHosts);
    const size_t batchSize = std::max<size_t>(1, m_options.pingBatchSize);

    auto backend = m_backend;
    std::function<bool(const std::string&)> pingOne = [backend](const std::string& ip) {
        return backend->ping(ip);
    };

    for (size_t i = 0; i < hosts.size(); i += batchSize) {
        const size_t end = std::min(hosts.size(), i + batchSize);
        const std::vector<std::string> batch(hosts.begin() + static_cast<std::ptrdiff_t>(i),
                                             hosts.begin() + static_cast<std::ptrdiff_t>(end));
        runDetachedBatch<bool>(batch, pingOne, m_options.pingBatchTimeout, false);
    }
}

void SubnetDiscovery::resolveHostnames(std::vector<DiscoveredHost>& hosts) {
    std::vector<std::string> ips;
    std::vector<size_t> positions;
    for (size_t i = 0; i < hosts.size(); ++i) {
        if (!hosts[i].hostname || hosts[i].hostname->empty()) {
            ips.push_back(hosts[i].ip);
            positions.push_back(i);
        }
    }

    auto backend = m_backend;
    std::function<std::string(const std::string&)> lookup = [backend](const std::string& ip) {
        return backend->reverseLookup(ip).value_or(std::string());
    };

    const size_t batchSize = std::max<size_t>(1, m_options.pingBatchSize);
    for (size_t i = 0; i < ips.size(); i += batchSize) {
        const size_t end = std::min(ips.size(), i + batchSize);
        const std::vector<std::string> batch(ips.begin() + static_cast<std::ptrdiff_t>(i),
                                             ips.begin() + static_cast<std::ptrdiff_t>(end));
        const auto names = runDetachedBatch<std::string>(batch, lookup, m_options.pingBatchTimeout, std::string());
        for (size_t j = 0; j < names.size(); ++j) {
            if (!names[j].empty()) {
                hosts[positions[i + j]].hostname = names[j];
            }
        }
    }
}

//=============================================================================
// SubnetDiscovery: verifyHostOnline()
//=============================================================================

bool SubnetDiscovery::verifyHostOnline(const std::string& ip,
                                       const std::optional<std::string>& expectedMac) {
    const std::string wanted = expectedMac ? NetUtils::normalizeMac(*expectedMac) : std::string();

    try {
        if (m_backend->ping(ip)) {
            return true;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("[SubnetDiscovery] verify ping " << ip << ": " << e.what());
    }

    try {
        const auto mac = m_backend->arpProbe(ip);
        if (mac) {
            if (!wanted.empty() && NetUtils::normalizeMac(*mac) != wanted) {
                LogDiscovery("Verify " + ip + ": answered by " + *mac + ", expected " + wanted);
                return false;
            }
            return true;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("[SubnetDiscovery] verify ARP probe " << ip << ": " << e.what());
    }

    try {
        for (const auto& entry : parseNeighborCache(m_backend->readNeighborCache())) {
            if (entry.ip != ip) {
                continue;
            }
            if (!wanted.empty() && entry.mac != wanted) {
                return false;
            }
            return true;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("[SubnetDiscovery] verify neighbor cache " << ip << ": " << e.what());
    }

    return false;
}

//=============================================================================
// Parsers
//=============================================================================

std::vector<DiscoveredHost> SubnetDiscovery::parseArpSweepOutput(const std::string& output,
                                                                 const VendorLookup* vendors) {
    static const std::regex rowPattern(
        R"(^(\d+\.\d+\.\d+\.\d+)\s+([0-9a-fA-F:]{17})\s*(.*)$)");

    std::vector<DiscoveredHost> out;
    for (const auto& rawLine : StringUtils::splitLines(output)) {
        const std::string line = StringUtils::trim(rawLine);
        std::smatch m;
        if (!std::regex_match(line, m, rowPattern)) {
            continue;
        }

        DiscoveredHost host;
        host.ip = m[1].str();
        host.mac = NetUtils::normalizeMac(m[2].str());
        if (host.mac.empty() || !NetUtils::isIpv4(host.ip)) {
            continue;
        }
        host.method = DiscoveryMethod::ARP_SWEEP_TOOL;

        const std::string vendor = StringUtils::trim(m[3].str());
        if (!vendor.empty()) {
            host.vendor = vendor;
        } else if (vendors) {
            host.vendor = vendors->lookup(host.mac);
        }
        out.push_back(std::move(host));
    }
    return out;
}

std::vector<DiscoveredHost> SubnetDiscovery::parseNeighborCache(const std::string& output) {
    // `arp -a`:        ? (192.168.1.1) at aa:bb:cc:dd:ee:ff [ether] on eth0
    static const std::regex arpPattern(
        R"(\((\d+\.\d+\.\d+\.\d+)\)\s+at\s+([0-9a-fA-F:]{17}))");
    // `ip neigh`:      192.168.1.1 dev eth0 lladdr aa:bb:cc:dd:ee:ff REACHABLE
    static const std::regex neighPattern(
        R"(^(\d+\.\d+\.\d+\.\d+)\s+dev\s+\S+\s+lladdr\s+([0-9a-fA-F:]{17}))");
    // /proc/net/arp:   192.168.1.1  0x1  0x2  aa:bb:cc:dd:ee:ff  *  eth0
    static const std::regex procPattern(
        R"(^(\d+\.\d+\.\d+\.\d+)\s+0x[0-9a-fA-F]+\s+(0x[0-9a-fA-F]+)\s+([0-9a-fA-F:]{17}))");

    std::vector<DiscoveredHost> out;
    std::unordered_set<std::string> seen;

    for (const auto& rawLine : StringUtils::splitLines(output)) {
        const std::string line = StringUtils::trim(rawLine);
        if (line.empty()) {
            continue;
        }

        std::string ip;
        std::string mac;
        std::smatch m;
        if (std::regex_search(line, m, arpPattern)) {
            ip = m[1].str();
            mac = m[2].str();
        } else if (std::regex_search(line, m, neighPattern)) {
            if (StringUtils::contains(line, "FAILED") || StringUtils::contains(line, "INCOMPLETE")) {
                continue;
            }
            ip = m[1].str();
            mac = m[2].str();
        } else if (std::regex_search(line, m, procPattern)) {
            if (m[2].str() == "0x0") {
                continue;  // incomplete entry
            }
            ip = m[1].str();
            mac = m[3].str();
        } else {
            continue;
        }

        mac = NetUtils::normalizeMac(mac);
        if (isUnusableMac(mac) || !NetUtils::isIpv4(ip)) {
            continue;
        }
        if (!seen.insert(mac).second) {
            continue;
        }

        DiscoveredHost host;
        host.ip = ip;
        host.mac = mac;
        host.method = DiscoveryMethod::NEIGHBOR_CACHE;
        out.push_back(std::move(host));
    }
    return out;
}

}  // namespace LanMonitor
