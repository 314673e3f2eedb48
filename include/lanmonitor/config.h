/**
 * @file config.h
 * @brief Configuration constants for LanMonitor
 *
 * This file contains all compile-time configuration constants used throughout
 * the LanMonitor engine, including scan scheduling, discovery timing, probe
 * timeouts, protocol ports, and persistence limits.
 *
 * All constants are organized into logical groups and documented with their
 * purpose and usage. Most scheduling values can also be overridden at runtime
 * through ScannerSettings; the values here are the defaults.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace LanMonitor
 * @brief LanMonitor namespace containing all public APIs
 */
namespace LanMonitor {

//=========================================================================
// Scan Scheduling
//=========================================================================

/** @defgroup ScanScheduling Scan Scheduling
 * @brief Periodic reconciliation loop timing
 * @{
 */

/**
 * @brief Seconds between the end of one scan cycle and the start of the next.
 *
 * The timer is reset after each cycle completes, regardless of how long the
 * cycle took.
 */
constexpr uint32_t SCAN_INTERVAL_S = 120;

/**
 * @brief Consecutive missed scans before an online device is actively verified.
 */
constexpr uint32_t OFFLINE_GRACE_SCANS = 3;

/**
 * @brief Lower bound for the enrichment time box of a deep scan.
 *
 * The deep-scan time box is max(DEEP_SCAN_MIN_TIMEOUT_S, interval / 2).
 */
constexpr uint32_t DEEP_SCAN_MIN_TIMEOUT_S = 10;

/** @} */ // end of ScanScheduling

//=========================================================================
// Subnet Discovery
//=========================================================================

/** @defgroup SubnetDiscovery Subnet Discovery Timing
 * @brief Timeouts and limits for the host discovery techniques
 * @{
 */

/// Per-attempt timeout for the layer-2 ARP broadcast sweep.
constexpr uint32_t ARP_TIMEOUT_S = 5;

/// Largest number of addresses a single ARP broadcast sweep will query.
constexpr size_t ARP_SWEEP_MAX_HOSTS = 4096;

/// Number of ARP broadcast sweep attempts per cycle.
constexpr uint32_t ARP_RETRIES = 2;

/// Delay between two ARP broadcast sweep attempts.
constexpr uint32_t ARP_RETRY_DELAY_MS = 500;

/// Unicast ARP probe timeout used by offline verification.
constexpr uint32_t VERIFY_ARP_TIMEOUT_S = 2;

/// Unicast ARP probe retransmissions used by offline verification.
constexpr uint32_t VERIFY_ARP_RETRIES = 2;

/// Upper bound for an external ARP-sweep utility run.
constexpr uint32_t ARP_SWEEP_TOOL_TIMEOUT_S = 30;

/// Upper bound for a neighbor cache dump.
constexpr uint32_t NEIGHBOR_CACHE_TIMEOUT_S = 5;

/**
 * @brief Ping sweep limits.
 *
 * The sweep only exists to populate the neighbor cache. At most
 * PING_SWEEP_MAX_HOSTS addresses are pinged, PING_SWEEP_BATCH_SIZE at a time,
 * and each batch is abandoned after PING_SWEEP_BATCH_TIMEOUT_MS.
 */
constexpr size_t PING_SWEEP_MAX_HOSTS = 254;
constexpr size_t PING_SWEEP_BATCH_SIZE = 50;
constexpr uint32_t PING_SWEEP_BATCH_TIMEOUT_MS = 3000;

/// Reply wait passed to the ping utility (-W).
constexpr uint32_t PING_TIMEOUT_S = 1;

/// Fallback subnet when none is configured and none can be detected.
constexpr const char* FALLBACK_SUBNET = "192.168.1.0/24";

/** @} */ // end of SubnetDiscovery

//=========================================================================
// mDNS / DNS-SD
//=========================================================================

/** @defgroup Mdns mDNS / DNS-SD
 * @{
 */

/// Upper bound for one run of the external service browser.
constexpr uint32_t MDNS_BROWSE_TIMEOUT_S = 10;

/// Listen window of the embedded fallback browse.
constexpr uint32_t MDNS_FALLBACK_LISTEN_MS = 2000;

constexpr uint16_t MDNS_PORT = 5353;
constexpr const char* MDNS_MULTICAST_ADDR = "224.0.0.251";

/// Largest DNS message accepted from the wire.
constexpr size_t MDNS_MAX_PACKET_SIZE = 9000;

/** @} */ // end of Mdns

//=========================================================================
// Host Enrichment
//=========================================================================

/** @defgroup Enrichment Host Enrichment
 * @brief Probe timeouts and concurrency bounds
 * @{
 */

/// Timeout applied to each individual probe operation.
constexpr uint32_t PROBE_TIMEOUT_MS = 2000;

/// Host-level time box is PROBE_TIMEOUT_MS * HOST_TIMEOUT_MULTIPLIER.
constexpr uint32_t HOST_TIMEOUT_MULTIPLIER = 6;

/// Hosts enriched simultaneously.
constexpr size_t HOST_CONCURRENCY = 4;

constexpr uint16_t SSDP_PORT = 1900;
constexpr const char* SSDP_MULTICAST_ADDR = "239.255.255.250";

/// How long the SSDP probe listens for replies.
constexpr uint32_t SSDP_WAIT_MS = 1500;

constexpr uint16_t NETBIOS_NS_PORT = 137;
constexpr uint32_t NETBIOS_TIMEOUT_MS = 1000;

/// Largest HTTP response body read by the HTTP and UPnP probes.
constexpr size_t HTTP_MAX_RESPONSE_BYTES = 256 * 1024;

/** @} */ // end of Enrichment

//=========================================================================
// Persistence
//=========================================================================

/** @defgroup Persistence Persistence
 * @{
 */

/// Stored service descriptions per device.
constexpr size_t MAX_STORED_SERVICES = 10;

/// Commit attempts of the JSON device store.
constexpr int STORE_MAX_ATTEMPTS = 3;

/// Base backoff delay; attempt n waits base * 2^n.
constexpr uint32_t STORE_RETRY_BASE_DELAY_MS = 500;

/** @} */ // end of Persistence

}  // namespace LanMonitor
