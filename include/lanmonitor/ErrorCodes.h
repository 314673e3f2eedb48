/**
 * @file ErrorCodes.h
 * @brief Stable, searchable error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message (failed scan sessions
 *   record them as a prefix of their error text)
 */

#pragma once

namespace LanMonitor {
namespace ErrorCodes {

// Scan cycle
inline constexpr const char* SCAN_INVALID_SUBNET = "LANMON-SCAN-1000";
inline constexpr const char* SCAN_REGISTRY_LOAD = "LANMON-SCAN-1001";
inline constexpr const char* SCAN_PERSIST = "LANMON-SCAN-1002";
inline constexpr const char* SCAN_INTERNAL_ERROR = "LANMON-SCAN-1100";

// Device store
inline constexpr const char* STORE_NO_TRANSACTION = "LANMON-STORE-2000";
inline constexpr const char* STORE_UNKNOWN_SESSION = "LANMON-STORE-2001";
inline constexpr const char* STORE_WRITE_FAILED = "LANMON-STORE-2002";
inline constexpr const char* STORE_READ_FAILED = "LANMON-STORE-2003";

// Configuration
inline constexpr const char* CONFIG_PARSE_FAILED = "LANMON-CFG-3000";

}  // namespace ErrorCodes
}  // namespace LanMonitor
