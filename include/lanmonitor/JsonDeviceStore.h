/**
 * @file JsonDeviceStore.h
 * @brief DeviceStore persisted to a single JSON document
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "MemoryDeviceStore.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace LanMonitor {

/// Commit retry schedule for JsonDeviceStore.
struct JsonStoreRetryPolicy {
    int maxAttempts = STORE_MAX_ATTEMPTS;
    std::chrono::milliseconds baseDelay{STORE_RETRY_BASE_DELAY_MS};
};

/**
 * @class JsonDeviceStore
 * @brief MemoryDeviceStore that rewrites its JSON file on every durable change
 *
 * The file is replaced with writeFileAtomically(), so readers see either the
 * previous or the new document. A failed write is retried up to maxAttempts
 * times with exponential backoff (baseDelay * 2^attempt) before StoreError
 * is thrown and the change is undone.
 */
class JsonDeviceStore final : public MemoryDeviceStore {
public:
    using Writer = std::function<bool(const std::filesystem::path&, const std::string&, std::string&)>;

    using RetryPolicy = JsonStoreRetryPolicy;

    /**
     * @param path Document location
     * @param retry Commit retry policy
     * @param writer Replaces the atomic file write (tests)
     */
    explicit JsonDeviceStore(std::filesystem::path path,
                             RetryPolicy retry = {},
                             Writer writer = {});

    /**
     * @brief Load the document if it exists.
     *
     * A missing file is not an error and leaves the store empty.
     * @return false on read or parse failure (errorMsg set)
     */
    bool load(std::string& errorMsg);

    const std::filesystem::path& path() const { return m_path; }

protected:
    void persist(const StoreData& data) override;

private:
    std::filesystem::path m_path;
    RetryPolicy m_retry;
    Writer m_writer;
};

}  // namespace LanMonitor
