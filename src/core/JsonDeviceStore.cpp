/**
 * @file JsonDeviceStore.cpp
 * @brief DeviceStore persisted to a single JSON document
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/JsonDeviceStore.h"
#include "lanmonitor/AtomicFile.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/ErrorCodes.h"

#include <system_error>
#include <thread>

namespace LanMonitor {

JsonDeviceStore::JsonDeviceStore(std::filesystem::path path, RetryPolicy retry, Writer writer)
    : m_path(std::move(path))
    , m_retry(retry)
    , m_writer(std::move(writer))
{
    if (!m_writer) {
        m_writer = [](const std::filesystem::path& p, const std::string& content, std::string& errorMsg) {
            return writeFileAtomically(p, content, errorMsg);
        };
    }
    if (m_retry.maxAttempts < 1) {
        m_retry.maxAttempts = 1;
    }
}

bool JsonDeviceStore::load(std::string& errorMsg) {
    if (removeStaleTempFile(m_path)) {
        LOG_WARNING("[JsonDeviceStore] Discarded partial write left next to " << m_path.string());
    }

    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        return true;
    }

    std::string content;
    if (!readWholeFile(m_path, content, errorMsg)) {
        return false;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        errorMsg = std::string(ErrorCodes::STORE_READ_FAILED) + ": " + m_path.string() + ": " + e.what();
        return false;
    }

    replaceData(StoreData::fromJson(j));
    return true;
}

void JsonDeviceStore::persist(const StoreData& data) {
    const std::string content = data.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    std::string errorMsg;
    for (int attempt = 0; attempt < m_retry.maxAttempts; ++attempt) {
        if (m_writer(m_path, content, errorMsg)) {
            return;
        }
        LOG_WARNING("[JsonDeviceStore] Write attempt " << (attempt + 1) << "/" << m_retry.maxAttempts
                    << " failed: " << errorMsg);
        if (attempt + 1 < m_retry.maxAttempts) {
            std::this_thread::sleep_for(m_retry.baseDelay * (1 << attempt));
        }
    }

    throw StoreError(ErrorCodes::STORE_WRITE_FAILED,
                     "Cannot write " + m_path.string() + ": " + errorMsg);
}

}  // namespace LanMonitor
