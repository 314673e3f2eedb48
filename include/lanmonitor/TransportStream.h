/**
 * @file TransportStream.h
 * @brief Byte stream over a connected socket, with or without TLS
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace LanMonitor {

class TlsSocket;

/**
 * @brief Connected stream used by the HTTP fingerprint probe.
 *
 * The socket descriptor is owned by the caller and must outlive the stream.
 */
class TransportStream {
public:
    /// Stop condition checked after every chunk; receives everything read so far.
    using CompletePredicate = std::function<bool(const std::string& received)>;

    virtual ~TransportStream() = default;

    virtual bool writeAll(const std::string& data, std::string& errorMsg) = 0;

    /**
     * @brief Read whatever is available, up to size bytes.
     * @return Bytes read; 0 at end of stream or on error (errorMsg set on error)
     */
    virtual size_t readSome(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;

    virtual void close() = 0;
    virtual bool isTls() const = 0;

    /**
     * @brief Read into out until the peer closes, isComplete holds,
     *        out reaches maxBytes or the deadline passes.
     * @return false only if the first read failed; a short read after
     *         data arrived is returned as success
     */
    bool readUntil(std::string& out, size_t maxBytes,
                   std::chrono::steady_clock::time_point deadline,
                   const CompletePredicate& isComplete,
                   std::string& errorMsg);

    /// Plain TCP over fd.
    static std::unique_ptr<TransportStream> plain(int fd);

    /// TLS client session over fd; nullptr with errorMsg set if the handshake fails.
    static std::unique_ptr<TransportStream> tls(int fd, const std::string& serverName,
                                                std::string& errorMsg);
};

}  // namespace LanMonitor
