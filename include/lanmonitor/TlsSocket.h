/**
 * @file TlsSocket.h
 * @brief OpenSSL client wrapper used by the HTTP fingerprint probe
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace LanMonitor {

/// Idempotent OpenSSL library initialization.
void initOpenSsl();

/**
 * @class TlsSocket
 * @brief TLS client session over an already connected TCP socket
 *
 * Devices on a LAN almost always present self-signed certificates, so the
 * peer certificate is not verified. The wrapper is only used to read HTTP
 * banners, never to transfer anything trusted.
 *
 * The socket descriptor stays owned by the caller.
 */
class TlsSocket {
public:
    explicit TlsSocket(int socketFd);
    ~TlsSocket();

    // Prevent copying
    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * @brief Run the client handshake.
     * @param serverName SNI host name (ignored when it is an IP address)
     */
    bool connect(const std::string& serverName, std::string& errorMsg);

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg);

    /**
     * @brief Read up to size bytes.
     * @return Bytes read; 0 on clean close or error (errorMsg set on error)
     */
    size_t recv(uint8_t* buffer, size_t size, std::string& errorMsg);

    void shutdown();

    bool isConnected() const { return m_connected; }

    static std::string getErrorDescription(int sslErrorCode);

private:
    int m_socket;
    SSL_CTX* m_ctx;
    SSL* m_ssl;
    bool m_connected;
};

}  // namespace LanMonitor
