/**
 * @file TlsSocket.cpp
 * @brief OpenSSL client wrapper used by the HTTP fingerprint probe
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/TlsSocket.h"
#include "lanmonitor/NetUtils.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace LanMonitor {

namespace {
    constexpr size_t TLS_MAX_WRITE_CHUNK = 16 * 1024;

    std::once_flag g_openSslInit;

    std::string formatSslFailureDetails(int sslErrorCode, int sysErrno) {
        // Prefer OpenSSL's error queue when present.
        const unsigned long opensslErr = ERR_get_error();
        if (opensslErr != 0) {
            char buf[256];
            ERR_error_string_n(opensslErr, buf, sizeof(buf));
            return std::string(buf);
        }
        if (sslErrorCode == SSL_ERROR_SYSCALL) {
            if (sysErrno != 0) {
                return std::string("errno ") + std::to_string(sysErrno) + " (" + std::strerror(sysErrno) + ")";
            }
            return "peer closed the connection";
        }
        return "Unknown error";
    }
}

//=============================================================================
// OpenSSL Initialization
//=============================================================================

void initOpenSsl() {
    std::call_once(g_openSslInit, [] {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

//=============================================================================
// TlsSocket: Constructor / Destructor
//=============================================================================

TlsSocket::TlsSocket(int socketFd)
    : m_socket(socketFd)
    , m_ctx(nullptr)
    , m_ssl(nullptr)
    , m_connected(false)
{
    initOpenSsl();
}

TlsSocket::~TlsSocket() {
    shutdown();

    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }
    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

//=============================================================================
// TlsSocket: Handshake
//=============================================================================

bool TlsSocket::connect(const std::string& serverName, std::string& errorMsg) {
    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx) {
        errorMsg = "Failed to create SSL context: " + formatSslFailureDetails(SSL_ERROR_SSL, 0);
        return false;
    }

    // Embedded web UIs still speak TLS 1.0/1.1; accept whatever they offer.
    SSL_CTX_set_min_proto_version(m_ctx, 0);
    SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);

    m_ssl = SSL_new(m_ctx);
    if (!m_ssl) {
        errorMsg = "Failed to create SSL object: " + formatSslFailureDetails(SSL_ERROR_SSL, 0);
        return false;
    }
    if (SSL_set_fd(m_ssl, m_socket) != 1) {
        errorMsg = "Failed to attach socket: " + formatSslFailureDetails(SSL_ERROR_SSL, 0);
        return false;
    }
    if (!serverName.empty() && !NetUtils::isIpv4(serverName)) {
        SSL_set_tlsext_host_name(m_ssl, serverName.c_str());
    }

    const int result = SSL_connect(m_ssl);
    if (result != 1) {
        const int sysErrno = errno;
        const int err = SSL_get_error(m_ssl, result);
        errorMsg = "TLS handshake failed (" + getErrorDescription(err) + "): " +
                   formatSslFailureDetails(err, sysErrno);
        return false;
    }

    m_connected = true;
    return true;
}

//=============================================================================
// TlsSocket: Send / Receive
//=============================================================================

bool TlsSocket::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        const size_t chunkSize = std::min(size - totalSent, TLS_MAX_WRITE_CHUNK);
        const int sent = SSL_write(m_ssl, data + totalSent, static_cast<int>(chunkSize));
        if (sent <= 0) {
            const int sysErrno = errno;
            const int err = SSL_get_error(m_ssl, sent);
            if (err == SSL_ERROR_WANT_WRITE) {
                continue;
            }
            errorMsg = "TLS send failed (" + getErrorDescription(err) + "): " +
                       formatSslFailureDetails(err, sysErrno);
            return false;
        }
        totalSent += static_cast<size_t>(sent);
    }
    return true;
}

size_t TlsSocket::recv(uint8_t* buffer, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return 0;
    }
    if (!buffer || size == 0) {
        return 0;
    }

    for (;;) {
        const int received = SSL_read(m_ssl, buffer, static_cast<int>(size));
        if (received > 0) {
            return static_cast<size_t>(received);
        }

        const int sysErrno = errno;
        const int err = SSL_get_error(m_ssl, received);
        if (err == SSL_ERROR_ZERO_RETURN) {
            return 0;
        }
        if (err == SSL_ERROR_WANT_READ) {
            continue;
        }
        // Many embedded servers drop the connection without close_notify.
        if (err == SSL_ERROR_SYSCALL && sysErrno == 0) {
            return 0;
        }
        errorMsg = "TLS read failed (" + getErrorDescription(err) + "): " +
                   formatSslFailureDetails(err, sysErrno);
        return 0;
    }
}

void TlsSocket::shutdown() {
    if (m_ssl && m_connected) {
        SSL_shutdown(m_ssl);
        m_connected = false;
    }
}

std::string TlsSocket::getErrorDescription(int sslErrorCode) {
    switch (sslErrorCode) {
        case SSL_ERROR_NONE:
            return "SSL_ERROR_NONE";
        case SSL_ERROR_ZERO_RETURN:
            return "SSL_ERROR_ZERO_RETURN (connection closed)";
        case SSL_ERROR_WANT_READ:
            return "SSL_ERROR_WANT_READ (retry needed)";
        case SSL_ERROR_WANT_WRITE:
            return "SSL_ERROR_WANT_WRITE (retry needed)";
        case SSL_ERROR_SYSCALL:
            return "SSL_ERROR_SYSCALL (I/O error)";
        case SSL_ERROR_SSL:
            return "SSL_ERROR_SSL (protocol error)";
        default:
            return "SSL_ERROR_UNKNOWN (" + std::to_string(sslErrorCode) + ")";
    }
}

}  // namespace LanMonitor
