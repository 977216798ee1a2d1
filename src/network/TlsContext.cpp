#include "llmrouter/network/TlsContext.h"
#include "llmrouter/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mutex>

namespace llmrouter {
namespace network {

TlsContext::TlsContext() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

std::string TlsContext::LastError() {
    unsigned long code = 0;
    unsigned long last = 0;
    while ((code = ERR_get_error()) != 0) last = code;
    if (last == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(last, buf, sizeof(buf));
    return buf;
}

bool TlsContext::InitClient(bool verifyPeer, const std::string& caFile) {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }

    SSL_CTX* c = SSL_CTX_new(TLS_client_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastError();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_mode(c, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    verifyPeer_ = verifyPeer;
    if (verifyPeer) {
        const int loaded = caFile.empty()
            ? SSL_CTX_set_default_verify_paths(c)
            : SSL_CTX_load_verify_locations(c, caFile.c_str(), nullptr);
        if (loaded != 1) {
            LOG_ERROR << "TLS: loading CA certificates failed: " << LastError();
            SSL_CTX_free(c);
            return false;
        }
        SSL_CTX_set_verify(c, SSL_VERIFY_PEER, nullptr);
    } else {
        LOG_WARN << "TLS: peer verification disabled for outbound connections";
        SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    return true;
}

} // namespace network
} // namespace llmrouter
