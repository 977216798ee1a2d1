#pragma once

#include "llmrouter/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace llmrouter {
namespace network {

// Owns an OpenSSL SSL_CTX for outbound connections.
class TlsContext : llmrouter::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // Loads the system CA store (or caFile when given). With verifyPeer off
    // the peer certificate is accepted unchecked.
    bool InitClient(bool verifyPeer, const std::string& caFile = std::string());

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Most recent OpenSSL error queue entry as text; empties the queue.
    static std::string LastError();

private:
    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{true};
};

} // namespace network
} // namespace llmrouter
