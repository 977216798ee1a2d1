#pragma once

#include <stdexcept>
#include <string>

namespace llmrouter {
namespace common {

enum class ErrorKind {
    kPolicyNotFound,
    kUnresolvedLabel,
    kInvalidRequest,
    kUnauthorized,
    kRateLimited,
    kClassificationUnavailable,
    kNoEligibleBackend,
    kUpstreamTransient,
    kUpstreamPermanent,
    kUpstreamExhausted,
    kCacheUnavailable,
};

// Machine-readable reason code, e.g. "routing_error_policy_not_found".
const char* ErrorReason(ErrorKind kind);

struct GatewayError {
    ErrorKind kind{ErrorKind::kUpstreamTransient};
    std::string message;
    // Status returned by the backend, when the error came from one.
    int upstreamStatus{0};

    GatewayError() = default;
    GatewayError(ErrorKind k, std::string msg, int upstream = 0)
        : kind(k), message(std::move(msg)), upstreamStatus(upstream) {}

    int HttpStatus() const;
    const char* Reason() const { return ErrorReason(kind); }

    // {"error":{"type":...,"message":...,"status":...,"source":"llm-router"}}
    std::string ToJson() const;
};

class GatewayException : public std::runtime_error {
public:
    explicit GatewayException(GatewayError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}
    GatewayException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), error_(kind, message) {}

    const GatewayError& error() const { return error_; }

private:
    GatewayError error_;
};

} // namespace common
} // namespace llmrouter
