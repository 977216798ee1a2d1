#include "llmrouter/common/GatewayError.h"

#include <json/json.h>

namespace llmrouter {
namespace common {

const char* ErrorReason(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kPolicyNotFound: return "routing_error_policy_not_found";
        case ErrorKind::kUnresolvedLabel: return "routing_error_unresolved_label";
        case ErrorKind::kInvalidRequest: return "invalid_request";
        case ErrorKind::kUnauthorized: return "invalid_api_key";
        case ErrorKind::kRateLimited: return "rate_limited";
        case ErrorKind::kClassificationUnavailable: return "classification_unavailable";
        case ErrorKind::kNoEligibleBackend: return "no_eligible_backend";
        case ErrorKind::kUpstreamTransient: return "upstream_transient_error";
        case ErrorKind::kUpstreamPermanent: return "upstream_permanent_error";
        case ErrorKind::kUpstreamExhausted: return "upstream_exhausted";
        case ErrorKind::kCacheUnavailable: return "cache_unavailable";
    }
    return "internal_error";
}

int GatewayError::HttpStatus() const {
    switch (kind) {
        case ErrorKind::kPolicyNotFound:
        case ErrorKind::kUnresolvedLabel:
        case ErrorKind::kInvalidRequest:
            return 400;
        case ErrorKind::kUnauthorized:
            return 401;
        case ErrorKind::kRateLimited:
            return 429;
        case ErrorKind::kClassificationUnavailable:
        case ErrorKind::kNoEligibleBackend:
            return 503;
        case ErrorKind::kUpstreamPermanent:
            return (upstreamStatus >= 400 && upstreamStatus < 500) ? upstreamStatus : 502;
        case ErrorKind::kUpstreamTransient:
        case ErrorKind::kUpstreamExhausted:
            return 502;
        case ErrorKind::kCacheUnavailable:
            return 500;
    }
    return 500;
}

std::string GatewayError::ToJson() const {
    Json::Value inner(Json::objectValue);
    inner["type"] = Reason();
    inner["message"] = message;
    inner["status"] = HttpStatus();
    inner["source"] = "llm-router";
    if (upstreamStatus != 0) inner["upstream_status"] = upstreamStatus;

    Json::Value root(Json::objectValue);
    root["error"] = inner;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

} // namespace common
} // namespace llmrouter
