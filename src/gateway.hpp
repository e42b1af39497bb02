#pragma once

#include "span.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace code_mt {

enum class GatewayErrorKind {
    Timeout,
    Unavailable,
    Protocol,
    Unsupported
};

const char* gateway_error_kind_name(GatewayErrorKind kind);

class GatewayError : public std::runtime_error {
public:
    GatewayError(GatewayErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    GatewayErrorKind kind() const { return kind_; }

    // Worth retrying: the backend may answer the same request later.
    bool transient() const {
        return kind_ == GatewayErrorKind::Timeout || kind_ == GatewayErrorKind::Unavailable;
    }

private:
    GatewayErrorKind kind_;
};

struct TranslationRequest {
    std::vector<std::string> texts;
    std::string source_lang;
    std::string target_lang;
    // Dominant span kind of the chunk, used as a prompt hint.
    SpanKind kind = SpanKind::LineComment;
    std::chrono::milliseconds timeout{0};
};

class TranslationGateway {
public:
    virtual ~TranslationGateway() = default;

    // Per-thread isolation point: each worker gets its own gateway clone.
    virtual std::unique_ptr<TranslationGateway> clone() const = 0;

    // Returns one translated string per request text, in order. Throws
    // GatewayError.
    virtual std::vector<std::string> translate(const TranslationRequest& request) = 0;
};

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds backoff{500};
};

struct TranslationResult {
    bool ok = false;
    std::vector<std::string> translated;
    GatewayErrorKind failure = GatewayErrorKind::Unavailable;
    std::string message;
    int attempts = 0;
};

// Calls the gateway, retrying transient failures with exponential backoff.
// Never throws GatewayError; the outcome is in the result. A set `cancel`
// flag ends the backoff wait early and stops further attempts.
TranslationResult translate_with_retry(
    TranslationGateway& gateway,
    const TranslationRequest& request,
    const RetryPolicy& policy,
    const std::atomic<bool>* cancel = nullptr
);

}  // namespace code_mt
