#include "gateway.hpp"

#include <algorithm>
#include <thread>

namespace code_mt {

namespace {

bool cancelled(const std::atomic<bool>* cancel) {
    return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

// Sleeps in short slices so an interrupt does not wait out a long backoff.
void backoff_sleep(std::chrono::milliseconds total, const std::atomic<bool>* cancel) {
    constexpr std::chrono::milliseconds slice{50};
    const auto deadline = std::chrono::steady_clock::now() + total;
    while (!cancelled(cancel)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
}

}  // namespace

const char* gateway_error_kind_name(GatewayErrorKind kind) {
    switch (kind) {
    case GatewayErrorKind::Timeout:
        return "timeout";
    case GatewayErrorKind::Unavailable:
        return "unavailable";
    case GatewayErrorKind::Protocol:
        return "protocol";
    case GatewayErrorKind::Unsupported:
        return "unsupported";
    }
    return "unknown";
}

TranslationResult translate_with_retry(
    TranslationGateway& gateway,
    const TranslationRequest& request,
    const RetryPolicy& policy,
    const std::atomic<bool>* cancel
) {
    TranslationResult result;
    const int max_attempts = std::max(1, policy.max_attempts);
    auto delay = policy.backoff;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        result.attempts = attempt;
        try {
            result.translated = gateway.translate(request);
            if (result.translated.size() != request.texts.size()) {
                result.failure = GatewayErrorKind::Protocol;
                result.message = "gateway returned " + std::to_string(result.translated.size()) +
                    " translations for " + std::to_string(request.texts.size()) + " texts";
                result.translated.clear();
                return result;
            }
            result.ok = true;
            result.message.clear();
            return result;
        } catch (const GatewayError& ex) {
            result.failure = ex.kind();
            result.message = ex.what();
            if (!ex.transient()) {
                return result;
            }
        } catch (const std::exception& ex) {
            result.failure = GatewayErrorKind::Unavailable;
            result.message = ex.what();
        }

        if (attempt == max_attempts || cancelled(cancel)) {
            break;
        }
        backoff_sleep(delay, cancel);
        delay *= 2;
    }

    return result;
}

}  // namespace code_mt
