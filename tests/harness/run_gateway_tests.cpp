#include "fake_gateway.hpp"
#include "gateway.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static code_mt::TranslationRequest request_() {
        code_mt::TranslationRequest request;
        request.texts = {" 注释 ", "文档"};
        request.source_lang = "Chinese";
        request.target_lang = "English";
        request.timeout = std::chrono::milliseconds(1000);
        return request;
    }

    static code_mt::RetryPolicy fast_policy_() {
        code_mt::RetryPolicy policy;
        policy.max_attempts = 3;
        policy.backoff = std::chrono::milliseconds(1);
        return policy;
    }

    // Throws `kind` for the first `failures` calls, then echoes the input.
    static code_mt_test::FakeGateway failing_then_ok_(code_mt::GatewayErrorKind kind, int failures) {
        auto seen = std::make_shared<std::atomic<int>>(0);
        return code_mt_test::FakeGateway([seen, kind, failures](const code_mt::TranslationRequest& request) {
            if (seen->fetch_add(1) < failures) {
                throw code_mt::GatewayError(kind, std::string("scripted ") + code_mt::gateway_error_kind_name(kind));
            }
            return request.texts;
        });
    }

    static bool test_transient_failures_are_retried_() {
        auto gateway = failing_then_ok_(code_mt::GatewayErrorKind::Timeout, 2);
        const auto result = code_mt::translate_with_retry(gateway, request_(), fast_policy_());

        bool ok = true;
        ok &= require_(result.ok, "third attempt succeeds");
        ok &= require_(result.attempts == 3 && gateway.calls() == 3, "two retries were made");
        ok &= require_(result.translated == request_().texts, "translation returned aligned with request");
        ok &= require_(result.message.empty(), "no failure message after success");
        return ok;
    }

    static bool test_retries_are_bounded_() {
        auto gateway = failing_then_ok_(code_mt::GatewayErrorKind::Unavailable, 100);
        const auto result = code_mt::translate_with_retry(gateway, request_(), fast_policy_());

        bool ok = true;
        ok &= require_(!result.ok, "persistent outage fails");
        ok &= require_(result.attempts == 3 && gateway.calls() == 3, "attempts stop at max_attempts");
        ok &= require_(result.failure == code_mt::GatewayErrorKind::Unavailable, "failure kind kept");
        ok &= require_(result.message.find("scripted") != std::string::npos, "gateway message kept");
        return ok;
    }

    static bool test_non_transient_failures_are_not_retried_() {
        bool ok = true;
        for (const auto kind : {code_mt::GatewayErrorKind::Protocol, code_mt::GatewayErrorKind::Unsupported}) {
            auto gateway = failing_then_ok_(kind, 100);
            const auto result = code_mt::translate_with_retry(gateway, request_(), fast_policy_());
            ok &= require_(!result.ok && result.attempts == 1 && gateway.calls() == 1,
                           "protocol and unsupported errors are final");
            ok &= require_(result.failure == kind, "kind reported");
        }
        return ok;
    }

    static bool test_count_mismatch_is_protocol_error_() {
        code_mt_test::FakeGateway gateway([](const code_mt::TranslationRequest&) {
            return std::vector<std::string>{"only one"};
        });
        const auto result = code_mt::translate_with_retry(gateway, request_(), fast_policy_());

        bool ok = true;
        ok &= require_(!result.ok && result.failure == code_mt::GatewayErrorKind::Protocol,
                       "wrong number of translations is a protocol error");
        ok &= require_(result.attempts == 1, "count mismatch is not retried");
        ok &= require_(result.translated.empty(), "no partial translations handed out");
        ok &= require_(result.message.find("1 translations for 2 texts") != std::string::npos,
                       "message names both counts");
        return ok;
    }

    static bool test_unknown_exceptions_count_as_unavailable_() {
        auto seen = std::make_shared<std::atomic<int>>(0);
        code_mt_test::FakeGateway gateway([seen](const code_mt::TranslationRequest& request) {
            if (seen->fetch_add(1) == 0) {
                throw std::runtime_error("socket closed");
            }
            return request.texts;
        });
        const auto result = code_mt::translate_with_retry(gateway, request_(), fast_policy_());
        return require_(result.ok && result.attempts == 2, "plain exceptions are retried like outages");
    }

    static bool test_cancellation_stops_retrying_() {
        auto gateway = failing_then_ok_(code_mt::GatewayErrorKind::Timeout, 100);
        std::atomic<bool> cancel{true};

        code_mt::RetryPolicy slow = fast_policy_();
        slow.backoff = std::chrono::milliseconds(60000);

        const auto started = std::chrono::steady_clock::now();
        const auto result = code_mt::translate_with_retry(gateway, request_(), slow, &cancel);
        const auto elapsed = std::chrono::steady_clock::now() - started;

        bool ok = true;
        ok &= require_(!result.ok && result.attempts == 1, "no retry once cancelled");
        ok &= require_(elapsed < std::chrono::seconds(5), "cancelled retry does not wait out the backoff");
        return ok;
    }

    static bool test_error_kind_names_() {
        bool ok = true;
        ok &= require_(std::string(code_mt::gateway_error_kind_name(code_mt::GatewayErrorKind::Timeout)) == "timeout",
                       "timeout name");
        ok &= require_(code_mt::GatewayError(code_mt::GatewayErrorKind::Timeout, "t").transient(), "timeout is transient");
        ok &= require_(!code_mt::GatewayError(code_mt::GatewayErrorKind::Protocol, "p").transient(),
                       "protocol is not transient");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"transient_failures_are_retried", test_transient_failures_are_retried_},
        {"retries_are_bounded", test_retries_are_bounded_},
        {"non_transient_failures_are_not_retried", test_non_transient_failures_are_not_retried_},
        {"count_mismatch_is_protocol_error", test_count_mismatch_is_protocol_error_},
        {"unknown_exceptions_count_as_unavailable", test_unknown_exceptions_count_as_unavailable_},
        {"cancellation_stops_retrying", test_cancellation_stops_retrying_},
        {"error_kind_names", test_error_kind_names_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
