#include <gtest/gtest.h>
#include <mcpbridge/session/readiness_probe.h>

#include <chrono>
#include <thread>

using namespace mcpbridge;
using namespace mcpbridge::session;
using namespace std::chrono_literals;

namespace {

RetryPolicy fastPolicy(int attempts) {
    return RetryPolicy{attempts, 5ms, 1.0, 5ms};
}

} // namespace

TEST(ReadinessProbe, SucceedsOnThirdAttempt) {
    ReadinessProbe probe(fastPolicy(5));
    int calls = 0;
    auto outcome = probe.run([&](int n) -> Result<nlohmann::json> {
        ++calls;
        EXPECT_EQ(n, calls);
        if (n < 3) {
            return Error{ErrorCode::RemoteError, "Remote error -32603: loading"};
        }
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });
    EXPECT_TRUE(outcome.ready);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(calls, 3);
    EXPECT_TRUE(outcome.result.contains("tools"));
}

TEST(ReadinessProbe, StopsAtExactlyTheBudget) {
    ReadinessProbe probe(fastPolicy(3));
    int calls = 0;
    auto outcome = probe.run([&](int) -> Result<nlohmann::json> {
        ++calls;
        return Error{ErrorCode::RequestTimeout, "no answer"};
    });
    EXPECT_FALSE(outcome.ready);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(outcome.lastError.code, ErrorCode::RequestTimeout);
}

TEST(ReadinessProbe, TransportLossEndsProbingEarly) {
    ReadinessProbe probe(fastPolicy(5));
    int calls = 0;
    auto outcome = probe.run([&](int) -> Result<nlohmann::json> {
        ++calls;
        return Error{ErrorCode::TransportClosed, "helper exited"};
    });
    EXPECT_FALSE(outcome.ready);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcome.lastError.code, ErrorCode::TransportClosed);
}

TEST(ReadinessProbe, StopRequestCancelsBetweenAttempts) {
    ReadinessProbe probe(RetryPolicy{10, 10s, 1.0, 10s});
    std::stop_source source;
    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        source.request_stop();
    });
    auto started = std::chrono::steady_clock::now();
    auto outcome = probe.run(
        [&](int) -> Result<nlohmann::json> { return Error{ErrorCode::RemoteError, "x"}; },
        source.get_token());
    canceller.join();
    EXPECT_FALSE(outcome.ready);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.lastError.code, ErrorCode::OperationCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(RetryPolicy, DelayGrowsGeometricallyAndIsCapped) {
    RetryPolicy policy{5, 1000ms, 2.0, 30000ms};
    EXPECT_EQ(policy.delayAfter(1), 1000ms);
    EXPECT_EQ(policy.delayAfter(2), 2000ms);
    EXPECT_EQ(policy.delayAfter(3), 4000ms);
    EXPECT_EQ(policy.delayAfter(10), 30000ms);

    RetryPolicy flat{5, 250ms, 1.0, 30000ms};
    EXPECT_EQ(flat.delayAfter(1), 250ms);
    EXPECT_EQ(flat.delayAfter(4), 250ms);
}

TEST(RetryWithBudget, NonRetryableErrorReturnsImmediately) {
    int calls = 0;
    auto outcome = retryWithBudget<int>(
        fastPolicy(5),
        [&](int) -> Result<int> {
            ++calls;
            return Error{ErrorCode::NotFound, "no such server"};
        },
        [](const Error& e) { return e.code == ErrorCode::RequestTimeout; });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.result.error().code, ErrorCode::NotFound);
}

TEST(RetryWithBudget, ZeroBudgetStillMakesOneAttempt) {
    int calls = 0;
    auto outcome = retryWithBudget<int>(
        RetryPolicy{0, 1ms, 1.0, 1ms},
        [&](int) -> Result<int> {
            ++calls;
            return 42;
        },
        [](const Error&) { return true; });
    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(outcome.result);
    EXPECT_EQ(outcome.result.value(), 42);
}
