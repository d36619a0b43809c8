#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include "test_harness.h"
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "sync/wait_condition.h"

using namespace marionette;
using namespace marionette::sync;
using namespace std::chrono_literals;

void testFixedPollingTiming() {
    std::cout << "[TEST] Fixed polling, satisfied on the third poll\n";

    int calls = 0;
    WaitResult result = awaitCondition([&]() { return ++calls == 3; },
                                       WaitPolicy(10000ms, 500ms, BackoffMode::FIXED));

    CHECK(result.satisfied);
    CHECK_EQ(result.attempts, 3);
    CHECK(result.elapsed >= 1000ms);
    CHECK(result.elapsed < 2000ms);
    CHECK_EQ(result.pollIntervals.size(), 2u);
    CHECK_EQ(result.pollIntervals[0].count(), 500);
    CHECK_EQ(result.pollIntervals[1].count(), 500);

    std::cout << "[OK] Fixed polling took " << result.elapsed.count() << " ms\n\n";
}

void testExponentialIntervalSequence() {
    std::cout << "[TEST] Exponential backoff interval sequence\n";

    WaitPolicy policy(60000ms, 100ms, BackoffMode::EXPONENTIAL);
    const long long expected[] = {100, 200, 400, 800, 1600, 3200, 6400, 6400, 6400};
    for (int n = 0; n < 9; ++n) {
        CHECK_EQ(policy.intervalForAttempt(n).count(), expected[n]);
    }

    WaitPolicy fixed(60000ms, 100ms, BackoffMode::FIXED);
    CHECK_EQ(fixed.intervalForAttempt(5).count(), 100);

    // The scheduled delays of a real wait follow the same sequence
    int calls = 0;
    WaitResult result = awaitCondition([&]() { return ++calls == 5; },
                                       WaitPolicy(10000ms, 5ms, BackoffMode::EXPONENTIAL));
    CHECK(result.satisfied);
    CHECK_EQ(result.pollIntervals.size(), 4u);
    CHECK_EQ(result.pollIntervals[0].count(), 5);
    CHECK_EQ(result.pollIntervals[1].count(), 10);
    CHECK_EQ(result.pollIntervals[2].count(), 20);
    CHECK_EQ(result.pollIntervals[3].count(), 40);

    std::cout << "[OK] Exponential backoff interval sequence\n\n";
}

void testDelayClampedToRemainingBudget() {
    std::cout << "[TEST] Last delay clamped to the remaining timeout\n";

    WaitResult result = awaitCondition([]() { return false; },
                                       WaitPolicy(250ms, 100ms, BackoffMode::FIXED));

    CHECK(!result.satisfied);
    CHECK(!result.cancelled);
    CHECK(result.attempts >= 3);
    CHECK(result.elapsed >= 250ms);

    long long scheduled = 0;
    for (const auto& interval : result.pollIntervals) {
        CHECK(interval.count() <= 100);
        scheduled += interval.count();
    }
    CHECK(scheduled <= 250);
    CHECK(result.pollIntervals.back().count() < 100);

    std::cout << "[OK] Delays stayed inside the budget\n\n";
}

void testMaxRetriesBoundsAttempts() {
    std::cout << "[TEST] maxRetries caps re-polls\n";

    int calls = 0;
    WaitResult result = awaitCondition([&]() { ++calls; return false; },
                                       WaitPolicy(10000ms, 5ms, BackoffMode::FIXED, 2));

    CHECK(!result.satisfied);
    CHECK_EQ(calls, 3);
    CHECK_EQ(result.attempts, 3);
    CHECK(result.elapsed < 1000ms);

    std::cout << "[OK] maxRetries caps re-polls\n\n";
}

void testImmediateSuccessDoesNotSleep() {
    std::cout << "[TEST] Satisfied on the first evaluation\n";

    WaitResult result = awaitCondition([]() { return true; }, WaitPolicy(10000ms, 5000ms));
    CHECK(result.satisfied);
    CHECK_EQ(result.attempts, 1);
    CHECK(result.pollIntervals.empty());
    CHECK(result.elapsed < 1000ms);

    std::cout << "[OK] Satisfied on the first evaluation\n\n";
}

void testLastObservedState() {
    std::cout << "[TEST] Result carries the last observed state\n";

    int calls = 0;
    WaitResult result = awaitCondition(Probe([&]() {
        ++calls;
        return ProbeResult(false, "score " + std::to_string(calls));
    }), WaitPolicy(100ms, 10ms));

    CHECK(!result.satisfied);
    CHECK_EQ(result.lastObservedState, "score " + std::to_string(calls));

    std::cout << "[OK] Last observed state: " << result.lastObservedState << "\n\n";
}

void testTransientExceptionsAreRetried() {
    std::cout << "[TEST] Transient errors count as not yet satisfied\n";

    int calls = 0;
    WaitResult result = awaitCondition([&]() -> bool {
        ++calls;
        if (calls == 1) {
            throw OperationError("screen grab failed");
        }
        if (calls == 2) {
            throw std::runtime_error("window moving");
        }
        return true;
    }, WaitPolicy(5000ms, 5ms));

    CHECK(result.satisfied);
    CHECK_EQ(result.attempts, 3);

    WaitResult failed = awaitCondition([]() -> bool { throw std::runtime_error("still loading"); },
                                       WaitPolicy(50ms, 10ms));
    CHECK(!failed.satisfied);
    CHECK_EQ(failed.lastObservedState, std::string("still loading"));

    std::cout << "[OK] Transient errors are retried\n\n";
}

void testFatalExceptionsPropagate() {
    std::cout << "[TEST] Fatal engine errors end the wait at once\n";

    int calls = 0;
    CHECK_THROWS(awaitCondition([&]() -> bool {
        ++calls;
        throw NotFoundError("application 'calc' is gone", "calc");
    }, WaitPolicy(5000ms, 5ms)), NotFoundError);
    CHECK_EQ(calls, 1);

    calls = 0;
    CHECK_THROWS(awaitCondition([&]() -> bool {
        ++calls;
        throw OcrError("tesseract crashed");
    }, WaitPolicy(5000ms, 5ms)), OcrError);
    CHECK_EQ(calls, 1);

    std::cout << "[OK] Fatal errors propagate\n\n";
}

void testCancellation() {
    std::cout << "[TEST] Cancellation wakes the waiter\n";

    CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(100ms);
        token.cancel();
    });

    WaitResult result = awaitCondition([]() { return false; },
                                       WaitPolicy(30000ms, 5000ms), &token);
    canceller.join();

    CHECK(!result.satisfied);
    CHECK(result.cancelled);
    CHECK(result.elapsed < 2000ms);

    // Already cancelled: the condition is never evaluated
    int calls = 0;
    WaitResult second = awaitCondition([&]() { ++calls; return true; }, WaitPolicy(1000ms, 10ms), &token);
    CHECK(second.cancelled);
    CHECK_EQ(calls, 0);

    std::cout << "[OK] Cancelled after " << result.elapsed.count() << " ms\n\n";
}

void testThrowIfFailed() {
    std::cout << "[TEST] throwIfFailed raises TimeoutError with diagnostics\n";

    WaitResult result = awaitCondition(Probe([]() { return ProbeResult(false, "text 'Welc'"); }),
                                       WaitPolicy(60ms, 20ms));
    bool thrown = false;
    try {
        result.throwIfFailed("[notepad] assertVisibleText", "evidence/shot.png");
    } catch (const TimeoutError& e) {
        thrown = true;
        CHECK_EQ(e.attempts(), result.attempts);
        CHECK_EQ(e.elapsed().count(), result.elapsed.count());
        CHECK_EQ(e.lastObservedState(), std::string("text 'Welc'"));
        CHECK_EQ(e.evidencePath(), std::string("evidence/shot.png"));
        std::string message = e.what();
        CHECK(message.find("[notepad] assertVisibleText") != std::string::npos);
        CHECK(message.find("evidence/shot.png") != std::string::npos);
        CHECK(!e.isFatal());
    }
    CHECK(thrown);

    WaitResult ok = awaitCondition([]() { return true; }, WaitPolicy(60ms, 20ms));
    ok.throwIfFailed("never thrown");

    std::cout << "[OK] TimeoutError carries the wait diagnostics\n\n";
}

void testAwaitValueAndFalse() {
    std::cout << "[TEST] awaitValue and awaitConditionFalse\n";

    int calls = 0;
    std::optional<int> value = awaitValue<int>([&]() -> std::optional<int> {
        return ++calls < 3 ? std::nullopt : std::optional<int>(579);
    }, WaitPolicy(5000ms, 5ms));
    CHECK(value.has_value());
    CHECK_EQ(*value, 579);

    std::optional<std::string> never = awaitValue<std::string>(
        []() { return std::optional<std::string>(); }, WaitPolicy(30ms, 10ms));
    CHECK(!never.has_value());

    std::atomic<bool> dialogOpen(true);
    std::thread closer([&dialogOpen]() {
        std::this_thread::sleep_for(50ms);
        dialogOpen = false;
    });
    WaitResult closed = awaitConditionFalse([&]() { return dialogOpen.load(); }, WaitPolicy(5000ms, 10ms));
    closer.join();
    CHECK(closed.satisfied);

    std::cout << "[OK] awaitValue and awaitConditionFalse\n\n";
}

void testPolicyFromConfig() {
    std::cout << "[TEST] Wait policy from configuration\n";

    ConfigManager config;
    config.loadFromJson({{"wait", {{"default_timeout_ms", 12000},
                                   {"poll_interval_ms", 250},
                                   {"exponential_backoff", true},
                                   {"max_retries", 7}}}});
    WaitPolicy policy = WaitPolicy::fromConfig(config);

    CHECK_EQ(policy.timeout.count(), 12000);
    CHECK_EQ(policy.pollInterval.count(), 250);
    CHECK(policy.backoffMode == BackoffMode::EXPONENTIAL);
    CHECK_EQ(policy.maxRetries, 0);
    CHECK_EQ(policy.withTimeout(3000ms).timeout.count(), 3000);
    CHECK_EQ(backoffModeToString(BackoffMode::FIXED), std::string("FIXED"));

    std::cout << "[OK] Wait policy from configuration\n\n";
}

int main() {
    return marionette::testing::runTests("Marionette Wait Condition Test Suite", {
        {"fixed polling timing", testFixedPollingTiming},
        {"exponential interval sequence", testExponentialIntervalSequence},
        {"delay clamped to budget", testDelayClampedToRemainingBudget},
        {"max retries", testMaxRetriesBoundsAttempts},
        {"immediate success", testImmediateSuccessDoesNotSleep},
        {"last observed state", testLastObservedState},
        {"transient exceptions", testTransientExceptionsAreRetried},
        {"fatal exceptions", testFatalExceptionsPropagate},
        {"cancellation", testCancellation},
        {"throwIfFailed", testThrowIfFailed},
        {"awaitValue / awaitConditionFalse", testAwaitValueAndFalse},
        {"policy from config", testPolicyFromConfig},
    });
}
