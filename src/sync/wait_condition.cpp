#include "wait_condition.h"
#include "../common/config_manager.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <thread>

namespace marionette {
namespace sync {

namespace {
    const int MAX_BACKOFF_EXPONENT = 6;

    std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    }
}

std::string backoffModeToString(BackoffMode mode) {
    switch (mode) {
        case BackoffMode::FIXED: return "FIXED";
        case BackoffMode::EXPONENTIAL: return "EXPONENTIAL";
    }
    return "UNKNOWN";
}

std::chrono::milliseconds WaitPolicy::intervalForAttempt(int attempt) const {
    if (backoffMode == BackoffMode::FIXED || attempt <= 0) {
        return pollInterval;
    }
    int exponent = std::min(attempt, MAX_BACKOFF_EXPONENT);
    return pollInterval * (1LL << exponent);
}

WaitPolicy WaitPolicy::withTimeout(std::chrono::milliseconds t) const {
    WaitPolicy copy = *this;
    copy.timeout = t;
    return copy;
}

WaitPolicy WaitPolicy::fromConfig(const ConfigManager& config) {
    return WaitPolicy(std::chrono::milliseconds(config.getDefaultTimeoutMs()),
                      std::chrono::milliseconds(config.getPollIntervalMs()),
                      config.getExponentialBackoff() ? BackoffMode::EXPONENTIAL : BackoffMode::FIXED,
                      0);
}

void WaitResult::throwIfFailed(const std::string& context, const std::string& evidencePath) const {
    if (satisfied) {
        return;
    }
    std::string message = context + (cancelled ? " cancelled" : " timed out") +
                          " after " + std::to_string(elapsed.count()) + "ms (" +
                          std::to_string(attempts) + " attempts)";
    if (!lastObservedState.empty()) {
        message += "; last observed: " + lastObservedState;
    }
    if (!evidencePath.empty()) {
        message += "; evidence: " + evidencePath;
    }
    throw TimeoutError(message, attempts, elapsed, lastObservedState, evidencePath, context);
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, duration, [this]() { return m_cancelled; });
}

WaitResult awaitCondition(const Probe& probe, const WaitPolicy& policy,
                          const CancellationToken* cancellation) {
    WaitResult result;
    const auto start = std::chrono::steady_clock::now();

    while (true) {
        if (cancellation && cancellation->isCancelled()) {
            result.cancelled = true;
            break;
        }

        ++result.attempts;
        try {
            ProbeResult probeResult = probe();
            result.lastObservedState = probeResult.observedState;
            if (probeResult.satisfied) {
                result.satisfied = true;
                break;
            }
        } catch (const MarionetteException& e) {
            if (e.isFatal()) {
                throw;
            }
            result.lastObservedState = e.what();
        } catch (const std::exception& e) {
            result.lastObservedState = e.what();
        }

        auto elapsed = elapsedSince(start);
        if (elapsed >= policy.timeout) {
            break;
        }
        if (policy.maxRetries > 0 && result.attempts > policy.maxRetries) {
            break;
        }

        auto delay = std::min(policy.intervalForAttempt(result.attempts - 1), policy.timeout - elapsed);
        result.pollIntervals.push_back(delay);

        if (cancellation) {
            if (cancellation->waitFor(delay)) {
                result.cancelled = true;
                break;
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

    result.elapsed = elapsedSince(start);

    if (!result.satisfied) {
        SLOG_DEBUG().message("Wait ended unsatisfied")
            .context("attempts", result.attempts)
            .context("elapsed_ms", result.elapsed.count())
            .context("cancelled", result.cancelled)
            .context("backoff", backoffModeToString(policy.backoffMode))
            .context("last_observed", result.lastObservedState);
    }
    return result;
}

WaitResult awaitCondition(const Predicate& predicate, const WaitPolicy& policy,
                          const CancellationToken* cancellation) {
    return awaitCondition(Probe([&predicate]() {
        return ProbeResult(predicate(), "");
    }), policy, cancellation);
}

WaitResult awaitConditionFalse(const Predicate& predicate, const WaitPolicy& policy,
                               const CancellationToken* cancellation) {
    return awaitCondition(Probe([&predicate]() {
        bool holds = predicate();
        return ProbeResult(!holds, holds ? "condition still true" : "");
    }), policy, cancellation);
}

} // namespace sync
} // namespace marionette
