#ifndef MARIONETTE_WAIT_CONDITION_H
#define MARIONETTE_WAIT_CONDITION_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace marionette {

class ConfigManager;

namespace sync {

enum class BackoffMode {
    FIXED,
    EXPONENTIAL
};

std::string backoffModeToString(BackoffMode mode);

/**
 * @brief How long and how often a condition is polled
 *
 * maxRetries > 0 caps the number of re-polls after the first attempt;
 * 0 leaves the timeout as the only bound.
 */
struct WaitPolicy {
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds pollInterval;
    BackoffMode backoffMode;
    int maxRetries;

    WaitPolicy(std::chrono::milliseconds t = std::chrono::milliseconds(30000),
               std::chrono::milliseconds poll = std::chrono::milliseconds(500),
               BackoffMode mode = BackoffMode::FIXED,
               int retries = 0)
        : timeout(t), pollInterval(poll), backoffMode(mode), maxRetries(retries) {}

    /**
     * @brief Delay scheduled after 0-based attempt n, before clamping to the
     * remaining budget: pollInterval for FIXED, pollInterval * 2^min(n, 6)
     * for EXPONENTIAL
     */
    std::chrono::milliseconds intervalForAttempt(int attempt) const;

    WaitPolicy withTimeout(std::chrono::milliseconds t) const;

    /**
     * @brief Observation policy from wait.* settings. maxRetries stays 0:
     * wait.max_retries bounds retried actions, not observations.
     */
    static WaitPolicy fromConfig(const ConfigManager& config);
};

/**
 * @brief Outcome of a single probe: whether the condition holds, and what
 * was seen (partial OCR text, best match score) for diagnostics
 */
struct ProbeResult {
    bool satisfied;
    std::string observedState;

    explicit ProbeResult(bool s = false, std::string observed = "")
        : satisfied(s), observedState(std::move(observed)) {}
};

struct WaitResult {
    bool satisfied;
    bool cancelled;
    int attempts;
    std::chrono::milliseconds elapsed;
    std::string lastObservedState;
    std::vector<std::chrono::milliseconds> pollIntervals;  // delays actually slept, in order

    WaitResult() : satisfied(false), cancelled(false), attempts(0), elapsed(0) {}

    explicit operator bool() const { return satisfied; }

    /**
     * @throws TimeoutError carrying attempts, elapsed and last observed state
     *         unless the wait was satisfied
     */
    void throwIfFailed(const std::string& context, const std::string& evidencePath = "") const;
};

/**
 * @brief Cooperative cancellation shared between a waiter and its controller
 */
class CancellationToken {
public:
    CancellationToken() : m_cancelled(false) {}

    void cancel();
    bool isCancelled() const;

    /**
     * @brief Sleep for up to duration, waking early on cancel()
     * @return true if cancelled
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_cancelled;
};

using Probe = std::function<ProbeResult()>;
using Predicate = std::function<bool()>;

/**
 * @brief Poll probe until it is satisfied, the policy runs out, or the token is cancelled
 *
 * The first evaluation happens immediately. A std::exception from the probe
 * counts as "not yet" and its message becomes the observed state, except for
 * fatal MarionetteExceptions (see MarionetteException::isFatal), which
 * propagate at once. Running out of time is reported through the result,
 * never thrown.
 */
WaitResult awaitCondition(const Probe& probe, const WaitPolicy& policy,
                          const CancellationToken* cancellation = nullptr);

WaitResult awaitCondition(const Predicate& predicate, const WaitPolicy& policy,
                          const CancellationToken* cancellation = nullptr);

// Wait until predicate turns false, e.g. a progress dialog closing
WaitResult awaitConditionFalse(const Predicate& predicate, const WaitPolicy& policy,
                               const CancellationToken* cancellation = nullptr);

/**
 * @brief Poll supplier until it yields a value
 * @return The first value produced, or std::nullopt on timeout or cancellation
 */
template<typename T>
std::optional<T> awaitValue(const std::function<std::optional<T>()>& supplier,
                            const WaitPolicy& policy,
                            const CancellationToken* cancellation = nullptr) {
    std::optional<T> value;
    WaitResult result = awaitCondition(Probe([&]() {
        value = supplier();
        return ProbeResult(value.has_value(), value.has_value() ? "value available" : "no value yet");
    }), policy, cancellation);
    if (!result.satisfied) {
        return std::nullopt;
    }
    return value;
}

} // namespace sync
} // namespace marionette

#endif // MARIONETTE_WAIT_CONDITION_H
