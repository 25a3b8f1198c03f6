#pragma once

/**
 * @file retry_policy.h
 * @brief Bounded re-attempts with growing deadlines and pauses
 *
 * Attempt 1 uses the base timeout. Each later attempt multiplies the
 * previous timeout by BackoffConfig::timeoutGrowth (strictly increasing
 * until BackoffConfig::maxTimeout) and is preceded by a pause that grows
 * the same way up to BackoffConfig::maxPause. The worst-case wall clock of
 * a run is therefore known up front (RetrySchedule::worstCase()).
 *
 * Debug mode feeds smaller inputs into the same computation: fewer
 * attempts, shorter timeouts and pauses. It never increases either.
 */

#include <blendpipe/config.h>
#include <blendpipe/execution_client.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blendpipe {

/// Per-attempt timeouts and pauses for one run
struct RetrySchedule {
    struct Attempt {
        Millis timeout{0};       ///< Deadline for this attempt
        Millis pauseBefore{0};   ///< Sleep before this attempt (0 for the first)
    };

    std::vector<Attempt> attempts;

    /// @brief Build the schedule for @p attempts tries starting at @p baseTimeout
    static RetrySchedule compute(int attempts, Millis baseTimeout, bool debug,
                                 const BackoffConfig& backoff);

    /// @brief Upper bound on the run's duration: all timeouts plus all pauses
    Millis worstCase() const;
};

/// Final verdict of a RetryPolicy run
struct Outcome {
    bool success = false;
    int attemptsUsed = 0;                ///< Executor calls actually made
    ErrorKind kind = ErrorKind::None;    ///< Kind of the last failure
    std::string message;                 ///< Message of the last failure
    std::optional<Response> response;    ///< Last decoded response, if any

    bool ok() const { return success; }
};

/**
 * @brief Wraps Executor::execute() with bounded retries
 *
 * Stops on the first success. Transport, Timeout and Decode failures are
 * retried while attempts remain; Application failures only when the
 * command opted in with Command::withApplicationRetry(); InvalidCommand
 * fails at once.
 */
class RetryPolicy {
public:
    using SleepFunction = std::function<void(Millis)>;
    using AttemptCallback = std::function<void(int attempt, int total, const ExecutionResult& result)>;

    RetryPolicy(Executor& executor, const ClientConfig& config);

    /**
     * @brief Run @p command with an explicit budget
     * @param attempts Maximum executor calls before debug scaling (>= 1)
     * @param baseTimeout Timeout of the first attempt before debug scaling
     * @param debug Shrink attempts and timeouts for fast local iteration
     */
    Outcome run(const Command& command, int attempts, Millis baseTimeout, bool debug);

    /// @brief Run @p command with the budget from the ClientConfig
    Outcome run(const Command& command);

    /// @brief Attempts actually used for a requested budget
    static int effectiveAttempts(int attempts, bool debug, const BackoffConfig& backoff);

    /// @brief First-attempt timeout actually used for a requested base timeout
    static Millis effectiveTimeout(Millis baseTimeout, bool debug, const BackoffConfig& backoff);

    /// @brief Replace the pause implementation (defaults to std::this_thread::sleep_for)
    void setSleepFunction(SleepFunction sleep) { m_sleep = std::move(sleep); }

    /// @brief Observe every attempt's result
    void onAttempt(AttemptCallback callback) { m_attemptCallback = std::move(callback); }

    const ClientConfig& config() const { return m_config; }
    Executor& executor() const { return m_executor; }

private:
    Executor& m_executor;
    ClientConfig m_config;
    SleepFunction m_sleep;
    AttemptCallback m_attemptCallback;
};

} // namespace blendpipe
