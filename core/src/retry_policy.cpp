#include <blendpipe/retry_policy.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>

namespace blendpipe {

static Millis scaled(Millis value, double factor) {
    return Millis(static_cast<Millis::rep>(std::llround(static_cast<double>(value.count()) * factor)));
}

// -----------------------------------------------------------------------------
// RetrySchedule
// -----------------------------------------------------------------------------

RetrySchedule RetrySchedule::compute(int attempts, Millis baseTimeout, bool debug,
                                     const BackoffConfig& backoff) {
    RetrySchedule schedule;

    const int count = RetryPolicy::effectiveAttempts(attempts, debug, backoff);
    const Millis first = RetryPolicy::effectiveTimeout(baseTimeout, debug, backoff);
    Millis cap = RetryPolicy::effectiveTimeout(backoff.maxTimeout, debug, backoff);
    cap = std::max(cap, first);

    Millis pause = debug ? scaled(backoff.initialPause, backoff.debugTimeoutScale) : backoff.initialPause;
    const Millis maxPause = debug ? scaled(backoff.maxPause, backoff.debugTimeoutScale) : backoff.maxPause;

    Millis timeout = first;
    for (int i = 0; i < count; ++i) {
        Attempt attempt;
        attempt.timeout = timeout;
        attempt.pauseBefore = i == 0 ? Millis(0) : pause;
        schedule.attempts.push_back(attempt);

        if (i > 0) {
            pause = std::min(scaled(pause, backoff.pauseGrowth), maxPause);
        }

        auto next = static_cast<Millis::rep>(std::ceil(static_cast<double>(timeout.count()) * backoff.timeoutGrowth));
        if (next <= timeout.count()) {
            next = timeout.count() + 1;
        }
        timeout = std::min(Millis(next), cap);
    }

    return schedule;
}

Millis RetrySchedule::worstCase() const {
    Millis total{0};
    for (const auto& attempt : attempts) {
        total += attempt.timeout + attempt.pauseBefore;
    }
    return total;
}

// -----------------------------------------------------------------------------
// RetryPolicy
// -----------------------------------------------------------------------------

RetryPolicy::RetryPolicy(Executor& executor, const ClientConfig& config)
    : m_executor(executor)
    , m_config(config)
    , m_sleep([](Millis duration) { std::this_thread::sleep_for(duration); }) {}

int RetryPolicy::effectiveAttempts(int attempts, bool debug, const BackoffConfig& backoff) {
    if (attempts < 1) return 0;
    if (!debug) return attempts;
    return std::max(1, std::min(attempts, backoff.debugMaxAttempts));
}

Millis RetryPolicy::effectiveTimeout(Millis baseTimeout, bool debug, const BackoffConfig& backoff) {
    if (!debug) return baseTimeout;
    Millis floor = std::min(baseTimeout, backoff.debugMinTimeout);
    Millis shrunk = std::min(baseTimeout, scaled(baseTimeout, backoff.debugTimeoutScale));
    return std::max(shrunk, floor);
}

Outcome RetryPolicy::run(const Command& command) {
    return run(command, m_config.maxAttempts, m_config.baseTimeout, m_config.debug);
}

Outcome RetryPolicy::run(const Command& command, int attempts, Millis baseTimeout, bool debug) {
    Outcome outcome;
    const std::string label = command.describe();

    if (attempts < 1 || baseTimeout.count() <= 0) {
        outcome.kind = ErrorKind::InvalidCommand;
        outcome.message = "retry budget must allow at least one attempt with a positive timeout";
        std::cerr << "[RetryPolicy] " << label << ": " << outcome.message << "\n";
        return outcome;
    }

    const RetrySchedule schedule = RetrySchedule::compute(attempts, baseTimeout, debug, m_config.backoff);
    const int total = static_cast<int>(schedule.attempts.size());

    for (int i = 0; i < total; ++i) {
        const auto& step = schedule.attempts[i];

        if (step.pauseBefore.count() > 0) {
            std::cout << "[RetryPolicy] " << label << ": retrying in " << step.pauseBefore.count()
                      << " ms (attempt " << (i + 1) << "/" << total
                      << ", timeout " << step.timeout.count() << " ms)\n";
            m_sleep(step.pauseBefore);
        }

        ExecutionResult result = m_executor.execute(command, step.timeout);
        outcome.attemptsUsed = i + 1;

        if (m_attemptCallback) {
            m_attemptCallback(i + 1, total, result);
        }

        outcome.response = result.response;
        if (result.ok()) {
            outcome.success = true;
            outcome.kind = ErrorKind::None;
            outcome.message.clear();
            return outcome;
        }

        outcome.kind = result.kind;
        outcome.message = result.message;

        bool retryable = isRetryable(result.kind) ||
            (result.kind == ErrorKind::Application && command.retryOnApplicationError());
        if (!retryable) {
            break;
        }
    }

    std::cerr << "[RetryPolicy] " << label << ": failed after " << outcome.attemptsUsed
              << " attempt(s): " << errorKindName(outcome.kind) << "\n";
    return outcome;
}

} // namespace blendpipe
