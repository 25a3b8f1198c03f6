#pragma once

/**
 * @file config.h
 * @brief Connection and retry configuration
 *
 * One ClientConfig is built per process invocation (defaults, then the
 * pipeline file, then environment, then command-line flags) and handed to
 * the ExecutionClient and RetryPolicy constructors. Nothing here is global.
 */

#include <chrono>
#include <string>

namespace blendpipe {

using Millis = std::chrono::milliseconds;

/// Default port of the host's script server
constexpr int DEFAULT_PORT = 9876;

/// Backoff knobs used by RetryPolicy
struct BackoffConfig {
    double timeoutGrowth = 1.5;        ///< Per-attempt timeout multiplier (> 1)
    Millis maxTimeout{120000};         ///< Cap for any single attempt's timeout
    Millis initialPause{500};          ///< Pause before the second attempt
    double pauseGrowth = 2.0;          ///< Per-attempt pause multiplier
    Millis maxPause{8000};             ///< Cap for any single pause

    // Debug mode scaling. Applied to the same algorithm, never increases a value.
    double debugTimeoutScale = 0.25;   ///< Timeouts and pauses are multiplied by this
    Millis debugMinTimeout{1000};      ///< Scaled timeouts do not drop below this (unless already lower)
    int debugMaxAttempts = 2;          ///< Attempts are clamped to this
};

/// Endpoint, deadlines and retry budget for talking to the host
struct ClientConfig {
    std::string host = "localhost";
    int port = DEFAULT_PORT;
    Millis baseTimeout{30000};         ///< Timeout of the first attempt
    int maxAttempts = 3;               ///< Attempts per command (>= 1)
    bool debug = false;                ///< Fast local iteration: fewer attempts, shorter deadlines
    Millis probeTimeout{2000};         ///< Deadline for the pre-flight reachability check
    BackoffConfig backoff;

    /// @brief Validate ranges; returns an empty string when the config is usable
    std::string validate() const;
};

} // namespace blendpipe
