#pragma once

/**
 * @file errors.h
 * @brief Failure taxonomy shared by the client, retry policy and pipeline
 */

#include <string>

namespace blendpipe {

/// Why a command did not produce a successful response
enum class ErrorKind {
    None,            ///< No error
    InvalidCommand,  ///< Rejected before any network call (bad payload, unreadable script)
    Transport,       ///< Socket-level failure: refused, reset, unreachable
    Timeout,         ///< Deadline exceeded while connecting or awaiting bytes
    Decode,          ///< Bytes received but not a well-formed response
    Application      ///< Well-formed response with status "error"
};

/// @brief Short display name ("TransportError", "TimeoutError", ...)
const char* errorKindName(ErrorKind kind);

/// @brief True for failures that re-sending the same command may fix
///
/// Application errors are not retryable here: whether a script with side
/// effects may run twice is decided per command.
bool isRetryable(ErrorKind kind);

} // namespace blendpipe
