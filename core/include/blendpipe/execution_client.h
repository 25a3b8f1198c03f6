#pragma once

/**
 * @file execution_client.h
 * @brief One command, one connection, one response
 */

#include <blendpipe/config.h>
#include <blendpipe/errors.h>
#include <blendpipe/protocol.h>
#include <blendpipe/network/tcp_channel.h>
#include <optional>
#include <string>

namespace blendpipe {

/// Outcome of a single round trip
struct ExecutionResult {
    ErrorKind kind = ErrorKind::None;
    std::optional<Response> response;   ///< Set whenever the reply decoded (success or application error)
    std::string message;                ///< Failure description; empty on success
    Millis elapsed{0};

    bool ok() const { return kind == ErrorKind::None; }
};

/**
 * @brief Anything that can run a Command against the host
 *
 * RetryPolicy and Pipeline only see this interface. At most one command is
 * in flight at a time.
 */
class Executor {
public:
    virtual ~Executor() = default;

    /// @brief Run @p command, giving up once @p timeout has elapsed
    virtual ExecutionResult execute(const Command& command, Millis timeout) = 0;

    /// @brief Check that the host accepts connections at all
    virtual network::ChannelStatus ping(Millis timeout) = 0;
};

/**
 * @brief Socket-backed Executor
 *
 * Each execute() opens its own connection, sends the encoded command,
 * waits for the reply with the timeout as an absolute deadline covering
 * connect, send and receive, then closes the connection on every path.
 *
 * Failure classification:
 * - refused / unreachable / reset: Transport
 * - deadline passed: Timeout
 * - reply bytes that do not decode: Decode
 * - decoded reply with status "error": Application (returned, not retried here)
 * - command that cannot be encoded: InvalidCommand (no connection is opened)
 */
class ExecutionClient : public Executor {
public:
    explicit ExecutionClient(const ClientConfig& config);
    explicit ExecutionClient(network::TcpChannel channel);

    ExecutionResult execute(const Command& command, Millis timeout) override;
    network::ChannelStatus ping(Millis timeout) override;

    const network::Endpoint& endpoint() const { return m_channel.endpoint(); }

private:
    network::TcpChannel m_channel;
};

} // namespace blendpipe
