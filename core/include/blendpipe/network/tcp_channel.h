#pragma once

/**
 * @file tcp_channel.h
 * @brief Deadline-bounded TCP transport to the host's script server
 *
 * Byte-level only: the channel knows where a message ends (see
 * MessageFramer) but not what it means. Every call takes an absolute
 * deadline and never blocks past it.
 *
 * @par Example
 * @code
 * TcpChannel channel({"localhost", 9876});
 * auto deadline = Clock::now() + std::chrono::seconds(5);
 * Connection conn;
 * if (channel.open(conn, deadline).ok() &&
 *     channel.send(conn, request, deadline).ok()) {
 *     std::string reply;
 *     channel.receive(conn, deadline, reply);
 * }
 * // conn closes when it goes out of scope
 * @endcode
 */

#include <blendpipe/errors.h>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace blendpipe::network {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/// Host and port of the script server
struct Endpoint {
    std::string host = "localhost";
    int port = 9876;

    std::string toString() const { return host + ":" + std::to_string(port); }
};

/// Failure of a channel call; kind is None on success
struct ChannelStatus {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static ChannelStatus success() { return {}; }
    static ChannelStatus failure(ErrorKind k, std::string msg) { return {k, std::move(msg)}; }
};

/**
 * @brief Exclusive owner of one connected socket
 *
 * Move-only. The descriptor is closed by the destructor, so every exit path
 * of a round trip releases it.
 */
class Connection {
public:
    Connection() = default;
    explicit Connection(int fd) : m_fd(fd) {}
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    bool isOpen() const { return m_fd != -1; }
    int fd() const { return m_fd; }

    /// @brief Close the socket now (idempotent)
    void close();

private:
    int m_fd = -1;
};

/**
 * @brief Opens connections to a fixed endpoint and moves bytes over them
 */
class TcpChannel {
public:
    /// Largest response accepted before the read is abandoned
    static constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 16 * 1024 * 1024;

    /**
     * @param endpoint Where the host listens
     * @param readBufferSize Bytes requested per recv() call
     * @param maxMessageBytes Responses longer than this fail instead of being truncated
     */
    explicit TcpChannel(Endpoint endpoint,
                        size_t readBufferSize = 8192,
                        size_t maxMessageBytes = DEFAULT_MAX_MESSAGE_BYTES);

    /// @brief Connect, trying every resolved address, until @p deadline
    ChannelStatus open(Connection& connection, Deadline deadline) const;

    /// @brief Write all of @p bytes before @p deadline
    ChannelStatus send(Connection& connection, std::string_view bytes, Deadline deadline) const;

    /**
     * @brief Read one complete message
     *
     * Loops over partial reads until the framer finds the end of a message,
     * or the host closes the connection after writing something.
     */
    ChannelStatus receive(Connection& connection, Deadline deadline, std::string& message) const;

    /// @brief Open and immediately close a connection (reachability check)
    ChannelStatus probe(Deadline deadline) const;

    const Endpoint& endpoint() const { return m_endpoint; }
    size_t readBufferSize() const { return m_readBufferSize; }
    size_t maxMessageBytes() const { return m_maxMessageBytes; }

private:
    Endpoint m_endpoint;
    size_t m_readBufferSize;
    size_t m_maxMessageBytes;
};

} // namespace blendpipe::network
