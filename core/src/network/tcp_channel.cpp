#include <blendpipe/network/tcp_channel.h>
#include <blendpipe/protocol.h>
#include <climits>
#include <cstring>
#include <vector>

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace blendpipe::network {

// Milliseconds left until the deadline, rounded up so poll() never wakes
// before it; 0 once the deadline has passed.
static int remainingMs(Deadline deadline) {
    auto now = Clock::now();
    if (now >= deadline) return 0;
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
    return left > INT_MAX ? INT_MAX : static_cast<int>(left);
}

static std::string errnoText(int err) {
    return std::strerror(err);
}

static bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

// Wait until fd is ready for `events` or the deadline passes.
// Returns 1 when ready, 0 on deadline, -1 on error (errno set).
static int waitReady(int fd, short events, Deadline deadline) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;

    while (true) {
        int left = remainingMs(deadline);
        if (left == 0) return 0;

        pfd.revents = 0;
        int ready = poll(&pfd, 1, left);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (ready > 0) return 1;
    }
}

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------

Connection::~Connection() {
    close();
}

Connection::Connection(Connection&& other) noexcept : m_fd(other.m_fd) {
    other.m_fd = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

void Connection::close() {
    if (m_fd != -1) {
        ::close(m_fd);
        m_fd = -1;
    }
}

// -----------------------------------------------------------------------------
// TcpChannel
// -----------------------------------------------------------------------------

TcpChannel::TcpChannel(Endpoint endpoint, size_t readBufferSize, size_t maxMessageBytes)
    : m_endpoint(std::move(endpoint))
    , m_readBufferSize(readBufferSize > 0 ? readBufferSize : 1)
    , m_maxMessageBytes(maxMessageBytes) {}

ChannelStatus TcpChannel::open(Connection& connection, Deadline deadline) const {
    connection.close();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addresses = nullptr;
    std::string service = std::to_string(m_endpoint.port);
    int gai = getaddrinfo(m_endpoint.host.c_str(), service.c_str(), &hints, &addresses);
    if (gai != 0) {
        return ChannelStatus::failure(ErrorKind::Transport,
            "cannot resolve " + m_endpoint.toString() + ": " + gai_strerror(gai));
    }

    ChannelStatus last = ChannelStatus::failure(ErrorKind::Transport,
        "no usable address for " + m_endpoint.toString());

    for (struct addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
        Connection candidate(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!candidate.isOpen()) {
            last = ChannelStatus::failure(ErrorKind::Transport,
                "socket() failed: " + errnoText(errno));
            continue;
        }
        fcntl(candidate.fd(), F_SETFD, FD_CLOEXEC);
        if (!setNonBlocking(candidate.fd())) {
            last = ChannelStatus::failure(ErrorKind::Transport,
                "cannot make socket non-blocking: " + errnoText(errno));
            continue;
        }
#ifdef SO_NOSIGPIPE
        int noSigPipe = 1;
        setsockopt(candidate.fd(), SOL_SOCKET, SO_NOSIGPIPE, &noSigPipe, sizeof(noSigPipe));
#endif

        if (::connect(candidate.fd(), ai->ai_addr, ai->ai_addrlen) == 0) {
            connection = std::move(candidate);
            break;
        }
        if (errno != EINPROGRESS) {
            last = ChannelStatus::failure(ErrorKind::Transport,
                "connect to " + m_endpoint.toString() + " failed: " + errnoText(errno));
            continue;
        }

        int ready = waitReady(candidate.fd(), POLLOUT, deadline);
        if (ready == 0) {
            last = ChannelStatus::failure(ErrorKind::Timeout,
                "timed out connecting to " + m_endpoint.toString());
            break;
        }
        if (ready < 0) {
            last = ChannelStatus::failure(ErrorKind::Transport,
                "poll() failed while connecting: " + errnoText(errno));
            continue;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(candidate.fd(), SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
            soError = errno;
        }
        if (soError != 0) {
            last = ChannelStatus::failure(ErrorKind::Transport,
                "connect to " + m_endpoint.toString() + " failed: " + errnoText(soError));
            continue;
        }

        connection = std::move(candidate);
        break;
    }

    freeaddrinfo(addresses);

    if (!connection.isOpen()) {
        return last;
    }
    return ChannelStatus::success();
}

ChannelStatus TcpChannel::send(Connection& connection, std::string_view bytes, Deadline deadline) const {
    if (!connection.isOpen()) {
        return ChannelStatus::failure(ErrorKind::Transport, "send on a closed connection");
    }

    size_t offset = 0;
    while (offset < bytes.size()) {
        ssize_t sent = ::send(connection.fd(), bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
        if (sent > 0) {
            offset += static_cast<size_t>(sent);
            continue;
        }
        if (sent < 0 && errno == EINTR) continue;
        if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            int ready = waitReady(connection.fd(), POLLOUT, deadline);
            if (ready == 0) {
                return ChannelStatus::failure(ErrorKind::Timeout,
                    "timed out sending to " + m_endpoint.toString());
            }
            if (ready < 0) {
                return ChannelStatus::failure(ErrorKind::Transport,
                    "poll() failed while sending: " + errnoText(errno));
            }
            continue;
        }
        return ChannelStatus::failure(ErrorKind::Transport,
            "send to " + m_endpoint.toString() + " failed: " + errnoText(errno));
    }
    return ChannelStatus::success();
}

ChannelStatus TcpChannel::receive(Connection& connection, Deadline deadline, std::string& message) const {
    message.clear();
    if (!connection.isOpen()) {
        return ChannelStatus::failure(ErrorKind::Transport, "receive on a closed connection");
    }

    std::string buffer;
    std::vector<char> chunk(m_readBufferSize);
    MessageFramer framer;

    while (true) {
        int ready = waitReady(connection.fd(), POLLIN, deadline);
        if (ready == 0) {
            return ChannelStatus::failure(ErrorKind::Timeout,
                "no complete response from " + m_endpoint.toString() + " before the deadline (" +
                std::to_string(buffer.size()) + " bytes received)");
        }
        if (ready < 0) {
            return ChannelStatus::failure(ErrorKind::Transport,
                "poll() failed while receiving: " + errnoText(errno));
        }

        ssize_t received = ::recv(connection.fd(), chunk.data(), chunk.size(), 0);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return ChannelStatus::failure(ErrorKind::Transport,
                "receive from " + m_endpoint.toString() + " failed: " + errnoText(errno));
        }

        if (received == 0) {
            // Host closed the connection. Hand over whatever arrived and let the
            // decoder judge it; nothing at all is a transport failure.
            if (buffer.find_first_not_of(" \t\r\n") == std::string::npos) {
                return ChannelStatus::failure(ErrorKind::Transport,
                    "connection closed by " + m_endpoint.toString() + " without a response");
            }
            message = std::move(buffer);
            return ChannelStatus::success();
        }

        buffer.append(chunk.data(), static_cast<size_t>(received));

        size_t end = framer.feed(buffer);
        if (end > 0) {
            message = buffer.substr(0, end);
            return ChannelStatus::success();
        }

        if (buffer.size() > m_maxMessageBytes) {
            return ChannelStatus::failure(ErrorKind::Transport,
                "response from " + m_endpoint.toString() + " exceeds " +
                std::to_string(m_maxMessageBytes) + " bytes");
        }
    }
}

ChannelStatus TcpChannel::probe(Deadline deadline) const {
    Connection connection;
    return open(connection, deadline);
}

} // namespace blendpipe::network
