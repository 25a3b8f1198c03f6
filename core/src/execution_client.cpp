#include <blendpipe/execution_client.h>
#include <iostream>

namespace blendpipe {

using network::Clock;
using network::Connection;

ExecutionClient::ExecutionClient(const ClientConfig& config)
    : m_channel(network::Endpoint{config.host, config.port}) {}

ExecutionClient::ExecutionClient(network::TcpChannel channel)
    : m_channel(std::move(channel)) {}

ExecutionResult ExecutionClient::execute(const Command& command, Millis timeout) {
    ExecutionResult out;
    const auto start = Clock::now();
    const auto deadline = start + timeout;
    const std::string label = command.describe();

    auto finish = [&](ErrorKind kind, std::string message) {
        out.kind = kind;
        out.message = std::move(message);
        out.elapsed = std::chrono::duration_cast<Millis>(Clock::now() - start);
        if (out.ok()) {
            std::cout << "[ExecutionClient] " << label << ": success (" << out.elapsed.count() << " ms)\n";
        } else {
            std::cerr << "[ExecutionClient] " << label << ": " << errorKindName(kind)
                      << ": " << out.message << " (" << out.elapsed.count() << " ms)\n";
        }
        return out;
    };

    EncodeResult encoded = encode(command);
    if (!encoded.ok()) {
        return finish(ErrorKind::InvalidCommand, encoded.error);
    }

    Connection connection;
    network::ChannelStatus status = m_channel.open(connection, deadline);
    if (!status.ok()) {
        return finish(status.kind, status.message);
    }

    status = m_channel.send(connection, encoded.bytes, deadline);
    if (!status.ok()) {
        return finish(status.kind, status.message);
    }

    std::string reply;
    status = m_channel.receive(connection, deadline, reply);
    connection.close();
    if (!status.ok()) {
        return finish(status.kind, status.message);
    }

    DecodeResult decoded = decode(reply);
    if (!decoded.ok()) {
        return finish(ErrorKind::Decode, decoded.error);
    }

    out.response = std::move(decoded.response);
    if (!out.response->succeeded()) {
        std::string message = out.response->message.value_or("");
        if (message.empty()) {
            message = "host reported an error without a message";
        }
        return finish(ErrorKind::Application, message);
    }
    return finish(ErrorKind::None, "");
}

network::ChannelStatus ExecutionClient::ping(Millis timeout) {
    return m_channel.probe(Clock::now() + timeout);
}

} // namespace blendpipe
