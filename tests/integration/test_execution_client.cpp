/**
 * @file test_execution_client.cpp
 * @brief ExecutionClient, RetryPolicy and Pipeline against a real socket
 *
 * Every test talks to an in-process FakeHost on 127.0.0.1, so these cover
 * connection handling, framing and deadline enforcement end to end.
 */

#include <catch2/catch_test_macros.hpp>
#include <blendpipe/execution_client.h>
#include <blendpipe/pipeline.h>
#include <blendpipe/retry_policy.h>
#include "../support/fake_host.h"
#include <nlohmann/json.hpp>

using namespace blendpipe;
using namespace blendpipe::testing;
using json = nlohmann::json;

namespace {

ExecutionClient clientFor(int port, size_t readBufferSize = 8192,
                          size_t maxMessageBytes = network::TcpChannel::DEFAULT_MAX_MESSAGE_BYTES) {
    return ExecutionClient(network::TcpChannel(network::Endpoint{"127.0.0.1", port},
                                               readBufferSize, maxMessageBytes));
}

FakeHost::Handler replyWith(std::vector<std::string> chunks) {
    return [chunks](const std::string&) { return chunks; };
}

FakeHost::Handler silent() {
    return [](const std::string&) { return std::vector<std::string>{}; };
}

} // namespace

TEST_CASE("ExecutionClient round trip", "[integration][client]") {
    FakeHost host(replyWith({R"({"status": "success", "result": "ok"})"}));
    ExecutionClient client = clientFor(host.port());

    ExecutionResult result = client.execute(Command::code("print('x')", "Probe"), Millis(2000));

    REQUIRE(result.ok());
    REQUIRE(result.response.has_value());
    REQUIRE(result.response->succeeded());
    REQUIRE(result.response->result == std::optional<std::string>("ok"));

    auto requests = host.requests();
    REQUIRE(requests.size() == 1);
    json request = json::parse(requests[0]);
    REQUIRE(request["type"] == "execute_code");
    REQUIRE(request["params"]["code"] == "print('x')");
}

TEST_CASE("ExecutionClient reassembles fragmented responses", "[integration][client][framing]") {
    FakeHost host(replyWith({
        R"({"status": "succ)",
        R"(ess", "result": "brace } and )",
        R"(quote \" inside"})",
    }));
    host.chunkGap(Millis(30));
    ExecutionClient client = clientFor(host.port());

    ExecutionResult result = client.execute(Command::code("x"), Millis(3000));

    REQUIRE(result.ok());
    REQUIRE(result.response->result == std::optional<std::string>("brace } and quote \" inside"));
}

TEST_CASE("ExecutionClient reads responses larger than its buffer", "[integration][client][framing]") {
    const std::string big(100000, 'a');
    FakeHost host(replyWith({json{{"status", "success"}, {"result", big}}.dump()}));
    ExecutionClient client = clientFor(host.port(), 16);

    ExecutionResult result = client.execute(Command::code("x"), Millis(5000));

    REQUIRE(result.ok());
    REQUIRE(result.response->result->size() == big.size());
}

TEST_CASE("ExecutionClient delivers payloads byte for byte", "[integration][client]") {
    FakeHost host([](const std::string& request) {
        json parsed = json::parse(request);
        json reply = {{"status", "success"}, {"result", parsed["params"]["code"]}};
        return std::vector<std::string>{reply.dump()};
    });
    ExecutionClient client = clientFor(host.port());

    const std::string payload =
        "import bpy\n"
        "s = '{\"status\": \"error\"}'\r\n"
        "\tpath = 'C:\\\\temp\\\\'\n"
        "brackets = [[{}]]}}\n";

    ExecutionResult result = client.execute(Command::code(payload), Millis(2000));

    REQUIRE(result.ok());
    REQUIRE(result.response->result == std::optional<std::string>(payload));
}

TEST_CASE("ExecutionClient enforces its deadline", "[integration][client][timeout]") {
    FakeHost host(silent());
    ExecutionClient client = clientFor(host.port());
    const Millis timeout(300);

    ExecutionResult result = client.execute(Command::code("import time; time.sleep(60)"), timeout);

    REQUIRE(result.kind == ErrorKind::Timeout);
    REQUIRE_FALSE(result.response.has_value());
    REQUIRE(result.elapsed >= timeout);
    REQUIRE(result.elapsed < timeout + Millis(1000));
}

TEST_CASE("RetryPolicy gives up on a silent host", "[integration][retry][timeout]") {
    FakeHost host(silent());
    ExecutionClient client = clientFor(host.port());
    ClientConfig config;
    RetryPolicy policy(client, config);
    policy.setSleepFunction([](Millis) {});

    Outcome outcome = policy.run(Command::code("x", "Hang"), 2, Millis(100), false);

    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.kind == ErrorKind::Timeout);
    REQUIRE(outcome.attemptsUsed == 2);
    REQUIRE(host.connections() == 2);
}

TEST_CASE("ExecutionClient classifies connection failures", "[integration][client][transport]") {
    SECTION("nothing listening") {
        ExecutionClient client = clientFor(FakeHost::closedPort());
        ExecutionResult result = client.execute(Command::code("x"), Millis(2000));
        REQUIRE(result.kind == ErrorKind::Transport);
        REQUIRE_FALSE(result.response.has_value());
    }

    SECTION("host closes without answering") {
        FakeHost host(replyWith({""}));
        host.closeAfterReply(true);
        ExecutionClient client = clientFor(host.port());
        ExecutionResult result = client.execute(Command::code("x"), Millis(2000));
        REQUIRE(result.kind == ErrorKind::Transport);
    }

    SECTION("host closes mid-response") {
        FakeHost host(replyWith({R"({"status": "succ)"}));
        host.closeAfterReply(true);
        ExecutionClient client = clientFor(host.port());
        ExecutionResult result = client.execute(Command::code("x"), Millis(2000));
        REQUIRE(result.kind == ErrorKind::Decode);
    }

    SECTION("oversized response") {
        FakeHost host(replyWith({R"({"status": "success", "result": ")" + std::string(512, 'z')}));
        ExecutionClient client = clientFor(host.port(), 64, 256);
        ExecutionResult result = client.execute(Command::code("x"), Millis(2000));
        REQUIRE(result.kind == ErrorKind::Transport);
        REQUIRE(result.message.find("exceeds") != std::string::npos);
    }
}

TEST_CASE("ExecutionClient reports host errors", "[integration][client][application]") {
    SECTION("with message") {
        FakeHost host(replyWith({R"({"status": "error", "message": "NameError: name 'foo' is not defined"})"}));
        ExecutionClient client = clientFor(host.port());
        ExecutionResult result = client.execute(Command::code("foo"), Millis(2000));

        REQUIRE(result.kind == ErrorKind::Application);
        REQUIRE(result.message == "NameError: name 'foo' is not defined");
        REQUIRE(result.response.has_value());
        REQUIRE_FALSE(result.response->succeeded());
    }

    SECTION("without message") {
        FakeHost host(replyWith({R"({"status": "error"})"}));
        ExecutionClient client = clientFor(host.port());
        ExecutionResult result = client.execute(Command::code("foo"), Millis(2000));

        REQUIRE(result.kind == ErrorKind::Application);
        REQUIRE_FALSE(result.message.empty());
    }

    SECTION("not retried by the policy") {
        FakeHost host(replyWith({R"({"status": "error", "message": "bad"})"}));
        ExecutionClient client = clientFor(host.port());
        ClientConfig config;
        RetryPolicy policy(client, config);
        policy.setSleepFunction([](Millis) {});

        Outcome outcome = policy.run(Command::code("x"), 3, Millis(2000), false);
        REQUIRE(outcome.kind == ErrorKind::Application);
        REQUIRE(outcome.attemptsUsed == 1);
        REQUIRE(host.connections() == 1);
    }
}

TEST_CASE("ExecutionClient rejects unsendable commands without connecting", "[integration][client]") {
    FakeHost host(replyWith({R"({"status": "success"})"}));
    ExecutionClient client = clientFor(host.port());

    ExecutionResult result = client.execute(Command::code(""), Millis(2000));

    REQUIRE(result.kind == ErrorKind::InvalidCommand);
    REQUIRE(host.connections() == 0);
}

TEST_CASE("ExecutionClient ping", "[integration][client][preflight]") {
    SECTION("reachable") {
        FakeHost host(silent());
        ExecutionClient client = clientFor(host.port());
        REQUIRE(client.ping(Millis(1000)).ok());
    }

    SECTION("unreachable") {
        ExecutionClient client = clientFor(FakeHost::closedPort());
        network::ChannelStatus status = client.ping(Millis(1000));
        REQUIRE(status.kind == ErrorKind::Transport);
    }
}

TEST_CASE("Pipeline against an absent host", "[integration][pipeline]") {
    ExecutionClient client = clientFor(FakeHost::closedPort());
    ClientConfig config;
    RetryPolicy policy(client, config);
    policy.setSleepFunction([](Millis) {});

    Stage stage = Stage::inlineCode("Setup", "import bpy");
    stage.attempts = 3;
    stage.timeout = Millis(500);
    Pipeline pipeline({stage, Stage::inlineCode("Render", "pass")}, policy);

    REQUIRE_FALSE(pipeline.preflight(Millis(500)).ok());

    PipelineResult result = pipeline.run();
    REQUIRE(result.state == PipelineState::Failed);
    REQUIRE(result.stages.size() == 1);
    REQUIRE(result.haltedStage()->kind == ErrorKind::Transport);
    REQUIRE(result.haltedStage()->attemptsUsed == 3);
}

TEST_CASE("Pipeline against a live host", "[integration][pipeline]") {
    FakeHost host([](const std::string& request) {
        json parsed = json::parse(request);
        std::string label = parsed["params"].value("label", std::string());
        return std::vector<std::string>{json{{"status", "success"}, {"result", label + " done"}}.dump()};
    });
    ExecutionClient client = clientFor(host.port());
    ClientConfig config;
    RetryPolicy policy(client, config);

    Pipeline pipeline({
        Stage::inlineCode("Scene Clearing", "pass"),
        Stage::inlineCode("Sorting Bucket", "pass"),
        Stage::hostFile("Physics", "/host/animate.py"),
    }, policy);

    REQUIRE(pipeline.preflight(Millis(1000)).ok());
    PipelineResult result = pipeline.run();

    REQUIRE(result.succeeded());
    REQUIRE(result.stages.size() == 3);
    REQUIRE(result.stages[2].result == std::optional<std::string>("Physics done"));

    auto requests = host.requests();
    REQUIRE(requests.size() == 3);
    REQUIRE(json::parse(requests[2])["type"] == "execute_file");
}
