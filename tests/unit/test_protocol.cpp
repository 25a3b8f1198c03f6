/**
 * @file test_protocol.cpp
 * @brief Unit tests for command encoding, response decoding and framing
 */

#include <catch2/catch_test_macros.hpp>
#include <blendpipe/protocol.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace blendpipe;
using json = nlohmann::json;
namespace fs = std::filesystem;

// =============================================================================
// Encoding
// =============================================================================

TEST_CASE("encode produces one JSON request line", "[protocol][encode]") {
    Command cmd = Command::code("import bpy\nprint('hi')", "Scene Clearing");
    EncodeResult encoded = encode(cmd);

    REQUIRE(encoded.ok());
    REQUIRE(encoded.bytes.back() == '\n');
    REQUIRE(encoded.bytes.find('\n') == encoded.bytes.size() - 1);

    json request = json::parse(encoded.bytes);
    REQUIRE(request["type"] == "execute_code");
    REQUIRE(request["params"]["code"] == "import bpy\nprint('hi')");
    REQUIRE(request["params"]["label"] == "Scene Clearing");
}

TEST_CASE("encode preserves delimiter-heavy payloads", "[protocol][encode]") {
    const std::string payload =
        "s = \"{\\\"status\\\": \\\"error\\\"}\"\n"
        "d = {'a': [1, 2, {'b': '}'}]}\r\n"
        "\ttab = '\\\\'\n"
        "unicode = 'w\xC3\xBCrfel \xE2\x9C\x85'\n"
        "}}]]\"\"\n";

    EncodeResult encoded = encode(Command::code(payload));
    REQUIRE(encoded.ok());

    json request = json::parse(encoded.bytes);
    REQUIRE(request["params"]["code"].get<std::string>() == payload);
    REQUIRE_FALSE(request["params"].contains("label"));
}

TEST_CASE("encode uses path for execute_file", "[protocol][encode]") {
    EncodeResult encoded = encode(Command::file("/tmp/render.py", "Render"));
    REQUIRE(encoded.ok());

    json request = json::parse(encoded.bytes);
    REQUIRE(request["type"] == "execute_file");
    REQUIRE(request["params"]["path"] == "/tmp/render.py");
    REQUIRE_FALSE(request["params"].contains("code"));
}

TEST_CASE("encode rejects commands that cannot be sent", "[protocol][encode]") {
    SECTION("empty code") {
        EncodeResult encoded = encode(Command::code(""));
        REQUIRE_FALSE(encoded.ok());
        REQUIRE(encoded.bytes.empty());
    }

    SECTION("empty path") {
        REQUIRE_FALSE(encode(Command::file("")).ok());
    }

    SECTION("payload that is not UTF-8") {
        std::string binary = "print('x')\xFF\xFE";
        EncodeResult encoded = encode(Command::code(binary));
        REQUIRE_FALSE(encoded.ok());
        REQUIRE(encoded.error.find("UTF-8") != std::string::npos);
    }
}

TEST_CASE("Command accessors", "[protocol][command]") {
    Command cmd = Command::code("x = 1", "Setup");

    SECTION("defaults") {
        REQUIRE(cmd.kind() == CommandKind::ExecuteCode);
        REQUIRE(cmd.payload() == "x = 1");
        REQUIRE(cmd.label() == "Setup");
        REQUIRE_FALSE(cmd.retryOnApplicationError());
    }

    SECTION("withApplicationRetry returns a modified copy") {
        Command retryable = cmd.withApplicationRetry(true);
        REQUIRE(retryable.retryOnApplicationError());
        REQUIRE_FALSE(cmd.retryOnApplicationError());
        REQUIRE(retryable.payload() == cmd.payload());
    }

    SECTION("describe falls back when there is no label") {
        REQUIRE(Command::code("x").describe() == "code");
        REQUIRE(Command::file("/a/b.py").describe() == "/a/b.py");
    }
}

TEST_CASE("Command::fromScriptFile", "[protocol][command]") {
    fs::path dir = fs::temp_directory_path() / "blendpipe_test_protocol";
    fs::create_directories(dir);
    fs::path script = dir / "clear_scene.py";
    {
        std::ofstream out(script, std::ios::binary);
        out << "import bpy\nbpy.ops.object.select_all(action='SELECT')\n";
    }

    SECTION("reads the file and labels it with the file name") {
        std::string error;
        auto cmd = Command::fromScriptFile(script, "", error);
        REQUIRE(cmd.has_value());
        REQUIRE(cmd->kind() == CommandKind::ExecuteCode);
        REQUIRE(cmd->label() == "clear_scene.py");
        REQUIRE(cmd->payload() == "import bpy\nbpy.ops.object.select_all(action='SELECT')\n");
    }

    SECTION("explicit label wins") {
        std::string error;
        auto cmd = Command::fromScriptFile(script, "Scene Clearing", error);
        REQUIRE(cmd.has_value());
        REQUIRE(cmd->label() == "Scene Clearing");
    }

    SECTION("missing file reports an error") {
        std::string error;
        auto cmd = Command::fromScriptFile(dir / "missing.py", "", error);
        REQUIRE_FALSE(cmd.has_value());
        REQUIRE(error.find("not found") != std::string::npos);
    }

    fs::remove_all(dir);
}

// =============================================================================
// Decoding
// =============================================================================

TEST_CASE("decode success responses", "[protocol][decode]") {
    SECTION("with result") {
        DecodeResult decoded = decode(R"({"status": "success", "result": "ok"})");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.response->succeeded());
        REQUIRE(decoded.response->result == std::optional<std::string>("ok"));
        REQUIRE_FALSE(decoded.response->message.has_value());
    }

    SECTION("optional fields absent") {
        DecodeResult decoded = decode(R"({"status": "success"})");
        REQUIRE(decoded.ok());
        REQUIRE_FALSE(decoded.response->result.has_value());
        REQUIRE_FALSE(decoded.response->message.has_value());
    }

    SECTION("null result is treated as absent") {
        DecodeResult decoded = decode(R"({"status": "success", "result": null})");
        REQUIRE(decoded.ok());
        REQUIRE_FALSE(decoded.response->result.has_value());
    }

    SECTION("wrapped execute_code output is unwrapped") {
        DecodeResult decoded = decode(R"({"status": "success", "result": {"executed": true, "result": "42\n"}})");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.response->result == std::optional<std::string>("42\n"));
    }

    SECTION("structured result keeps its JSON text") {
        DecodeResult decoded = decode(R"({"status": "success", "result": {"objects": 3}})");
        REQUIRE(decoded.ok());
        REQUIRE(json::parse(*decoded.response->result) == json{{"objects", 3}});
    }

    SECTION("trailing newline is accepted") {
        REQUIRE(decode("{\"status\": \"success\"}\n").ok());
    }
}

TEST_CASE("decode error responses", "[protocol][decode]") {
    SECTION("with message") {
        DecodeResult decoded = decode(R"({"status": "error", "message": "NameError: foo"})");
        REQUIRE(decoded.ok());
        REQUIRE_FALSE(decoded.response->succeeded());
        REQUIRE(decoded.response->message == std::optional<std::string>("NameError: foo"));
    }

    SECTION("without message") {
        DecodeResult decoded = decode(R"({"status": "error"})");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.response->status == ResponseStatus::Failure);
        REQUIRE_FALSE(decoded.response->message.has_value());
    }
}

TEST_CASE("decode never invents a success", "[protocol][decode]") {
    SECTION("malformed bytes") {
        DecodeResult decoded = decode("not json at all");
        REQUIRE_FALSE(decoded.ok());
        REQUIRE_FALSE(decoded.error.empty());
    }

    SECTION("partial message") {
        REQUIRE_FALSE(decode(R"({"status": "succ)").ok());
    }

    SECTION("empty input") {
        REQUIRE_FALSE(decode("").ok());
    }

    SECTION("missing status") {
        REQUIRE_FALSE(decode(R"({"result": "ok"})").ok());
    }

    SECTION("non-string status") {
        REQUIRE_FALSE(decode(R"({"status": true})").ok());
    }

    SECTION("unknown status") {
        DecodeResult decoded = decode(R"({"status": "maybe"})");
        REQUIRE_FALSE(decoded.ok());
        REQUIRE(decoded.error.find("maybe") != std::string::npos);
    }

    SECTION("not an object") {
        REQUIRE_FALSE(decode(R"(["success"])").ok());
    }
}

// =============================================================================
// Framing
// =============================================================================

TEST_CASE("findMessageEnd", "[protocol][framing]") {
    SECTION("incomplete object needs more bytes") {
        REQUIRE(findMessageEnd(R"({"status": "success", "res)") == 0);
        REQUIRE(findMessageEnd("") == 0);
        REQUIRE(findMessageEnd("   \n") == 0);
    }

    SECTION("complete object") {
        std::string msg = R"({"status": "success"})";
        REQUIRE(findMessageEnd(msg) == msg.size());
    }

    SECTION("braces and quotes inside strings are ignored") {
        std::string msg = R"({"status": "success", "result": "}{ \"}\" ]["})";
        REQUIRE(findMessageEnd(msg) == msg.size());
        REQUIRE(findMessageEnd(msg.substr(0, msg.size() - 1)) == 0);
    }

    SECTION("escaped backslash before closing quote") {
        std::string msg = R"({"result": "C:\\"})";
        REQUIRE(findMessageEnd(msg) == msg.size());
    }

    SECTION("stops after the first of two messages") {
        std::string first = R"({"status": "success"})";
        std::string both = first + "\n" + R"({"status": "error"})";
        REQUIRE(findMessageEnd(both) == first.size());
    }

    SECTION("leading whitespace is part of the message") {
        std::string msg = "\r\n  {\"status\": \"success\"}";
        REQUIRE(findMessageEnd(msg) == msg.size());
    }

    SECTION("non-JSON text ends at newline") {
        REQUIRE(findMessageEnd("Traceback (most recent call last)") == 0);
        REQUIRE(findMessageEnd("Traceback\nmore") == std::string("Traceback\n").size());
    }
}

TEST_CASE("MessageFramer scans appended bytes only", "[protocol][framing]") {
    SECTION("escape split across reads") {
        MessageFramer framer;
        std::string buffer = R"({"result": "a\)";
        REQUIRE(framer.feed(buffer) == 0);
        buffer += R"("}"})";
        REQUIRE(framer.feed(buffer) == buffer.size());
    }

    SECTION("leading whitespace split across reads") {
        MessageFramer framer;
        std::string buffer = "\r\n";
        REQUIRE(framer.feed(buffer) == 0);
        buffer += "  {\"status\": ";
        REQUIRE(framer.feed(buffer) == 0);
        buffer += "\"success\"}";
        REQUIRE(framer.feed(buffer) == buffer.size());
    }

    SECTION("non-JSON text completes on a later newline") {
        MessageFramer framer;
        std::string buffer = "Traceback";
        REQUIRE(framer.feed(buffer) == 0);
        buffer += " (most recent call last)\nmore";
        REQUIRE(framer.feed(buffer) == std::string("Traceback (most recent call last)\n").size());
    }

    SECTION("reset starts over") {
        MessageFramer framer;
        REQUIRE(framer.feed(R"({"a": [)") == 0);
        framer.reset();
        REQUIRE(framer.scanned() == 0);
        REQUIRE(framer.feed(R"({"b": 1})") == 8);
    }
}

TEST_CASE("MessageFramer frames multi-megabyte responses in linear time", "[protocol][framing]") {
    const size_t bodySize = 12 * 1024 * 1024;
    const size_t chunkSize = 8192;

    std::string message = R"({"status": "success", "result": ")";
    message.append(bodySize, 'a');
    message += R"("})";

    MessageFramer framer;
    std::string buffer;
    size_t end = 0;

    const auto start = std::chrono::steady_clock::now();
    for (size_t offset = 0; offset < message.size() && end == 0; offset += chunkSize) {
        buffer.append(message, offset, chunkSize);
        end = framer.feed(buffer);
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(end == message.size());
    REQUIRE(framer.scanned() == message.size());
    REQUIRE(elapsed < std::chrono::seconds(3));
}
