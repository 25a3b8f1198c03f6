// blendpipe - Command/response wire encoding

#include <blendpipe/protocol.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace blendpipe {

const char* commandKindName(CommandKind kind) {
    switch (kind) {
        case CommandKind::ExecuteCode: return "execute_code";
        case CommandKind::ExecuteFile: return "execute_file";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------
// Command
// -----------------------------------------------------------------------------

Command Command::code(std::string code, std::string label) {
    return Command(CommandKind::ExecuteCode, std::move(code), std::move(label));
}

Command Command::file(std::string path, std::string label) {
    return Command(CommandKind::ExecuteFile, std::move(path), std::move(label));
}

std::optional<Command> Command::fromScriptFile(const fs::path& path,
                                               const std::string& label,
                                               std::string& error) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        error = "Script file not found: " + path.string();
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error = "Cannot open script file: " + path.string();
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error = "Failed reading script file: " + path.string();
        return std::nullopt;
    }

    std::string name = label.empty() ? path.filename().string() : label;
    return Command::code(buffer.str(), std::move(name));
}

Command Command::withApplicationRetry(bool enabled) const {
    Command copy = *this;
    copy.m_retryOnApplicationError = enabled;
    return copy;
}

std::string Command::describe() const {
    if (!m_label.empty()) return m_label;
    if (m_kind == CommandKind::ExecuteFile) return m_payload;
    return "code";
}

// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------

EncodeResult encode(const Command& command) {
    EncodeResult out;

    if (command.payload().empty()) {
        out.error = command.kind() == CommandKind::ExecuteFile
            ? "command has an empty path"
            : "command has an empty code payload";
        return out;
    }

    json params;
    if (command.kind() == CommandKind::ExecuteFile) {
        params["path"] = command.payload();
    } else {
        params["code"] = command.payload();
    }
    if (!command.label().empty()) {
        params["label"] = command.label();
    }

    json request;
    request["type"] = commandKindName(command.kind());
    request["params"] = params;

    try {
        out.bytes = request.dump();
    } catch (const json::type_error& e) {
        // Strict UTF-8 handling: a payload that is not text cannot be sent.
        out.error = std::string("payload is not valid UTF-8 text: ") + e.what();
        return out;
    }
    out.bytes.push_back('\n');
    return out;
}

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------

// String fields pass through; anything else keeps its JSON text.
static std::optional<std::string> optionalText(const json& value) {
    if (value.is_null()) return std::nullopt;
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

DecodeResult decode(std::string_view bytes) {
    DecodeResult out;

    json j;
    try {
        j = json::parse(bytes.begin(), bytes.end());
    } catch (const json::parse_error& e) {
        out.error = std::string("malformed response: ") + e.what();
        return out;
    }

    if (!j.is_object()) {
        out.error = "response is not a JSON object";
        return out;
    }

    auto statusIt = j.find("status");
    if (statusIt == j.end() || !statusIt->is_string()) {
        out.error = "response has no status field";
        return out;
    }

    Response response;
    const std::string status = statusIt->get<std::string>();
    if (status == "success") {
        response.status = ResponseStatus::Success;
    } else if (status == "error") {
        response.status = ResponseStatus::Failure;
    } else {
        out.error = "unknown response status '" + status + "'";
        return out;
    }

    auto resultIt = j.find("result");
    if (resultIt != j.end()) {
        // execute_code hosts wrap captured output as {"executed": true, "result": "..."}
        if (resultIt->is_object() && resultIt->contains("result") &&
            (*resultIt)["result"].is_string()) {
            response.result = (*resultIt)["result"].get<std::string>();
        } else {
            response.result = optionalText(*resultIt);
        }
    }

    auto messageIt = j.find("message");
    if (messageIt != j.end()) {
        response.message = optionalText(*messageIt);
    }

    out.response = std::move(response);
    return out;
}

// -----------------------------------------------------------------------------
// Framing
// -----------------------------------------------------------------------------

size_t MessageFramer::feed(std::string_view buffer) {
    for (size_t i = m_scanned; i < buffer.size(); ++i) {
        const char c = buffer[i];

        if (!m_started) {
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
            m_started = true;
            m_json = c == '{' || c == '[';
        }

        if (!m_json) {
            if (c == '\n') {
                m_scanned = i + 1;
                return i + 1;
            }
            continue;
        }

        if (m_inString) {
            if (m_escaped) {
                m_escaped = false;
            } else if (c == '\\') {
                m_escaped = true;
            } else if (c == '"') {
                m_inString = false;
            }
            continue;
        }

        switch (c) {
            case '"':
                m_inString = true;
                break;
            case '{':
            case '[':
                ++m_depth;
                break;
            case '}':
            case ']':
                if (--m_depth == 0) {
                    m_scanned = i + 1;
                    return i + 1;
                }
                break;
            default:
                break;
        }
    }

    m_scanned = buffer.size();
    return 0;
}

size_t findMessageEnd(std::string_view buffer) {
    MessageFramer framer;
    return framer.feed(buffer);
}

} // namespace blendpipe
