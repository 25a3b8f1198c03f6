#pragma once

/**
 * @file protocol.h
 * @brief Commands, responses and their JSON wire encoding
 *
 * A request is one JSON object terminated by a newline:
 * @code
 * {"type":"execute_code","params":{"code":"import bpy\n...","label":"Scene Clearing"}}
 * @endcode
 * The host answers with one JSON object per request:
 * @code
 * {"status":"success","result":"..."}
 * {"status":"error","message":"NameError: name 'foo' is not defined"}
 * @endcode
 * Payloads travel as JSON strings, so quotes, braces and newlines inside a
 * script cannot break framing.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace blendpipe {

/// What the host is asked to do
enum class CommandKind {
    ExecuteCode,  ///< Run the payload text as a script
    ExecuteFile   ///< Run the script at the payload path (resolved by the host)
};

/// @brief Wire name of a command kind ("execute_code" / "execute_file")
const char* commandKindName(CommandKind kind);

/**
 * @brief One request to execute a script payload remotely
 *
 * Immutable once built. The payload is opaque: the host runs it as a single
 * self-contained unit of work.
 */
class Command {
public:
    /// @brief Command that runs @p code on the host
    static Command code(std::string code, std::string label = "");

    /// @brief Command that asks the host to run the script at @p path
    static Command file(std::string path, std::string label = "");

    /**
     * @brief Read a local script and wrap its text in an ExecuteCode command
     * @param path Script to read
     * @param label Human-readable label; defaults to the file name
     * @param error Receives the reason when the file cannot be read
     */
    static std::optional<Command> fromScriptFile(const std::filesystem::path& path,
                                                 const std::string& label,
                                                 std::string& error);

    /// @brief Copy of this command that may be re-sent after an application error
    Command withApplicationRetry(bool enabled) const;

    CommandKind kind() const { return m_kind; }
    const std::string& payload() const { return m_payload; }
    const std::string& label() const { return m_label; }

    /// @brief Label if set, otherwise a generic description of the command
    std::string describe() const;

    /// @brief Whether a status "error" response may be retried (idempotent scripts only)
    bool retryOnApplicationError() const { return m_retryOnApplicationError; }

private:
    Command(CommandKind kind, std::string payload, std::string label)
        : m_kind(kind), m_payload(std::move(payload)), m_label(std::move(label)) {}

    CommandKind m_kind;
    std::string m_payload;
    std::string m_label;
    bool m_retryOnApplicationError = false;
};

/// Outcome reported by the host
enum class ResponseStatus {
    Success,
    Failure
};

/// The host's structured reply to a Command
struct Response {
    ResponseStatus status = ResponseStatus::Success;
    std::optional<std::string> result;   ///< Script output, if any
    std::optional<std::string> message;  ///< Error description, if any

    bool succeeded() const { return status == ResponseStatus::Success; }
};

/// Result of encoding a command
struct EncodeResult {
    std::string bytes;   ///< Wire bytes including the trailing newline
    std::string error;   ///< Non-empty when the command cannot be sent

    bool ok() const { return error.empty(); }
};

/// Result of decoding a response
struct DecodeResult {
    std::optional<Response> response;
    std::string error;   ///< Non-empty when the bytes are not a valid response

    bool ok() const { return response.has_value(); }
};

/**
 * @brief Serialize a command as a newline-terminated JSON request
 *
 * Fails for an empty payload or one that is not valid UTF-8; such a command
 * is rejected before any network call.
 */
EncodeResult encode(const Command& command);

/**
 * @brief Parse one response message
 *
 * Absent `result` and `message` are allowed. Malformed or partial input,
 * a missing `status`, or an unknown status value produce an error, never a
 * default success.
 */
DecodeResult decode(std::string_view bytes);

/**
 * @brief Incremental message framer for a growing receive buffer
 *
 * A message ends after the first balanced top-level JSON object or array
 * (string literals and escapes are honored), or at the first newline when
 * the buffer does not start with one. Each feed() only scans the bytes
 * appended since the previous call, so framing a large response stays
 * linear in its size.
 *
 * @code
 * MessageFramer framer;
 * while (...) {
 *     buffer.append(chunk, n);
 *     if (size_t end = framer.feed(buffer)) { ... }
 * }
 * @endcode
 */
class MessageFramer {
public:
    /**
     * @brief Continue scanning @p buffer where the previous call stopped
     * @param buffer Everything received so far; earlier bytes must be unchanged
     * @return Number of bytes making up the message, or 0 if more bytes are needed
     */
    size_t feed(std::string_view buffer);

    /// @brief Forget all state before framing a new buffer
    void reset() { *this = MessageFramer(); }

    /// @brief Bytes already examined
    size_t scanned() const { return m_scanned; }

private:
    size_t m_scanned = 0;
    bool m_started = false;     // first non-whitespace byte seen
    bool m_json = false;        // message started with '{' or '['
    int m_depth = 0;
    bool m_inString = false;
    bool m_escaped = false;
};

/**
 * @brief Find the end of the first complete message in a buffer
 *
 * One-shot form of MessageFramer::feed().
 */
size_t findMessageEnd(std::string_view buffer);

} // namespace blendpipe
