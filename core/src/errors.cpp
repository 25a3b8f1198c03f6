#include <blendpipe/errors.h>

namespace blendpipe {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "None";
        case ErrorKind::InvalidCommand: return "InvalidCommand";
        case ErrorKind::Transport:      return "TransportError";
        case ErrorKind::Timeout:        return "TimeoutError";
        case ErrorKind::Decode:         return "DecodeError";
        case ErrorKind::Application:    return "ApplicationError";
    }
    return "Unknown";
}

bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::Transport ||
           kind == ErrorKind::Timeout ||
           kind == ErrorKind::Decode;
}

} // namespace blendpipe
