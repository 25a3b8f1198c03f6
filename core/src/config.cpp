#include <blendpipe/config.h>

namespace blendpipe {

std::string ClientConfig::validate() const {
    if (host.empty()) {
        return "host must not be empty";
    }
    if (port <= 0 || port > 65535) {
        return "port must be in 1..65535, got " + std::to_string(port);
    }
    if (baseTimeout.count() <= 0) {
        return "base timeout must be positive";
    }
    if (maxAttempts < 1) {
        return "attempts must be at least 1, got " + std::to_string(maxAttempts);
    }
    if (probeTimeout.count() <= 0) {
        return "probe timeout must be positive";
    }
    if (backoff.timeoutGrowth <= 1.0) {
        return "timeout growth must be greater than 1";
    }
    if (backoff.pauseGrowth < 1.0) {
        return "pause growth must be at least 1";
    }
    if (backoff.maxTimeout.count() <= 0 || backoff.maxPause.count() < 0) {
        return "backoff caps must be positive";
    }
    if (backoff.debugTimeoutScale <= 0.0 || backoff.debugTimeoutScale > 1.0) {
        return "debug timeout scale must be in (0, 1]";
    }
    if (backoff.debugMaxAttempts < 1) {
        return "debug max attempts must be at least 1";
    }
    return "";
}

} // namespace blendpipe
