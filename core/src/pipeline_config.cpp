#include <blendpipe/pipeline_config.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace blendpipe {

Millis secondsToMillis(double seconds) {
    return Millis(static_cast<Millis::rep>(std::llround(seconds * 1000.0)));
}

static PipelineLoadResult failure(std::string message) {
    PipelineLoadResult result;
    result.error = std::move(message);
    return result;
}

PipelineLoadResult parsePipeline(const std::string& text,
                                 const fs::path& baseDir,
                                 const ClientConfig& defaults) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return failure(std::string("parse error: ") + e.what());
    }

    if (!root.is_object()) {
        return failure("pipeline file must contain a JSON object");
    }

    PipelineFile file;
    file.client = defaults;

    try {
        file.client.host = root.value("host", file.client.host);
        file.client.port = root.value("port", file.client.port);
        file.client.maxAttempts = root.value("attempts", file.client.maxAttempts);
        file.client.debug = root.value("debug", file.client.debug);
        if (root.contains("base_timeout")) {
            file.client.baseTimeout = secondsToMillis(root["base_timeout"].get<double>());
        }

        std::string configError = file.client.validate();
        if (!configError.empty()) {
            return failure(configError);
        }

        auto stagesIt = root.find("stages");
        if (stagesIt == root.end() || !stagesIt->is_array() || stagesIt->empty()) {
            return failure("pipeline file needs a non-empty \"stages\" array");
        }

        for (size_t i = 0; i < stagesIt->size(); ++i) {
            const json& entry = (*stagesIt)[i];
            const std::string where = "stage " + std::to_string(i + 1);

            if (!entry.is_object()) {
                return failure(where + " must be an object");
            }

            Stage stage;
            stage.name = entry.value("name", std::string());
            if (stage.name.empty()) {
                return failure(where + " has no name");
            }

            int sources = static_cast<int>(entry.contains("script")) +
                          static_cast<int>(entry.contains("code")) +
                          static_cast<int>(entry.contains("path"));
            if (sources != 1) {
                return failure(where + " '" + stage.name +
                               "' needs exactly one of \"script\", \"code\" or \"path\"");
            }

            if (entry.contains("script")) {
                fs::path script = entry["script"].get<std::string>();
                if (script.is_relative()) {
                    script = baseDir / script;
                }
                stage.source = script.lexically_normal().string();
                stage.sourceKind = StageSource::ScriptFile;
            } else if (entry.contains("code")) {
                stage.source = entry["code"].get<std::string>();
                stage.sourceKind = StageSource::InlineCode;
            } else {
                stage.source = entry["path"].get<std::string>();
                stage.sourceKind = StageSource::HostFile;
            }
            if (stage.source.empty()) {
                return failure(where + " '" + stage.name + "' has an empty payload");
            }

            stage.attempts = entry.value("attempts", file.client.maxAttempts);
            stage.timeout = entry.contains("timeout")
                ? secondsToMillis(entry["timeout"].get<double>())
                : file.client.baseTimeout;
            stage.retryOnApplicationError = entry.value("retry_on_error", false);

            if (stage.attempts < 1) {
                return failure(where + " '" + stage.name + "' needs at least 1 attempt");
            }
            if (stage.timeout.count() <= 0) {
                return failure(where + " '" + stage.name + "' needs a positive timeout");
            }

            for (const auto& existing : file.stages) {
                if (existing.name == stage.name) {
                    return failure("duplicate stage name '" + stage.name + "'");
                }
            }
            file.stages.push_back(std::move(stage));
        }
    } catch (const json::exception& e) {
        return failure(std::string("invalid pipeline file: ") + e.what());
    }

    PipelineLoadResult result;
    result.pipeline = std::move(file);
    return result;
}

PipelineLoadResult loadPipelineFile(const fs::path& path, const ClientConfig& defaults) {
    std::ifstream in(path);
    if (!in) {
        return failure("cannot open pipeline file: " + path.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    fs::path baseDir = path.has_parent_path() ? path.parent_path() : fs::current_path();
    PipelineLoadResult result = parsePipeline(buffer.str(), baseDir, defaults);
    if (result.ok()) {
        result.pipeline->path = path;
    } else {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

void applyOverrides(ClientConfig& config, const ConfigOverrides& overrides) {
    if (overrides.host) config.host = *overrides.host;
    if (overrides.port) config.port = *overrides.port;
    if (overrides.baseTimeout) config.baseTimeout = *overrides.baseTimeout;
    if (overrides.attempts) config.maxAttempts = *overrides.attempts;
    if (overrides.debug) config.debug = *overrides.debug;
}

void applyOverrides(PipelineFile& file, const ConfigOverrides& overrides) {
    applyOverrides(file.client, overrides);
    for (auto& stage : file.stages) {
        if (overrides.baseTimeout) stage.timeout = *overrides.baseTimeout;
        if (overrides.attempts) stage.attempts = *overrides.attempts;
    }
}

std::optional<size_t> resolveStage(const std::vector<Stage>& stages, const std::string& nameOrNumber) {
    for (size_t i = 0; i < stages.size(); ++i) {
        if (stages[i].name == nameOrNumber) return i;
    }

    // Bounded length keeps stoul from overflowing
    if (nameOrNumber.empty() || nameOrNumber.size() > 9 ||
        !std::all_of(nameOrNumber.begin(), nameOrNumber.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    size_t number = std::stoul(nameOrNumber);
    if (number >= 1 && number <= stages.size()) {
        return number - 1;
    }
    return std::nullopt;
}

} // namespace blendpipe
