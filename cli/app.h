// blendpipe Application
// Builds the client, retry policy and pipeline from parsed options and runs one command

#pragma once

#include <blendpipe/pipeline_config.h>
#include <filesystem>
#include <string>

namespace blendpipe {

enum class AppMode {
    Ping,   // Reachability check only
    Exec,   // One command through the retry policy
    Run     // A pipeline file
};

// Configuration passed from command-line arguments
struct AppConfig {
    AppMode mode = AppMode::Run;
    ConfigOverrides overrides;

    // run
    std::filesystem::path pipelinePath;
    std::string fromStage;          // Stage name or 1-based number; empty = first stage
    int monitorPort = 0;            // 0 = no status bridge

    // exec
    std::filesystem::path scriptPath;
    std::string code;
    std::string hostPath;           // Path opened by the host (execute_file)
    std::string label;
    bool retryOnError = false;
};

class Application {
public:
    explicit Application(AppConfig config) : m_config(std::move(config)) {}

    // Returns a blendpipe::cli exit code
    int run();

private:
    int ping();
    int exec();
    int runPipeline();

    AppConfig m_config;
};

} // namespace blendpipe
