// blendpipe - Application

#include "app.h"
#include <blendpipe/cli.h>
#include <blendpipe/execution_client.h>
#include <blendpipe/pipeline.h>
#include <blendpipe/retry_policy.h>
#include <blendpipe/status_bridge.h>
#include <iostream>

namespace blendpipe {

static void printSetupInstructions(const ClientConfig& config) {
    std::cerr << "\nCannot reach the script server at " << config.host << ":" << config.port << ".\n";
    std::cerr << "To start it:\n";
    std::cerr << "  1. Open Blender\n";
    std::cerr << "  2. Open the 3D View sidebar (press N)\n";
    std::cerr << "  3. Find the 'BlenderMCP' tab\n";
    std::cerr << "  4. Click 'Connect to Claude' (starts the server on port " << config.port << ")\n";
    std::cerr << "  5. Run this command again\n";
}

static void printOutcome(const std::string& label, const Outcome& outcome) {
    if (outcome.ok()) {
        std::cout << "Executed " << label << " (" << outcome.attemptsUsed << " attempt"
                  << (outcome.attemptsUsed == 1 ? "" : "s") << ")\n";
        if (outcome.response && outcome.response->result && !outcome.response->result->empty()) {
            std::cout << "Result: " << *outcome.response->result << "\n";
        }
    } else {
        std::cerr << "Failed to execute " << label << " after " << outcome.attemptsUsed << " attempt"
                  << (outcome.attemptsUsed == 1 ? "" : "s") << "\n";
        std::cerr << errorKindName(outcome.kind) << ": " << outcome.message << "\n";
    }
}

int Application::run() {
    switch (m_config.mode) {
        case AppMode::Ping: return ping();
        case AppMode::Exec: return exec();
        case AppMode::Run:  return runPipeline();
    }
    return cli::EXIT_USAGE;
}

int Application::ping() {
    ClientConfig config;
    applyOverrides(config, m_config.overrides);
    std::string configError = config.validate();
    if (!configError.empty()) {
        std::cerr << "Error: " << configError << "\n";
        return cli::EXIT_USAGE;
    }

    ExecutionClient client(config);
    network::ChannelStatus status = client.ping(config.probeTimeout);
    if (!status.ok()) {
        std::cerr << errorKindName(status.kind) << ": " << status.message << "\n";
        printSetupInstructions(config);
        return cli::EXIT_UNREACHABLE;
    }

    std::cout << "Script server is running on " << client.endpoint().toString() << "\n";
    return cli::EXIT_OK;
}

int Application::exec() {
    ClientConfig config;
    applyOverrides(config, m_config.overrides);
    std::string configError = config.validate();
    if (!configError.empty()) {
        std::cerr << "Error: " << configError << "\n";
        return cli::EXIT_USAGE;
    }

    std::optional<Command> command;
    if (!m_config.code.empty()) {
        command = Command::code(m_config.code, m_config.label);
    } else if (!m_config.hostPath.empty()) {
        command = Command::file(m_config.hostPath, m_config.label);
    } else {
        std::string error;
        command = Command::fromScriptFile(m_config.scriptPath, m_config.label, error);
        if (!command) {
            std::cerr << "Error: " << error << "\n";
            return cli::EXIT_USAGE;
        }
        std::cout << "Executing script: " << m_config.scriptPath.string() << "\n";
    }
    command = command->withApplicationRetry(m_config.retryOnError);

    ExecutionClient client(config);
    RetryPolicy policy(client, config);
    Outcome outcome = policy.run(*command);

    printOutcome(command->describe(), outcome);
    return outcome.ok() ? cli::EXIT_OK : cli::EXIT_FAILED;
}

int Application::runPipeline() {
    PipelineLoadResult loaded = loadPipelineFile(m_config.pipelinePath, ClientConfig{});
    if (!loaded.ok()) {
        std::cerr << "Error: " << loaded.error << "\n";
        return cli::EXIT_USAGE;
    }

    PipelineFile& file = *loaded.pipeline;
    applyOverrides(file, m_config.overrides);
    std::string configError = file.client.validate();
    if (!configError.empty()) {
        std::cerr << "Error: " << configError << "\n";
        return cli::EXIT_USAGE;
    }
    if (m_config.retryOnError) {
        for (auto& stage : file.stages) {
            stage.retryOnApplicationError = true;
        }
    }

    ExecutionClient client(file.client);
    RetryPolicy policy(client, file.client);
    Pipeline pipeline(file.stages, policy);

    size_t startIndex = 0;
    if (!m_config.fromStage.empty()) {
        auto index = resolveStage(file.stages, m_config.fromStage);
        if (!index) {
            std::cerr << "Error: no stage named '" << m_config.fromStage << "' in "
                      << m_config.pipelinePath.string() << "\n";
            return cli::EXIT_USAGE;
        }
        startIndex = *index;
    }

    if (file.client.debug) {
        std::cout << "Debug mode: attempts <= " << file.client.backoff.debugMaxAttempts
                  << ", timeouts scaled by " << file.client.backoff.debugTimeoutScale << "\n";
    }

    StatusBridge bridge;
    if (m_config.monitorPort > 0 && !bridge.start(m_config.monitorPort)) {
        std::cerr << "Error: cannot start the progress monitor on port " << m_config.monitorPort
                  << " (is it already in use?)\n";
        return cli::EXIT_USAGE;
    }

    pipeline.onStageStarted([&bridge](size_t index, const Stage& stage) {
        bridge.sendStageStarted(index, stage);
    });
    pipeline.onStageFinished([&bridge](const StageReport& report) {
        if (report.outcome == StageOutcome::Success && report.result && !report.result->empty()) {
            std::cout << "Result: " << *report.result << "\n";
        }
        bridge.sendStageFinished(report);
    });
    pipeline.onPipelineFinished([&bridge](const PipelineResult& result) {
        bridge.sendPipelineFinished(result);
    });

    // Fail fast on an absent host instead of burning every stage's retry budget
    network::ChannelStatus reachable = pipeline.preflight(file.client.probeTimeout);
    if (!reachable.ok()) {
        printSetupInstructions(file.client);
        return cli::EXIT_UNREACHABLE;
    }

    bridge.sendPipelineStarted(pipeline, startIndex);
    PipelineResult result = pipeline.run(startIndex);

    std::cout << "\n" << result.summary();
    if (const StageReport* halted = result.haltedStage()) {
        std::cerr << "Resume with: blendpipe run " << m_config.pipelinePath.string()
                  << " --from \"" << halted->stageName << "\"\n";
    }

    bridge.stop();
    return result.succeeded() ? cli::EXIT_OK : cli::EXIT_FAILED;
}

} // namespace blendpipe
