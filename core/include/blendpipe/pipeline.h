#pragma once

/**
 * @file pipeline.h
 * @brief Ordered, fail-fast execution of named stages
 *
 * Stages run strictly in order because later scripts depend on host state
 * produced by earlier ones. The first stage that exhausts its retry budget
 * halts the run; nothing after it executes.
 *
 * @par Example
 * @code
 * ExecutionClient client(config);
 * RetryPolicy policy(client, config);
 * Pipeline pipeline({
 *     Stage::scriptFile("Scene Clearing", "scripts/clear_scene.py"),
 *     Stage::scriptFile("Sorting Bucket", "scripts/create_sorting_bucket.py"),
 * }, policy);
 *
 * if (pipeline.preflight(Millis(2000)).ok()) {
 *     PipelineResult result = pipeline.run();
 *     std::cout << result.summary();
 * }
 * @endcode
 */

#include <blendpipe/retry_policy.h>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blendpipe {

/// Where a stage's payload comes from
enum class StageSource {
    InlineCode,  ///< source is the script text itself
    ScriptFile,  ///< source is a local path, read when the stage runs and sent as code
    HostFile     ///< source is a path the host opens itself (execute_file)
};

/// One named step of the pipeline, wrapping one Command and its retry budget
struct Stage {
    std::string name;
    std::string source;
    StageSource sourceKind = StageSource::ScriptFile;
    int attempts = 3;
    Millis timeout{30000};
    bool retryOnApplicationError = false;   ///< Only for scripts that are safe to re-run

    static Stage inlineCode(std::string name, std::string code);
    static Stage scriptFile(std::string name, std::string path);
    static Stage hostFile(std::string name, std::string path);

    /// @brief Build the command for this stage; fails if a script file cannot be read
    std::optional<Command> toCommand(std::string& error) const;
};

enum class StageOutcome {
    Success,
    Failed
};

/// Report for one executed stage
struct StageReport {
    std::string stageName;
    size_t index = 0;                        ///< Position in the full stage list
    StageOutcome outcome = StageOutcome::Failed;
    int attemptsUsed = 0;
    ErrorKind kind = ErrorKind::None;        ///< Failure kind when outcome is Failed
    std::string message;                     ///< Last error message when outcome is Failed
    std::optional<std::string> result;       ///< Host output of the successful attempt
    Millis elapsed{0};
};

enum class PipelineState {
    Pending,
    Running,
    Succeeded,
    Failed
};

/// @brief Display name of a pipeline state
const char* pipelineStateName(PipelineState state);

/// Ordered stage reports, finalized when the run halts
struct PipelineResult {
    PipelineState state = PipelineState::Pending;
    std::vector<StageReport> stages;
    std::string error;                       ///< Set when the run could not start

    bool succeeded() const { return state == PipelineState::Succeeded; }

    /// @brief The stage that halted the run, or nullptr
    const StageReport* haltedStage() const;

    /// @brief Executor calls consumed across all reported stages
    int totalAttempts() const;

    /// @brief Multi-line human-readable report
    std::string summary() const;
};

/**
 * @brief Runs a fixed list of stages through a RetryPolicy
 *
 * State machine: Pending -> Running(i) -> Running(i+1) ... -> Succeeded,
 * or Running(i) -> Failed on the first stage whose policy run fails. A
 * failed stage is never retried by the pipeline. Each run() is a fresh,
 * stateless pass over the same immutable stage list.
 */
class Pipeline {
public:
    using StageStartedCallback = std::function<void(size_t index, const Stage& stage)>;
    using StageFinishedCallback = std::function<void(const StageReport& report)>;
    using PipelineFinishedCallback = std::function<void(const PipelineResult& result)>;

    Pipeline(std::vector<Stage> stages, RetryPolicy& policy);

    /**
     * @brief Check the host is reachable before spending any retry budget
     * @return ok() when a connection could be opened
     */
    network::ChannelStatus preflight(Millis timeout) const;

    /**
     * @brief Run stages starting at @p startIndex
     *
     * Starting past stage 0 resumes a run that halted there; earlier stages
     * are neither executed nor reported.
     */
    PipelineResult run(size_t startIndex = 0);

    /// @brief Index of the stage called @p name
    std::optional<size_t> indexOf(const std::string& name) const;

    const std::vector<Stage>& stages() const { return m_stages; }
    size_t size() const { return m_stages.size(); }

    /// @brief State of the current or most recent run
    PipelineState state() const { return m_state; }

    /// @brief Index of the stage currently running (valid while state() is Running)
    size_t currentStage() const { return m_current; }

    void onStageStarted(StageStartedCallback callback) { m_stageStarted = std::move(callback); }
    void onStageFinished(StageFinishedCallback callback) { m_stageFinished = std::move(callback); }
    void onPipelineFinished(PipelineFinishedCallback callback) { m_pipelineFinished = std::move(callback); }

private:
    StageReport runStage(size_t index);
    PipelineResult finish(PipelineResult result);

    const std::vector<Stage> m_stages;
    RetryPolicy& m_policy;
    PipelineState m_state = PipelineState::Pending;
    size_t m_current = 0;

    StageStartedCallback m_stageStarted;
    StageFinishedCallback m_stageFinished;
    PipelineFinishedCallback m_pipelineFinished;
};

} // namespace blendpipe
