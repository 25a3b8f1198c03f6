// blendpipe - Pipeline orchestration

#include <blendpipe/pipeline.h>
#include <iostream>
#include <sstream>

namespace blendpipe {

using network::Clock;

// -----------------------------------------------------------------------------
// Stage
// -----------------------------------------------------------------------------

Stage Stage::inlineCode(std::string name, std::string code) {
    Stage stage;
    stage.name = std::move(name);
    stage.source = std::move(code);
    stage.sourceKind = StageSource::InlineCode;
    return stage;
}

Stage Stage::scriptFile(std::string name, std::string path) {
    Stage stage;
    stage.name = std::move(name);
    stage.source = std::move(path);
    stage.sourceKind = StageSource::ScriptFile;
    return stage;
}

Stage Stage::hostFile(std::string name, std::string path) {
    Stage stage;
    stage.name = std::move(name);
    stage.source = std::move(path);
    stage.sourceKind = StageSource::HostFile;
    return stage;
}

std::optional<Command> Stage::toCommand(std::string& error) const {
    std::optional<Command> command;
    switch (sourceKind) {
        case StageSource::InlineCode:
            command = Command::code(source, name);
            break;
        case StageSource::HostFile:
            command = Command::file(source, name);
            break;
        case StageSource::ScriptFile:
            command = Command::fromScriptFile(source, name, error);
            break;
    }
    if (command && retryOnApplicationError) {
        command = command->withApplicationRetry(true);
    }
    return command;
}

// -----------------------------------------------------------------------------
// PipelineResult
// -----------------------------------------------------------------------------

const char* pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Pending:   return "Pending";
        case PipelineState::Running:   return "Running";
        case PipelineState::Succeeded: return "Succeeded";
        case PipelineState::Failed:    return "Failed";
    }
    return "Unknown";
}

const StageReport* PipelineResult::haltedStage() const {
    if (state != PipelineState::Failed || stages.empty()) return nullptr;
    const StageReport& last = stages.back();
    return last.outcome == StageOutcome::Failed ? &last : nullptr;
}

int PipelineResult::totalAttempts() const {
    int total = 0;
    for (const auto& stage : stages) {
        total += stage.attemptsUsed;
    }
    return total;
}

std::string PipelineResult::summary() const {
    std::ostringstream out;

    for (const auto& stage : stages) {
        out << "  " << (stage.outcome == StageOutcome::Success ? "[ok]    " : "[FAILED]")
            << " " << (stage.index + 1) << ". " << stage.stageName
            << " (" << stage.attemptsUsed << " attempt" << (stage.attemptsUsed == 1 ? "" : "s")
            << ", " << stage.elapsed.count() << " ms)\n";
    }

    if (!error.empty()) {
        out << "Pipeline did not start: " << error << "\n";
    } else if (const StageReport* halted = haltedStage()) {
        out << "Pipeline halted at stage " << (halted->index + 1) << " '" << halted->stageName
            << "': " << errorKindName(halted->kind) << ": " << halted->message << "\n";
    } else {
        out << "Pipeline " << pipelineStateName(state) << "\n";
    }
    out << "Total attempts: " << totalAttempts() << "\n";
    return out.str();
}

// -----------------------------------------------------------------------------
// Pipeline
// -----------------------------------------------------------------------------

Pipeline::Pipeline(std::vector<Stage> stages, RetryPolicy& policy)
    : m_stages(std::move(stages))
    , m_policy(policy) {}

network::ChannelStatus Pipeline::preflight(Millis timeout) const {
    network::ChannelStatus status = m_policy.executor().ping(timeout);
    if (status.ok()) {
        std::cout << "[Pipeline] Host reachable\n";
    } else {
        std::cerr << "[Pipeline] Host not reachable: " << status.message << "\n";
    }
    return status;
}

std::optional<size_t> Pipeline::indexOf(const std::string& name) const {
    for (size_t i = 0; i < m_stages.size(); ++i) {
        if (m_stages[i].name == name) return i;
    }
    return std::nullopt;
}

PipelineResult Pipeline::run(size_t startIndex) {
    PipelineResult result;

    if (startIndex > m_stages.size()) {
        result.state = PipelineState::Failed;
        result.error = "start stage " + std::to_string(startIndex + 1) + " is past the last stage (" +
                       std::to_string(m_stages.size()) + ")";
        return finish(std::move(result));
    }

    m_state = PipelineState::Running;
    std::cout << "[Pipeline] Running " << (m_stages.size() - startIndex) << " stage(s)";
    if (startIndex > 0 && startIndex < m_stages.size()) {
        std::cout << " from stage " << (startIndex + 1) << " '" << m_stages[startIndex].name << "'";
    }
    std::cout << "\n";

    for (size_t i = startIndex; i < m_stages.size(); ++i) {
        m_current = i;
        if (m_stageStarted) {
            m_stageStarted(i, m_stages[i]);
        }

        StageReport report = runStage(i);
        result.stages.push_back(report);

        if (m_stageFinished) {
            m_stageFinished(report);
        }

        if (report.outcome == StageOutcome::Failed) {
            result.state = PipelineState::Failed;
            return finish(std::move(result));
        }
    }

    result.state = PipelineState::Succeeded;
    return finish(std::move(result));
}

StageReport Pipeline::runStage(size_t index) {
    const Stage& stage = m_stages[index];
    const auto start = Clock::now();

    StageReport report;
    report.stageName = stage.name;
    report.index = index;

    std::cout << "[Pipeline] Stage " << (index + 1) << "/" << m_stages.size() << ": " << stage.name << "\n";

    std::string error;
    std::optional<Command> command = stage.toCommand(error);
    if (!command) {
        report.outcome = StageOutcome::Failed;
        report.kind = ErrorKind::InvalidCommand;
        report.message = error;
        report.elapsed = std::chrono::duration_cast<Millis>(Clock::now() - start);
        std::cerr << "[Pipeline] " << stage.name << ": " << error << "\n";
        return report;
    }

    Outcome outcome = m_policy.run(*command, stage.attempts, stage.timeout, m_policy.config().debug);

    report.attemptsUsed = outcome.attemptsUsed;
    report.elapsed = std::chrono::duration_cast<Millis>(Clock::now() - start);
    if (outcome.ok()) {
        report.outcome = StageOutcome::Success;
        if (outcome.response) {
            report.result = outcome.response->result;
        }
    } else {
        report.outcome = StageOutcome::Failed;
        report.kind = outcome.kind;
        report.message = outcome.message;
    }
    return report;
}

PipelineResult Pipeline::finish(PipelineResult result) {
    m_state = result.state;
    if (result.succeeded()) {
        std::cout << "[Pipeline] Completed " << result.stages.size() << " stage(s)\n";
    } else if (const StageReport* halted = result.haltedStage()) {
        std::cerr << "[Pipeline] Halted at stage " << (halted->index + 1) << " '" << halted->stageName
                  << "' after " << halted->attemptsUsed << " attempt(s)\n";
    } else if (!result.error.empty()) {
        std::cerr << "[Pipeline] " << result.error << "\n";
    }

    if (m_pipelineFinished) {
        m_pipelineFinished(result);
    }
    return result;
}

} // namespace blendpipe
