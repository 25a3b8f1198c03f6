#pragma once

#include <blendpipe/pipeline.h>
#include <memory>
#include <string>

namespace blendpipe {

/// StatusBridge runs a WebSocket server that streams pipeline progress to monitors
/// (editor panels, dashboards). Events are JSON objects with a "type" field:
/// pipeline_started, stage_started, stage_finished, pipeline_finished.
/// A monitor that connects mid-run can send {"type":"request_status"} to get
/// the latest snapshot.
class StatusBridge {
public:
    StatusBridge();
    ~StatusBridge();

    /// Start listening on the given port; returns false if the port cannot be bound
    bool start(int port);

    /// Stop the server
    void stop();

    bool isRunning() const { return m_running; }
    int port() const { return m_port; }

    /// Number of connected monitors
    size_t clientCount() const;

    // -------------------------------------------------------------------------
    // Outgoing messages (pipeline -> monitors)
    // -------------------------------------------------------------------------

    void sendPipelineStarted(const Pipeline& pipeline, size_t startIndex);
    void sendStageStarted(size_t index, const Stage& stage);
    void sendStageFinished(const StageReport& report);
    void sendPipelineFinished(const PipelineResult& result);

private:
    void broadcast(const std::string& message);

    class Impl;
    std::unique_ptr<Impl> m_impl;
    bool m_running = false;
    int m_port = 0;
};

} // namespace blendpipe
