#include <blendpipe/status_bridge.h>
#include <ixwebsocket/IXWebSocketServer.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace blendpipe {

class StatusBridge::Impl {
public:
    ix::WebSocketServer server;
    mutable std::mutex mutex;

    // Latest known progress, replayed to monitors that ask for it
    json snapshot = {{"type", "status"}, {"state", "Pending"}, {"stages", json::array()}};

    explicit Impl(int port) : server(port, "127.0.0.1") {}
};

static json reportToJson(const StageReport& report) {
    json j;
    j["index"] = report.index;
    j["name"] = report.stageName;
    j["outcome"] = report.outcome == StageOutcome::Success ? "success" : "failed";
    j["attempts"] = report.attemptsUsed;
    j["elapsedMs"] = report.elapsed.count();
    if (report.outcome == StageOutcome::Failed) {
        j["errorKind"] = errorKindName(report.kind);
        j["message"] = report.message;
    }
    return j;
}

StatusBridge::StatusBridge() = default;

StatusBridge::~StatusBridge() {
    stop();
}

bool StatusBridge::start(int port) {
    if (m_running) return true;

    m_port = port;
    m_impl = std::make_unique<Impl>(port);

    m_impl->server.setOnClientMessageCallback(
        [this](std::shared_ptr<ix::ConnectionState> state,
               ix::WebSocket& ws,
               const ix::WebSocketMessagePtr& msg) {

            if (msg->type == ix::WebSocketMessageType::Open) {
                std::cout << "[StatusBridge] Monitor connected from " << state->getRemoteIp() << "\n";
            }
            else if (msg->type == ix::WebSocketMessageType::Close) {
                std::cout << "[StatusBridge] Monitor disconnected\n";
            }
            else if (msg->type == ix::WebSocketMessageType::Message) {
                try {
                    json j = json::parse(msg->str);
                    std::string type = j.value("type", "");

                    if (type == "request_status") {
                        std::string snapshot;
                        {
                            std::lock_guard<std::mutex> lock(m_impl->mutex);
                            snapshot = m_impl->snapshot.dump();
                        }
                        ws.send(snapshot);
                    }
                } catch (const json::exception& e) {
                    std::cerr << "[StatusBridge] JSON parse error: " << e.what() << "\n";
                }
            }
            else if (msg->type == ix::WebSocketMessageType::Error) {
                std::cerr << "[StatusBridge] Error: " << msg->errorInfo.reason << "\n";
            }
        }
    );

    auto res = m_impl->server.listen();
    if (!res.first) {
        std::cerr << "[StatusBridge] Failed to start on port " << port << ": " << res.second << "\n";
        m_impl.reset();
        return false;
    }

    m_impl->server.start();
    m_running = true;
    std::cout << "[StatusBridge] Listening on port " << port << "\n";
    return true;
}

void StatusBridge::stop() {
    if (!m_running) return;

    m_impl->server.stop();
    m_running = false;
    std::cout << "[StatusBridge] Stopped\n";
}

size_t StatusBridge::clientCount() const {
    if (!m_impl) return 0;
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->server.getClients().size();
}

void StatusBridge::broadcast(const std::string& message) {
    if (!m_running || !m_impl) return;

    std::lock_guard<std::mutex> lock(m_impl->mutex);
    for (auto& client : m_impl->server.getClients()) {
        client->send(message);
    }
}

void StatusBridge::sendPipelineStarted(const Pipeline& pipeline, size_t startIndex) {
    if (!m_running || !m_impl) return;

    json j;
    j["type"] = "pipeline_started";
    j["startIndex"] = startIndex;
    j["stages"] = json::array();
    for (const auto& stage : pipeline.stages()) {
        j["stages"].push_back(stage.name);
    }

    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        m_impl->snapshot["state"] = pipelineStateName(PipelineState::Running);
        m_impl->snapshot["stages"] = json::array();
        m_impl->snapshot["stageNames"] = j["stages"];
    }
    broadcast(j.dump());
}

void StatusBridge::sendStageStarted(size_t index, const Stage& stage) {
    if (!m_running || !m_impl) return;

    json j;
    j["type"] = "stage_started";
    j["index"] = index;
    j["name"] = stage.name;
    j["attempts"] = stage.attempts;
    j["timeoutMs"] = stage.timeout.count();

    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        m_impl->snapshot["current"] = index;
    }
    broadcast(j.dump());
}

void StatusBridge::sendStageFinished(const StageReport& report) {
    if (!m_running || !m_impl) return;

    json j = reportToJson(report);
    j["type"] = "stage_finished";

    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        m_impl->snapshot["stages"].push_back(reportToJson(report));
    }
    broadcast(j.dump());
}

void StatusBridge::sendPipelineFinished(const PipelineResult& result) {
    if (!m_running || !m_impl) return;

    json j;
    j["type"] = "pipeline_finished";
    j["state"] = pipelineStateName(result.state);
    j["totalAttempts"] = result.totalAttempts();
    if (const StageReport* halted = result.haltedStage()) {
        j["haltedAt"] = reportToJson(*halted);
    }
    if (!result.error.empty()) {
        j["error"] = result.error;
    }

    {
        std::lock_guard<std::mutex> lock(m_impl->mutex);
        m_impl->snapshot["state"] = pipelineStateName(result.state);
        m_impl->snapshot.erase("current");
    }
    broadcast(j.dump());
}

} // namespace blendpipe
