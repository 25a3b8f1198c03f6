#pragma once

/**
 * @file pipeline_config.h
 * @brief Loading pipeline definitions from JSON
 *
 * @code
 * {
 *   "host": "localhost",
 *   "port": 9876,
 *   "base_timeout": 30,
 *   "attempts": 3,
 *   "stages": [
 *     { "name": "Scene Clearing", "script": "scripts/clear_scene.py" },
 *     { "name": "Physics", "script": "scripts/animate_physics.py", "timeout": 120, "attempts": 2 },
 *     { "name": "Probe", "code": "import bpy\nprint(len(bpy.data.objects))", "retry_on_error": true },
 *     { "name": "Render", "path": "/abs/path/on/host/render.py" }
 *   ]
 * }
 * @endcode
 *
 * Timeouts are in seconds. "script" paths are relative to the file's
 * directory; "path" is passed to the host untouched. Stage attempts and
 * timeout default to the file-level values.
 */

#include <blendpipe/config.h>
#include <blendpipe/pipeline.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace blendpipe {

/// A parsed pipeline file
struct PipelineFile {
    ClientConfig client;
    std::vector<Stage> stages;
    std::filesystem::path path;
};

/// Result of loading a pipeline file
struct PipelineLoadResult {
    std::optional<PipelineFile> pipeline;
    std::string error;

    bool ok() const { return pipeline.has_value(); }
};

/// Values supplied from outside the file (environment, command line)
struct ConfigOverrides {
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<Millis> baseTimeout;   ///< Also replaces every stage timeout
    std::optional<int> attempts;         ///< Also replaces every stage attempt budget
    std::optional<bool> debug;
};

/**
 * @brief Parse pipeline JSON text
 * @param text File contents
 * @param baseDir Directory that relative "script" paths are resolved against
 * @param defaults Client settings the file's values are layered over
 */
PipelineLoadResult parsePipeline(const std::string& text,
                                 const std::filesystem::path& baseDir,
                                 const ClientConfig& defaults);

/// @brief Read and parse a pipeline file
PipelineLoadResult loadPipelineFile(const std::filesystem::path& path, const ClientConfig& defaults);

/// @brief Layer overrides onto a client config
void applyOverrides(ClientConfig& config, const ConfigOverrides& overrides);

/// @brief Layer overrides onto a loaded pipeline (client config and stages)
void applyOverrides(PipelineFile& file, const ConfigOverrides& overrides);

/**
 * @brief Find a stage by name, or by 1-based number when no stage has that name
 * @return Zero-based index, or nullopt when nothing matches
 */
std::optional<size_t> resolveStage(const std::vector<Stage>& stages, const std::string& nameOrNumber);

/// @brief Seconds (possibly fractional) to milliseconds
Millis secondsToMillis(double seconds);

} // namespace blendpipe
