// blendpipe CLI Commands
// Handles: blendpipe ping, blendpipe exec, blendpipe run, --help, --version

#include "app.h"
#include <blendpipe/cli.h>
#include <blendpipe/config.h>
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>

namespace blendpipe::cli {

// Options shared by every subcommand. Environment variables fill in what the
// command line leaves out; the pipeline file sits below both.
struct CommonOptions {
    std::string host;
    int port = DEFAULT_PORT;
    double timeoutSeconds = 0.0;
    int attempts = 0;
    bool debug = false;
    bool retryOnError = false;

    CLI::Option* hostOpt = nullptr;
    CLI::Option* portOpt = nullptr;
    CLI::Option* timeoutOpt = nullptr;
    CLI::Option* attemptsOpt = nullptr;
    CLI::Option* debugOpt = nullptr;

    void addTo(CLI::App* cmd) {
        hostOpt = cmd->add_option("--host", host, "Script server host (default: localhost)")
                     ->envname("BLENDPIPE_HOST");
        portOpt = cmd->add_option("-p,--port", port, "Script server port (default: 9876)")
                     ->envname("BLENDPIPE_PORT")
                     ->check(CLI::Range(1, 65535));
        timeoutOpt = cmd->add_option("-t,--timeout", timeoutSeconds,
                                     "Base timeout in seconds for the first attempt")
                        ->envname("BLENDPIPE_TIMEOUT")
                        ->check(CLI::PositiveNumber);
        attemptsOpt = cmd->add_option("-a,--attempts", attempts, "Maximum attempts per command")
                         ->check(CLI::Range(1, 100));
        debugOpt = cmd->add_flag("-d,--debug", debug,
                                 "Debug mode: fewer attempts, shorter timeouts")
                      ->envname("BLENDPIPE_DEBUG");
        cmd->add_flag("--retry-on-error", retryOnError,
                      "Also retry when the script itself fails (only for scripts safe to re-run)");
    }

    ConfigOverrides overrides() const {
        ConfigOverrides o;
        if (hostOpt->count() > 0) o.host = host;
        if (portOpt->count() > 0) o.port = port;
        if (timeoutOpt->count() > 0) o.baseTimeout = secondsToMillis(timeoutSeconds);
        if (attemptsOpt->count() > 0) o.attempts = attempts;
        if (debugOpt->count() > 0) o.debug = debug;
        return o;
    }
};

int handleCommand(int argc, char** argv) {
    CLI::App app{"blendpipe - Run script pipelines on a remote 3D host"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(1);

    // 'ping' subcommand
    CommonOptions pingOpts;
    auto* pingCmd = app.add_subcommand("ping", "Check that the script server is reachable");
    pingOpts.addTo(pingCmd);

    // 'exec' subcommand
    CommonOptions execOpts;
    std::string execScript;
    std::string execCode;
    std::string execHostPath;
    std::string execLabel;
    auto* execCmd = app.add_subcommand("exec", "Execute one script on the host");
    execOpts.addTo(execCmd);
    auto* scriptOpt = execCmd->add_option("script", execScript, "Local script file to send")
                             ->check(CLI::ExistingFile);
    auto* codeOpt = execCmd->add_option("-c,--code", execCode, "Inline code to send");
    auto* hostPathOpt = execCmd->add_option("--host-path", execHostPath,
                                            "Script path opened by the host itself");
    execCmd->add_option("-l,--label", execLabel, "Label shown in logs");
    scriptOpt->excludes(codeOpt)->excludes(hostPathOpt);
    codeOpt->excludes(hostPathOpt);

    // 'run' subcommand
    CommonOptions runOpts;
    std::string runPipelinePath;
    std::string runFrom;
    int runMonitorPort = 0;
    auto* runCmd = app.add_subcommand("run", "Run a pipeline file, stopping at the first failed stage");
    runOpts.addTo(runCmd);
    runCmd->add_option("pipeline", runPipelinePath, "Pipeline JSON file")
          ->required()
          ->check(CLI::ExistingFile);
    runCmd->add_option("-f,--from", runFrom, "Resume from this stage (name or 1-based number)");
    runCmd->add_option("--monitor-port", runMonitorPort,
                       "Broadcast progress over WebSocket on this port")
          ->check(CLI::Range(1, 65535));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? EXIT_OK : EXIT_USAGE;
    }

    AppConfig config;

    if (pingCmd->parsed()) {
        config.mode = AppMode::Ping;
        config.overrides = pingOpts.overrides();
    } else if (execCmd->parsed()) {
        if (execScript.empty() && execCode.empty() && execHostPath.empty()) {
            std::cerr << "Error: exec needs a script file, --code or --host-path\n";
            return EXIT_USAGE;
        }
        config.mode = AppMode::Exec;
        config.overrides = execOpts.overrides();
        config.scriptPath = execScript;
        config.code = execCode;
        config.hostPath = execHostPath;
        config.label = execLabel;
        config.retryOnError = execOpts.retryOnError;
    } else {
        config.mode = AppMode::Run;
        config.overrides = runOpts.overrides();
        config.pipelinePath = runPipelinePath;
        config.fromStage = runFrom;
        config.monitorPort = runMonitorPort;
        config.retryOnError = runOpts.retryOnError;
    }

    Application application(std::move(config));
    return application.run();
}

} // namespace blendpipe::cli
