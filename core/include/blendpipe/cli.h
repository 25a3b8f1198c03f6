// blendpipe CLI Commands
// Handles: blendpipe ping, blendpipe exec, blendpipe run, --help, --version

#pragma once

namespace blendpipe::cli {

// Version info
constexpr const char* VERSION = "1.2.0";

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;       // A stage or command failed
constexpr int EXIT_USAGE = 2;        // Bad arguments or pipeline file
constexpr int EXIT_UNREACHABLE = 3;  // Pre-flight could not reach the host

// Parse arguments and run the selected command
// Returns the process exit code
int handleCommand(int argc, char** argv);

} // namespace blendpipe::cli
