// blendpipe - Entry Point
// Parses command-line arguments and runs the selected command

#include <blendpipe/cli.h>

int main(int argc, char** argv) {
    return blendpipe::cli::handleCommand(argc, argv);
}
