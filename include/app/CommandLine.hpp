#pragma once

#include <string>
#include <vector>

#include "core/GameConfig.hpp"

namespace game2048::app {

enum class ParseOutcome {
    Run,        // config is ready to use
    ShowHelp,   // --help / -h: print usage, exit successfully
    Error       // unknown option, missing or malformed value
};

struct CommandLine {
    ParseOutcome outcome{ParseOutcome::Run};
    core::GameConfig config;
};

/// Build a GameConfig from program arguments (argv[0] excluded).
/// Understands --size N, --target T, --best-file PATH, --seed S, --help.
/// On Error the reason has already been written to std::cerr.
CommandLine parseCommandLine(const std::vector<std::string>& args);

CommandLine parseCommandLine(int argc, char** argv);

std::string usage(const std::string& program);

} // namespace game2048::app
