#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sim/Direction.h"

namespace rocketrun::app {

struct ArrowArg {
    int            x = 0;
    int            y = 0;
    sim::Direction direction = sim::Direction::Up;
};

// Parsed command-line arguments for rocketrun_run.
//
// Notes:
//   - Option names are case-insensitive; values keep their case.
//   - Both "--opt=value" and "--opt value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;                    // --help / -h
    bool noSolution = false;                  // --no-solution

    std::optional<std::string> mapFile;       // --map <file.txt|file.bin>
    std::optional<std::string> packFile;      // --pack <pack.json>
    std::optional<int>         level;         // --level <index> (with --pack)
    std::optional<int>         maxTicks;      // --max-ticks <n>
    std::optional<bool>        realtime;      // --realtime / --no-realtime

    std::optional<std::string> configDir;     // --config-dir <dir>
    std::optional<std::string> logLevel;      // --log-level <level>
    std::optional<std::string> logFile;       // --log-file <file>
    std::optional<std::string> reportFile;    // --report <file.json>

    std::vector<ArrowArg> arrows;             // --arrow X,Y,DIR (repeatable)

    // Any unknown/unsupported args (or options with bad values) in order.
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

// "X,Y,DIR" with DIR one of up/down/left/right or ^ v < >.
[[nodiscard]] std::optional<ArrowArg> ParseArrowArg(std::string_view text);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace rocketrun::app
