// src/tools/MapCompilerMain.cpp
//
// rocketrun_mapc: level authoring tool
// ------------------------------------
// Compiles an ASCII-art level file into the packed 199-byte format.
//   - -o/--output writes the packed .bin
//   - --header writes a C++ header with the bytes as a constexpr array
//   - --print re-renders the compiled level in canonical form on stdout
//
// Exit code 0 on success, 1 on a compile error, 2 on usage errors.

#include "core/Log.h"
#include "maps/MapCompiler.h"
#include "sim/MapFormat.h"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace rocketrun;

namespace {

struct ToolArgs {
    bool                       showHelp = false;
    bool                       print = false;
    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::string> header;
    std::optional<std::string> symbol;
    std::string                logLevel = "warn";
    std::string                error;
};

ToolArgs ParseArgs(int argc, char** argv)
{
    ToolArgs out;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        const auto next = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argc) {
                out.error = "missing value for " + std::string(arg);
                return;
            }
            dst = argv[++i];
        };

        if (arg == "--help" || arg == "-h")        { out.showHelp = true; }
        else if (arg == "--print")                 { out.print = true; }
        else if (arg == "-o" || arg == "--output") { next(out.output); }
        else if (arg == "--header")                { next(out.header); }
        else if (arg == "--symbol")                { next(out.symbol); }
        else if (arg == "--log-level")
        {
            std::optional<std::string> level;
            next(level);
            if (level)
                out.logLevel = *level;
        }
        else if (!arg.empty() && arg[0] == '-')    { out.error = "unknown option " + std::string(arg); }
        else if (!out.input)                       { out.input = std::string(arg); }
        else                                       { out.error = "more than one input file"; }

        if (!out.error.empty())
            break;
    }
    return out;
}

void PrintUsage(std::FILE* to)
{
    std::fputs("Usage: rocketrun_mapc <level.txt> [-o level.bin] [--header level.h [--symbol NAME]] [--print]\n"
               "                      [--log-level LEVEL]\n", to);
}

// "where_to_go" -> "kWhereToGo"
std::string SymbolFromStem(const std::string& stem)
{
    std::string out = "k";
    bool upper = true;
    for (const char c : stem)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc))
        {
            upper = true;
            continue;
        }
        out.push_back(upper ? static_cast<char>(std::toupper(uc)) : c);
        upper = false;
    }
    return out.size() > 1 ? out : "kLevel";
}

bool WriteHeader(const fs::path& path, const std::string& symbol, const fs::path& source, const sim::MapBuffer& map)
{
    std::ostringstream ss;
    ss << "// Generated by rocketrun_mapc from " << source.filename().string() << ". Do not edit.\n";
    ss << "// " << sim::MapName(map) << " by " << sim::MapAuthor(map) << "\n";
    ss << "#pragma once\n\n";
    ss << "#include <array>\n#include <cstdint>\n\n";
    ss << "inline constexpr std::array<std::uint8_t, " << map.size() << "> " << symbol << " = {";
    for (std::size_t i = 0; i < map.size(); ++i)
    {
        if (i % 12 == 0)
            ss << "\n    ";
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%02X,", static_cast<unsigned>(map[i]));
        ss << buf << (i % 12 == 11 ? "" : " ");
    }
    ss << "\n};\n";

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        spdlog::error("Cannot open {} for writing", path.string());
        return false;
    }
    f << ss.str();
    return static_cast<bool>(f);
}

} // namespace

int main(int argc, char** argv)
{
    const ToolArgs args = ParseArgs(argc, argv);

    core::LogOptions logOptions;
    logOptions.level = args.logLevel;
    core::InitLogging(logOptions);

    if (args.showHelp)
    {
        PrintUsage(stdout);
        return 0;
    }

    if (!args.error.empty() || !args.input)
    {
        spdlog::error("{}", args.error.empty() ? "no input file" : args.error);
        PrintUsage(stderr);
        return 2;
    }

    const fs::path input = *args.input;
    sim::MapBuffer map{};
    std::string error;
    if (!maps::CompileMapFile(input, map, &error))
    {
        spdlog::error("{}", error);
        return 1;
    }

    spdlog::info("Compiled '{}' by '{}'", sim::MapName(map), sim::MapAuthor(map));

    if (args.output && !sim::WriteMapFile(*args.output, map, &error))
    {
        spdlog::error("{}", error);
        return 1;
    }

    if (args.header)
    {
        const std::string symbol = args.symbol.value_or(SymbolFromStem(input.stem().string()));
        if (!WriteHeader(*args.header, symbol, input, map))
            return 1;
    }

    if (args.print)
        std::fputs(maps::RenderMapText(map).c_str(), stdout);

    core::ShutdownLogging();
    return 0;
}
