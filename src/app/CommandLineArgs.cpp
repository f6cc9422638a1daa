#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>

namespace rocketrun::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (const char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (s.empty())
        return std::nullopt;

    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

// Splits "--name=value" into its parts; `value` is empty for "--name".
void SplitOption(std::string_view raw, std::string& name, std::optional<std::string_view>& value)
{
    const std::size_t eq = raw.find('=');
    if (eq == std::string_view::npos || raw.size() < 2 || raw[0] != '-')
    {
        name = ToLower(raw);
        value.reset();
        return;
    }
    name = ToLower(raw.substr(0, eq));
    value = raw.substr(eq + 1);
}

} // namespace

std::optional<ArrowArg> ParseArrowArg(std::string_view text)
{
    const std::size_t c1 = text.find(',');
    if (c1 == std::string_view::npos)
        return std::nullopt;
    const std::size_t c2 = text.find(',', c1 + 1);
    if (c2 == std::string_view::npos)
        return std::nullopt;

    const auto x = ParseInt(text.substr(0, c1));
    const auto y = ParseInt(text.substr(c1 + 1, c2 - c1 - 1));
    const std::string dirText(text.substr(c2 + 1));
    const auto dir = sim::ParseDirection(dirText.c_str());
    if (!x || !y || !dir)
        return std::nullopt;

    return ArrowArg{*x, *y, *dir};
}

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    const std::size_t argc = argv.size();
    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        std::string arg;
        std::optional<std::string_view> inlineValue;
        SplitOption(raw, arg, inlineValue);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Simple flags
        if (arg == "--no-solution") { out.noSolution = true; continue; }
        if (arg == "--realtime") { out.realtime = true; continue; }
        if (arg == "--no-realtime") { out.realtime = false; continue; }

        // Options with values: inline "=value" or the next argument.
        const auto takeValue = [&]() -> std::optional<std::string_view> {
            if (inlineValue)
                return inlineValue;
            if (i + 1 >= argc)
                return std::nullopt;
            return argv[++i];
        };

        const auto takeString = [&](std::optional<std::string>& dst) {
            const auto v = takeValue();
            if (!v || v->empty()) {
                out.unknown.emplace_back(raw);
                return;
            }
            dst = std::string(*v);
        };

        const auto takeInt = [&](std::optional<int>& dst) {
            const auto v = takeValue();
            const auto parsed = v ? ParseInt(*v) : std::nullopt;
            if (!parsed) {
                out.unknown.emplace_back(raw);
                return;
            }
            dst = *parsed;
        };

        if (arg == "--map")        { takeString(out.mapFile); continue; }
        if (arg == "--pack")       { takeString(out.packFile); continue; }
        if (arg == "--config-dir") { takeString(out.configDir); continue; }
        if (arg == "--log-level")  { takeString(out.logLevel); continue; }
        if (arg == "--log-file")   { takeString(out.logFile); continue; }
        if (arg == "--report")     { takeString(out.reportFile); continue; }
        if (arg == "--level")      { takeInt(out.level); continue; }
        if (arg == "--max-ticks")  { takeInt(out.maxTicks); continue; }

        if (arg == "--arrow") {
            const auto v = takeValue();
            const auto parsed = v ? ParseArrowArg(*v) : std::nullopt;
            if (!parsed)
                out.unknown.emplace_back(raw);
            else
                out.arrows.push_back(*parsed);
            continue;
        }

        // Anything else is unknown.
        out.unknown.emplace_back(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream ss;
    ss << "rocketrun_run - run a level headless until it is won, lost or times out\n\n";
    ss << "Usage:\n";
    ss << "  rocketrun_run --map <level.txt|level.bin> [options]\n";
    ss << "  rocketrun_run --pack <pack.json> --level <index> [options]\n\n";
    ss << "Options:\n";
    ss << "  --help, -h               Show this help\n";
    ss << "  --map <file>             Level file (ASCII art .txt or packed .bin)\n";
    ss << "  --pack <file>            Map pack manifest (JSON)\n";
    ss << "  --level <index>          Level index within the pack (default 0)\n";
    ss << "  --max-ticks <n>          Give up after n simulation ticks\n";
    ss << "  --no-solution            Do not place the level's solution arrows\n";
    ss << "  --arrow X,Y,DIR          Place an arrow before running (repeatable)\n";
    ss << "  --realtime               Pace the simulation at 60 Hz wall-clock time\n";
    ss << "  --no-realtime            Run as fast as possible\n";
    ss << "  --config-dir <dir>       Directory holding rocketrun.ini\n";
    ss << "  --log-level <level>      trace, debug, info, warn, error, critical, off\n";
    ss << "  --log-file <file>        Also log to this file\n";
    ss << "  --report <file>          Write a JSON run report\n\n";
    ss << "Exit codes: 0 win, 1 lose, 2 timeout, 3 usage or load error\n";
    return ss.str();
}

} // namespace rocketrun::app
