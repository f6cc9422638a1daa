// src/app/RunnerMain.cpp
//
// rocketrun_run: headless level runner
// ------------------------------------
// Loads one level (a level file or an entry of a map pack), places its
// solution arrows plus any arrows given on the command line, and drives the
// state machine with idle input until the level is won, lost or the tick
// limit runs out. Useful for checking that a level is solvable.

#include "app/CommandLineArgs.h"
#include "app/StateMachine.h"
#include "core/Config.h"
#include "core/Log.h"
#include "maps/MapPack.h"
#include "maps/MapPack_Format.h"
#include "sim/FixedTimestep.h"
#include "sim/World.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace rocketrun;

namespace {

constexpr int kExitWin     = 0;
constexpr int kExitLose    = 1;
constexpr int kExitTimeout = 2;
constexpr int kExitError   = 3;

enum class RunOutcome { Win, Lose, Timeout };

const char* RunOutcomeName(RunOutcome o) noexcept
{
    switch (o) {
    case RunOutcome::Win:     return "Win";
    case RunOutcome::Lose:    return "Lose";
    case RunOutcome::Timeout: return "Timeout";
    }
    return "Unknown";
}

struct RunResult {
    RunOutcome    outcome = RunOutcome::Timeout;
    std::uint32_t frames = 0;
};

bool LoadSelectedLevel(const app::CommandLineArgs& args, sim::MapBuffer& map,
                       std::uint16_t& mapCount, std::string& error)
{
    if (args.mapFile && args.packFile)
    {
        error = "use either --map or --pack, not both";
        return false;
    }

    if (args.mapFile)
    {
        mapCount = 1;
        return maps::LoadLevelFile(*args.mapFile, map, &error);
    }

    if (args.packFile)
    {
        maps::MapPack pack;
        if (!pack.load(*args.packFile, &error))
            return false;

        const int level = args.level.value_or(0);
        if (level < 0)
        {
            error = "--level must not be negative";
            return false;
        }

        mapCount = static_cast<std::uint16_t>(std::min<std::size_t>(pack.size(), 0xFFFF));
        return pack.loadLevel(static_cast<std::size_t>(level), map, &error);
    }

    error = "no level given (use --map or --pack)";
    return false;
}

bool PlaceArrows(sim::World& world, const core::Config& cfg, const std::vector<app::ArrowArg>& arrows)
{
    if (cfg.placeSolution)
    {
        const int placed = world.placeSolution();
        spdlog::info("Placed {} solution arrow(s)", placed);
    }

    for (const auto& a : arrows)
    {
        if (!sim::InBounds(a.x, a.y))
        {
            spdlog::error("--arrow {},{} is outside the {}x{} grid", a.x, a.y, sim::kWorldWidth, sim::kWorldHeight);
            return false;
        }

        // Command-line arrows come on top of the level's own stock.
        const auto r = world.placeExtraArrow(a.x, a.y, a.direction);
        if (r != sim::PlaceArrowResult::Placed)
            spdlog::warn("Arrow {} at ({},{}) not placed: {}",
                         sim::DirectionName(a.direction), a.x, a.y, sim::PlaceArrowResultName(r));
    }

    return true;
}

// Returns true once the game screen has latched a result.
bool Finished(const app::StateMachine& machine, RunResult& result)
{
    const auto* game = std::get_if<app::GameState>(&machine.state());
    if (!game)
        return false;

    if (game->run == sim::WorldState::Success)
    {
        result.outcome = RunOutcome::Win;
        return true;
    }
    if (game->run == sim::WorldState::Defeat)
    {
        result.outcome = RunOutcome::Lose;
        return true;
    }
    return false;
}

RunResult Run(app::StateMachine& machine, const core::Config& cfg)
{
    const input::InputState idle{};
    const auto maxTicks = static_cast<std::uint32_t>(cfg.maxTicks);
    // Room for the transition into the game screen on top of the tick budget.
    const std::uint32_t maxFrames = maxTicks + 4u * app::StateMachine::kTransitionFrames;

    RunResult result;
    const auto keepGoing = [&]() {
        return !Finished(machine, result) &&
               machine.world().tickCount() < maxTicks &&
               machine.frame() < maxFrames;
    };

    if (!cfg.realtime)
    {
        while (keepGoing())
            machine.tick(idle);
    }
    else
    {
        using clock = std::chrono::steady_clock;
        sim::FixedTimestep timestep;
        auto last = clock::now();

        while (keepGoing())
        {
            const auto now = clock::now();
            const double elapsed = std::chrono::duration<double>(now - last).count();
            last = now;

            timestep.step(elapsed, [&](std::uint64_t) {
                machine.tick(idle);
                return keepGoing();
            });

            std::this_thread::sleep_for(std::chrono::duration<double>(timestep.remaining()));
        }
    }

    Finished(machine, result);
    result.frames = machine.frame();
    return result;
}

bool WriteReport(const std::string& path, const sim::World& world, const RunResult& result)
{
    try
    {
        const nlohmann::json j = {
            {"format", maps::packfmt::kReportFormat},
            {"version", maps::packfmt::kReportVersion},
            {"map", world.name()},
            {"author", world.author()},
            {"outcome", RunOutcomeName(result.outcome)},
            {"frames", result.frames},
            {"ticks", world.tickCount()},
            {"mice", world.mice().size()},
            {"cats", world.cats().size()},
        };

        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f)
        {
            spdlog::error("Cannot open report file {}", path);
            return false;
        }
        f << j.dump(2) << "\n";
        return static_cast<bool>(f);
    }
    catch (const std::exception& e)
    {
        spdlog::error("Writing report {} failed: {}", path, e.what());
        return false;
    }
}

} // namespace

int main(int argc, char** argv)
{
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);

    // Console logging until the configuration is known.
    core::InitLogging(core::LogOptions{});

    if (args.showHelp)
    {
        std::fputs(app::BuildCommandLineHelpText().c_str(), stdout);
        return kExitWin;
    }

    if (!args.unknown.empty())
    {
        for (const auto& a : args.unknown)
            spdlog::error("Unknown or invalid argument: {}", a);
        std::fputs(app::BuildCommandLineHelpText().c_str(), stderr);
        return kExitError;
    }

    core::Config cfg;
    const std::string configDir = args.configDir.value_or(".");
    if (!core::LoadConfig(cfg, configDir))
        spdlog::debug("No {} found, using defaults", core::ConfigPath(configDir).string());

    if (args.maxTicks)
        cfg.maxTicks = std::clamp(*args.maxTicks, core::kMinMaxTicks, core::kMaxMaxTicks);
    if (args.realtime)
        cfg.realtime = *args.realtime;
    if (args.noSolution)
        cfg.placeSolution = false;
    if (args.logLevel)
        cfg.logLevel = *args.logLevel;
    if (args.logFile)
        cfg.logFile = *args.logFile;

    core::LogOptions logOptions;
    logOptions.level = cfg.logLevel;
    logOptions.file = cfg.logFile;
    core::InitLogging(logOptions);

    sim::MapBuffer map{};
    std::uint16_t mapCount = 1;
    std::string error;
    if (!LoadSelectedLevel(args, map, mapCount, error))
    {
        spdlog::error("{}", error);
        core::ShutdownLogging();
        return kExitError;
    }

    sim::World world(map);
    spdlog::info("Level '{}' by '{}': {} mice, {} cats", world.name(), world.author(),
                 world.mice().size(), world.cats().size());

    if (!PlaceArrows(world, cfg, args.arrows))
    {
        core::ShutdownLogging();
        return kExitError;
    }

    app::StateMachine machine(sim::World{}, mapCount);
    machine.startGame(world);

    const RunResult result = Run(machine, cfg);
    spdlog::info("Result: {} after {} ticks ({} frames)",
                 RunOutcomeName(result.outcome), machine.world().tickCount(), result.frames);

    int exitCode = kExitTimeout;
    if (result.outcome == RunOutcome::Win)
        exitCode = kExitWin;
    else if (result.outcome == RunOutcome::Lose)
        exitCode = kExitLose;

    if (args.reportFile && !WriteReport(*args.reportFile, machine.world(), result))
        exitCode = kExitError;

    core::ShutdownLogging();
    return exitCode;
}
