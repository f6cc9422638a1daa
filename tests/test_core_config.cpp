// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.{h,cpp}.
//
// Goals:
//   - Saving creates the directory + writes rocketrun.ini
//   - Loading round-trips values
//   - Corrupt values do not throw / crash and keep the previous value
//   - Every skipped line is reported with its line number

#include <doctest/doctest.h>

#include "core/Config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
namespace core = rocketrun::core;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("rocketrun_core_config_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void WriteIni(const fs::path& dir, const std::string& text)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    std::ofstream f(core::ConfigPath(dir), std::ios::binary | std::ios::trunc);
    REQUIRE(f.good());
    f << text;
}

} // namespace

TEST_CASE("core::SaveConfig creates rocketrun.ini and core::LoadConfig round-trips values")
{
    const fs::path dir = make_unique_temp_dir() / "roundtrip";

    core::Config cfg;
    cfg.maxTicks = 600;
    cfg.realtime = true;
    cfg.placeSolution = false;
    cfg.logLevel = "debug";
    cfg.logFile = "run.log";

    CHECK(core::SaveConfig(cfg, dir));
    CHECK(fs::exists(dir / "rocketrun.ini"));

    core::Config loaded;
    std::vector<std::string> warnings;
    CHECK(core::LoadConfig(loaded, dir, &warnings));
    CHECK(warnings.empty());
    CHECK(loaded.maxTicks == 600);
    CHECK(loaded.realtime == true);
    CHECK(loaded.placeSolution == false);
    CHECK(loaded.logLevel == "debug");
    CHECK(loaded.logFile == "run.log");

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig returns false for missing file (first run)")
{
    const fs::path dir = make_unique_temp_dir() / "missing";
    std::error_code ec;
    fs::create_directories(dir, ec);

    core::Config cfg; // defaults
    CHECK_FALSE(core::LoadConfig(cfg, dir));
    CHECK(cfg.maxTicks == 7200);
    CHECK(cfg.placeSolution);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig tolerates corrupt values (does not throw)")
{
    const fs::path dir = make_unique_temp_dir() / "corrupt";
    WriteIni(dir,
             "max_ticks=not_an_int\n"
             "realtime=maybe\n"
             "place_solution=no\n");

    core::Config cfg;
    cfg.maxTicks = 111;    // should remain unchanged (invalid)
    cfg.realtime = true;   // should remain unchanged (invalid bool)
    cfg.placeSolution = true;

    std::vector<std::string> warnings;
    CHECK(core::LoadConfig(cfg, dir, &warnings));
    CHECK(cfg.maxTicks == 111);
    CHECK(cfg.realtime == true);
    CHECK(cfg.placeSolution == false);

    REQUIRE(warnings.size() == 2);
    CHECK(warnings[0].rfind("rocketrun.ini:1:", 0) == 0);
    CHECK(warnings[1].rfind("rocketrun.ini:2:", 0) == 0);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig clamps max_ticks")
{
    const fs::path dir = make_unique_temp_dir() / "clamp";

    core::Config cfg;
    WriteIni(dir, "max_ticks = 0\n");
    CHECK(core::LoadConfig(cfg, dir));
    CHECK(cfg.maxTicks == core::kMinMaxTicks);

    WriteIni(dir, "max_ticks = 99999999\n");
    CHECK(core::LoadConfig(cfg, dir));
    CHECK(cfg.maxTicks == core::kMaxMaxTicks);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig supports comments, sections, BOM and any key case")
{
    const fs::path dir = make_unique_temp_dir() / "syntax";
    WriteIni(dir,
             "\xEF\xBB\xBF# rocketrun\n"
             "[runner]\n"
             "MAX_TICKS = 600  # ten seconds\n"
             "Realtime = on ; pace it\n"
             "\n"
             "; whole line comment\n"
             "log_level = warn\n");

    core::Config cfg;
    std::vector<std::string> warnings;
    CHECK(core::LoadConfig(cfg, dir, &warnings));
    CHECK(warnings.empty());
    CHECK(cfg.maxTicks == 600);
    CHECK(cfg.realtime);
    CHECK(cfg.logLevel == "warn");

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig reports unknown keys and lines without '='")
{
    const fs::path dir = make_unique_temp_dir() / "unknown";
    WriteIni(dir,
             "max_ticks = 42\n"
             "window_width = 800\n"
             "just some words\n");

    core::Config cfg;
    std::vector<std::string> warnings;
    CHECK(core::LoadConfig(cfg, dir, &warnings));
    CHECK(cfg.maxTicks == 42);

    REQUIRE(warnings.size() == 2);
    CHECK(warnings[0].find("unknown key 'window_width'") != std::string::npos);
    CHECK(warnings[1].rfind("rocketrun.ini:3:", 0) == 0);

    std::error_code dec;
    fs::remove_all(dir, dec);
}
