#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace rocketrun::core {

// Settings for the headless runner, read from rocketrun.ini.
struct Config {
    int         maxTicks      = 7200;   // 2 minutes at 60 Hz
    bool        realtime      = false;
    bool        placeSolution = true;
    std::string logLevel      = "info";
    std::string logFile;                // empty = console only
};

inline constexpr int kMinMaxTicks = 1;
inline constexpr int kMaxMaxTicks = 1000000;

[[nodiscard]] std::filesystem::path ConfigPath(const std::filesystem::path& configDir);

// Returns false when the file is missing or unreadable; `cfg` keeps its values then.
// Lines that fail to parse are skipped and described in `warnings` (if given).
bool LoadConfig(Config& cfg, const std::filesystem::path& configDir,
                std::vector<std::string>* warnings = nullptr);
bool SaveConfig(const Config& cfg, const std::filesystem::path& configDir);

} // namespace rocketrun::core
