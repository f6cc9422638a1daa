// src/core/Log.h
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rocketrun::core {

struct LogOptions {
    std::string           level = "info"; // trace/debug/info/warn/error/critical/off
    std::filesystem::path file;           // empty = console only
    bool                  console = true;
};

// Installs the "rocketrun" logger as spdlog's default logger.
// Safe to call more than once; the previous default logger is replaced.
std::shared_ptr<spdlog::logger> InitLogging(const LogOptions& options);

// Flushes and drops every registered logger.
void ShutdownLogging();

// Parses a level name; returns false (and leaves `out` untouched) on unknown text.
[[nodiscard]] bool ParseLogLevel(const std::string& text, spdlog::level::level_enum& out) noexcept;

} // namespace rocketrun::core
