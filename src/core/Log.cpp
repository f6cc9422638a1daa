#include "core/Log.h"

#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace rocketrun::core {

namespace {

constexpr const char* kLoggerName = "rocketrun";
constexpr const char* kPattern    = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// Common default logger configuration.
void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger,
                              spdlog::level::level_enum level)
{
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern(kPattern);
}

} // namespace

bool ParseLogLevel(const std::string& text, spdlog::level::level_enum& out) noexcept
{
    // spdlog maps anything it does not know to "off"; only accept "off" when
    // it was actually spelled out.
    const auto level = spdlog::level::from_str(text);
    if (level == spdlog::level::off && text != "off")
        return false;

    out = level;
    return true;
}

std::shared_ptr<spdlog::logger> InitLogging(const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;

    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!options.file.empty())
    {
        std::error_code ec;
        if (options.file.has_parent_path())
            fs::create_directories(options.file.parent_path(), ec);

        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file.string(), true));
        }
        catch (const spdlog::spdlog_ex& ex)
        {
            // Keep going with whatever sinks we have; the failure is reported below.
            if (sinks.empty())
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            auto fallback = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            configure_default_logger(fallback, spdlog::level::info);
            spdlog::warn("Log file '{}' could not be opened: {}", options.file.string(), ex.what());
            return fallback;
        }
    }

    spdlog::level::level_enum level = spdlog::level::info;
    const bool levelOk = ParseLogLevel(options.level, level);

    spdlog::drop(kLoggerName);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    configure_default_logger(logger, level);

    if (!levelOk)
        spdlog::warn("Unknown log level '{}', using info", options.level);

    return logger;
}

void ShutdownLogging()
{
    spdlog::shutdown();
}

} // namespace rocketrun::core
