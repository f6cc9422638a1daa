#include "core/Fatal.h"

#include <cstdlib>

#include <spdlog/spdlog.h>

namespace rocketrun::core {

void FatalError(const char* expr, const char* file, int line, const char* message) noexcept
{
    spdlog::critical("Fatal: {} ({}) at {}:{}",
                     message ? message : "check failed",
                     expr ? expr : "?",
                     file ? file : "?",
                     line);
    spdlog::shutdown();
    std::abort();
}

} // namespace rocketrun::core
