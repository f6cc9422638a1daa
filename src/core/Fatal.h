#pragma once

namespace rocketrun::core {

// Logs the failed check at critical level, flushes every logger and aborts.
// Called through ROCKETRUN_VERIFY; never returns.
[[noreturn]] void FatalError(const char* expr, const char* file, int line, const char* message) noexcept;

} // namespace rocketrun::core
