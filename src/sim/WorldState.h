#pragma once

#include <cstdint>

namespace rocketrun::sim {

// Result of one World::tick().
enum class WorldStateChange : std::uint8_t {
    NoChange = 0,
    Win,
    Lose,
};

// Run state of a level while the game screen is active.
enum class WorldState : std::uint8_t {
    Stopped = 0,
    Running,
    RunningFast,
    Success,
    Defeat,
};

[[nodiscard]] const char* WorldStateChangeName(WorldStateChange change) noexcept;
[[nodiscard]] const char* WorldStateName(WorldState state) noexcept;

} // namespace rocketrun::sim
