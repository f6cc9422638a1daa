#include "sim/WorldState.h"

namespace rocketrun::sim {

const char* WorldStateChangeName(WorldStateChange change) noexcept
{
    switch (change) {
    case WorldStateChange::NoChange: return "NoChange";
    case WorldStateChange::Win:      return "Win";
    case WorldStateChange::Lose:     return "Lose";
    }
    return "Unknown";
}

const char* WorldStateName(WorldState state) noexcept
{
    switch (state) {
    case WorldState::Stopped:     return "Stopped";
    case WorldState::Running:     return "Running";
    case WorldState::RunningFast: return "RunningFast";
    case WorldState::Success:     return "Success";
    case WorldState::Defeat:      return "Defeat";
    }
    return "Unknown";
}

} // namespace rocketrun::sim
