#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include "input/InputState.h"
#include "sim/World.h"
#include "sim/WorldState.h"

namespace rocketrun::app {

struct IntroState {
    std::uint32_t frame = 0;
    bool          transitionStarted = false;

    friend bool operator==(const IntroState&, const IntroState&) = default;
};

struct MenuState {
    std::uint16_t mapIndex = 0;
    std::uint16_t mapCount = 0;

    friend bool operator==(const MenuState&, const MenuState&) = default;
};

struct GameState {
    sim::WorldState       run = sim::WorldState::Running;
    sim::WorldStateChange lastOutcome = sim::WorldStateChange::NoChange;

    friend bool operator==(const GameState&, const GameState&) = default;
};

using AppState = std::variant<IntroState, MenuState, GameState>;

[[nodiscard]] const char* AppStateName(const AppState& state) noexcept;

// Top-level flow: Intro -> Menu, with Game entered from outside through
// startGame(). Every transition is delayed by a fixed grace window during
// which the outgoing state keeps ticking.
class StateMachine {
public:
    static constexpr std::uint16_t kTransitionFrames   = 45;
    static constexpr std::uint32_t kIntroTimeoutFrames = 120;

    StateMachine();
    explicit StateMachine(sim::World world, std::uint16_t mapCount = 1);

    // One frame.
    void tick(const input::InputState& input);

    // Schedules a transition. Replaces any pending one and restarts the
    // grace window.
    void requestTransition(const AppState& target);

    // Schedules the switch to a fresh game screen playing `world`. The level
    // is held back until the switch happens, so an outgoing game screen keeps
    // ticking its own level during the grace window. When a fresh game screen
    // is already showing there is nothing to wait for and the level is
    // installed at once.
    void startGame(const sim::World& world);

    [[nodiscard]] const AppState& state() const noexcept { return m_state; }
    [[nodiscard]] const AppState& targetState() const noexcept { return m_target; }
    [[nodiscard]] std::uint16_t transitionTimer() const noexcept { return m_transitionTimer; }
    [[nodiscard]] bool inTransition() const noexcept { return m_state != m_target; }

    [[nodiscard]] std::uint16_t mapCount() const noexcept { return m_mapCount; }
    [[nodiscard]] std::uint32_t frame() const noexcept { return m_frame; }

    [[nodiscard]] sim::World& world() noexcept { return m_world; }
    [[nodiscard]] const sim::World& world() const noexcept { return m_world; }

private:
    // Per-state frame update. A returned state is a transition request.
    [[nodiscard]] std::optional<AppState> tickState(IntroState& s, const input::InputState& in);
    [[nodiscard]] std::optional<AppState> tickState(MenuState& s, const input::InputState& in);
    [[nodiscard]] std::optional<AppState> tickState(GameState& s, const input::InputState& in);

    AppState      m_state{IntroState{}};
    AppState      m_target{IntroState{}};
    std::uint16_t m_transitionTimer = 0;
    std::uint16_t m_mapCount = 1;
    std::uint32_t m_frame = 0;
    sim::World    m_world;

    // Level passed to startGame(), installed when the game screen appears.
    std::optional<sim::World> m_pendingWorld;
};

} // namespace rocketrun::app
