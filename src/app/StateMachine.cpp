#include "app/StateMachine.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace rocketrun::app {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

const char* AppStateName(const AppState& state) noexcept
{
    return std::visit(Overloaded{
        [](const IntroState&) { return "Intro"; },
        [](const MenuState&)  { return "Menu"; },
        [](const GameState&)  { return "Game"; },
    }, state);
}

StateMachine::StateMachine() = default;

StateMachine::StateMachine(sim::World world, std::uint16_t mapCount)
    : m_mapCount(mapCount)
    , m_world(std::move(world))
{
}

void StateMachine::tick(const input::InputState& input)
{
    ++m_frame;

    if (m_state != m_target)
    {
        if (m_transitionTimer > 0)
        {
            --m_transitionTimer;
        }
        else
        {
            spdlog::debug("StateMachine: {} -> {} at frame {}",
                          AppStateName(m_state), AppStateName(m_target), m_frame);
            m_state = m_target;

            if (m_pendingWorld && std::holds_alternative<GameState>(m_state))
            {
                m_world = std::move(*m_pendingWorld);
                m_pendingWorld.reset();
            }
        }
    }

    // The current state ticks even while a transition is pending.
    std::optional<AppState> request = std::visit(
        [this, &input](auto& s) { return tickState(s, input); }, m_state);

    if (request)
        requestTransition(*request);
}

void StateMachine::requestTransition(const AppState& target)
{
    m_target = target;
    m_transitionTimer = kTransitionFrames;

    if (!std::holds_alternative<GameState>(target))
        m_pendingWorld.reset();
}

void StateMachine::startGame(const sim::World& world)
{
    spdlog::info("StateMachine: starting '{}' by '{}'", world.name(), world.author());
    requestTransition(GameState{});

    if (!inTransition())
    {
        m_world = world;
        m_pendingWorld.reset();
        return;
    }

    m_pendingWorld = world;
}

// ------------------------------------------------------------------------------------------------
// Intro
// ------------------------------------------------------------------------------------------------

std::optional<AppState> StateMachine::tickState(IntroState& s, const input::InputState& in)
{
    ++s.frame;

    if (s.transitionStarted)
        return std::nullopt;

    const bool skip = in.btnStart.pressed || in.btnA.pressed || in.btnB.pressed;
    if (skip || s.frame == kIntroTimeoutFrames)
    {
        s.transitionStarted = true;
        return MenuState{0, m_mapCount};
    }

    return std::nullopt;
}

// ------------------------------------------------------------------------------------------------
// Menu
// ------------------------------------------------------------------------------------------------

std::optional<AppState> StateMachine::tickState(MenuState& s, const input::InputState& in)
{
    if (s.mapCount == 0)
        return std::nullopt;

    const std::uint16_t last = static_cast<std::uint16_t>(s.mapCount - 1);

    if (in.jsUp.pressed)
        s.mapIndex = (s.mapIndex == 0) ? last : static_cast<std::uint16_t>(s.mapIndex - 1);

    if (in.jsDown.pressed)
        s.mapIndex = (s.mapIndex >= last) ? 0 : static_cast<std::uint16_t>(s.mapIndex + 1);

    return std::nullopt;
}

// ------------------------------------------------------------------------------------------------
// Game
// ------------------------------------------------------------------------------------------------

std::optional<AppState> StateMachine::tickState(GameState& s, const input::InputState& in)
{
    using sim::WorldState;
    using sim::WorldStateChange;

    if (s.run == WorldState::Success || s.run == WorldState::Defeat)
        return std::nullopt;

    if (in.btnStart.pressed)
        s.run = (s.run == WorldState::Stopped) ? WorldState::Running : WorldState::Stopped;

    if (in.btnSelect.pressed && s.run != WorldState::Stopped)
        s.run = (s.run == WorldState::RunningFast) ? WorldState::Running : WorldState::RunningFast;

    int steps = 0;
    if (s.run == WorldState::Running)
        steps = 1;
    else if (s.run == WorldState::RunningFast)
        steps = 2;

    for (int i = 0; i < steps; ++i)
    {
        const WorldStateChange outcome = m_world.tick();
        if (outcome == WorldStateChange::NoChange)
            continue;

        s.lastOutcome = outcome;
        s.run = (outcome == WorldStateChange::Win) ? WorldState::Success : WorldState::Defeat;
        spdlog::info("StateMachine: '{}' {} after {} ticks",
                     m_world.name(), sim::WorldStateChangeName(outcome), m_world.tickCount());
        break;
    }

    return std::nullopt;
}

} // namespace rocketrun::app
