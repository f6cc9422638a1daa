// tests/test_state_machine.cpp
//
// src/app/StateMachine.{h,cpp}: intro timeout and skip, the 45-frame
// transition window, menu wrapping and the game screen's run states.

#include <doctest/doctest.h>

#include "app/StateMachine.h"

#include <initializer_list>
#include <string>
#include <variant>

using namespace rocketrun;
using app::GameState;
using app::IntroState;
using app::MenuState;
using app::StateMachine;
using sim::WorldState;
using sim::WorldStateChange;

namespace {

input::InputState Press(input::ButtonState input::InputState::*button)
{
    input::InputState in;
    (in.*button).pressed = true;
    (in.*button).down = true;
    return in;
}

void Run(StateMachine& sm, int frames, const input::InputState& in = {})
{
    for (int i = 0; i < frames; ++i)
        sm.tick(in);
}

// Skips the intro and waits out the transition.
void EnterMenu(StateMachine& sm)
{
    sm.tick(Press(&input::InputState::btnStart));
    Run(sm, StateMachine::kTransitionFrames + 1);
    REQUIRE(std::holds_alternative<MenuState>(sm.state()));
}

std::uint16_t MenuIndex(const StateMachine& sm)
{
    return std::get<MenuState>(sm.state()).mapIndex;
}

// One mouse a cell away from a rocket: wins on world tick 60.
sim::World QuickWin()
{
    sim::World w;
    REQUIRE(w.createWalker(2, 4, sim::Direction::Right, sim::WalkerType::Mouse));
    w.setTile(3, 4, sim::TileType::Rocket);
    return w;
}

const GameState& Game(const StateMachine& sm)
{
    REQUIRE(std::holds_alternative<GameState>(sm.state()));
    return std::get<GameState>(sm.state());
}

} // namespace

TEST_CASE("Intro times out into the menu after the transition window")
{
    StateMachine sm;
    CHECK(std::string(app::AppStateName(sm.state())) == "Intro");

    Run(sm, 119);
    CHECK_FALSE(sm.inTransition());

    const app::AppState menu = MenuState{0, 1};

    Run(sm, 1);
    CHECK(sm.inTransition());
    CHECK(sm.targetState() == menu);
    CHECK(sm.transitionTimer() == 45);

    // The intro keeps ticking during the window.
    Run(sm, 20);
    CHECK(sm.transitionTimer() == 25);
    CHECK(std::get<IntroState>(sm.state()).frame == 140);
    CHECK(std::get<IntroState>(sm.state()).transitionStarted);

    Run(sm, 25);
    CHECK(sm.frame() == 165);
    CHECK(sm.transitionTimer() == 0);
    CHECK(std::holds_alternative<IntroState>(sm.state()));

    Run(sm, 1);
    CHECK(sm.state() == menu);
    CHECK_FALSE(sm.inTransition());
}

TEST_CASE("Start, A or B skips the intro, once")
{
    for (auto button : {&input::InputState::btnStart, &input::InputState::btnA, &input::InputState::btnB})
    {
        StateMachine sm;
        sm.tick(Press(button));
        CHECK(sm.inTransition());
        CHECK(sm.transitionTimer() == 45);

        Run(sm, 10);
        // A second press is ignored; the window is not restarted.
        sm.tick(Press(button));
        CHECK(sm.transitionTimer() == 34);

        Run(sm, 34);
        CHECK(std::holds_alternative<IntroState>(sm.state()));
        Run(sm, 1);
        CHECK(std::holds_alternative<MenuState>(sm.state()));
        CHECK(sm.frame() == 47);
    }
}

TEST_CASE("Menu index wraps at both ends")
{
    StateMachine sm(sim::World{}, 3);
    EnterMenu(sm);
    CHECK(MenuIndex(sm) == 0);
    CHECK(std::get<MenuState>(sm.state()).mapCount == 3);

    sm.tick(Press(&input::InputState::jsDown));
    CHECK(MenuIndex(sm) == 1);
    sm.tick(Press(&input::InputState::jsDown));
    CHECK(MenuIndex(sm) == 2);
    sm.tick(Press(&input::InputState::jsDown));
    CHECK(MenuIndex(sm) == 0);
    sm.tick(Press(&input::InputState::jsUp));
    CHECK(MenuIndex(sm) == 2);

    // Holding the stick does not repeat.
    input::InputState held;
    held.jsUp.down = true;
    sm.tick(held);
    CHECK(MenuIndex(sm) == 2);
}

TEST_CASE("An empty menu ignores navigation")
{
    StateMachine sm(sim::World{}, 0);
    EnterMenu(sm);
    sm.tick(Press(&input::InputState::jsDown));
    sm.tick(Press(&input::InputState::jsUp));
    CHECK(MenuIndex(sm) == 0);
}

TEST_CASE("A new transition request replaces the pending one")
{
    StateMachine sm;
    sm.requestTransition(MenuState{2, 5});
    Run(sm, 10);
    CHECK(sm.transitionTimer() == 35);

    sm.requestTransition(GameState{});
    CHECK(sm.transitionTimer() == 45);
    CHECK(std::holds_alternative<GameState>(sm.targetState()));
}

TEST_CASE("startGame runs the level after the window and latches the result")
{
    StateMachine sm;
    sm.startGame(QuickWin());
    CHECK(sm.world().mice().empty());

    Run(sm, 45);
    CHECK(std::holds_alternative<IntroState>(sm.state()));
    CHECK(sm.world().mice().empty());
    CHECK(sm.world().tickCount() == 0);

    // The level is installed, and ticks once per frame, from the frame the
    // game screen appears.
    Run(sm, 1);
    CHECK(Game(sm).run == WorldState::Running);
    CHECK(sm.world().mice().size() == 1);
    CHECK(sm.world().tickCount() == 1);

    Run(sm, 59);
    CHECK(Game(sm).run == WorldState::Success);
    CHECK(Game(sm).lastOutcome == WorldStateChange::Win);
    CHECK(sm.world().tickCount() == 60);

    Run(sm, 30);
    CHECK(sm.world().tickCount() == 60);
    CHECK(Game(sm).run == WorldState::Success);
}

TEST_CASE("Start pauses the level and Select toggles fast forward")
{
    StateMachine sm;
    sm.startGame(QuickWin());
    Run(sm, 46);
    REQUIRE(sm.world().tickCount() == 1);

    sm.tick(Press(&input::InputState::btnStart));
    CHECK(Game(sm).run == WorldState::Stopped);
    Run(sm, 10);
    CHECK(sm.world().tickCount() == 1);

    // Fast forward cannot be engaged while stopped.
    sm.tick(Press(&input::InputState::btnSelect));
    CHECK(Game(sm).run == WorldState::Stopped);

    sm.tick(Press(&input::InputState::btnStart));
    CHECK(Game(sm).run == WorldState::Running);
    CHECK(sm.world().tickCount() == 2);

    sm.tick(Press(&input::InputState::btnSelect));
    CHECK(Game(sm).run == WorldState::RunningFast);
    CHECK(sm.world().tickCount() == 4);

    Run(sm, 10);
    CHECK(sm.world().tickCount() == 24);

    sm.tick(Press(&input::InputState::btnSelect));
    CHECK(Game(sm).run == WorldState::Running);
    CHECK(sm.world().tickCount() == 25);
}

TEST_CASE("startGame from a running level keeps the old level until the switch")
{
    // Two mice pacing an open grid: never wins or loses.
    sim::World stroll;
    REQUIRE(stroll.createWalker(1, 1, sim::Direction::Right, sim::WalkerType::Mouse));
    REQUIRE(stroll.createWalker(1, 6, sim::Direction::Left, sim::WalkerType::Mouse));

    StateMachine sm;
    sm.startGame(stroll);
    Run(sm, 46);
    REQUIRE(sm.world().mice().size() == 2);
    REQUIRE(sm.world().tickCount() == 1);

    SUBCASE("fast-forwarding level")
    {
        sm.tick(Press(&input::InputState::btnSelect));
        REQUIRE(Game(sm).run == WorldState::RunningFast);
        REQUIRE(sm.world().tickCount() == 3);

        sm.startGame(QuickWin());
        CHECK(sm.inTransition());

        Run(sm, StateMachine::kTransitionFrames);
        CHECK(Game(sm).run == WorldState::RunningFast);
        CHECK(sm.world().mice().size() == 2);
        CHECK(sm.world().tickCount() == 3 + 2 * StateMachine::kTransitionFrames);

        Run(sm, 1);
        CHECK_FALSE(sm.inTransition());
        CHECK(Game(sm).run == WorldState::Running);
        CHECK(sm.world().mice().size() == 1);
        CHECK(sm.world().tickCount() == 1);

        Run(sm, 59);
        CHECK(Game(sm).run == WorldState::Success);
    }

    SUBCASE("fresh game screen")
    {
        sm.startGame(QuickWin());
        CHECK_FALSE(sm.inTransition());
        CHECK(sm.world().mice().size() == 1);
        CHECK(sm.world().tickCount() == 0);

        Run(sm, 60);
        CHECK(Game(sm).run == WorldState::Success);
    }
}

TEST_CASE("Switching to the menu drops a level that has not started")
{
    StateMachine sm;
    sm.startGame(QuickWin());
    sm.requestTransition(MenuState{0, 1});

    Run(sm, StateMachine::kTransitionFrames + 1);
    REQUIRE(std::holds_alternative<MenuState>(sm.state()));

    sm.requestTransition(GameState{});
    Run(sm, StateMachine::kTransitionFrames + 1);
    REQUIRE(std::holds_alternative<GameState>(sm.state()));
    CHECK(sm.world().mice().empty());
}

TEST_CASE("A lost level latches Defeat")
{
    sim::World w;
    REQUIRE(w.createWalker(2, 4, sim::Direction::Right, sim::WalkerType::Mouse));
    w.setTile(3, 4, sim::TileType::Hole);

    StateMachine sm;
    sm.startGame(w);
    Run(sm, 45 + 60);
    CHECK(Game(sm).run == WorldState::Defeat);
    CHECK(Game(sm).lastOutcome == WorldStateChange::Lose);
    CHECK(std::string(app::AppStateName(sm.state())) == "Game");
}
