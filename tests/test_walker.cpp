// tests/test_walker.cpp
//
// src/sim/Walker.{h,cpp}: per-tick motion, cell crossings and the
// Alive -> Dead/Rescued transitions.

#include <doctest/doctest.h>

#include "sim/Walker.h"

#include <string>
#include <vector>

using namespace rocketrun::sim;

namespace {

// Walks until the next cell boundary; returns the number of ticks taken.
int WalkToNextCell(Walker& w)
{
    for (int t = 1; t <= 1000; ++t)
    {
        if (w.walk() == WalkResult::NewSquare)
            return t;
    }
    return -1;
}

} // namespace

TEST_CASE("Mice cross a cell in 60 ticks, cats in 90")
{
    Walker mouse(2, 3, Direction::Right, WalkerType::Mouse);
    CHECK(WalkToNextCell(mouse) == 60);
    CHECK(mouse.cellX() == 3);
    CHECK(mouse.cellY() == 3);
    CHECK(mouse.x().fractionalPart() == 0);

    Walker cat(2, 3, Direction::Down, WalkerType::Cat);
    CHECK(WalkToNextCell(cat) == 90);
    CHECK(cat.cellX() == 2);
    CHECK(cat.cellY() == 4);
}

TEST_CASE("Walking up or left keeps the cell until a whole unit is travelled")
{
    Walker w(4, 4, Direction::Up, WalkerType::Mouse);
    CHECK(w.walk() == WalkResult::None);
    CHECK(w.cellY() == 4);
    CHECK(w.y().fractionalPart() == -6);

    CHECK(WalkToNextCell(w) == 59);
    CHECK(w.cellY() == 3);

    Walker l(4, 4, Direction::Left, WalkerType::Cat);
    CHECK(WalkToNextCell(l) == 90);
    CHECK(l.cellX() == 3);
}

TEST_CASE("wrapPosition folds positions that left the grid")
{
    Walker right(11, 2, Direction::Right, WalkerType::Mouse);
    REQUIRE(WalkToNextCell(right) == 60);
    CHECK(right.cellX() == 12);
    right.wrapPosition(12, 9);
    CHECK(right.cellX() == 0);

    Walker left(0, 2, Direction::Left, WalkerType::Mouse);
    REQUIRE(WalkToNextCell(left) == 60);
    CHECK(left.cellX() == -1);
    left.wrapPosition(12, 9);
    CHECK(left.cellX() == 11);

    Walker up(5, 0, Direction::Up, WalkerType::Cat);
    REQUIRE(WalkToNextCell(up) == 90);
    up.wrapPosition(12, 9);
    CHECK(up.cellY() == 8);
}

TEST_CASE("Walker state changes once")
{
    Walker a(0, 0, Direction::Up, WalkerType::Mouse);
    CHECK(a.isAlive());
    a.rescue();
    CHECK(a.state() == WalkerState::Rescued);
    CHECK_FALSE(a.isAlive());

    Walker b(0, 0, Direction::Up, WalkerType::Cat);
    b.kill();
    CHECK(b.state() == WalkerState::Dead);
    CHECK(std::string(WalkerStateName(b.state())) == "Dead");
    CHECK(std::string(WalkerTypeName(b.type())) == "Cat");
}

TEST_CASE("NewSquare fires on a fixed cadence")
{
    Walker mouse(1, 1, Direction::Right, WalkerType::Mouse);
    Walker cat(1, 2, Direction::Right, WalkerType::Cat);

    std::vector<int> mouseTicks;
    std::vector<int> catTicks;
    for (int t = 1; t <= 180; ++t)
    {
        if (mouse.walk() == WalkResult::NewSquare)
            mouseTicks.push_back(t);
        if (cat.walk() == WalkResult::NewSquare)
            catTicks.push_back(t);
    }

    const std::vector<int> expectedMouse = {60, 120, 180};
    const std::vector<int> expectedCat = {90, 180};
    CHECK(mouseTicks == expectedMouse);
    CHECK(catTicks == expectedCat);
}
