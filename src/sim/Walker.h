#pragma once

#include <cstdint>

#include "sim/Direction.h"
#include "sim/FixedPoint.h"

namespace rocketrun::sim {

enum class WalkerType : std::uint8_t { Mouse, Cat };
enum class WalkerState : std::uint8_t { Alive, Dead, Rescued };
enum class WalkResult : std::uint8_t { None, NewSquare };

// Distance covered per tick: a mouse crosses a cell in 60 ticks, a cat in 90.
inline constexpr FixedPoint kMouseSpeed{0, 6};
inline constexpr FixedPoint kCatSpeed{0, 4};

[[nodiscard]] const char* WalkerTypeName(WalkerType type) noexcept;
[[nodiscard]] const char* WalkerStateName(WalkerState state) noexcept;

// A single mouse or cat.
class Walker {
public:
    Walker(int x, int y, Direction direction, WalkerType type) noexcept;

    // Advances one tick along the current heading. Returns NewSquare when
    // the integer coordinate on the axis of travel just changed.
    WalkResult walk() noexcept;

    // Folds the integer position back into [0, width) x [0, height).
    // Only meaningful at a cell boundary, which is the only place a walker
    // can leave the grid.
    void wrapPosition(int width, int height) noexcept;

    [[nodiscard]] FixedPoint  x() const noexcept { return m_x; }
    [[nodiscard]] FixedPoint  y() const noexcept { return m_y; }
    [[nodiscard]] int         cellX() const noexcept { return m_x.integerPart(); }
    [[nodiscard]] int         cellY() const noexcept { return m_y.integerPart(); }
    [[nodiscard]] Direction   direction() const noexcept { return m_direction; }
    [[nodiscard]] WalkerType  type() const noexcept { return m_type; }
    [[nodiscard]] WalkerState state() const noexcept { return m_state; }
    [[nodiscard]] bool        isAlive() const noexcept { return m_state == WalkerState::Alive; }

    void setDirection(Direction direction) noexcept { m_direction = direction; }

    // Alive -> Dead / Alive -> Rescued. Fatal on any other walker.
    void kill();
    void rescue();

private:
    FixedPoint  m_x;
    FixedPoint  m_y;
    Direction   m_direction;
    WalkerType  m_type;
    WalkerState m_state = WalkerState::Alive;
};

} // namespace rocketrun::sim
