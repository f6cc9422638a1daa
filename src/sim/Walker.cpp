#include "sim/Walker.h"

#include "common/Compiler.h"

namespace rocketrun::sim {

const char* WalkerTypeName(WalkerType type) noexcept
{
    switch (type) {
    case WalkerType::Mouse: return "Mouse";
    case WalkerType::Cat:   return "Cat";
    }
    return "Unknown";
}

const char* WalkerStateName(WalkerState state) noexcept
{
    switch (state) {
    case WalkerState::Alive:   return "Alive";
    case WalkerState::Dead:    return "Dead";
    case WalkerState::Rescued: return "Rescued";
    }
    return "Unknown";
}

Walker::Walker(int x, int y, Direction direction, WalkerType type) noexcept
    : m_x(static_cast<std::int8_t>(x), 0)
    , m_y(static_cast<std::int8_t>(y), 0)
    , m_direction(direction)
    , m_type(type)
{
}

WalkResult Walker::walk() noexcept
{
    const FixedPoint speed = (m_type == WalkerType::Cat) ? kCatSpeed : kMouseSpeed;

    bool crossed = false;
    switch (m_direction) {
    case Direction::Up: {
        const FixedPoint before = m_y;
        m_y -= speed;
        crossed = m_y.didOverflow(before);
        break;
    }
    case Direction::Down: {
        const FixedPoint before = m_y;
        m_y += speed;
        crossed = m_y.didOverflow(before);
        break;
    }
    case Direction::Left: {
        const FixedPoint before = m_x;
        m_x -= speed;
        crossed = m_x.didOverflow(before);
        break;
    }
    case Direction::Right: {
        const FixedPoint before = m_x;
        m_x += speed;
        crossed = m_x.didOverflow(before);
        break;
    }
    }

    return crossed ? WalkResult::NewSquare : WalkResult::None;
}

void Walker::wrapPosition(int width, int height) noexcept
{
    const auto wrap = [](FixedPoint p, int extent) {
        int cell = p.integerPart() % extent;
        if (cell < 0)
            cell += extent;
        return FixedPoint(static_cast<std::int8_t>(cell), p.fractionalPart());
    };

    m_x = wrap(m_x, width);
    m_y = wrap(m_y, height);
}

void Walker::kill()
{
    ROCKETRUN_VERIFY(m_state == WalkerState::Alive, "Walker::kill on a walker that is not alive");
    m_state = WalkerState::Dead;
}

void Walker::rescue()
{
    ROCKETRUN_VERIFY(m_state == WalkerState::Alive, "Walker::rescue on a walker that is not alive");
    m_state = WalkerState::Rescued;
}

} // namespace rocketrun::sim
