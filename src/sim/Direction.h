#pragma once

#include <cstdint>
#include <optional>

namespace rocketrun::sim {

// The four ordinal headings. The numeric values match the two-bit direction
// fields of the packed map format.
enum class Direction : std::uint8_t {
    Up    = 0,
    Down  = 1,
    Left  = 2,
    Right = 3,
};

inline constexpr int kDirectionCount = 4;

[[nodiscard]] constexpr Direction TurnRight(Direction d) noexcept
{
    switch (d) {
    case Direction::Up:    return Direction::Right;
    case Direction::Down:  return Direction::Left;
    case Direction::Left:  return Direction::Up;
    case Direction::Right: return Direction::Down;
    }
    return d;
}

[[nodiscard]] constexpr Direction TurnLeft(Direction d) noexcept
{
    switch (d) {
    case Direction::Up:    return Direction::Left;
    case Direction::Down:  return Direction::Right;
    case Direction::Left:  return Direction::Down;
    case Direction::Right: return Direction::Up;
    }
    return d;
}

[[nodiscard]] constexpr Direction TurnAround(Direction d) noexcept
{
    switch (d) {
    case Direction::Up:    return Direction::Down;
    case Direction::Down:  return Direction::Up;
    case Direction::Left:  return Direction::Right;
    case Direction::Right: return Direction::Left;
    }
    return d;
}

[[nodiscard]] const char* DirectionName(Direction d) noexcept;

// Map glyphs: '^' 'v' '<' '>'.
[[nodiscard]] char DirectionGlyph(Direction d) noexcept;
[[nodiscard]] std::optional<Direction> DirectionFromGlyph(char32_t glyph) noexcept;

// Accepts "up"/"down"/"left"/"right" (any case) or a single glyph.
[[nodiscard]] std::optional<Direction> ParseDirection(const char* text) noexcept;

} // namespace rocketrun::sim
