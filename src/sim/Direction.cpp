#include "sim/Direction.h"

#include <cctype>
#include <cstring>

namespace rocketrun::sim {

const char* DirectionName(Direction d) noexcept
{
    switch (d) {
    case Direction::Up:    return "Up";
    case Direction::Down:  return "Down";
    case Direction::Left:  return "Left";
    case Direction::Right: return "Right";
    }
    return "Unknown";
}

char DirectionGlyph(Direction d) noexcept
{
    switch (d) {
    case Direction::Up:    return '^';
    case Direction::Down:  return 'v';
    case Direction::Left:  return '<';
    case Direction::Right: return '>';
    }
    return '?';
}

std::optional<Direction> DirectionFromGlyph(char32_t glyph) noexcept
{
    switch (glyph) {
    case U'^': return Direction::Up;
    case U'v': return Direction::Down;
    case U'<': return Direction::Left;
    case U'>': return Direction::Right;
    default:   return std::nullopt;
    }
}

std::optional<Direction> ParseDirection(const char* text) noexcept
{
    if (!text || !*text)
        return std::nullopt;

    if (text[1] == '\0')
        return DirectionFromGlyph(static_cast<unsigned char>(text[0]));

    char lower[8] = {};
    const std::size_t n = std::strlen(text);
    if (n >= sizeof(lower))
        return std::nullopt;
    for (std::size_t i = 0; i < n; ++i)
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));

    if (std::strcmp(lower, "up") == 0)    return Direction::Up;
    if (std::strcmp(lower, "down") == 0)  return Direction::Down;
    if (std::strcmp(lower, "left") == 0)  return Direction::Left;
    if (std::strcmp(lower, "right") == 0) return Direction::Right;
    return std::nullopt;
}

} // namespace rocketrun::sim
