#include "sim/TileType.h"

namespace rocketrun::sim {

TileType Diminish(TileType tile) noexcept
{
    switch (tile) {
    case TileType::Up:    return TileType::UpHalf;
    case TileType::Down:  return TileType::DownHalf;
    case TileType::Left:  return TileType::LeftHalf;
    case TileType::Right: return TileType::RightHalf;

    case TileType::UpHalf:
    case TileType::DownHalf:
    case TileType::LeftHalf:
    case TileType::RightHalf:
        return TileType::Empty;

    default:
        return tile;
    }
}

std::optional<Direction> TileDirection(TileType tile) noexcept
{
    switch (tile) {
    case TileType::Up:
    case TileType::UpHalf:    return Direction::Up;
    case TileType::Down:
    case TileType::DownHalf:  return Direction::Down;
    case TileType::Left:
    case TileType::LeftHalf:  return Direction::Left;
    case TileType::Right:
    case TileType::RightHalf: return Direction::Right;
    default:                  return std::nullopt;
    }
}

TileType ArrowTile(Direction d) noexcept
{
    switch (d) {
    case Direction::Up:    return TileType::Up;
    case Direction::Down:  return TileType::Down;
    case Direction::Left:  return TileType::Left;
    case Direction::Right: return TileType::Right;
    }
    return TileType::Empty;
}

bool IsFullArrow(TileType tile) noexcept
{
    return tile == TileType::Up || tile == TileType::Down ||
           tile == TileType::Left || tile == TileType::Right;
}

const char* TileTypeName(TileType tile) noexcept
{
    switch (tile) {
    case TileType::Empty:     return "Empty";
    case TileType::Rocket:    return "Rocket";
    case TileType::Hole:      return "Hole";
    case TileType::Up:        return "Up";
    case TileType::UpHalf:    return "UpHalf";
    case TileType::Down:      return "Down";
    case TileType::DownHalf:  return "DownHalf";
    case TileType::Left:      return "Left";
    case TileType::LeftHalf:  return "LeftHalf";
    case TileType::Right:     return "Right";
    case TileType::RightHalf: return "RightHalf";
    }
    return "Unknown";
}

} // namespace rocketrun::sim
