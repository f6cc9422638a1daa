#pragma once

#include <cstdint>
#include <optional>

#include "sim/Direction.h"

namespace rocketrun::sim {

enum class TileType : std::uint8_t {
    Empty = 0,
    Rocket,
    Hole,
    Up,
    UpHalf,
    Down,
    DownHalf,
    Left,
    LeftHalf,
    Right,
    RightHalf,
};

// Full arrow -> half arrow -> Empty. Every other tile is left as is.
[[nodiscard]] TileType Diminish(TileType tile) noexcept;

// Direction of an arrow tile (full or half); nullopt for Empty/Rocket/Hole.
[[nodiscard]] std::optional<Direction> TileDirection(TileType tile) noexcept;

[[nodiscard]] TileType ArrowTile(Direction d) noexcept;

[[nodiscard]] inline bool IsArrow(TileType tile) noexcept { return TileDirection(tile).has_value(); }
[[nodiscard]] bool IsFullArrow(TileType tile) noexcept;

[[nodiscard]] const char* TileTypeName(TileType tile) noexcept;

} // namespace rocketrun::sim
