#pragma once

// Packed 199-byte level format.
//
//   offset  size  content
//        0    32  map name (raw bytes, NUL padded, not NUL terminated)
//       32    32  author
//       64    27  walls: 4 cells per byte, top + left bit per cell
//       91   108  one entity/arrow byte per cell, row major
//
// Entity/arrow byte:
//   bits 7-5  entity (0 empty, 1 mouse, 2 cat, 3 rocket, 4 hole)
//   bits 4-3  entity direction (0 up, 1 down, 2 left, 3 right)
//   bit  2    arrow present
//   bits 1-0  arrow direction
//
// Only the top and left edge of each cell is stored. Bottom and right edges
// are the top/left edges of the neighbouring cell with toroidal wrap.

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "sim/Direction.h"

namespace rocketrun::sim {

inline constexpr int kWorldWidth  = 12;
inline constexpr int kWorldHeight = 9;
inline constexpr int kCellCount   = kWorldWidth * kWorldHeight;

namespace mapfmt {

inline constexpr std::size_t kNameOffset   = 0;
inline constexpr std::size_t kNameSize     = 32;
inline constexpr std::size_t kAuthorOffset = 32;
inline constexpr std::size_t kAuthorSize   = 32;
inline constexpr std::size_t kHeaderSize   = 64;
inline constexpr std::size_t kWallOffset   = kHeaderSize;
inline constexpr std::size_t kWallSize     = kCellCount / 4;
inline constexpr std::size_t kCellOffset   = kWallOffset + kWallSize;
inline constexpr std::size_t kCellSize     = kCellCount;
inline constexpr std::size_t kMapSize      = kCellOffset + kCellSize;

static_assert(kWallSize == 27);
static_assert(kCellOffset == 91);
static_assert(kMapSize == 199);

// Wall bits, selected by x & 3.
inline constexpr std::array<std::uint8_t, 4> kTopWallMask  = {0x01, 0x04, 0x10, 0x40};
inline constexpr std::array<std::uint8_t, 4> kLeftWallMask = {0x02, 0x08, 0x20, 0x80};

inline constexpr std::uint8_t kEntityTypeMask      = 0xE0;
inline constexpr std::uint8_t kEntityDirectionMask = 0x18;
inline constexpr std::uint8_t kArrowPresentMask    = 0x04;
inline constexpr std::uint8_t kArrowDirectionMask  = 0x03;
inline constexpr int          kEntityTypeShift      = 5;
inline constexpr int          kEntityDirectionShift = 3;

} // namespace mapfmt

using MapBuffer = std::array<std::uint8_t, mapfmt::kMapSize>;

enum class EntityType : std::uint8_t {
    Empty  = 0,
    Mouse  = 1,
    Cat    = 2,
    Rocket = 3,
    Hole   = 4,
    // 5-7 are unused and mark a corrupt buffer.
};

[[nodiscard]] const char* EntityTypeName(EntityType type) noexcept;

// Decoded entity/arrow byte. `entityType` is the raw 3-bit field so corrupt
// values survive decoding and can be reported.
struct CellRecord {
    std::uint8_t entityType      = 0;
    Direction    entityDirection = Direction::Up;
    bool         arrowPresent    = false;
    Direction    arrowDirection  = Direction::Up;

    [[nodiscard]] bool hasKnownEntity() const noexcept { return entityType <= static_cast<std::uint8_t>(EntityType::Hole); }
    [[nodiscard]] EntityType entity() const noexcept { return static_cast<EntityType>(entityType); }

    friend bool operator==(const CellRecord&, const CellRecord&) = default;
};

[[nodiscard]] constexpr CellRecord DecodeCell(std::uint8_t byte) noexcept
{
    CellRecord r;
    r.entityType      = static_cast<std::uint8_t>((byte & mapfmt::kEntityTypeMask) >> mapfmt::kEntityTypeShift);
    r.entityDirection = static_cast<Direction>((byte & mapfmt::kEntityDirectionMask) >> mapfmt::kEntityDirectionShift);
    r.arrowPresent    = (byte & mapfmt::kArrowPresentMask) != 0;
    r.arrowDirection  = static_cast<Direction>(byte & mapfmt::kArrowDirectionMask);
    return r;
}

[[nodiscard]] constexpr std::uint8_t EncodeCell(const CellRecord& r) noexcept
{
    std::uint8_t byte = static_cast<std::uint8_t>((r.entityType << mapfmt::kEntityTypeShift) & mapfmt::kEntityTypeMask);
    byte |= static_cast<std::uint8_t>((static_cast<std::uint8_t>(r.entityDirection) << mapfmt::kEntityDirectionShift) &
                                      mapfmt::kEntityDirectionMask);
    if (r.arrowPresent)
        byte |= mapfmt::kArrowPresentMask;
    byte |= static_cast<std::uint8_t>(static_cast<std::uint8_t>(r.arrowDirection) & mapfmt::kArrowDirectionMask);
    return byte;
}

// ------------------------------------------------------------------------------------------------
// Wall addressing
// ------------------------------------------------------------------------------------------------

enum class WallEdge : std::uint8_t { Top, Left };

// The cell/edge pair that physically stores a wall.
struct WallAddress {
    int      x    = 0;
    int      y    = 0;
    WallEdge edge = WallEdge::Top;

    friend bool operator==(const WallAddress&, const WallAddress&) = default;
};

// Location of a wall bit inside the wall block (byteIndex is relative to kWallOffset).
struct WallBit {
    std::size_t  byteIndex = 0;
    std::uint8_t mask      = 0;

    friend bool operator==(const WallBit&, const WallBit&) = default;
};

// Resolves (x, y, direction) to the owning cell and edge. A Down wall is the
// Top wall of the cell below, a Right wall the Left wall of the cell to the
// right, both with wraparound. x and y must be inside the grid.
[[nodiscard]] constexpr WallAddress CanonicalWall(int x, int y, Direction d) noexcept
{
    switch (d) {
    case Direction::Up:    return {x, y, WallEdge::Top};
    case Direction::Down:  return {x, (y + 1) % kWorldHeight, WallEdge::Top};
    case Direction::Left:  return {x, y, WallEdge::Left};
    case Direction::Right: return {(x + 1) % kWorldWidth, y, WallEdge::Left};
    }
    return {x, y, WallEdge::Top};
}

[[nodiscard]] constexpr WallBit WallBitFor(const WallAddress& a) noexcept
{
    const auto& masks = (a.edge == WallEdge::Top) ? mapfmt::kTopWallMask : mapfmt::kLeftWallMask;
    return {static_cast<std::size_t>(a.y * kWorldWidth + a.x) / 4, masks[static_cast<std::size_t>(a.x & 3)]};
}

[[nodiscard]] constexpr bool InBounds(int x, int y) noexcept
{
    return x >= 0 && y >= 0 && x < kWorldWidth && y < kWorldHeight;
}

[[nodiscard]] constexpr std::size_t CellIndex(int x, int y) noexcept
{
    return static_cast<std::size_t>(y * kWorldWidth + x);
}

// Raw bit access on a full buffer, no bounds checks beyond the grid contract.
[[nodiscard]] bool ReadWall(const MapBuffer& map, int x, int y, Direction d) noexcept;
void WriteWall(MapBuffer& map, int x, int y, Direction d, bool present) noexcept;

// ------------------------------------------------------------------------------------------------
// Header / buffer helpers
// ------------------------------------------------------------------------------------------------

// Header text up to the first NUL.
[[nodiscard]] std::string MapName(const MapBuffer& map);
[[nodiscard]] std::string MapAuthor(const MapBuffer& map);

// Writes a header field, NUL padded. Returns false if `text` is longer than the field.
bool WriteMapName(MapBuffer& map, const std::string& text) noexcept;
bool WriteMapAuthor(MapBuffer& map, const std::string& text) noexcept;

// Checks what the World constructor treats as fatal: an entity type of 5-7.
// A missing outer boundary is not an error; World re-marks it on load.
[[nodiscard]] bool ValidateMapBuffer(const MapBuffer& map, std::string* outError = nullptr);

// Reads an exact 199-byte file.
[[nodiscard]] bool ReadMapFile(const std::filesystem::path& path, MapBuffer& out, std::string* outError = nullptr);
[[nodiscard]] bool WriteMapFile(const std::filesystem::path& path, const MapBuffer& map, std::string* outError = nullptr);

} // namespace rocketrun::sim
