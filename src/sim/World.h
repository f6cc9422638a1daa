#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "rocketrun/memory/fixed_vector.h"
#include "sim/ArrowStock.h"
#include "sim/Direction.h"
#include "sim/MapFormat.h"
#include "sim/TileType.h"
#include "sim/Walker.h"
#include "sim/WorldState.h"

namespace rocketrun::sim {

enum class PlaceArrowResult : std::uint8_t {
    Placed,
    Blocked,  // rocket or hole on the cell
    NoStock,  // no arrow of that direction left
};

[[nodiscard]] const char* PlaceArrowResultName(PlaceArrowResult result) noexcept;

// The 12x9 toroidal level: packed walls, tile grid, mice and cats.
//
// Walls and the per-cell entity bytes live in the same packed buffer the
// level was loaded from. Tiles are kept unpacked, one per cell.
//
// Every accessor taking (x, y) requires 0 <= x < 12 and 0 <= y < 9;
// anything else aborts.
class World {
public:
    static constexpr std::size_t kMaxWalkers = static_cast<std::size_t>(kCellCount);
    using WalkerList = memory::FixedVector<Walker, kMaxWalkers>;

    // Empty level walled on its outer boundary.
    World();

    // Loads a packed level. Mice and cats are spawned, rockets and holes
    // become tiles, the arrow bits become the level's solution arrows and
    // fill the arrow stock. Fatal on unknown entity types.
    explicit World(const MapBuffer& map);

    [[nodiscard]] static constexpr int width() noexcept { return kWorldWidth; }
    [[nodiscard]] static constexpr int height() noexcept { return kWorldHeight; }

    // ---- walls ----
    [[nodiscard]] bool getWall(int x, int y, Direction d) const;
    void setWall(int x, int y, Direction d, bool present);

    // ---- tiles ----
    [[nodiscard]] TileType getTile(int x, int y) const;
    void setTile(int x, int y, TileType tile);

    // ---- walkers ----
    // Returns false if the cell already holds an entity (walker, rocket or
    // hole) in the packed cell byte. A cell keeps its entity for the lifetime
    // of the level, even after the walker moved away.
    bool createWalker(int x, int y, Direction d, WalkerType type);

    [[nodiscard]] const WalkerList& mice() const noexcept { return m_mice; }
    [[nodiscard]] const WalkerList& cats() const noexcept { return m_cats; }

    // ---- arrows ----
    PlaceArrowResult placeArrow(int x, int y, Direction d);

    // Places an arrow that does not come out of the stock. The stock only
    // changes when the arrow replaces a full arrow of another direction.
    PlaceArrowResult placeExtraArrow(int x, int y, Direction d);

    // Clears an arrow tile. Full arrows go back to the stock, half arrows are
    // gone. Returns false if there was no arrow.
    bool removeArrow(int x, int y);

    // Arrow the level author placed on this cell in the solution, if any.
    [[nodiscard]] std::optional<Direction> solutionArrow(int x, int y) const;

    // Places every solution arrow from the stock. Returns how many were placed.
    int placeSolution();

    [[nodiscard]] const ArrowStock& arrowStock() const noexcept { return m_stock; }
    [[nodiscard]] ArrowStock& arrowStock() noexcept { return m_stock; }

    // ---- simulation ----
    // One 60 Hz step: advance every mouse then every cat, resolve the ones
    // that entered a new cell (hole/rocket, arrow, wall), compute the outcome
    // and prune walkers that are no longer alive.
    WorldStateChange tick();

    // Turns `walker` toward the first open edge of its cell, trying its
    // heading, then right, left and back. Leaves the heading alone if the
    // cell is closed on all four sides.
    void resolveWalls(Walker& walker) const;

    [[nodiscard]] std::uint32_t tickCount() const noexcept { return m_tickCount; }

    // ---- header ----
    [[nodiscard]] std::string name() const { return MapName(m_data); }
    [[nodiscard]] std::string author() const { return MapAuthor(m_data); }
    [[nodiscard]] const MapBuffer& data() const noexcept { return m_data; }

private:
    void markBoundary();
    void verifyCell(int x, int y) const;

    void advance(Walker& walker);
    void resolveRocketsAndHoles(Walker& walker) const;
    void resolveArrows(Walker& walker);

    [[nodiscard]] std::uint8_t& cellByte(int x, int y) noexcept { return m_data[mapfmt::kCellOffset + CellIndex(x, y)]; }
    [[nodiscard]] std::uint8_t cellByte(int x, int y) const noexcept { return m_data[mapfmt::kCellOffset + CellIndex(x, y)]; }

    MapBuffer                              m_data{};
    std::array<TileType, kCellCount>       m_tiles{};
    WalkerList                             m_mice;
    WalkerList                             m_cats;
    ArrowStock                             m_stock;
    std::uint32_t                          m_tickCount = 0;
};

} // namespace rocketrun::sim
