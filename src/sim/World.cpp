#include "sim/World.h"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

#include "common/Compiler.h"

namespace rocketrun::sim {

namespace {

constexpr std::uint8_t kArrowBits = mapfmt::kArrowPresentMask | mapfmt::kArrowDirectionMask;

EntityType EntityFor(WalkerType type) noexcept
{
    return type == WalkerType::Cat ? EntityType::Cat : EntityType::Mouse;
}

} // namespace

const char* PlaceArrowResultName(PlaceArrowResult result) noexcept
{
    switch (result) {
    case PlaceArrowResult::Placed:  return "Placed";
    case PlaceArrowResult::Blocked: return "Blocked";
    case PlaceArrowResult::NoStock: return "NoStock";
    }
    return "Unknown";
}

// ------------------------------------------------------------------------------------------------
// Construction
// ------------------------------------------------------------------------------------------------

World::World()
{
    m_tiles.fill(TileType::Empty);
    markBoundary();
}

World::World(const MapBuffer& map)
{
    m_tiles.fill(TileType::Empty);

    std::string error;
    const bool valid = ValidateMapBuffer(map, &error);
    ROCKETRUN_VERIFY(valid, error.c_str());

    // Header and walls verbatim; cell bytes start out holding only the arrow
    // bits and gain their entity bits as entities are created below.
    std::copy_n(map.begin(), mapfmt::kCellOffset, m_data.begin());

    for (int y = 0; y < kWorldHeight; ++y)
    {
        for (int x = 0; x < kWorldWidth; ++x)
        {
            const std::uint8_t raw = map[mapfmt::kCellOffset + CellIndex(x, y)];
            const CellRecord cell = DecodeCell(raw);
            cellByte(x, y) = static_cast<std::uint8_t>(raw & kArrowBits);

            switch (cell.entity())
            {
            case EntityType::Mouse:
                createWalker(x, y, cell.entityDirection, WalkerType::Mouse);
                break;
            case EntityType::Cat:
                createWalker(x, y, cell.entityDirection, WalkerType::Cat);
                break;
            case EntityType::Rocket:
                m_tiles[CellIndex(x, y)] = TileType::Rocket;
                cellByte(x, y) = raw;
                break;
            case EntityType::Hole:
                m_tiles[CellIndex(x, y)] = TileType::Hole;
                cellByte(x, y) = raw;
                break;
            case EntityType::Empty:
                break;
            }

            if (cell.arrowPresent)
                m_stock.add(cell.arrowDirection);
        }
    }

    markBoundary();

    spdlog::debug("World: loaded '{}' by '{}' ({} mice, {} cats, {} solution arrows)",
                  name(), author(), m_mice.size(), m_cats.size(), m_stock.total());
}

void World::markBoundary()
{
    // Top row and left column; the wrap makes these the bottom and right
    // edges too.
    for (int x = 0; x < kWorldWidth; ++x)
        setWall(x, 0, Direction::Up, true);

    for (int y = 0; y < kWorldHeight; ++y)
        setWall(0, y, Direction::Left, true);
}

void World::verifyCell(int x, int y) const
{
    ROCKETRUN_VERIFY(InBounds(x, y), "World: grid coordinate out of range");
}

// ------------------------------------------------------------------------------------------------
// Storage
// ------------------------------------------------------------------------------------------------

bool World::getWall(int x, int y, Direction d) const
{
    verifyCell(x, y);
    return ReadWall(m_data, x, y, d);
}

void World::setWall(int x, int y, Direction d, bool present)
{
    verifyCell(x, y);
    WriteWall(m_data, x, y, d, present);
}

TileType World::getTile(int x, int y) const
{
    verifyCell(x, y);
    return m_tiles[CellIndex(x, y)];
}

void World::setTile(int x, int y, TileType tile)
{
    verifyCell(x, y);
    m_tiles[CellIndex(x, y)] = tile;
}

bool World::createWalker(int x, int y, Direction d, WalkerType type)
{
    verifyCell(x, y);

    std::uint8_t& byte = cellByte(x, y);
    if ((byte & mapfmt::kEntityTypeMask) != 0)
    {
        spdlog::debug("World: cell ({},{}) is occupied, {} not created", x, y, WalkerTypeName(type));
        return false;
    }

    WalkerList& list = (type == WalkerType::Cat) ? m_cats : m_mice;
    const bool stored = list.emplace_back(x, y, d, type);
    ROCKETRUN_VERIFY(stored, "World: walker registry overflow");

    CellRecord cell = DecodeCell(byte);
    cell.entityType = static_cast<std::uint8_t>(EntityFor(type));
    cell.entityDirection = d;
    byte = EncodeCell(cell);
    return true;
}

// ------------------------------------------------------------------------------------------------
// Arrows
// ------------------------------------------------------------------------------------------------

PlaceArrowResult World::placeArrow(int x, int y, Direction d)
{
    const TileType current = getTile(x, y);
    if (current == TileType::Rocket || current == TileType::Hole)
        return PlaceArrowResult::Blocked;

    if (current == ArrowTile(d))
        return PlaceArrowResult::Placed;

    if (!m_stock.take(d))
        return PlaceArrowResult::NoStock;

    if (IsFullArrow(current))
        m_stock.add(*TileDirection(current));

    setTile(x, y, ArrowTile(d));
    return PlaceArrowResult::Placed;
}

PlaceArrowResult World::placeExtraArrow(int x, int y, Direction d)
{
    const TileType current = getTile(x, y);
    if (current == TileType::Rocket || current == TileType::Hole)
        return PlaceArrowResult::Blocked;

    if (current == ArrowTile(d))
        return PlaceArrowResult::Placed;

    if (IsFullArrow(current))
        m_stock.add(*TileDirection(current));

    setTile(x, y, ArrowTile(d));
    return PlaceArrowResult::Placed;
}

bool World::removeArrow(int x, int y)
{
    const TileType current = getTile(x, y);
    const auto dir = TileDirection(current);
    if (!dir)
        return false;

    if (IsFullArrow(current))
        m_stock.add(*dir);

    setTile(x, y, TileType::Empty);
    return true;
}

std::optional<Direction> World::solutionArrow(int x, int y) const
{
    verifyCell(x, y);
    const CellRecord cell = DecodeCell(cellByte(x, y));
    if (!cell.arrowPresent)
        return std::nullopt;
    return cell.arrowDirection;
}

int World::placeSolution()
{
    int placed = 0;
    for (int y = 0; y < kWorldHeight; ++y)
    {
        for (int x = 0; x < kWorldWidth; ++x)
        {
            const auto arrow = solutionArrow(x, y);
            if (!arrow)
                continue;

            const PlaceArrowResult r = placeArrow(x, y, *arrow);
            if (r == PlaceArrowResult::Placed)
                ++placed;
            else
                spdlog::warn("World: solution arrow {} at ({},{}) not placed: {}",
                             DirectionName(*arrow), x, y, PlaceArrowResultName(r));
        }
    }
    return placed;
}

// ------------------------------------------------------------------------------------------------
// Tick
// ------------------------------------------------------------------------------------------------

void World::resolveRocketsAndHoles(Walker& walker) const
{
    switch (getTile(walker.cellX(), walker.cellY()))
    {
    case TileType::Hole:
        walker.kill();
        spdlog::trace("World: {} fell into hole at ({},{})",
                      WalkerTypeName(walker.type()), walker.cellX(), walker.cellY());
        break;
    case TileType::Rocket:
        walker.rescue();
        spdlog::trace("World: {} reached rocket at ({},{})",
                      WalkerTypeName(walker.type()), walker.cellX(), walker.cellY());
        break;
    default:
        break;
    }
}

void World::resolveArrows(Walker& walker)
{
    const int x = walker.cellX();
    const int y = walker.cellY();
    const TileType tile = getTile(x, y);

    const auto arrow = TileDirection(tile);
    if (!arrow)
        return;

    // Only a cat walking head-on into an arrow wears it down.
    if (walker.type() == WalkerType::Cat && TurnAround(walker.direction()) == *arrow)
    {
        const TileType worn = Diminish(tile);
        setTile(x, y, worn);
        spdlog::trace("World: cat diminished arrow at ({},{}) to {}", x, y, TileTypeName(worn));
    }

    walker.setDirection(*arrow);
}

void World::resolveWalls(Walker& walker) const
{
    const int x = walker.cellX();
    const int y = walker.cellY();
    const Direction heading = walker.direction();

    const Direction candidates[] = {heading, TurnRight(heading), TurnLeft(heading), TurnAround(heading)};
    for (const Direction candidate : candidates)
    {
        if (!getWall(x, y, candidate))
        {
            walker.setDirection(candidate);
            return;
        }
    }
}

void World::advance(Walker& walker)
{
    if (walker.walk() != WalkResult::NewSquare)
        return;

    walker.wrapPosition(kWorldWidth, kWorldHeight);

    // Order matters: classify the cell, then redirect, then bounce. Wall
    // resolution also runs for a walker that just died or was rescued.
    resolveRocketsAndHoles(walker);
    resolveArrows(walker);
    resolveWalls(walker);
}

WorldStateChange World::tick()
{
    ++m_tickCount;

    for (Walker& mouse : m_mice)
        advance(mouse);
    for (Walker& cat : m_cats)
        advance(cat);

    const bool mouseDied = std::any_of(m_mice.begin(), m_mice.end(),
        [](const Walker& w) { return w.state() == WalkerState::Dead; });
    const bool catEscaped = std::any_of(m_cats.begin(), m_cats.end(),
        [](const Walker& w) { return w.state() == WalkerState::Rescued; });
    const bool allMiceRescued = !m_mice.empty() && std::all_of(m_mice.begin(), m_mice.end(),
        [](const Walker& w) { return w.state() == WalkerState::Rescued; });

    WorldStateChange outcome = WorldStateChange::NoChange;
    if (mouseDied || catEscaped)
        outcome = WorldStateChange::Lose;
    else if (allMiceRescued)
        outcome = WorldStateChange::Win;

    const auto notAlive = [](const Walker& w) { return !w.isAlive(); };
    m_mice.erase_if(notAlive);
    m_cats.erase_if(notAlive);

    if (outcome != WorldStateChange::NoChange)
        spdlog::debug("World: tick {} -> {}", m_tickCount, WorldStateChangeName(outcome));

    return outcome;
}

} // namespace rocketrun::sim
