// tests/test_map_format.cpp
//
// src/sim/MapFormat.{h,cpp}: layout constants, the per-cell byte, wall
// addressing with wraparound, header fields and raw file IO.

#include <doctest/doctest.h>

#include "sim/MapFormat.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace rocketrun::sim;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("rocketrun_map_format_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

} // namespace

TEST_CASE("Map layout offsets")
{
    CHECK(mapfmt::kWallOffset == 64);
    CHECK(mapfmt::kCellOffset == 91);
    CHECK(mapfmt::kMapSize == 199);
    CHECK(kCellCount == 108);
}

TEST_CASE("EncodeCell packs entity, heading and arrow bits")
{
    CellRecord mouse;
    mouse.entityType = static_cast<std::uint8_t>(EntityType::Mouse);
    mouse.entityDirection = Direction::Right;
    mouse.arrowPresent = true;
    mouse.arrowDirection = Direction::Up;
    CHECK(EncodeCell(mouse) == 0x3C);
    CHECK(DecodeCell(0x3C) == mouse);

    CellRecord cat;
    cat.entityType = static_cast<std::uint8_t>(EntityType::Cat);
    cat.entityDirection = Direction::Down;
    cat.arrowPresent = true;
    cat.arrowDirection = Direction::Left;
    CHECK(EncodeCell(cat) == 0x4E);

    CHECK(DecodeCell(0x60).entity() == EntityType::Rocket);
    CHECK(DecodeCell(0x80).entity() == EntityType::Hole);
    CHECK_FALSE(DecodeCell(0x80).arrowPresent);

    // Arrow direction bits without the present bit carry no arrow.
    CHECK_FALSE(DecodeCell(0x03).arrowPresent);

    CHECK_FALSE(DecodeCell(0xA0).hasKnownEntity());
    CHECK(DecodeCell(0xA0).entityType == 5);
}

TEST_CASE("Bottom and right walls alias the neighbour's top and left walls")
{
    CHECK(CanonicalWall(3, 4, Direction::Up) == WallAddress{3, 4, WallEdge::Top});
    CHECK(CanonicalWall(3, 4, Direction::Down) == WallAddress{3, 5, WallEdge::Top});
    CHECK(CanonicalWall(3, 4, Direction::Left) == WallAddress{3, 4, WallEdge::Left});
    CHECK(CanonicalWall(3, 4, Direction::Right) == WallAddress{4, 4, WallEdge::Left});

    // Wraparound at the far edges.
    CHECK(CanonicalWall(11, 8, Direction::Down) == WallAddress{11, 0, WallEdge::Top});
    CHECK(CanonicalWall(11, 8, Direction::Right) == WallAddress{0, 8, WallEdge::Left});
}

TEST_CASE("Wall bits: four cells per byte, top/left pair per cell")
{
    CHECK(WallBitFor({0, 0, WallEdge::Top}) == WallBit{0, 0x01});
    CHECK(WallBitFor({0, 0, WallEdge::Left}) == WallBit{0, 0x02});
    CHECK(WallBitFor({5, 0, WallEdge::Top}) == WallBit{1, 0x04});
    CHECK(WallBitFor({3, 2, WallEdge::Left}) == WallBit{6, 0x80});
    CHECK(WallBitFor({11, 8, WallEdge::Top}) == WallBit{26, 0x40});

    MapBuffer map{};
    WriteWall(map, 5, 0, Direction::Up, true);
    CHECK(map[mapfmt::kWallOffset + 1] == 0x04);

    WriteWall(map, 2, 1, Direction::Right, true);
    CHECK(ReadWall(map, 3, 1, Direction::Left));
    CHECK_FALSE(ReadWall(map, 2, 1, Direction::Left));

    WriteWall(map, 3, 1, Direction::Left, false);
    CHECK_FALSE(ReadWall(map, 2, 1, Direction::Right));
    CHECK(map[mapfmt::kWallOffset + 1] == 0x04);
}

TEST_CASE("Header fields are NUL padded and read up to the first NUL")
{
    MapBuffer map{};
    CHECK(WriteMapName(map, "Where to go?"));
    CHECK(WriteMapAuthor(map, "Sega"));
    CHECK(MapName(map) == "Where to go?");
    CHECK(MapAuthor(map) == "Sega");
    CHECK(map[mapfmt::kNameOffset + 12] == 0);

    // A full 32-byte field has no terminator and must not run into the next one.
    const std::string full(32, 'n');
    CHECK(WriteMapName(map, full));
    CHECK(MapName(map) == full);
    CHECK(MapAuthor(map) == "Sega");

    CHECK_FALSE(WriteMapName(map, std::string(33, 'x')));
    CHECK(MapName(map) == full);
}

TEST_CASE("ValidateMapBuffer rejects unknown entity types")
{
    MapBuffer map{};
    std::string err;
    CHECK(ValidateMapBuffer(map, &err));

    map[mapfmt::kCellOffset + CellIndex(4, 2)] = 0xE0; // type 7
    CHECK_FALSE(ValidateMapBuffer(map, &err));
    CHECK(err.find("(4,2)") != std::string::npos);
}

TEST_CASE("ReadMapFile requires exactly 199 bytes")
{
    const fs::path dir = make_unique_temp_dir() / "io";
    std::error_code ec;
    fs::create_directories(dir, ec);

    MapBuffer map{};
    REQUIRE(WriteMapName(map, "io"));
    map[mapfmt::kCellOffset] = 0x3C;

    std::string err;
    REQUIRE(WriteMapFile(dir / "level.bin", map, &err));
    CHECK(fs::file_size(dir / "level.bin") == 199);

    MapBuffer loaded{};
    REQUIRE(ReadMapFile(dir / "level.bin", loaded, &err));
    CHECK(loaded == map);

    {
        std::ofstream f(dir / "short.bin", std::ios::binary);
        f << "too short";
    }
    CHECK_FALSE(ReadMapFile(dir / "short.bin", loaded, &err));
    CHECK(err.find("expected 199 bytes") != std::string::npos);

    CHECK_FALSE(ReadMapFile(dir / "missing.bin", loaded, &err));

    std::error_code dec;
    fs::remove_all(dir, dec);
}
