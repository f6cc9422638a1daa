#include "sim/MapFormat.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace rocketrun::sim {

namespace {

std::string ReadField(const MapBuffer& map, std::size_t offset, std::size_t size)
{
    const auto* begin = reinterpret_cast<const char*>(map.data() + offset);
    const auto* end   = begin + size;
    return std::string(begin, std::find(begin, end, '\0'));
}

bool WriteField(MapBuffer& map, std::size_t offset, std::size_t size, const std::string& text) noexcept
{
    if (text.size() > size)
        return false;

    std::fill_n(map.begin() + static_cast<std::ptrdiff_t>(offset), size, std::uint8_t{0});
    std::memcpy(map.data() + offset, text.data(), text.size());
    return true;
}

void SetError(std::string* outError, std::string msg)
{
    if (outError)
        *outError = std::move(msg);
}

} // namespace

const char* EntityTypeName(EntityType type) noexcept
{
    switch (type) {
    case EntityType::Empty:  return "Empty";
    case EntityType::Mouse:  return "Mouse";
    case EntityType::Cat:    return "Cat";
    case EntityType::Rocket: return "Rocket";
    case EntityType::Hole:   return "Hole";
    }
    return "Unknown";
}

bool ReadWall(const MapBuffer& map, int x, int y, Direction d) noexcept
{
    const WallBit bit = WallBitFor(CanonicalWall(x, y, d));
    return (map[mapfmt::kWallOffset + bit.byteIndex] & bit.mask) != 0;
}

void WriteWall(MapBuffer& map, int x, int y, Direction d, bool present) noexcept
{
    const WallBit bit = WallBitFor(CanonicalWall(x, y, d));
    std::uint8_t& byte = map[mapfmt::kWallOffset + bit.byteIndex];
    if (present)
        byte = static_cast<std::uint8_t>(byte | bit.mask);
    else
        byte = static_cast<std::uint8_t>(byte & ~bit.mask);
}

std::string MapName(const MapBuffer& map)
{
    return ReadField(map, mapfmt::kNameOffset, mapfmt::kNameSize);
}

std::string MapAuthor(const MapBuffer& map)
{
    return ReadField(map, mapfmt::kAuthorOffset, mapfmt::kAuthorSize);
}

bool WriteMapName(MapBuffer& map, const std::string& text) noexcept
{
    return WriteField(map, mapfmt::kNameOffset, mapfmt::kNameSize, text);
}

bool WriteMapAuthor(MapBuffer& map, const std::string& text) noexcept
{
    return WriteField(map, mapfmt::kAuthorOffset, mapfmt::kAuthorSize, text);
}

bool ValidateMapBuffer(const MapBuffer& map, std::string* outError)
{
    for (int y = 0; y < kWorldHeight; ++y)
    {
        for (int x = 0; x < kWorldWidth; ++x)
        {
            const CellRecord cell = DecodeCell(map[mapfmt::kCellOffset + CellIndex(x, y)]);
            if (!cell.hasKnownEntity())
            {
                SetError(outError, "cell (" + std::to_string(x) + "," + std::to_string(y) +
                                   ") has unknown entity type " + std::to_string(cell.entityType));
                return false;
            }
        }
    }

    return true;
}

bool ReadMapFile(const std::filesystem::path& path, MapBuffer& out, std::string* outError)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        SetError(outError, "cannot open " + path.string());
        return false;
    }

    const std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (bytes.size() != mapfmt::kMapSize)
    {
        SetError(outError, path.string() + ": expected " + std::to_string(mapfmt::kMapSize) +
                           " bytes, got " + std::to_string(bytes.size()));
        return false;
    }

    std::memcpy(out.data(), bytes.data(), out.size());
    return true;
}

bool WriteMapFile(const std::filesystem::path& path, const MapBuffer& map, std::string* outError)
{
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        SetError(outError, "cannot open " + path.string() + " for writing");
        return false;
    }

    f.write(reinterpret_cast<const char*>(map.data()), static_cast<std::streamsize>(map.size()));
    if (!f)
    {
        SetError(outError, "write failed for " + path.string());
        return false;
    }
    return true;
}

} // namespace rocketrun::sim
