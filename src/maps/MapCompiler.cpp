#include "maps/MapCompiler.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "util/TextEncoding.h"

namespace rocketrun::maps {

using sim::CellRecord;
using sim::Direction;
using sim::EntityType;

namespace {

constexpr char32_t kHorizontalWall = U'─';
constexpr char32_t kVerticalWall   = U'│';

// Collects the first error with its position.
// `rowOffset` turns art rows into file lines when compiling a level file.
struct Diagnostics {
    std::string* out = nullptr;
    int          rowOffset = 0;
    const char*  rowLabel = "row";

    bool fail(int row, int column, const std::string& message) const
    {
        if (out)
            *out = std::string(rowLabel) + " " + std::to_string(rowOffset + row + 1) +
                   ", column " + std::to_string(column + 1) + ": " + message;
        return false;
    }

    bool fail(const std::string& message) const
    {
        if (out)
            *out = message;
        return false;
    }
};

std::string Glyph(char32_t cp)
{
    std::string s = "'";
    util::AppendUtf8(s, cp);
    s += "'";
    return s;
}

bool ParseTopWall(const std::u32string& row, int r, int x, bool& wall, const Diagnostics& diag)
{
    const int c = x * kCellChars + 1;
    const char32_t glyph = row[static_cast<std::size_t>(c)];

    for (int i = 1; i < kCellChars - 1; ++i)
    {
        if (row[static_cast<std::size_t>(c + i)] != glyph)
            return diag.fail(r, c + i, "top wall glyphs of a cell must all match " + Glyph(glyph));
    }

    if (glyph == kHorizontalWall) { wall = true; return true; }
    if (glyph == U' ')            { wall = false; return true; }
    if (glyph == U'-')
        return diag.fail(r, c, "'-' is not a wall; look closely, walls are drawn with U+2500 '─'");
    return diag.fail(r, c, "expected '─' or ' ' for a top wall, found " + Glyph(glyph));
}

bool ParseLeftWall(const std::u32string& row, int r, int x, bool& wall, const Diagnostics& diag)
{
    const int c = x * kCellChars;
    const char32_t glyph = row[static_cast<std::size_t>(c)];

    if (glyph == kVerticalWall) { wall = true; return true; }
    if (glyph == U' ')          { wall = false; return true; }
    if (glyph == U'|')
        return diag.fail(r, c, "'|' is not a wall; look closely, walls are drawn with U+2502 '│'");
    return diag.fail(r, c, "expected '│' or ' ' for a left wall, found " + Glyph(glyph));
}

bool ParseEntity(const std::u32string& row, int r, int x, CellRecord& cell, const Diagnostics& diag)
{
    const int c = x * kCellChars + 1;
    const char32_t kind = row[static_cast<std::size_t>(c)];
    const char32_t arg  = row[static_cast<std::size_t>(c + 1)];

    switch (kind)
    {
    case U' ':
        if (arg != U' ')
            return diag.fail(r, c + 1, "stray " + Glyph(arg) + " after an empty entity slot");
        cell.entityType = static_cast<std::uint8_t>(EntityType::Empty);
        return true;

    case U'M':
    case U'C': {
        const auto dir = sim::DirectionFromGlyph(arg);
        if (!dir)
            return diag.fail(r, c + 1, "walker needs a direction (^ v < >), found " + Glyph(arg));
        cell.entityType = static_cast<std::uint8_t>(kind == U'M' ? EntityType::Mouse : EntityType::Cat);
        cell.entityDirection = *dir;
        return true;
    }

    case U'R':
    case U'H':
        if (arg != U' ')
            return diag.fail(r, c + 1, Glyph(kind) + " takes no direction, found " + Glyph(arg));
        cell.entityType = static_cast<std::uint8_t>(kind == U'R' ? EntityType::Rocket : EntityType::Hole);
        return true;

    default:
        return diag.fail(r, c, "unknown entity " + Glyph(kind) + " (expected M, C, R, H or ' ')");
    }
}

bool ParseArrow(const std::u32string& row, int r, int x, CellRecord& cell, const Diagnostics& diag)
{
    const int c = x * kCellChars + 3;
    const char32_t kind = row[static_cast<std::size_t>(c)];
    const char32_t arg  = row[static_cast<std::size_t>(c + 1)];

    if (kind == U' ')
    {
        if (arg != U' ')
            return diag.fail(r, c + 1, "stray " + Glyph(arg) + " after an empty arrow slot");
        cell.arrowPresent = false;
        return true;
    }

    if (kind != U'A')
        return diag.fail(r, c, "unknown arrow " + Glyph(kind) + " (expected A or ' ')");

    const auto dir = sim::DirectionFromGlyph(arg);
    if (!dir)
        return diag.fail(r, c + 1, "arrow needs a direction (^ v < >), found " + Glyph(arg));

    cell.arrowPresent = true;
    cell.arrowDirection = *dir;
    return true;
}

bool CheckHeaderField(const char* what, std::string_view value, const Diagnostics& diag)
{
    if (value.empty())
        return diag.fail(std::string("map ") + what + " must not be empty");
    if (value.size() > sim::mapfmt::kNameSize)
        return diag.fail(std::string("map ") + what + " is " + std::to_string(value.size()) +
                         " bytes, the limit is " + std::to_string(sim::mapfmt::kNameSize));
    return true;
}

void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

// "key: value" with a case-insensitive key. Returns the trimmed value.
std::optional<std::string> HeaderValue(const std::string& line, std::string_view key)
{
    if (line.size() <= key.size() || line[key.size()] != ':')
        return std::nullopt;

    for (std::size_t i = 0; i < key.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(line[i])) != key[i])
            return std::nullopt;
    }

    std::string value = line.substr(key.size() + 1);
    TrimInPlace(value);
    return value;
}

void AppendRepeated(std::string& out, char32_t cp, int count)
{
    for (int i = 0; i < count; ++i)
        util::AppendUtf8(out, cp);
}

void AppendPair(std::string& out, char a, char b)
{
    out.push_back(a);
    out.push_back(b);
}

} // namespace

// ------------------------------------------------------------------------------------------------
// Compile
// ------------------------------------------------------------------------------------------------

namespace {

bool CompileRows(std::string_view name, std::string_view author,
                 const std::vector<std::string>& rows,
                 sim::MapBuffer& out, const Diagnostics& diag)
{
    if (!CheckHeaderField("name", name, diag) || !CheckHeaderField("author", author, diag))
        return false;

    if (static_cast<int>(rows.size()) != kArtRows)
        return diag.fail("expected " + std::to_string(kArtRows) + " art rows, found " + std::to_string(rows.size()));

    std::vector<std::u32string> art(rows.size());
    for (int r = 0; r < kArtRows; ++r)
    {
        const auto ri = static_cast<std::size_t>(r);
        if (!util::DecodeUtf8(rows[ri], art[ri]))
            return diag.fail(r, 0, "row is not valid UTF-8");
        if (static_cast<int>(art[ri].size()) != kArtColumns)
            return diag.fail(r, 0, "row is " + std::to_string(art[ri].size()) + " characters long, expected " +
                                   std::to_string(kArtColumns));
    }

    // The grid wraps: the bottom edge is the top edge of row 0 and the right
    // edge is the left edge of column 0, so both copies must agree.
    const std::u32string& top = art.front();
    const std::u32string& bottom = art.back();
    for (int x = 0; x < sim::kWorldWidth; ++x)
    {
        const auto c = static_cast<std::size_t>(x * kCellChars + 1);
        if (top[c] != bottom[c])
            return diag.fail(kArtRows - 1, static_cast<int>(c), "bottom wall does not match the top wall of row 1 (the grid wraps)");
    }

    for (int r = 1; r < kArtRows; r += 2)
    {
        const auto& row = art[static_cast<std::size_t>(r)];
        if (row.front() != row.back())
            return diag.fail(r, kArtColumns - 1, "right wall does not match the left wall of column 1 (the grid wraps)");
    }

    // Parse everything before touching `out`.
    sim::MapBuffer map{};
    if (!sim::WriteMapName(map, std::string(name)) || !sim::WriteMapAuthor(map, std::string(author)))
        return diag.fail("map header does not fit");

    for (int y = 0; y < sim::kWorldHeight; ++y)
    {
        const int topRow = 2 * y;
        const int midRow = 2 * y + 1;
        const auto& wallRow = art[static_cast<std::size_t>(topRow)];
        const auto& cellRow = art[static_cast<std::size_t>(midRow)];

        for (int x = 0; x < sim::kWorldWidth; ++x)
        {
            bool topWall = false;
            bool leftWall = false;
            CellRecord cell;

            if (!ParseTopWall(wallRow, topRow, x, topWall, diag) ||
                !ParseLeftWall(cellRow, midRow, x, leftWall, diag) ||
                !ParseEntity(cellRow, midRow, x, cell, diag) ||
                !ParseArrow(cellRow, midRow, x, cell, diag))
            {
                return false;
            }

            sim::WriteWall(map, x, y, Direction::Up, topWall);
            sim::WriteWall(map, x, y, Direction::Left, leftWall);
            map[sim::mapfmt::kCellOffset + sim::CellIndex(x, y)] = sim::EncodeCell(cell);
        }
    }

    out = map;
    return true;
}

} // namespace

bool CompileAsciiMap(std::string_view name, std::string_view author,
                     const std::vector<std::string>& rows,
                     sim::MapBuffer& out, std::string* outError)
{
    return CompileRows(name, author, rows, out, Diagnostics{outError});
}

bool CompileMapText(std::string_view text, sim::MapBuffer& out, std::string* outError)
{
    const Diagnostics diag{outError};

    std::string bytes(text);
    util::StripUtf8Bom(bytes);

    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= bytes.size())
    {
        std::size_t end = bytes.find('\n', start);
        if (end == std::string::npos)
            end = bytes.size();
        std::string line = bytes.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }

    auto isBlank = [](const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    };

    while (!lines.empty() && isBlank(lines.back()))
        lines.pop_back();

    if (static_cast<int>(lines.size()) < kArtRows)
        return diag.fail("level file needs " + std::to_string(kArtRows) + " art rows, found " +
                         std::to_string(lines.size()) + " lines");

    const std::size_t headerLines = lines.size() - static_cast<std::size_t>(kArtRows);

    std::string name;
    std::string author;
    for (std::size_t i = 0; i < headerLines; ++i)
    {
        std::string line = lines[i];
        TrimInPlace(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (auto v = HeaderValue(line, "name"))
            name = std::move(*v);
        else if (auto a = HeaderValue(line, "author"))
            author = std::move(*a);
        else
            return diag.fail("line " + std::to_string(i + 1) + ": expected 'name:' or 'author:'");
    }

    const std::vector<std::string> rows(lines.begin() + static_cast<std::ptrdiff_t>(headerLines), lines.end());
    return CompileRows(name, author, rows, out, Diagnostics{outError, static_cast<int>(headerLines), "line"});
}

bool CompileMapFile(const std::filesystem::path& path, sim::MapBuffer& out, std::string* outError)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        if (outError)
            *outError = "cannot open " + path.string();
        return false;
    }

    const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    std::string error;
    if (!CompileMapText(text, out, &error))
    {
        if (outError)
            *outError = path.string() + ": " + error;
        return false;
    }

    spdlog::debug("Compiled level '{}' from {}", sim::MapName(out), path.string());
    return true;
}

// ------------------------------------------------------------------------------------------------
// Render
// ------------------------------------------------------------------------------------------------

std::string RenderAsciiMap(const sim::MapBuffer& map)
{
    using sim::kWorldHeight;
    using sim::kWorldWidth;

    std::string out;

    for (int r = 0; r < kArtRows; ++r)
    {
        if (r % 2 == 0)
        {
            const int y = (r / 2) % kWorldHeight;
            const bool first = (r == 0);
            const bool last  = (r == kArtRows - 1);

            for (int x = 0; x <= kWorldWidth; ++x)
            {
                // Junction glyph. Outer corners and the left/right border get
                // their proper box-drawing shape; inner junctions are '┼'.
                char32_t junction = U'┼';
                if (x == 0)
                {
                    junction = first ? U'┌' : last ? U'└'
                             : sim::ReadWall(map, 0, y, Direction::Up) ? U'├' : U'│';
                }
                else if (x == kWorldWidth)
                {
                    junction = first ? U'┐' : last ? U'┘'
                             : sim::ReadWall(map, kWorldWidth - 1, y, Direction::Up) ? U'┤' : U'│';
                }
                else if (first || last)
                {
                    const bool joined = sim::ReadWall(map, x - 1, y, Direction::Up) ||
                                        sim::ReadWall(map, x, y, Direction::Up);
                    junction = joined ? kHorizontalWall : U' ';
                }
                util::AppendUtf8(out, junction);

                if (x < kWorldWidth)
                    AppendRepeated(out, sim::ReadWall(map, x, y, Direction::Up) ? kHorizontalWall : U' ', kCellChars - 1);
            }
        }
        else
        {
            const int y = r / 2;
            for (int x = 0; x <= kWorldWidth; ++x)
            {
                const int wx = x % kWorldWidth;
                util::AppendUtf8(out, sim::ReadWall(map, wx, y, Direction::Left) ? kVerticalWall : U' ');
                if (x == kWorldWidth)
                    break;

                const CellRecord cell = sim::DecodeCell(map[sim::mapfmt::kCellOffset + sim::CellIndex(x, y)]);
                const char dir = sim::DirectionGlyph(cell.entityDirection);
                switch (cell.entityType)
                {
                case static_cast<std::uint8_t>(EntityType::Empty):  AppendPair(out, ' ', ' '); break;
                case static_cast<std::uint8_t>(EntityType::Mouse):  AppendPair(out, 'M', dir); break;
                case static_cast<std::uint8_t>(EntityType::Cat):    AppendPair(out, 'C', dir); break;
                case static_cast<std::uint8_t>(EntityType::Rocket): AppendPair(out, 'R', ' '); break;
                case static_cast<std::uint8_t>(EntityType::Hole):   AppendPair(out, 'H', ' '); break;
                default:                                            AppendPair(out, '?', '?'); break;
                }

                if (cell.arrowPresent)
                    AppendPair(out, 'A', sim::DirectionGlyph(cell.arrowDirection));
                else
                    AppendPair(out, ' ', ' ');
            }
        }

        if (r + 1 < kArtRows)
            out.push_back('\n');
    }

    return out;
}

std::string RenderMapText(const sim::MapBuffer& map)
{
    std::string out;
    out += "name: " + sim::MapName(map) + "\n";
    out += "author: " + sim::MapAuthor(map) + "\n";
    out += RenderAsciiMap(map);
    out += "\n";
    return out;
}

} // namespace rocketrun::maps
