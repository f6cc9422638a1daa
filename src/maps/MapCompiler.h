#pragma once

// ASCII-art level source <-> packed map.
//
// A level is drawn on a 61 x 19 grid of code points, five columns per cell:
//
//   ┌────┬────┐      even rows: top walls, '─' at columns 1..4 of a cell
//   │M>A^ R   │      odd rows:  left wall at column 0, entity pair at 1..2,
//   ├────┼    ┤                 arrow pair at 3..4
//
// Entity pairs: "M" or "C" followed by ^ v < >, "R " (rocket), "H " (hole),
// or two spaces. Arrow pairs: "A" followed by a direction, or two spaces.
// Junction glyphs (columns 0, 5, 10, ... of even rows) are free-form.
// Row 18 repeats row 0 and column 60 repeats column 0 because the grid wraps.
//
// Level files carry "name: ..." and "author: ..." lines (plus blank lines
// and '#' comments) followed by the 19 art rows as the last lines of the file.

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "sim/MapFormat.h"

namespace rocketrun::maps {

inline constexpr int kArtRows    = 2 * sim::kWorldHeight + 1;
inline constexpr int kArtColumns = 5 * sim::kWorldWidth + 1;
inline constexpr int kCellChars  = 5;

// Errors are reported as "row R, column C: message" with 1-based positions.
// CompileMapText reports "line L, column C" against the file's own lines.
[[nodiscard]] bool CompileAsciiMap(std::string_view name, std::string_view author,
                                   const std::vector<std::string>& rows,
                                   sim::MapBuffer& out, std::string* outError = nullptr);

[[nodiscard]] bool CompileMapText(std::string_view text, sim::MapBuffer& out, std::string* outError = nullptr);
[[nodiscard]] bool CompileMapFile(const std::filesystem::path& path, sim::MapBuffer& out, std::string* outError = nullptr);

// The 19 art rows for a packed map, '\n' separated, with canonical junction
// glyphs. Compiling the result yields the same buffer.
[[nodiscard]] std::string RenderAsciiMap(const sim::MapBuffer& map);

// RenderAsciiMap plus the name/author header: a complete level file.
[[nodiscard]] std::string RenderMapText(const sim::MapBuffer& map);

} // namespace rocketrun::maps
