#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "sim/MapFormat.h"

namespace rocketrun::maps {

struct MapPackEntry {
    std::string           title;  // display name; falls back to the file stem
    std::filesystem::path file;   // resolved against the manifest directory
};

// Ordered list of levels read from a JSON manifest:
//
//   { "format": "RocketRun.MapPack", "version": 1,
//     "maps": [ { "file": "where_to_go.txt", "title": "Where to go?" } ] }
class MapPack {
public:
    [[nodiscard]] bool load(const std::filesystem::path& manifest, std::string* outError = nullptr) noexcept;
    [[nodiscard]] bool save(const std::filesystem::path& manifest, std::string* outError = nullptr) const noexcept;

    void add(MapPackEntry entry) { m_entries.push_back(std::move(entry)); }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] const MapPackEntry& operator[](std::size_t i) const { return m_entries[i]; }
    [[nodiscard]] const std::vector<MapPackEntry>& entries() const noexcept { return m_entries; }

    // Loads level `index` through LoadLevelFile.
    [[nodiscard]] bool loadLevel(std::size_t index, sim::MapBuffer& out, std::string* outError = nullptr) const;

private:
    std::vector<MapPackEntry> m_entries;
};

// ".bin" files are read as packed maps, anything else is compiled as an
// ASCII-art level file. Fails on invalid buffers (see ValidateMapBuffer).
[[nodiscard]] bool LoadLevelFile(const std::filesystem::path& file, sim::MapBuffer& out, std::string* outError = nullptr);

} // namespace rocketrun::maps
