#include "maps/MapPack.h"
#include "maps/MapPack_Format.h"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "maps/MapCompiler.h"
#include "util/TextEncoding.h"

namespace rocketrun::maps {

namespace {

using json = nlohmann::json;

[[nodiscard]] int ObjInt(const json& obj, const char* key, int def) noexcept
{
    if (!obj.is_object())
        return def;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer())
        return def;
    return it->get<int>();
}

[[nodiscard]] std::string ObjString(const json& obj, const char* key, const std::string& def)
{
    if (!obj.is_object())
        return def;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return def;
    return it->get<std::string>();
}

bool Fail(std::string* outError, std::string msg)
{
    if (outError)
        *outError = std::move(msg);
    return false;
}

} // namespace

bool LoadLevelFile(const std::filesystem::path& file, sim::MapBuffer& out, std::string* outError)
{
    sim::MapBuffer map{};
    if (file.extension() == ".bin")
    {
        if (!sim::ReadMapFile(file, map, outError))
            return false;
    }
    else if (!CompileMapFile(file, map, outError))
    {
        return false;
    }

    std::string invalid;
    if (!sim::ValidateMapBuffer(map, &invalid))
        return Fail(outError, file.string() + ": " + invalid);

    out = map;
    return true;
}

bool MapPack::load(const std::filesystem::path& manifest, std::string* outError) noexcept
{
    try
    {
        std::ifstream f(manifest, std::ios::binary);
        if (!f)
            return Fail(outError, "cannot open " + manifest.string());

        std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        util::StripUtf8Bom(bytes);

        const json j = json::parse(bytes, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
        if (j.is_discarded() || !j.is_object())
            return Fail(outError, manifest.string() + ": not valid JSON");

        if (ObjString(j, "format", std::string{}) != packfmt::kPackFormat)
            return Fail(outError, manifest.string() + ": unsupported format (expected \"" +
                                  std::string(packfmt::kPackFormat) + "\")");

        const int version = ObjInt(j, "version", 0);
        if (version < 1 || version > packfmt::kPackVersion)
            return Fail(outError, manifest.string() + ": unsupported version " + std::to_string(version));

        auto maps = j.find("maps");
        if (maps == j.end() || !maps->is_array())
            return Fail(outError, manifest.string() + ": \"maps\" must be an array");

        const auto baseDir = manifest.parent_path();
        std::vector<MapPackEntry> entries;
        for (std::size_t i = 0; i < maps->size(); ++i)
        {
            const json& item = (*maps)[i];
            const std::string file = ObjString(item, "file", std::string{});
            if (file.empty())
                return Fail(outError, manifest.string() + ": maps[" + std::to_string(i) + "] has no \"file\"");

            MapPackEntry entry;
            entry.file = baseDir / file;
            entry.title = ObjString(item, "title", entry.file.stem().string());
            entries.push_back(std::move(entry));
        }

        m_entries = std::move(entries);
        spdlog::debug("MapPack: {} levels from {}", m_entries.size(), manifest.string());
        return true;
    }
    catch (const std::exception& e)
    {
        return Fail(outError, e.what());
    }
}

bool MapPack::save(const std::filesystem::path& manifest, std::string* outError) const noexcept
{
    try
    {
        json maps = json::array();
        const auto baseDir = manifest.parent_path();
        for (const auto& entry : m_entries)
        {
            std::error_code ec;
            auto rel = std::filesystem::relative(entry.file, baseDir, ec);
            if (ec || rel.empty())
                rel = entry.file;

            maps.push_back({{"file", rel.generic_string()}, {"title", entry.title}});
        }

        const json j = {
            {"format", packfmt::kPackFormat},
            {"version", packfmt::kPackVersion},
            {"maps", std::move(maps)},
        };

        std::ofstream f(manifest, std::ios::binary | std::ios::trunc);
        if (!f)
            return Fail(outError, "cannot open " + manifest.string() + " for writing");

        f << j.dump(2) << "\n";
        if (!f)
            return Fail(outError, "write failed for " + manifest.string());
        return true;
    }
    catch (const std::exception& e)
    {
        return Fail(outError, e.what());
    }
}

bool MapPack::loadLevel(std::size_t index, sim::MapBuffer& out, std::string* outError) const
{
    if (index >= m_entries.size())
        return Fail(outError, "level " + std::to_string(index) + " is out of range (pack has " +
                              std::to_string(m_entries.size()) + ")");

    return LoadLevelFile(m_entries[index].file, out, outError);
}

} // namespace rocketrun::maps
