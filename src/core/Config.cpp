#include "core/Config.h"
#include "util/TextEncoding.h"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace rocketrun::core {

namespace {

void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

bool ParseInt(std::string_view sv, int& out) noexcept
{
    int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

bool ParseBool(std::string_view sv, bool& out) noexcept
{
    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

// Strip trailing inline comments, e.g. "max_ticks = 600  # ten seconds".
void StripInlineComment(std::string& v)
{
    const std::size_t cut = std::min(v.find('#'), v.find(';'));
    if (cut != std::string::npos)
    {
        v.erase(cut);
        TrimInPlace(v);
    }
}

void Warn(std::vector<std::string>* warnings, int lineNo, const std::string& what)
{
    std::string msg = "rocketrun.ini:" + std::to_string(lineNo) + ": " + what;
    spdlog::warn("LoadConfig: {}", msg);
    if (warnings)
        warnings->push_back(std::move(msg));
}

} // namespace

std::filesystem::path ConfigPath(const std::filesystem::path& configDir)
{
    return configDir / "rocketrun.ini";
}

// Tiny INI-style parser: key=value lines, sections ignored.
bool LoadConfig(Config& cfg, const std::filesystem::path& configDir, std::vector<std::string>* warnings)
{
    const auto path = ConfigPath(configDir);

    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false;

    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();
    util::StripUtf8Bom(text);

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;

        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;
        if (tmp.front() == '[' && tmp.back() == ']') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos)
        {
            Warn(warnings, lineNo, "expected key = value");
            continue;
        }

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);
        StripInlineComment(v);

        if (k.empty()) continue;

        if (EqualsI(k, "max_ticks"))
        {
            int parsed = cfg.maxTicks;
            if (ParseInt(v, parsed))
                cfg.maxTicks = std::clamp(parsed, kMinMaxTicks, kMaxMaxTicks);
            else
                Warn(warnings, lineNo, "max_ticks is not an integer: '" + v + "'");
        }
        else if (EqualsI(k, "realtime"))
        {
            if (!ParseBool(v, cfg.realtime))
                Warn(warnings, lineNo, "realtime is not a boolean: '" + v + "'");
        }
        else if (EqualsI(k, "place_solution"))
        {
            if (!ParseBool(v, cfg.placeSolution))
                Warn(warnings, lineNo, "place_solution is not a boolean: '" + v + "'");
        }
        else if (EqualsI(k, "log_level"))
        {
            cfg.logLevel = v;
        }
        else if (EqualsI(k, "log_file"))
        {
            cfg.logFile = v;
        }
        else
        {
            Warn(warnings, lineNo, "unknown key '" + k + "'");
        }
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& configDir)
{
    std::error_code ec;
    std::filesystem::create_directories(configDir, ec);
    if (ec)
    {
        spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                      configDir.string(), ec.value(), ec.message());
        return false;
    }

    std::ostringstream oss;
    oss << "# rocketrun headless runner settings\n";
    oss << "max_ticks = "      << cfg.maxTicks << "\n";
    oss << "realtime = "       << (cfg.realtime ? "true" : "false") << "\n";
    oss << "place_solution = " << (cfg.placeSolution ? "true" : "false") << "\n";
    oss << "log_level = "      << cfg.logLevel << "\n";
    oss << "log_file = "       << cfg.logFile << "\n";
    const std::string text = oss.str();

    const auto path = ConfigPath(configDir);
    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f)
        {
            spdlog::error("SaveConfig: cannot open {}", tmp.string());
            return false;
        }
        f.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!f)
        {
            spdlog::error("SaveConfig: write failed for {}", tmp.string());
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec)
    {
        spdlog::error("SaveConfig: rename {} -> {} failed ({}: {})",
                      tmp.string(), path.string(), ec.value(), ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }

    return true;
}

} // namespace rocketrun::core
