#pragma once

// util/TextEncoding.h
// -------------------
// Small, dependency-free UTF-8 helpers for the text formats rocketrun reads
// (rocketrun.ini, ASCII-art maps, map pack manifests).

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rocketrun::util {

inline void AppendUtf8(std::string& out, char32_t cp)
{
    if (cp <= 0x7Fu) {
        out.push_back(static_cast<char>(cp));
        return;
    }
    if (cp <= 0x7FFu) {
        out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
        return;
    }
    if (cp <= 0xFFFFu) {
        out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
        return;
    }

    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
}

inline std::string ToUtf8(std::u32string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (const char32_t cp : text)
        AppendUtf8(out, cp);
    return out;
}

// Decodes UTF-8 into code points. Returns false on malformed input
// (bad lead byte, truncated or overlong sequence, surrogate, > U+10FFFF).
inline bool DecodeUtf8(std::string_view bytes, std::u32string& out)
{
    out.clear();
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size())
    {
        const auto b0 = static_cast<unsigned char>(bytes[i]);

        std::size_t len = 0;
        char32_t cp = 0;
        char32_t min = 0;
        if (b0 < 0x80u)              { len = 1; cp = b0; }
        else if ((b0 & 0xE0u) == 0xC0u) { len = 2; cp = b0 & 0x1Fu; min = 0x80u; }
        else if ((b0 & 0xF0u) == 0xE0u) { len = 3; cp = b0 & 0x0Fu; min = 0x800u; }
        else if ((b0 & 0xF8u) == 0xF0u) { len = 4; cp = b0 & 0x07u; min = 0x10000u; }
        else return false;

        if (i + len > bytes.size())
            return false;

        for (std::size_t k = 1; k < len; ++k)
        {
            const auto b = static_cast<unsigned char>(bytes[i + k]);
            if ((b & 0xC0u) != 0x80u)
                return false;
            cp = (cp << 6) | (b & 0x3Fu);
        }

        if (len > 1 && cp < min)
            return false;
        if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
            return false;

        out.push_back(cp);
        i += len;
    }

    return true;
}

// Strips a UTF-8 BOM (EF BB BF) if present. Files saved by Windows editors
// often carry one.
inline void StripUtf8Bom(std::string& bytes) noexcept
{
    if (bytes.size() >= 3 &&
        static_cast<unsigned char>(bytes[0]) == 0xEFu &&
        static_cast<unsigned char>(bytes[1]) == 0xBBu &&
        static_cast<unsigned char>(bytes[2]) == 0xBFu)
    {
        bytes.erase(0, 3);
    }
}

} // namespace rocketrun::util
