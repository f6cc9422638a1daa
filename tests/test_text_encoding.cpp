// tests/test_text_encoding.cpp
//
// Regression tests for src/util/TextEncoding.h.
//
// Level files are drawn with box-drawing glyphs, so the compiler has to see
// code points rather than bytes; config and level files saved by Windows
// editors may carry a UTF-8 BOM.

#include <doctest/doctest.h>

#include "util/TextEncoding.h"

#include <string>

using rocketrun::util::AppendUtf8;
using rocketrun::util::DecodeUtf8;
using rocketrun::util::StripUtf8Bom;
using rocketrun::util::ToUtf8;

TEST_CASE("StripUtf8Bom removes a leading BOM only")
{
    std::string s = "\xEF\xBB\xBFname: x\n";
    StripUtf8Bom(s);
    CHECK(s == "name: x\n");

    // Second call is a no-op.
    StripUtf8Bom(s);
    CHECK(s == "name: x\n");

    std::string shortText = "\xEF\xBB";
    StripUtf8Bom(shortText);
    CHECK(shortText.size() == 2);
}

TEST_CASE("DecodeUtf8 yields one code point per box glyph")
{
    // "┌──┐" is 4 code points, 12 bytes.
    const std::string bytes = "\xE2\x94\x8C\xE2\x94\x80\xE2\x94\x80\xE2\x94\x90";
    std::u32string cps;
    REQUIRE(DecodeUtf8(bytes, cps));
    REQUIRE(cps.size() == 4);
    CHECK(cps[0] == U'┌');
    CHECK(cps[1] == U'─');
    CHECK(cps[3] == U'┐');
}

TEST_CASE("AppendUtf8 and DecodeUtf8 agree on every encoding length")
{
    const std::u32string text = U"Aé│\U0001F680";
    const std::string bytes = ToUtf8(text);
    CHECK(bytes.size() == 1 + 2 + 3 + 4);

    std::u32string back;
    REQUIRE(DecodeUtf8(bytes, back));
    CHECK(back == text);

    std::string one;
    AppendUtf8(one, U'─');
    CHECK(one == "\xE2\x94\x80");
}

TEST_CASE("DecodeUtf8 rejects malformed input")
{
    std::u32string out;

    SUBCASE("stray continuation byte")
    {
        CHECK_FALSE(DecodeUtf8("\x80", out));
    }

    SUBCASE("truncated sequence")
    {
        CHECK_FALSE(DecodeUtf8("\xE2\x94", out));
    }

    SUBCASE("overlong encoding of '/'")
    {
        CHECK_FALSE(DecodeUtf8("\xC0\xAF", out));
    }

    SUBCASE("encoded surrogate")
    {
        CHECK_FALSE(DecodeUtf8("\xED\xA0\x80", out));
    }

    SUBCASE("beyond U+10FFFF")
    {
        CHECK_FALSE(DecodeUtf8("\xF4\x90\x80\x80", out));
    }
}
