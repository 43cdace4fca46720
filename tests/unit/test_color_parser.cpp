#include <gtest/gtest.h>

#include <contrast_audit/internal/processing/ColorParser.hpp>

using namespace ContrastAudit;
using Internal::Processing::ColorParser;

// ─── Hex literals ────────────────────────────────────────────────────────────

TEST(ColorParser, LongHexIsLowercased)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("#A1B2C3"), "#a1b2c3");
}

TEST(ColorParser, HashIsOptional)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("336699"), "#336699");
}

TEST(ColorParser, ShortHexDuplicatesDigits)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("#abc"), "#aabbcc");
    EXPECT_EQ(parser.normalizeToHex("#FFF"), "#ffffff");
}

TEST(ColorParser, AlphaIsDropped)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("#abcd"), "#aabbcc");
    EXPECT_EQ(parser.normalizeToHex("#11223380"), "#112233");
}

TEST(ColorParser, SurroundingWhitespaceIsIgnored)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("  #123456\t"), "#123456");
}

TEST(ColorParser, ChannelsAreDecoded)
{
    ColorParser parser;
    Domain::Color color = parser.normalize("#0a80ff");
    EXPECT_EQ(color.red(), 10);
    EXPECT_EQ(color.green(), 128);
    EXPECT_EQ(color.blue(), 255);
}

// ─── Named colors ────────────────────────────────────────────────────────────

TEST(ColorParser, NamedColorsResolve)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("white"), "#ffffff");
    EXPECT_EQ(parser.normalizeToHex("Black"), "#000000");
    EXPECT_EQ(parser.normalizeToHex("green"), "#008000");
    EXPECT_EQ(parser.normalizeToHex("brown"), "#a52a2a");
}

TEST(ColorParser, GrayAndGreyAreAliases)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("gray"), parser.normalizeToHex("grey"));
}

TEST(ColorParser, EveryNamedColorIsCanonicalHex)
{
    ColorParser parser;
    for (const auto& [name, hex] : ColorParser::namedColors()) {
        EXPECT_EQ(parser.normalizeToHex(name), hex) << name;
    }
}

// ─── Functional notation ─────────────────────────────────────────────────────

TEST(ColorParser, RgbFunction)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("rgb(255, 0, 128)"), "#ff0080");
    EXPECT_EQ(parser.normalizeToHex("rgb(0 255 0)"), "#00ff00");
}

TEST(ColorParser, RgbaDropsAlpha)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("rgba(10, 20, 30, 0.5)"), "#0a141e");
    EXPECT_EQ(parser.normalizeToHex("rgb(10 20 30 / 50%)"), "#0a141e");
}

TEST(ColorParser, RgbPercentChannels)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("rgb(100%, 0%, 0%)"), "#ff0000");
}

TEST(ColorParser, RgbChannelsClamp)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("rgb(300, -5, 0)"), "#ff0000");
}

TEST(ColorParser, HslFunction)
{
    ColorParser parser;
    EXPECT_EQ(parser.normalizeToHex("hsl(0, 100%, 50%)"), "#ff0000");
    EXPECT_EQ(parser.normalizeToHex("hsl(120deg 100% 25%)"), "#008000");
    EXPECT_EQ(parser.normalizeToHex("hsla(240, 100%, 50%, 0.3)"), "#0000ff");
}

// ─── Rejection ───────────────────────────────────────────────────────────────

TEST(ColorParser, RejectsUnknownName)
{
    ColorParser parser;
    EXPECT_THROW(parser.normalize("notacolor"), Domain::InvalidColorError);
}

TEST(ColorParser, ErrorCarriesNormalizedLiteral)
{
    ColorParser parser;
    try {
        parser.normalize("  #12345 ");
        FAIL() << "expected InvalidColorError";
    } catch (const Domain::InvalidColorError& e) {
        EXPECT_EQ(e.value(), "#12345");
        EXPECT_NE(std::string(e.what()).find("#12345"), std::string::npos);
    }
}

TEST(ColorParser, RejectsBadLengthsAndDigits)
{
    ColorParser parser;
    EXPECT_FALSE(parser.isValid(""));
    EXPECT_FALSE(parser.isValid("#"));
    EXPECT_FALSE(parser.isValid("#12"));
    EXPECT_FALSE(parser.isValid("#12345"));
    EXPECT_FALSE(parser.isValid("#1234567"));
    EXPECT_FALSE(parser.isValid("#gggggg"));
    EXPECT_TRUE(parser.isValid("#123"));
}

TEST(ColorParser, RejectsMalformedFunctions)
{
    ColorParser parser;
    EXPECT_FALSE(parser.isValid("rgb(1, 2)"));
    EXPECT_FALSE(parser.isValid("rgb(1, 2, 3"));
    EXPECT_FALSE(parser.isValid("rgb(a, b, c)"));
    EXPECT_FALSE(parser.isValid("hsl(0, 100%, 50%, 1, 2)"));
}
