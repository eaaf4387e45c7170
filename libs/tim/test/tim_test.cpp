#include "psxtools/tim.h"
#include "psxtools/error.h"

#include "fixtures/psx_fixtures.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace psxtools;
using namespace psxtools::tim;
namespace fx = psxtools::fixtures;

namespace {

ErrorKind kind_of(const std::vector<uint8_t>& data) {
    try {
        decode(data, false);
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "decode did not throw";
    return ErrorKind::NotFound;
}

} // namespace

TEST(TimColor, ChannelExpansion) {
    // r=31, g=0, b=16
    auto c = color_to_rgba(0x001F | (16 << 10), false);
    EXPECT_EQ(c.r, 248);
    EXPECT_EQ(c.g, 0);
    EXPECT_EQ(c.b, 128);
    EXPECT_EQ(c.a, 255);
}

TEST(TimColor, ZeroIsAlwaysTransparent) {
    EXPECT_EQ(color_to_rgba(0x0000, false).a, 0);
    EXPECT_EQ(color_to_rgba(0x0000, true).a, 0);
}

TEST(TimColor, StpOnlyDependsOnMode) {
    EXPECT_EQ(color_to_rgba(0x8000, true).a, 0);
    EXPECT_EQ(color_to_rgba(0x8000, false).a, 255);
}

TEST(TimColor, NonBlackWithStpIsOpaque) {
    EXPECT_EQ(color_to_rgba(0x8001, true).a, 255);
    EXPECT_EQ(color_to_rgba(0x7FFF, true).a, 255);
}

TEST(TimDecode, TrueColor16) {
    auto data = fx::make_tim16(2, 2, {0x001F, 0x03E0, 0x7C00, 0x0000});
    auto img = decode(data, false);
    ASSERT_EQ(img.width, 2);
    ASSERT_EQ(img.height, 2);
    ASSERT_EQ(img.pixels.size(), 16u);

    auto red = img.get(0, 0);
    EXPECT_EQ(red.r, 248);
    EXPECT_EQ(red.a, 255);
    EXPECT_EQ(img.get(1, 0).g, 248);
    EXPECT_EQ(img.get(0, 1).b, 248);
    EXPECT_EQ(img.get(1, 1).a, 0);
}

TEST(TimDecode, Paletted4BitSize) {
    // 3x2 words of 4 pixels each
    std::vector<uint16_t> palette(16, 0x7FFF);
    std::vector<uint16_t> words(6, 0x0000);
    auto img = decode(fx::make_tim_paletted(kPaletted4, palette, 3, 2, words), false);
    EXPECT_EQ(img.width, 12);
    EXPECT_EQ(img.height, 2);
    EXPECT_EQ(img.pixels.size(), 4u * 3u * 2u * 4u);
}

TEST(TimDecode, Paletted4BitLowNibbleFirst) {
    std::vector<uint16_t> palette(16, 0);
    palette[1] = 0x001F; // red
    palette[2] = 0x03E0; // green
    palette[3] = 0x7C00; // blue
    palette[4] = 0x7FFF; // white
    auto img = decode(fx::make_tim_paletted(kPaletted4, palette, 1, 1, {0x4321}), false);
    ASSERT_EQ(img.width, 4);
    EXPECT_EQ(img.get(0, 0).r, 248);
    EXPECT_EQ(img.get(1, 0).g, 248);
    EXPECT_EQ(img.get(2, 0).b, 248);
    auto w = img.get(3, 0);
    EXPECT_EQ(w.r, 248);
    EXPECT_EQ(w.g, 248);
    EXPECT_EQ(w.b, 248);
}

TEST(TimDecode, Paletted8BitLowByteFirst) {
    std::vector<uint16_t> palette(256, 0);
    palette[0x10] = 0x001F;
    palette[0xF0] = 0x7C00;
    auto img = decode(fx::make_tim_paletted(kPaletted8, palette, 1, 1, {0xF010}), false);
    ASSERT_EQ(img.width, 2);
    EXPECT_EQ(img.get(0, 0).r, 248);
    EXPECT_EQ(img.get(0, 0).b, 0);
    EXPECT_EQ(img.get(1, 0).b, 248);
    EXPECT_EQ(img.get(1, 0).r, 0);
}

TEST(TimDecode, Paletted8BitDimensions) {
    std::vector<uint16_t> palette(256, 0x1234);
    std::vector<uint16_t> words(8 * 8, 0x0101);
    auto img = decode(fx::make_tim_paletted(kPaletted8, palette, 8, 8, words), false);
    EXPECT_EQ(img.width, 16);
    EXPECT_EQ(img.height, 8);
    EXPECT_EQ(img.pixels.size(), 512u);

    std::vector<uint16_t> wide(16 * 8, 0x0101);
    auto img2 = decode(fx::make_tim_paletted(kPaletted8, palette, 16, 8, wide), false);
    EXPECT_EQ(img2.width, 32);
    EXPECT_EQ(img2.height, 8);
    EXPECT_EQ(img2.pixels.size(), 1024u);
}

TEST(TimDecode, PaletteHonorsTransparencyMode) {
    std::vector<uint16_t> palette(16, 0);
    palette[1] = 0x8000;
    auto data = fx::make_tim_paletted(kPaletted4, palette, 1, 1, {0x1111});
    EXPECT_EQ(decode(data, true).get(0, 0).a, 0);
    EXPECT_EQ(decode(data, false).get(0, 0).a, 255);
}

TEST(TimDecode, IndexBeyondPaletteReadsTransparentBlack) {
    std::vector<uint16_t> palette = {0x7FFF, 0x7FFF};
    auto img = decode(fx::make_tim_paletted(kPaletted4, palette, 1, 1, {0x00F0}), false);
    EXPECT_EQ(img.get(0, 0).a, 255);
    EXPECT_EQ(img.get(1, 0).a, 0);
}

TEST(TimDecode, PaletteCountDoesNotAddPaletteWords) {
    // paletteCount 2 with two colors: the pixel block follows the two palette words.
    std::vector<uint8_t> b;
    fx::put_u32le(b, fx::kTimMagic);
    fx::put_u32le(b, kPaletted8);
    fx::put_u32le(b, 12 + 4);
    fx::put_u16le(b, 0);
    fx::put_u16le(b, 0);
    fx::put_u16le(b, 2);
    fx::put_u16le(b, 2);
    fx::put_u16le(b, 0x001F);
    fx::put_u16le(b, 0x03E0);
    fx::put_u32le(b, 14);
    fx::put_u16le(b, 0);
    fx::put_u16le(b, 0);
    fx::put_u16le(b, 1);
    fx::put_u16le(b, 1);
    fx::put_u16le(b, 0x0100);

    auto hdr = read_header(b.data(), b.size());
    EXPECT_EQ(hdr.palette_count, 2);
    auto img = decode(b, false);
    ASSERT_EQ(img.width, 2);
    ASSERT_EQ(img.height, 1);
    EXPECT_EQ(img.get(0, 0).r, 248);
    EXPECT_EQ(img.get(0, 0).g, 0);
    EXPECT_EQ(img.get(1, 0).g, 248);
    EXPECT_EQ(img.get(1, 0).r, 0);
}

TEST(TimDecode, UnsupportedColorType) {
    auto data = fx::make_tim16(1, 1, {0x7FFF});
    data[4] = 0x03; // 24bpp
    EXPECT_EQ(kind_of(data), ErrorKind::UnsupportedColorType);
}

TEST(TimDecode, PixelDataOverrun) {
    auto data = fx::make_tim16(4, 4, {0x7FFF, 0x7FFF});
    EXPECT_EQ(kind_of(data), ErrorKind::MalformedHeader);
}

TEST(TimDecode, TruncatedPalette) {
    auto data = fx::make_tim_paletted(kPaletted4, std::vector<uint16_t>(16, 1), 1, 1, {0});
    data.resize(30);
    EXPECT_EQ(kind_of(data), ErrorKind::MalformedHeader);
}

TEST(TimDecode, NegativeRows) {
    auto data = fx::make_tim16(1, -1, {});
    EXPECT_EQ(kind_of(data), ErrorKind::MalformedHeader);
}

TEST(TimDecode, OversizedPalette) {
    auto data = fx::make_tim_paletted(kPaletted8, std::vector<uint16_t>(300, 1), 1, 1, {0});
    EXPECT_EQ(kind_of(data), ErrorKind::MalformedHeader);
}

TEST(TimHeader, ReportsDimensions) {
    std::vector<uint16_t> palette(16, 1);
    auto data = fx::make_tim_paletted(kPaletted4, palette, 4, 3, std::vector<uint16_t>(12, 0));
    auto hdr = read_header(data.data(), data.size());
    EXPECT_EQ(hdr.magic, fx::kTimMagic);
    EXPECT_EQ(hdr.color_type, kPaletted4);
    EXPECT_EQ(hdr.palette_colors, 16);
    EXPECT_EQ(hdr.palette_count, 1);
    EXPECT_EQ(hdr.width, 16);
    EXPECT_EQ(hdr.height, 3);
}

TEST(TimAlpha, Classify) {
    auto opaque = decode(fx::make_tim16(2, 1, {0x7FFF, 0x001F}), false);
    EXPECT_EQ(classify_alpha(opaque), AlphaMode::Opaque);

    auto cutout = decode(fx::make_tim16(2, 1, {0x7FFF, 0x0000}), false);
    EXPECT_EQ(classify_alpha(cutout), AlphaMode::Cutout);

    Image soft = make_placeholder(1, 1);
    soft.pixels[3] = 128;
    EXPECT_EQ(classify_alpha(soft), AlphaMode::Translucent);
}

TEST(TimAlpha, Placeholder) {
    auto img = make_placeholder();
    EXPECT_EQ(img.width, 1);
    EXPECT_EQ(img.height, 1);
    EXPECT_EQ(img.get(0, 0).a, 0);
    EXPECT_EQ(classify_alpha(img), AlphaMode::Cutout);
}

TEST(TimNames, ColorType) {
    EXPECT_EQ(color_type_name(0x08), "4bpp");
    EXPECT_EQ(color_type_name(0x09), "8bpp");
    EXPECT_EQ(color_type_name(0x02), "16bpp");
    EXPECT_EQ(color_type_name(0x03), "");
}

TEST(TimFile, DecodeAndMissing) {
    auto path = std::filesystem::temp_directory_path() / "psxtools_tim_test.tim";
    auto bytes = fx::make_tim4_solid(8, 2, 0x7FFF);
    {
        std::ofstream f(path, std::ios::binary);
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    auto img = decode_file(path, false);
    EXPECT_EQ(img.width, 8);
    EXPECT_EQ(img.height, 2);
    std::filesystem::remove(path);

    EXPECT_THROW(decode_file(path, false), Error);
}
