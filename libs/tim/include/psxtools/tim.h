#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace psxtools::tim {

// Color type tags stored in the second header word.
inline constexpr uint32_t kTrueColor16 = 0x02;
inline constexpr uint32_t kPaletted4 = 0x08;
inline constexpr uint32_t kPaletted8 = 0x09;

struct Rgba {
    uint8_t r = 0, g = 0, b = 0, a = 0;
};

struct Header {
    uint32_t magic = 0;
    uint32_t color_type = 0;
    int palette_colors = 0;  // 0 for true color
    int palette_count = 0;
    int entries_per_row = 0; // 16-bit words per row
    int width = 0;           // output pixels
    int height = 0;
    size_t pixel_offset = 0; // first pixel word
};

// RGBA pixel buffer (4 bytes per pixel, row-major, top-to-bottom).
struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // RGBA, size = width * height * 4

    void set(int x, int y, Rgba c) {
        size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
        pixels[off] = c.r; pixels[off+1] = c.g; pixels[off+2] = c.b; pixels[off+3] = c.a;
    }

    Rgba get(int x, int y) const {
        size_t off = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
        return {pixels[off], pixels[off+1], pixels[off+2], pixels[off+3]};
    }
};

enum class AlphaMode {
    Opaque,      // every alpha is 255
    Cutout,      // alpha is either 0 or 255
    Translucent, // at least one partial alpha
};

// color_to_rgba expands a 5:5:5:1 color word. A zero word is always
// transparent; with transparent set, a word with only the STP bit is too.
Rgba color_to_rgba(uint16_t c, bool transparent);

// read_header parses the TIM header and palette/pixel block headers
// without decoding pixels.
Header read_header(const uint8_t* data, size_t len);

// decode converts a TIM image to RGBA. Throws Error(UnsupportedColorType)
// for tags other than 0x02/0x08/0x09 and Error(MalformedHeader) when
// the declared blocks overrun the input.
Image decode(const uint8_t* data, size_t len, bool transparent);

Image decode(const std::vector<uint8_t>& data, bool transparent);

// decode_file reads a standalone .tim file. Throws Error(NotFound) if missing.
Image decode_file(const std::filesystem::path& path, bool transparent);

// make_placeholder returns a fully transparent image.
Image make_placeholder(int width = 1, int height = 1);

AlphaMode classify_alpha(const Image& img);

// color_type_name maps a TIM color type tag to "4bpp", "8bpp" or "16bpp".
std::string color_type_name(uint32_t tag);

std::string alpha_mode_name(AlphaMode mode);

} // namespace psxtools::tim
