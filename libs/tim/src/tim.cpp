#include "psxtools/tim.h"
#include "psxtools/binutil.h"
#include "psxtools/error.h"

#include <array>
#include <format>

namespace psxtools::tim {

namespace {

constexpr int kMaxPaletteColors = 256;

int pixels_per_word(uint32_t color_type) {
    switch (color_type) {
        case kTrueColor16: return 1;
        case kPaletted8: return 2;
        case kPaletted4: return 4;
        default: return 0;
    }
}

struct Parsed {
    Header header;
    std::array<Rgba, kMaxPaletteColors> palette{};
};

Parsed parse(const uint8_t* data, size_t len, bool transparent) {
    binutil::Cursor cur(data, len, "tim");
    Parsed p;
    Header& hdr = p.header;
    hdr.magic = cur.u32le("magic");
    hdr.color_type = cur.u32le("color type");

    int ppw = pixels_per_word(hdr.color_type);
    if (ppw == 0)
        throw Error(ErrorKind::UnsupportedColorType,
                    std::format("tim: unsupported color type 0x{:02x}", hdr.color_type));

    if (hdr.color_type != kTrueColor16) {
        cur.u32le("palette block length");
        cur.i16le("palette x");
        cur.i16le("palette y");
        int colors = cur.i16le("palette color count");
        int count = cur.i16le("palette count");
        if (colors < 0 || colors > kMaxPaletteColors || count < 0)
            throw Error(ErrorKind::MalformedHeader,
                        std::format("tim: bad palette {} colors x {}", colors, count));
        hdr.palette_colors = colors;
        hdr.palette_count = count;

        for (int i = 0; i < colors; i++)
            p.palette[static_cast<size_t>(i)] = color_to_rgba(cur.u16le("palette color"), transparent);

        // The palette count is informational; exactly palette_colors words
        // precede the pixel block.
    }

    cur.u32le("pixel block length");
    cur.i16le("skip x");
    cur.i16le("skip y");
    int entries = cur.i16le("entries per row");
    int rows = cur.i16le("row count");
    if (entries < 0 || rows < 0)
        throw Error(ErrorKind::MalformedHeader,
                    std::format("tim: negative pixel block size {}x{}", entries, rows));

    hdr.entries_per_row = entries;
    hdr.width = entries * ppw;
    hdr.height = rows;
    hdr.pixel_offset = cur.pos();
    cur.need(static_cast<size_t>(entries) * static_cast<size_t>(rows) * 2, "pixel data");
    return p;
}

} // namespace

Rgba color_to_rgba(uint16_t c, bool transparent) {
    Rgba out;
    out.r = static_cast<uint8_t>(((c >> 0) & 0x1F) << 3);
    out.g = static_cast<uint8_t>(((c >> 5) & 0x1F) << 3);
    out.b = static_cast<uint8_t>(((c >> 10) & 0x1F) << 3);
    if (c == 0)
        out.a = 0;
    else if (transparent && (c & 0x7FFF) == 0)
        out.a = 0;
    else
        out.a = 255;
    return out;
}

Header read_header(const uint8_t* data, size_t len) {
    return parse(data, len, false).header;
}

Image decode(const uint8_t* data, size_t len, bool transparent) {
    auto p = parse(data, len, transparent);
    const Header& hdr = p.header;

    Image img;
    img.width = hdr.width;
    img.height = hdr.height;
    img.pixels.resize(static_cast<size_t>(img.width) * static_cast<size_t>(img.height) * 4);

    const uint8_t* src = data + hdr.pixel_offset;
    for (int y = 0; y < hdr.height; y++) {
        for (int e = 0; e < hdr.entries_per_row; e++) {
            uint16_t word = binutil::get_u16le(src);
            src += 2;
            switch (hdr.color_type) {
                case kTrueColor16:
                    img.set(e, y, color_to_rgba(word, transparent));
                    break;
                case kPaletted8:
                    img.set(e * 2, y, p.palette[word & 0xFF]);
                    img.set(e * 2 + 1, y, p.palette[(word >> 8) & 0xFF]);
                    break;
                case kPaletted4:
                    for (int j = 0; j < 4; j++)
                        img.set(e * 4 + j, y, p.palette[(word >> (j * 4)) & 0xF]);
                    break;
            }
        }
    }
    return img;
}

Image decode(const std::vector<uint8_t>& data, bool transparent) {
    return decode(data.data(), data.size(), transparent);
}

Image decode_file(const std::filesystem::path& path, bool transparent) {
    auto data = binutil::read_file(path);
    return decode(data, transparent);
}

Image make_placeholder(int width, int height) {
    Image img;
    img.width = width;
    img.height = height;
    img.pixels.assign(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 0);
    return img;
}

AlphaMode classify_alpha(const Image& img) {
    bool has_cutout = false;
    for (size_t i = 3; i < img.pixels.size(); i += 4) {
        uint8_t a = img.pixels[i];
        if (a == 255) continue;
        if (a != 0) return AlphaMode::Translucent;
        has_cutout = true;
    }
    return has_cutout ? AlphaMode::Cutout : AlphaMode::Opaque;
}

std::string color_type_name(uint32_t tag) {
    switch (tag) {
        case kPaletted4: return "4bpp";
        case kPaletted8: return "8bpp";
        case kTrueColor16: return "16bpp";
        default: return "";
    }
}

std::string alpha_mode_name(AlphaMode mode) {
    switch (mode) {
        case AlphaMode::Opaque: return "opaque";
        case AlphaMode::Cutout: return "cutout";
        case AlphaMode::Translucent: return "translucent";
    }
    return "";
}

} // namespace psxtools::tim
