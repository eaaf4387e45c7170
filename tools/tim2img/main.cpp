#include "psxtools/binutil.h"
#include "psxtools/cli_logger.h"
#include "psxtools/tim.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;
namespace tim = psxtools::tim;

static void print_usage() {
    std::cerr << "Usage: tim2img [flags] <input.tim>\n\n"
              << "Converts a PlayStation TIM image to PNG.\n"
              << "Reads from file argument or stdin (use - or omit argument).\n\n"
              << "Flags:\n"
              << "  -o <path>       Output PNG path (use - for stdout)\n"
              << "  --transparent   Treat STP-only black as transparent\n"
              << "  -v, -vv         Verbose / debug logging\n";
}

static void write_png_to_stream(std::ostream& out, const tim::Image& img) {
    stbi_write_png_to_func(
        [](void* ctx, void* data, int size) {
            static_cast<std::ostream*>(ctx)->write(static_cast<const char*>(data), size);
        },
        &out, img.width, img.height, 4, img.pixels.data(), img.width * 4);
}

int main(int argc, char* argv[]) {
    std::string output;
    bool transparent = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--transparent") == 0) {
            transparent = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    psxtools::log::set_verbosity(verbosity);

    bool from_stdin = positional.empty() || positional[0] == "-";
    std::string input_name;
    std::vector<uint8_t> data;
    try {
        if (from_stdin) {
            data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
            input_name = "stdin";
        } else {
            data = psxtools::binutil::read_file(positional[0]);
            input_name = positional[0];
        }
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }

    tim::Image img;
    tim::Header hdr;
    try {
        hdr = tim::read_header(data.data(), data.size());
        img = tim::decode(data, transparent);
    } catch (const std::exception& e) {
        LOGE("decoding", input_name + ":", e.what());
        return 1;
    }

    if (img.width == 0 || img.height == 0) {
        LOGE(input_name, "has no pixels");
        return 1;
    }

    std::cerr << "TIM: " << input_name << " (" << tim::color_type_name(hdr.color_type) << ", "
              << img.width << "x" << img.height << ", "
              << tim::alpha_mode_name(tim::classify_alpha(img)) << ")\n";
    LOGD("palette", hdr.palette_colors, "colors x", hdr.palette_count);

    if (output == "-" || (from_stdin && output.empty())) {
        write_png_to_stream(std::cout, img);
    } else {
        std::string out_path = output;
        if (out_path.empty()) {
            fs::path p(input_name);
            out_path = (p.parent_path() / p.stem()).string() + ".png";
        }
        if (!stbi_write_png(out_path.c_str(), img.width, img.height, 4, img.pixels.data(), img.width * 4)) {
            LOGE("writing", out_path);
            return 1;
        }
        std::cerr << "Output: " << out_path << '\n';
    }

    return 0;
}
