#include "psxtools/cli_logger.h"
#include "psxtools/cmp.h"
#include "psxtools/error.h"
#include "psxtools/tim.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;
namespace cmp = psxtools::cmp;
namespace tim = psxtools::tim;

static void print_usage() {
    std::cerr << "Usage: cmp_extract [flags] <input.cmp>\n\n"
              << "Decompresses a CMP texture archive and writes every image as PNG.\n\n"
              << "Flags:\n"
              << "  -o <dir>        Output directory (default: <input>_images)\n"
              << "  --transparent   Treat STP-only black as transparent\n"
              << "  --raw           Write decompressed TIM blobs instead of PNG\n"
              << "  --list          Print the image table only\n"
              << "  -v, -vv         Verbose / debug logging\n";
}

int main(int argc, char* argv[]) {
    std::string output;
    bool transparent = false;
    bool raw = false;
    bool list_only = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--transparent") == 0) {
            transparent = true;
        } else if (std::strcmp(argv[i], "--raw") == 0) {
            raw = true;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            list_only = true;
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

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    fs::path input(positional[0]);
    cmp::Archive archive;
    try {
        archive = cmp::read_file(input);
    } catch (const psxtools::Error& e) {
        LOGE(psxtools::error_kind_name(e.kind()), e.what());
        return 1;
    }

    std::cerr << "CMP: " << input.string() << " (" << archive.images.size() << " images, "
              << archive.header.total_size() << " bytes)\n";

    if (list_only) {
        for (size_t i = 0; i < archive.images.size(); i++) {
            const auto& blob = archive.images[i];
            try {
                auto hdr = tim::read_header(blob.data(), blob.size());
                psxtools::log::print(std::format("{:3}", i), tim::color_type_name(hdr.color_type),
                                     std::format("{}x{}", hdr.width, hdr.height), blob.size());
            } catch (const std::exception& e) {
                psxtools::log::print(std::format("{:3}", i), "invalid:", e.what());
            }
        }
        return 0;
    }

    fs::path out_dir = output.empty() ? input.parent_path() / (input.stem().string() + "_images")
                                      : fs::path(output);
    try {
        fs::create_directories(out_dir);
    } catch (const std::exception& e) {
        LOGE("creating", out_dir.string(), e.what());
        return 1;
    }

    int failed = 0;
    for (size_t i = 0; i < archive.images.size(); i++) {
        const auto& blob = archive.images[i];
        auto base = out_dir / std::format("{}_{:03}", input.stem().string(), i);

        if (raw) {
            auto path = base.string() + ".tim";
            std::ofstream f(path, std::ios::binary);
            f.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
            if (!f) {
                LOGE("writing", path);
                failed++;
                continue;
            }
            LOGI("wrote", path);
            continue;
        }

        tim::Image img;
        try {
            img = tim::decode(blob, transparent);
        } catch (const std::exception& e) {
            LOGW("image", i, "skipped:", e.what());
            failed++;
            continue;
        }
        if (img.width == 0 || img.height == 0) {
            LOGW("image", i, "is empty");
            continue;
        }

        auto path = base.string() + ".png";
        if (!stbi_write_png(path.c_str(), img.width, img.height, 4, img.pixels.data(), img.width * 4)) {
            LOGE("writing", path);
            failed++;
            continue;
        }
        LOGI("wrote", path, std::format("{}x{}", img.width, img.height),
             tim::alpha_mode_name(tim::classify_alpha(img)));
    }

    std::cerr << "Output: " << out_dir.string() << '\n';
    return failed == 0 ? 0 : 1;
}
