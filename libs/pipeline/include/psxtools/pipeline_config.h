#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace psxtools::pipeline {

// An archive image that must not be drawn: it is swapped for a transparent
// placeholder after decode.
struct DuplicateTexture {
    std::string archive; // file name, matched case-insensitively
    int index = 0;
};

struct Config {
    std::vector<std::string> asset_roots = {
        "assets/wipeout",
        "../../assets/wipeout",
        "../../../assets/wipeout",
    };
    std::string texture_dir = "textures";
    std::vector<DuplicateTexture> duplicate_textures = {{"allsh.cmp", 11}};
};

// Name of the environment variable whose value is searched before the
// configured asset roots.
inline constexpr const char* kAssetRootEnv = "PSXTOOLS_ASSET_ROOT";

// Load config from disk. Returns defaults if the file doesn't exist or
// does not parse. The environment override is applied either way.
Config load_config(const std::filesystem::path& path);

// Save config to disk as indented JSON.
void save_config(const std::filesystem::path& path, const Config& cfg);

// Prepends $PSXTOOLS_ASSET_ROOT to asset_roots when it is set.
void apply_environment(Config& cfg);

} // namespace psxtools::pipeline
