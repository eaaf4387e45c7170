#include "psxtools/pipeline_config.h"
#include "psxtools/cli_logger.h"
#include "psxtools/error.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace psxtools::pipeline {

static void to_json(json& j, const DuplicateTexture& d) {
    j = json{{"archive", d.archive}, {"index", d.index}};
}

static void from_json(const json& j, DuplicateTexture& d) {
    if (j.contains("archive")) j.at("archive").get_to(d.archive);
    if (j.contains("index")) j.at("index").get_to(d.index);
}

void apply_environment(Config& cfg) {
    const char* root = std::getenv(kAssetRootEnv);
    if (root && *root) cfg.asset_roots.insert(cfg.asset_roots.begin(), root);
}

Config load_config(const fs::path& path) {
    Config cfg;
    std::ifstream f(path);
    if (f.is_open()) {
        try {
            json j = json::parse(f);
            if (j.contains("asset_roots")) j.at("asset_roots").get_to(cfg.asset_roots);
            if (j.contains("texture_dir")) j.at("texture_dir").get_to(cfg.texture_dir);
            if (j.contains("duplicate_textures")) {
                cfg.duplicate_textures.clear();
                for (const auto& item : j.at("duplicate_textures")) {
                    DuplicateTexture d;
                    from_json(item, d);
                    cfg.duplicate_textures.push_back(d);
                }
            }
        } catch (const json::exception& e) {
            LOGE("config parse error:", path.string(), e.what());
            cfg = Config{};
        }
    } else {
        LOGI("no config at", path.string(), "using defaults");
    }
    apply_environment(cfg);
    return cfg;
}

void save_config(const fs::path& path, const Config& cfg) {
    json j;
    j["asset_roots"] = cfg.asset_roots;
    j["texture_dir"] = cfg.texture_dir;
    json dups = json::array();
    for (const auto& d : cfg.duplicate_textures) {
        json item;
        to_json(item, d);
        dups.push_back(item);
    }
    j["duplicate_textures"] = dups;

    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream f(path);
    if (!f.is_open())
        throw Error(ErrorKind::NotFound, std::format("config: cannot write {}", path.string()));
    f << j.dump(2) << "\n";
}

} // namespace psxtools::pipeline
