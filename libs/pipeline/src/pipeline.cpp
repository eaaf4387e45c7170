#include "psxtools/pipeline.h"
#include "psxtools/cli_logger.h"
#include "psxtools/cmp.h"
#include "psxtools/error.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <string>

namespace fs = std::filesystem;

namespace psxtools::pipeline {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void clear_binding(prm::Primitive& p) {
    p.uv_normalized = {};
    p.normalized = false;
}

} // namespace

size_t bind_textures(prm::Mesh& mesh, const TextureTable& table) {
    size_t bound = 0;
    for (auto& p : mesh.primitives) {
        clear_binding(p);
        if (!p.textured()) continue;

        const tim::Image* img = table.find(p.texture_id);
        if (!img || img->width <= 0 || img->height <= 0) continue;

        auto w = static_cast<float>(img->width);
        auto h = static_cast<float>(img->height);
        for (int i = 0; i < p.vertex_count(); i++) {
            auto k = static_cast<size_t>(i);
            p.uv_normalized[k].u = static_cast<float>(p.uvs[k].u) / w;
            p.uv_normalized[k].v = static_cast<float>(p.uvs[k].v) / h;
        }
        p.normalized = true;
        bound++;
    }
    return bound;
}

std::vector<tim::Image> load_archive_images(const fs::path& archive_path, bool transparent) {
    auto archive = cmp::read_file(archive_path);
    std::vector<tim::Image> images;
    images.reserve(archive.images.size());
    for (size_t i = 0; i < archive.images.size(); i++) {
        try {
            images.push_back(tim::decode(archive.images[i], transparent));
        } catch (const Error& e) {
            throw Error(e.kind(), std::format("{} image {}: {}", archive_path.string(), i, e.what()));
        }
        LOGD("image", i, images.back().width, "x", images.back().height);
    }
    return images;
}

size_t apply_duplicate_workaround(TextureTable& table, const Config& config) {
    auto name = lower(table.source.filename().string());
    size_t replaced = 0;
    for (const auto& d : config.duplicate_textures) {
        if (lower(d.archive) != name) continue;
        if (d.index < 0 || static_cast<size_t>(d.index) >= table.images.size()) continue;
        LOGI("replacing duplicate image", d.index, "of", name, "with a transparent placeholder");
        table.images[static_cast<size_t>(d.index)] = tim::make_placeholder();
        replaced++;
    }
    return replaced;
}

TextureTable load_texture_table(const fs::path& archive_path, const Config& config) {
    TextureTable table;
    table.source = archive_path;
    table.images = load_archive_images(archive_path, false);
    apply_duplicate_workaround(table, config);
    return table;
}

fs::path companion_archive_path(const fs::path& model_path) {
    fs::path p = model_path;
    p.replace_extension(".cmp");
    return p;
}

LoadedObject load_object(const fs::path& model_path, int object_index, const Config& config) {
    LoadedObject obj;
    obj.mesh = prm::read_file(model_path, object_index);
    LOGI("loaded", model_path.string(), "object", object_index, "'" + obj.mesh.name + "'",
         obj.mesh.vertices.size(), "vertices", obj.mesh.primitives.size(), "primitives");

    auto archive = companion_archive_path(model_path);
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        LOGI("no archive beside", model_path.string(), "(", archive.string(), ")");
    } else {
        try {
            obj.textures = load_texture_table(archive, config);
        } catch (const Error& e) {
            LOGE("archive", archive.string(), "skipped:", error_kind_name(e.kind()), e.what());
            obj.textures = TextureTable{};
        }
    }

    size_t bound = bind_textures(obj.mesh, obj.textures);
    LOGI("bound", bound, "primitives to", obj.textures.size(), "textures");
    return obj;
}

int shadow_texture_index(int ship_index) {
    return (ship_index >> 1) + 1;
}

fs::path shadow_texture_path(const fs::path& model_path, int ship_index, const Config& config) {
    return model_path.parent_path() / ".." / config.texture_dir /
           std::format("shad{}.tim", shadow_texture_index(ship_index));
}

std::optional<tim::Image> load_shadow_texture(const fs::path& model_path, int ship_index,
                                              const Config& config) {
    auto path = shadow_texture_path(model_path, ship_index, config);
    try {
        return tim::decode_file(path, true);
    } catch (const Error& e) {
        LOGW("shadow texture", path.string(), "unavailable:", e.what());
        return std::nullopt;
    }
}

LoadedShip load_ship(const fs::path& model_path, int ship_index, const Config& config) {
    LoadedShip ship;
    ship.object = load_object(model_path, ship_index, config);
    ship.shadow_index = shadow_texture_index(ship_index);
    ship.shadow = load_shadow_texture(model_path, ship_index, config);
    return ship;
}

std::optional<fs::path> resolve_asset(const Config& config, const fs::path& relative) {
    for (const auto& root : config.asset_roots) {
        auto candidate = fs::path(root) / relative;
        std::error_code ec;
        if (fs::exists(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

} // namespace psxtools::pipeline
