#pragma once

#include "psxtools/pipeline_config.h"
#include "psxtools/prm.h"
#include "psxtools/tim.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace psxtools::pipeline {

// TextureTable holds the decoded images of one archive, indexed by the
// texture ids stored in PRM primitives.
struct TextureTable {
    std::filesystem::path source; // empty when no archive was loaded
    std::vector<tim::Image> images;

    size_t size() const { return images.size(); }
    bool empty() const { return images.empty(); }

    // find returns nullptr for ids outside the table.
    const tim::Image* find(int id) const {
        if (id < 0 || static_cast<size_t>(id) >= images.size()) return nullptr;
        return &images[static_cast<size_t>(id)];
    }
};

struct LoadedObject {
    prm::Mesh mesh;
    TextureTable textures;
};

struct LoadedShip {
    LoadedObject object;
    int shadow_index = 0;
    std::optional<tim::Image> shadow;
};

// load_object decodes one model and binds it to its companion archive.
// Model errors propagate. A missing or corrupt archive is logged and the
// object comes back with an empty table.
LoadedObject load_object(const std::filesystem::path& model_path, int object_index,
                         const Config& config);

// bind_textures fills the normalized UVs of every textured primitive whose
// id resolves in table, using that image's real size. Raw UVs are left
// alone; unresolved primitives have their normalized UVs cleared. Returns
// the number of primitives bound.
size_t bind_textures(prm::Mesh& mesh, const TextureTable& table);

// load_texture_table decodes every image of an archive with transparent
// off and applies the duplicate texture list. Throws on archive errors.
TextureTable load_texture_table(const std::filesystem::path& archive_path, const Config& config);

// apply_duplicate_workaround replaces listed images with a 1x1 transparent
// placeholder. Returns the number replaced.
size_t apply_duplicate_workaround(TextureTable& table, const Config& config);

// load_archive_images decodes every image of an archive. Throws on errors.
std::vector<tim::Image> load_archive_images(const std::filesystem::path& archive_path,
                                            bool transparent);

std::filesystem::path companion_archive_path(const std::filesystem::path& model_path);

// Ships share shadows in pairs: 0-1 use shad1, 2-3 shad2, and so on.
int shadow_texture_index(int ship_index);

// <model dir>/../<texture dir>/shad<N>.tim
std::filesystem::path shadow_texture_path(const std::filesystem::path& model_path, int ship_index,
                                          const Config& config = Config{});

// load_shadow_texture decodes the ship's shadow with transparent on.
// Returns nullopt if the file is missing or does not decode.
std::optional<tim::Image> load_shadow_texture(const std::filesystem::path& model_path,
                                              int ship_index, const Config& config = Config{});

// load_ship loads object ship_index of a ship model file plus its shadow.
LoadedShip load_ship(const std::filesystem::path& model_path, int ship_index, const Config& config);

// resolve_asset returns the first <root>/<relative> that exists, or
// nullopt when no configured root has it.
std::optional<std::filesystem::path> resolve_asset(const Config& config,
                                                   const std::filesystem::path& relative);

} // namespace psxtools::pipeline
