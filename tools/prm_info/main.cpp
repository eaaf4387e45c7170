#include "psxtools/binutil.h"
#include "psxtools/cli_logger.h"
#include "psxtools/error.h"
#include "psxtools/pipeline.h"
#include "psxtools/prm.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
namespace prm = psxtools::prm;
namespace pipeline = psxtools::pipeline;
using json = nlohmann::ordered_json;

namespace {

json vec3_to_json(const prm::Vec3& v) {
    return json::array({v.x, v.y, v.z});
}

json mesh_to_json(const prm::Mesh& mesh, int index) {
    std::map<std::string, int> by_type;
    std::set<int> texture_ids;
    int engine = 0;
    int translucent = 0;
    for (const auto& p : mesh.primitives) {
        by_type[prm::type_name(p.type)]++;
        if (p.textured()) texture_ids.insert(p.texture_id);
        if (p.has_flag(prm::flags::ShipEngine)) engine++;
        if (p.has_flag(prm::flags::Translucent)) translucent++;
    }

    json bounds = nullptr;
    if (!mesh.vertices.empty()) {
        prm::Vec3 lo = mesh.vertices[0];
        prm::Vec3 hi = mesh.vertices[0];
        for (const auto& v : mesh.vertices) {
            lo.x = std::min(lo.x, v.x); hi.x = std::max(hi.x, v.x);
            lo.y = std::min(lo.y, v.y); hi.y = std::max(hi.y, v.y);
            lo.z = std::min(lo.z, v.z); hi.z = std::max(hi.z, v.z);
        }
        bounds = {{"min", vec3_to_json(lo)}, {"max", vec3_to_json(hi)}};
    }

    return {
        {"index", index},
        {"name", mesh.name},
        {"flags", mesh.flags},
        {"origin", json::array({mesh.origin.x, mesh.origin.y, mesh.origin.z})},
        {"radius", mesh.radius},
        {"vertexCount", mesh.vertices.size()},
        {"normalCount", mesh.normals.size()},
        {"primitiveCount", mesh.primitives.size()},
        {"primitiveTypes", by_type},
        {"engineFaces", engine},
        {"translucentFaces", translucent},
        {"textureIds", texture_ids},
        {"bounds", std::move(bounds)},
    };
}

json textures_to_json(const pipeline::LoadedObject& obj) {
    json images = json::array();
    for (size_t i = 0; i < obj.textures.images.size(); i++) {
        const auto& img = obj.textures.images[i];
        images.push_back({
            {"index", i},
            {"width", img.width},
            {"height", img.height},
            {"alpha", psxtools::tim::alpha_mode_name(psxtools::tim::classify_alpha(img))},
        });
    }
    size_t bound = 0;
    for (const auto& p : obj.mesh.primitives)
        if (p.normalized) bound++;

    return {
        {"archive", obj.textures.source.string()},
        {"imageCount", obj.textures.size()},
        {"boundPrimitives", bound},
        {"images", std::move(images)},
    };
}

void write_json(std::ostream& w, const json& doc, bool pretty) {
    if (pretty)
        w << std::setw(2) << doc << '\n';
    else
        w << doc << '\n';
}

void print_usage() {
    psxtools::log::print("Usage: prm_info [flags] <input.prm>");
    psxtools::log::print("Prints the objects of a PRM model file as JSON.");
    psxtools::log::print("");
    psxtools::log::print("Flags:");
    psxtools::log::print("  --object <n>      Decode object n only");
    psxtools::log::print("  --textures        Bind object n to its .cmp archive and report textures");
    psxtools::log::print("  --ship            With --textures, also load the ship shadow texture");
    psxtools::log::print("  --config <path>   Pipeline config JSON");
    psxtools::log::print("  --pretty          Pretty-print JSON output");
    psxtools::log::print("  -v, -vv           Verbose / debug logging");
}

} // namespace

int main(int argc, char* argv[]) {
    bool pretty = false;
    bool textures = false;
    bool ship = false;
    int object_index = -1;
    int verbosity = 0;
    std::string config_path;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--pretty") == 0) pretty = true;
        else if (std::strcmp(argv[i], "--textures") == 0) textures = true;
        else if (std::strcmp(argv[i], "--ship") == 0) ship = true;
        else if ((std::strcmp(argv[i], "--object") == 0 || std::strcmp(argv[i], "--config") == 0) &&
                 i + 1 >= argc) {
            LOGE("missing value for", argv[i]);
            return 1;
        } else if (std::strcmp(argv[i], "--object") == 0) {
            try {
                object_index = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                LOGE("--object expects a number, got", argv[i]);
                return 1;
            }
        } else if (std::strcmp(argv[i], "--config") == 0) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            verbosity = std::min(verbosity + 1, 2);
        else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0)
            verbosity = 2;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
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
    if (textures && object_index < 0) object_index = 0;

    fs::path input(positional[0]);
    pipeline::Config cfg;
    if (!config_path.empty()) cfg = pipeline::load_config(config_path);
    else pipeline::apply_environment(cfg);

    json doc = {
        {"schemaVersion", 1},
        {"file", input.filename().string()},
    };

    try {
        if (textures) {
            if (ship) {
                auto loaded = pipeline::load_ship(input, object_index, cfg);
                doc["object"] = mesh_to_json(loaded.object.mesh, object_index);
                doc["textures"] = textures_to_json(loaded.object);
                doc["shadow"] = {
                    {"index", loaded.shadow_index},
                    {"path", pipeline::shadow_texture_path(input, object_index, cfg).string()},
                    {"loaded", loaded.shadow.has_value()},
                };
            } else {
                auto loaded = pipeline::load_object(input, object_index, cfg);
                doc["object"] = mesh_to_json(loaded.mesh, object_index);
                doc["textures"] = textures_to_json(loaded);
            }
        } else if (object_index >= 0) {
            auto mesh = prm::read_file(input, object_index);
            doc["object"] = mesh_to_json(mesh, object_index);
        } else {
            auto data = psxtools::binutil::read_file(input);
            auto infos = prm::list_objects(data.data(), data.size());
            json objects = json::array();
            for (const auto& info : infos) {
                objects.push_back({
                    {"index", info.index},
                    {"name", info.name},
                    {"offset", info.offset},
                    {"vertexCount", info.vertex_count},
                    {"normalCount", info.normal_count},
                    {"primitiveCount", info.primitive_count},
                });
            }
            doc["objectCount"] = infos.size();
            doc["objects"] = std::move(objects);
            LOGI("PRM:", input.string(), "(", infos.size(), "objects )");
        }
    } catch (const psxtools::Error& e) {
        LOGE(psxtools::error_kind_name(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        LOGE("reading", input.string(), e.what());
        return 1;
    }

    write_json(std::cout, doc, pretty);
    return 0;
}
