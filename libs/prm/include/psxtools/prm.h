#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace psxtools::prm {

// Primitive type tags as stored in the file.
enum class PrimitiveType : int16_t {
    F3 = 1,
    FT3 = 2,
    F4 = 3,
    FT4 = 4,
    G3 = 5,
    GT3 = 6,
    G4 = 7,
    GT4 = 8,
    LF2 = 9,
    TSPR = 10,
    BSPR = 11,
    LSF3 = 12,
    LSFT3 = 13,
    LSF4 = 14,
    LSFT4 = 15,
    LSG3 = 16,
    LSGT3 = 17,
    LSG4 = 18,
    LSGT4 = 19,
    Spline = 20,
    InfiniteLight = 21,
    PointLight = 22,
    SpotLight = 23,
};

// Primitive flag bits.
namespace flags {
inline constexpr uint16_t SingleSided = 0x0001; // parsed, not enforced
inline constexpr uint16_t ShipEngine = 0x0002;
inline constexpr uint16_t Translucent = 0x0004;
} // namespace flags

inline constexpr int kObjectHeaderSize = 144;
inline constexpr int kMaxCount = 10000;

struct Vec3 {
    int16_t x = 0, y = 0, z = 0;
};

struct Vec3i {
    int32_t x = 0, y = 0, z = 0;
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;
};

struct UV {
    uint8_t u = 0, v = 0;
};

struct UVf {
    float u = 0, v = 0;
};

// Primitive is one decoded face. Only the first vertex_count() slots of the
// per-vertex arrays are meaningful. Flat primitives repeat their single
// color in every slot. After decode the set of types is F3, FT3, F4, FT4,
// G3, GT3, G4; GT4 quads arrive as two GT3 and LSF3/LSFT3 as F3/FT3.
struct Primitive {
    PrimitiveType type = PrimitiveType::F3;
    uint16_t flags = 0;
    std::array<int16_t, 4> coords{};
    int16_t texture_id = -1; // -1 for untextured types
    std::array<Color, 4> colors{};
    std::array<UV, 4> uvs{};             // raw texel units, never rewritten
    std::array<UVf, 4> uv_normalized{};  // filled in by texture binding
    bool normalized = false;

    int vertex_count() const;
    bool textured() const;
    bool has_flag(uint16_t f) const { return (flags & f) != 0; }
};

struct Mesh {
    std::string name;
    std::vector<Vec3> vertices;
    std::vector<Vec3> normals;
    std::vector<Primitive> primitives;
    Vec3i origin;
    int16_t flags = 0;
    int32_t radius = 0; // largest absolute vertex coordinate
};

struct ObjectInfo {
    int index = 0;
    std::string name;
    int vertex_count = 0;
    int normal_count = 0;
    int primitive_count = 0;
    size_t offset = 0; // header position in the file
};

// read decodes the object_index-th object (every header counts). Throws
// Error(ObjectIndexOutOfRange), Error(UnknownPrimitiveTag) or
// Error(MalformedHeader).
Mesh read(const uint8_t* data, size_t len, int object_index = 0);

Mesh read(const std::vector<uint8_t>& data, int object_index = 0);

// read_file reads and decodes one object. Throws Error(NotFound) if missing.
Mesh read_file(const std::filesystem::path& path, int object_index = 0);

// list_objects walks every object header without decoding primitives.
std::vector<ObjectInfo> list_objects(const uint8_t* data, size_t len);

// read_all decodes every object that has vertices.
std::vector<Mesh> read_all(const uint8_t* data, size_t len);

// payload_size returns the byte size after the type/flags words, or -1
// for an unknown tag.
int payload_size(int16_t tag);

std::string type_name(PrimitiveType type);

} // namespace psxtools::prm
