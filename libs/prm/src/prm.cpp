#include "psxtools/prm.h"
#include "psxtools/binutil.h"
#include "psxtools/error.h"

#include <cstdlib>
#include <format>
#include <initializer_list>
#include <utility>

namespace psxtools::prm {

using binutil::Cursor;

int Primitive::vertex_count() const {
    switch (type) {
        case PrimitiveType::F4:
        case PrimitiveType::FT4:
        case PrimitiveType::G4:
        case PrimitiveType::GT4:
            return 4;
        default:
            return 3;
    }
}

bool Primitive::textured() const {
    switch (type) {
        case PrimitiveType::FT3:
        case PrimitiveType::FT4:
        case PrimitiveType::GT3:
        case PrimitiveType::GT4:
        case PrimitiveType::LSFT3:
            return true;
        default:
            return false;
    }
}

int payload_size(int16_t tag) {
    switch (static_cast<PrimitiveType>(tag)) {
        case PrimitiveType::F3: return 12;
        case PrimitiveType::FT3: return 24;
        case PrimitiveType::F4: return 12;
        case PrimitiveType::FT4: return 28;
        case PrimitiveType::G3: return 20;
        case PrimitiveType::GT3: return 32;
        case PrimitiveType::G4: return 24;
        case PrimitiveType::GT4: return 40;
        case PrimitiveType::LF2: return 12;
        case PrimitiveType::TSPR: return 12;
        case PrimitiveType::BSPR: return 12;
        case PrimitiveType::LSF3: return 12;
        case PrimitiveType::LSFT3: return 24;
        case PrimitiveType::LSF4: return 16;
        case PrimitiveType::LSFT4: return 30;
        case PrimitiveType::LSG3: return 24;
        case PrimitiveType::LSGT3: return 36;
        case PrimitiveType::LSG4: return 32;
        case PrimitiveType::LSGT4: return 46;
        case PrimitiveType::Spline: return 52;
        case PrimitiveType::InfiniteLight: return 12;
        case PrimitiveType::PointLight: return 24;
        case PrimitiveType::SpotLight: return 36;
    }
    return -1;
}

std::string type_name(PrimitiveType type) {
    switch (type) {
        case PrimitiveType::F3: return "F3";
        case PrimitiveType::FT3: return "FT3";
        case PrimitiveType::F4: return "F4";
        case PrimitiveType::FT4: return "FT4";
        case PrimitiveType::G3: return "G3";
        case PrimitiveType::GT3: return "GT3";
        case PrimitiveType::G4: return "G4";
        case PrimitiveType::GT4: return "GT4";
        case PrimitiveType::LF2: return "LF2";
        case PrimitiveType::TSPR: return "TSPR";
        case PrimitiveType::BSPR: return "BSPR";
        case PrimitiveType::LSF3: return "LSF3";
        case PrimitiveType::LSFT3: return "LSFT3";
        case PrimitiveType::LSF4: return "LSF4";
        case PrimitiveType::LSFT4: return "LSFT4";
        case PrimitiveType::LSG3: return "LSG3";
        case PrimitiveType::LSGT3: return "LSGT3";
        case PrimitiveType::LSG4: return "LSG4";
        case PrimitiveType::LSGT4: return "LSGT4";
        case PrimitiveType::Spline: return "Spline";
        case PrimitiveType::InfiniteLight: return "InfiniteLight";
        case PrimitiveType::PointLight: return "PointLight";
        case PrimitiveType::SpotLight: return "SpotLight";
    }
    return "";
}

namespace {

struct ObjectHeader {
    std::string name;
    int vertices = 0;
    int normals = 0;
    int primitives = 0;
    int16_t flags = 0;
    Vec3i origin;
};

ObjectHeader read_object_header(Cursor& cur) {
    ObjectHeader h;
    h.name = cur.fixed_string(16, "object name");
    h.vertices = cur.i16be("vertex count");
    cur.skip(6);
    h.normals = cur.i16be("normal count");
    cur.skip(6);
    h.primitives = cur.i16be("primitive count");
    cur.skip(6);
    cur.skip(12); // unused pointers, skeleton ref
    cur.i32be("extent");
    h.flags = cur.i16be("object flags");
    cur.skip(2);
    cur.skip(4);  // next pointer
    cur.skip(20); // relative rotation
    h.origin.x = cur.i32be("origin");
    h.origin.y = cur.i32be("origin");
    h.origin.z = cur.i32be("origin");
    cur.skip(48); // absolute rotation/translation, skeleton links

    auto bad = [](int n) { return n < 0 || n > kMaxCount; };
    if (bad(h.vertices) || bad(h.normals) || bad(h.primitives))
        throw Error(ErrorKind::MalformedHeader,
                    std::format("prm: object '{}' has implausible counts v={} n={} p={}",
                                h.name, h.vertices, h.normals, h.primitives));
    return h;
}

Vec3 read_vec(Cursor& cur, const char* what) {
    Vec3 v;
    v.x = cur.i16be(what);
    v.y = cur.i16be(what);
    v.z = cur.i16be(what);
    cur.skip(2);
    return v;
}

Color read_color(Cursor& cur) {
    uint32_t v = cur.u32be("color");
    return {static_cast<uint8_t>(v >> 24), static_cast<uint8_t>(v >> 16),
            static_cast<uint8_t>(v >> 8), 255};
}

class PrimitiveReader {
public:
    PrimitiveReader(Cursor& cur, const Mesh& mesh) : cur_(cur), mesh_(mesh) {}

    void coords(Primitive& p, int n) {
        for (int i = 0; i < n; i++) {
            int16_t idx = cur_.i16be("coord index");
            if (idx < 0 || static_cast<size_t>(idx) >= mesh_.vertices.size())
                throw Error(ErrorKind::MalformedHeader,
                            std::format("prm: object '{}' coord index {} outside {} vertices",
                                        mesh_.name, idx, mesh_.vertices.size()));
            p.coords[static_cast<size_t>(i)] = idx;
        }
    }

    // texture id, cba, tsb, then n uv pairs
    void texture(Primitive& p, int n) {
        p.texture_id = cur_.i16be("texture id");
        cur_.skip(4);
        for (int i = 0; i < n; i++) {
            p.uvs[static_cast<size_t>(i)].u = cur_.u8("uv");
            p.uvs[static_cast<size_t>(i)].v = cur_.u8("uv");
        }
    }

    void flat(Primitive& p, int n) {
        Color c = read_color(cur_);
        for (int i = 0; i < n; i++) p.colors[static_cast<size_t>(i)] = c;
    }

    void gouraud(Primitive& p, int n) {
        for (int i = 0; i < n; i++) p.colors[static_cast<size_t>(i)] = read_color(cur_);
    }

    void pad() { cur_.skip(2); }

private:
    Cursor& cur_;
    const Mesh& mesh_;
};

// Splits a GT4 quad into (v2,v1,v0) and (v2,v3,v1).
void split_gt4(const Primitive& quad, std::vector<Primitive>& out) {
    static constexpr int kTris[2][3] = {{2, 1, 0}, {2, 3, 1}};
    for (const auto& tri : kTris) {
        Primitive p;
        p.type = PrimitiveType::GT3;
        p.flags = quad.flags;
        p.texture_id = quad.texture_id;
        for (size_t i = 0; i < 3; i++) {
            auto src = static_cast<size_t>(tri[i]);
            p.coords[i] = quad.coords[src];
            p.colors[i] = quad.colors[src];
            p.uvs[i] = quad.uvs[src];
        }
        out.push_back(p);
    }
}

void read_primitive(Cursor& cur, Mesh& mesh) {
    int16_t tag = cur.i16be("primitive type");
    uint16_t pflags = cur.u16be("primitive flags");
    int size = payload_size(tag);
    if (size < 0)
        throw Error(ErrorKind::UnknownPrimitiveTag,
                    std::format("prm: unknown primitive type {} at offset {} in '{}'",
                                tag, cur.pos() - 4, mesh.name));
    cur.need(static_cast<size_t>(size), "primitive");
    size_t end = cur.pos() + static_cast<size_t>(size);

    PrimitiveReader r(cur, mesh);
    Primitive p;
    p.type = static_cast<PrimitiveType>(tag);
    p.flags = pflags;

    switch (p.type) {
        case PrimitiveType::F3:
            r.coords(p, 3); r.pad(); r.flat(p, 3);
            break;
        case PrimitiveType::FT3:
            r.coords(p, 3); r.texture(p, 3); r.pad(); r.flat(p, 3);
            break;
        case PrimitiveType::F4:
            r.coords(p, 4); r.flat(p, 4);
            break;
        case PrimitiveType::FT4:
            r.coords(p, 4); r.texture(p, 4); r.pad(); r.flat(p, 4);
            break;
        case PrimitiveType::G3:
            r.coords(p, 3); r.pad(); r.gouraud(p, 3);
            break;
        case PrimitiveType::GT3:
            r.coords(p, 3); r.texture(p, 3); r.pad(); r.gouraud(p, 3);
            break;
        case PrimitiveType::G4:
            r.coords(p, 4); r.gouraud(p, 4);
            break;
        case PrimitiveType::GT4:
            r.coords(p, 4); r.texture(p, 4); r.pad(); r.gouraud(p, 4);
            split_gt4(p, mesh.primitives);
            cur.seek(end);
            return;
        case PrimitiveType::LSF3:
            p.type = PrimitiveType::F3;
            r.coords(p, 3); r.pad(); r.flat(p, 3); // light source index unused
            break;
        case PrimitiveType::LSFT3:
            p.type = PrimitiveType::FT3;
            r.coords(p, 3); r.pad(); r.texture(p, 3); r.flat(p, 3);
            break;
        default:
            // sprites, lights, splines and the lit variants carry no
            // renderable face here
            cur.seek(end);
            return;
    }
    mesh.primitives.push_back(p);
    cur.seek(end);
}

void skip_object_body(Cursor& cur, const ObjectHeader& h) {
    cur.skip(static_cast<size_t>(h.vertices) * 8, "vertices");
    cur.skip(static_cast<size_t>(h.normals) * 8, "normals");
    for (int i = 0; i < h.primitives; i++) {
        int16_t tag = cur.i16be("primitive type");
        cur.skip(2);
        int size = payload_size(tag);
        if (size < 0)
            throw Error(ErrorKind::UnknownPrimitiveTag,
                        std::format("prm: unknown primitive type {} at offset {} in '{}'",
                                    tag, cur.pos() - 4, h.name));
        cur.skip(static_cast<size_t>(size), "primitive");
    }
}

Mesh read_object_body(Cursor& cur, const ObjectHeader& h) {
    Mesh mesh;
    mesh.name = h.name;
    mesh.flags = h.flags;
    mesh.origin = h.origin;

    mesh.vertices.reserve(static_cast<size_t>(h.vertices));
    for (int i = 0; i < h.vertices; i++) {
        Vec3 v = read_vec(cur, "vertex");
        mesh.vertices.push_back(v);
        for (int c : {static_cast<int>(v.x), static_cast<int>(v.y), static_cast<int>(v.z)})
            if (std::abs(c) > mesh.radius) mesh.radius = std::abs(c);
    }

    mesh.normals.reserve(static_cast<size_t>(h.normals));
    for (int i = 0; i < h.normals; i++)
        mesh.normals.push_back(read_vec(cur, "normal"));

    mesh.primitives.reserve(static_cast<size_t>(h.primitives));
    for (int i = 0; i < h.primitives; i++)
        read_primitive(cur, mesh);
    return mesh;
}

} // namespace

Mesh read(const uint8_t* data, size_t len, int object_index) {
    if (object_index < 0)
        throw Error(ErrorKind::ObjectIndexOutOfRange,
                    std::format("prm: negative object index {}", object_index));

    Cursor cur(data, len, "prm");
    int index = 0;
    while (cur.remaining() >= static_cast<size_t>(kObjectHeaderSize)) {
        auto h = read_object_header(cur);
        if (index == object_index) {
            if (h.vertices == 0)
                throw Error(ErrorKind::ObjectIndexOutOfRange,
                            std::format("prm: object {} ('{}') has no vertices", object_index, h.name));
            return read_object_body(cur, h);
        }
        skip_object_body(cur, h);
        index++;
    }
    throw Error(ErrorKind::ObjectIndexOutOfRange,
                std::format("prm: object {} requested, file has {}", object_index, index));
}

Mesh read(const std::vector<uint8_t>& data, int object_index) {
    return read(data.data(), data.size(), object_index);
}

Mesh read_file(const std::filesystem::path& path, int object_index) {
    auto data = binutil::read_file(path);
    return read(data, object_index);
}

std::vector<ObjectInfo> list_objects(const uint8_t* data, size_t len) {
    std::vector<ObjectInfo> out;
    Cursor cur(data, len, "prm");
    while (cur.remaining() >= static_cast<size_t>(kObjectHeaderSize)) {
        ObjectInfo info;
        info.index = static_cast<int>(out.size());
        info.offset = cur.pos();
        auto h = read_object_header(cur);
        info.name = h.name;
        info.vertex_count = h.vertices;
        info.normal_count = h.normals;
        info.primitive_count = h.primitives;
        skip_object_body(cur, h);
        out.push_back(std::move(info));
    }
    return out;
}

std::vector<Mesh> read_all(const uint8_t* data, size_t len) {
    std::vector<Mesh> out;
    Cursor cur(data, len, "prm");
    while (cur.remaining() >= static_cast<size_t>(kObjectHeaderSize)) {
        auto h = read_object_header(cur);
        if (h.vertices > 0)
            out.push_back(read_object_body(cur, h));
        else
            skip_object_body(cur, h);
    }
    return out;
}

} // namespace psxtools::prm
