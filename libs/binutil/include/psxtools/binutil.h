#pragma once

#include "psxtools/error.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace psxtools::binutil {

// --- Raw byte-order helpers (no bounds checks) ---

inline uint16_t get_u16le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t get_u32le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline uint16_t get_u16be(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t get_u32be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

// Cursor walks a byte buffer and throws MalformedHeader when a read would
// run past the end. The context string prefixes error messages ("tim", "prm").
class Cursor {
public:
    Cursor(const uint8_t* data, size_t size, const char* context)
        : data_(data), size_(size), context_(context) {}

    size_t pos() const { return pos_; }
    size_t size() const { return size_; }
    size_t remaining() const { return size_ - pos_; }
    const uint8_t* here() const { return data_ + pos_; }

    void seek(size_t pos) {
        if (pos > size_)
            throw Error(ErrorKind::MalformedHeader,
                        std::format("{}: seek to {} past end of {}-byte input", context_, pos, size_));
        pos_ = pos;
    }

    void need(size_t n, const char* what) const {
        if (n > remaining())
            throw Error(ErrorKind::MalformedHeader,
                        std::format("{}: truncated {} at offset {} (need {} bytes, {} left)",
                                    context_, what, pos_, n, remaining()));
    }

    void skip(size_t n, const char* what = "padding") {
        need(n, what);
        pos_ += n;
    }

    uint8_t u8(const char* what = "u8") {
        need(1, what);
        return data_[pos_++];
    }

    uint16_t u16le(const char* what = "u16") {
        need(2, what);
        auto v = get_u16le(data_ + pos_);
        pos_ += 2;
        return v;
    }

    int16_t i16le(const char* what = "i16") { return static_cast<int16_t>(u16le(what)); }

    uint32_t u32le(const char* what = "u32") {
        need(4, what);
        auto v = get_u32le(data_ + pos_);
        pos_ += 4;
        return v;
    }

    uint16_t u16be(const char* what = "u16") {
        need(2, what);
        auto v = get_u16be(data_ + pos_);
        pos_ += 2;
        return v;
    }

    int16_t i16be(const char* what = "i16") { return static_cast<int16_t>(u16be(what)); }

    uint32_t u32be(const char* what = "u32") {
        need(4, what);
        auto v = get_u32be(data_ + pos_);
        pos_ += 4;
        return v;
    }

    int32_t i32be(const char* what = "i32") { return static_cast<int32_t>(u32be(what)); }

    std::string fixed_string(size_t n, const char* what = "string") {
        need(n, what);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        auto nul = s.find('\0');
        if (nul != std::string::npos) s.resize(nul);
        return s;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
    const char* context_;
};

// read_file loads a whole file. Throws NotFound if it does not exist.
inline std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw Error(ErrorKind::NotFound, std::format("file not found: {}", path.string()));

    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw Error(ErrorKind::NotFound, std::format("cannot open {}", path.string()));
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

} // namespace psxtools::binutil
