#include "psxtools/cmp.h"
#include "psxtools/binutil.h"
#include "psxtools/error.h"
#include "psxtools/lzss.h"

#include <format>

namespace psxtools::cmp {

Header read_header(const uint8_t* data, size_t len) {
    binutil::Cursor cur(data, len, "cmp");
    uint32_t count = cur.u32le("image count");

    // Each size entry takes 4 bytes; reject counts the input cannot hold
    // before allocating anything.
    if (count > cur.remaining() / 4)
        throw Error(ErrorKind::MalformedHeader,
                    std::format("cmp: image count {} exceeds {}-byte input", count, len));

    Header hdr;
    hdr.image_sizes.reserve(count);
    for (uint32_t i = 0; i < count; i++)
        hdr.image_sizes.push_back(cur.u32le("image size"));
    hdr.data_offset = cur.pos();
    return hdr;
}

Archive read(const uint8_t* data, size_t len) {
    Archive ar;
    ar.header = read_header(data, len);

    auto unpacked = lzss::decompress(data, len, ar.header.data_offset);

    uint64_t expected = ar.header.total_size();
    if (expected != unpacked.size())
        throw Error(ErrorKind::SizeMismatch,
                    std::format("cmp: declared image sizes total {} bytes, decompressed {}",
                                expected, unpacked.size()));

    ar.images.reserve(ar.header.image_sizes.size());
    size_t offset = 0;
    for (auto size : ar.header.image_sizes) {
        auto first = unpacked.begin() + static_cast<std::ptrdiff_t>(offset);
        ar.images.emplace_back(first, first + static_cast<std::ptrdiff_t>(size));
        offset += size;
    }
    return ar;
}

Archive read(const std::vector<uint8_t>& data) {
    return read(data.data(), data.size());
}

Archive read_file(const std::filesystem::path& path) {
    auto data = binutil::read_file(path);
    return read(data);
}

} // namespace psxtools::cmp
