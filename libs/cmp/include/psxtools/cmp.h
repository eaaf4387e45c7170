#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace psxtools::cmp {

// Header is the uncompressed prefix of a CMP archive: an image count and the
// decompressed size of every image, followed by one LZSS stream.
struct Header {
    std::vector<uint32_t> image_sizes;
    size_t data_offset = 0; // start of the LZSS stream

    uint64_t total_size() const {
        uint64_t sum = 0;
        for (auto s : image_sizes) sum += s;
        return sum;
    }
};

// Archive holds the decompressed images in file order.
struct Archive {
    Header header;
    std::vector<std::vector<uint8_t>> images;
};

// read_header parses the image table. Throws Error(MalformedHeader) if the
// table does not fit in the input.
Header read_header(const uint8_t* data, size_t len);

// read decompresses the archive and slices it by the declared image sizes.
// Throws Error(SizeMismatch) if the declared sizes do not add up to the
// decompressed length; LZSS failures propagate as Error(TruncatedStream).
Archive read(const uint8_t* data, size_t len);

Archive read(const std::vector<uint8_t>& data);

// read_file reads and decodes a CMP file. Throws Error(NotFound) if missing.
Archive read_file(const std::filesystem::path& path);

} // namespace psxtools::cmp
