#include "psxtools/lzss.h"
#include "psxtools/error.h"

#include <format>

namespace psxtools::lzss {

namespace {

// MSB-first bit reader over a byte buffer. The rack holds the current byte
// and is refilled each time the mask wraps back to 0x80.
class BitReader {
public:
    BitReader(const uint8_t* src, size_t src_len, size_t pos)
        : src_(src), src_len_(src_len), pos_(pos) {}

    uint32_t read(int bit_count) {
        uint32_t value = 0;
        for (int i = 0; i < bit_count; i++) {
            if (mask_ == 0x80) {
                if (pos_ >= src_len_)
                    throw Error(ErrorKind::TruncatedStream,
                                std::format("lzss: input exhausted at byte {} before end-of-stream marker",
                                            pos_));
                rack_ = src_[pos_++];
            }
            value = (value << 1) | ((rack_ & mask_) != 0 ? 1u : 0u);
            mask_ >>= 1;
            if (mask_ == 0) mask_ = 0x80;
        }
        return value;
    }

private:
    const uint8_t* src_;
    size_t src_len_;
    size_t pos_;
    uint8_t mask_ = 0x80;
    uint8_t rack_ = 0;
};

} // namespace

std::vector<uint8_t> decompress(const uint8_t* src, size_t src_len, size_t offset) {
    if (offset > src_len)
        throw Error(ErrorKind::MalformedHeader,
                    std::format("lzss: stream offset {} past end of {}-byte input", offset, src_len));

    constexpr size_t window_mask = kWindowSize - 1;

    // Writes start at position 1; a match at position 0 marks the end of
    // the stream.
    std::vector<uint8_t> window(kWindowSize, 0);
    size_t cursor = 1;

    std::vector<uint8_t> out;
    out.reserve((src_len - offset) * 2);

    BitReader bits(src, src_len, offset);
    while (true) {
        if (bits.read(1) != 0) {
            auto c = static_cast<uint8_t>(bits.read(8));
            out.push_back(c);
            window[cursor] = c;
            cursor = (cursor + 1) & window_mask;
            continue;
        }

        uint32_t match_pos = bits.read(kIndexBits);
        if (match_pos == kEndOfStream) break;

        uint32_t match_len = bits.read(kLengthBits) + kBreakEven;
        for (uint32_t i = 0; i <= match_len; i++) {
            uint8_t c = window[(match_pos + i) & window_mask];
            out.push_back(c);
            window[cursor] = c;
            cursor = (cursor + 1) & window_mask;
        }
    }

    return out;
}

std::vector<uint8_t> decompress(const std::vector<uint8_t>& src, size_t offset) {
    return decompress(src.data(), src.size(), offset);
}

} // namespace psxtools::lzss
