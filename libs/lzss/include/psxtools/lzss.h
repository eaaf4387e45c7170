#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace psxtools::lzss {

// Bitstream parameters of the CMP archive LZSS variant.
inline constexpr int kIndexBits = 13;
inline constexpr int kLengthBits = 4;
inline constexpr size_t kWindowSize = size_t{1} << kIndexBits; // 8192
inline constexpr int kBreakEven = (1 + kIndexBits + kLengthBits) / 9; // 2
// A back-reference copies length field + kBreakEven + 1 bytes.
inline constexpr uint32_t kEndOfStream = 0;

// decompress decodes the LZSS bitstream starting at src[offset] until the
// end-of-stream marker (a back-reference to window position 0).
// Throws Error(TruncatedStream) if the input ends before the marker and
// Error(MalformedHeader) if offset lies past the end of src.
std::vector<uint8_t> decompress(const uint8_t* src, size_t src_len, size_t offset = 0);

std::vector<uint8_t> decompress(const std::vector<uint8_t>& src, size_t offset = 0);

} // namespace psxtools::lzss
