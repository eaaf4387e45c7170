#pragma once

#include <stdexcept>
#include <string>

namespace psxtools {

enum class ErrorKind {
    NotFound,              // model or archive file missing
    TruncatedStream,       // compressed stream ended before the end marker
    MalformedHeader,       // header fields or counts overrun the input
    UnsupportedColorType,  // TIM color type other than 4bpp/8bpp/16bpp
    UnknownPrimitiveTag,   // PRM primitive type code outside the known set
    ObjectIndexOutOfRange, // requested object not present in a PRM file
    SizeMismatch,          // CMP declared sizes disagree with decompressed length
};

constexpr const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::TruncatedStream: return "TruncatedStream";
        case ErrorKind::MalformedHeader: return "MalformedHeader";
        case ErrorKind::UnsupportedColorType: return "UnsupportedColorType";
        case ErrorKind::UnknownPrimitiveTag: return "UnknownPrimitiveTag";
        case ErrorKind::ObjectIndexOutOfRange: return "ObjectIndexOutOfRange";
        case ErrorKind::SizeMismatch: return "SizeMismatch";
    }
    return "Unknown";
}

// Error is thrown by every decoder. The kind tells callers whether the
// failure is recoverable (a missing archive) or fatal for the file.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace psxtools
