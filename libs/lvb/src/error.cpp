#include "lvbtools/lvb_error.h"

namespace lvbtools::lvb {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MalformedHeader: return "MalformedHeader";
        case ErrorCode::CorruptSection: return "CorruptSection";
        case ErrorCode::MissingRequiredSection: return "MissingRequiredSection";
        case ErrorCode::UnresolvedReference: return "UnresolvedReference";
        case ErrorCode::InvalidEncoding: return "InvalidEncoding";
        case ErrorCode::OffsetOutOfRange: return "OffsetOutOfRange";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::ReadFailed: return "ReadFailed";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error("lvb: " + message), code_(code) {}

} // namespace lvbtools::lvb
