#pragma once

#include <stdexcept>
#include <string>

namespace lvbtools::lvb {

enum class ErrorCode {
    MalformedHeader,
    CorruptSection,
    MissingRequiredSection,
    UnresolvedReference,
    InvalidEncoding,
    OffsetOutOfRange,
    NotFound,
    ReadFailed,
};

const char* to_string(ErrorCode code);

// Error is thrown for every decode failure. what() carries an "lvb: " prefix.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace lvbtools::lvb
