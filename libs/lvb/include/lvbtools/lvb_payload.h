#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lvbtools::lvb {

// Fixed entry layouts. A slice shorter than its layout is a corrupt section.
constexpr size_t kInfoSize = 16;
constexpr size_t kLegacyInfoSize = 16;
constexpr size_t kTransformSize = 64;
constexpr size_t kDebugSize = 16;

// Opaque bytes of an entry whose magic has no decoder.
struct Raw {
    std::vector<uint8_t> bytes;
};

// Gimmick info record, format version 5 and later.
struct Info {
    uint32_t bdat_id = 0;
    uint32_t xfrm_index = 0;
    uint16_t shape = 0;
    uint16_t sequential_id = 0;
    uint32_t hash_id = 0;
};

// Gimmick info record before version 5. name_id is an offset into STRG.
struct LegacyInfo {
    uint32_t name_id = 0;
    uint32_t xfrm_index = 0;
    uint32_t shape = 0;
};

struct Transform {
    std::array<float, 16> matrix{}; // row-major 4x4
};

// String table blob (STRG). Names are zero-terminated UTF-8 at byte offsets.
class Strings {
public:
    Strings() = default;
    explicit Strings(std::vector<uint8_t> blob) : blob_(std::move(blob)) {}

    // read returns the zero-terminated string starting at offset.
    // Throws Error(OffsetOutOfRange) if offset or terminator is outside the
    // blob, Error(InvalidEncoding) if the bytes are not valid UTF-8.
    [[nodiscard]] std::string read(uint32_t offset) const;

    [[nodiscard]] const std::vector<uint8_t>& blob() const { return blob_; }
    [[nodiscard]] size_t size() const { return blob_.size(); }

private:
    std::vector<uint8_t> blob_;
};

// Debug name record (DEBI). gimmick_id matches Info::hash_id, which is
// generally a hash of the gimmick's string name.
struct Debug {
    uint32_t gimmick_id = 0;
    uint32_t type_id = 0; // shared by gimmicks of the same type
    uint32_t string_id = 0;
    uint32_t parent_id = 0;
};

using FieldValue = std::variant<int64_t, double, std::string>;

struct Field {
    std::string name;
    FieldValue value;
};

// Record produced by an extension decoder for a section type the core does
// not know about.
struct Extension {
    std::string type;
    std::vector<Field> fields;
    std::vector<uint8_t> bytes;
};

using Payload = std::variant<Raw, Info, LegacyInfo, Transform, Strings, Debug, Extension>;

Info decode_info(std::span<const uint8_t> entry);
LegacyInfo decode_legacy_info(std::span<const uint8_t> entry);
Transform decode_transform(std::span<const uint8_t> entry);
Strings decode_strings(std::span<const uint8_t> entry);
Debug decode_debug(std::span<const uint8_t> entry);
Raw decode_raw(std::span<const uint8_t> entry);

// transform_index returns the XFRM index of an Info or LegacyInfo payload.
std::optional<uint32_t> transform_index(const Payload& p);

// payload_name names the active payload alternative ("info", "raw", ...).
const char* payload_name(const Payload& p);

// valid_utf8 checks for well-formed UTF-8 (no overlongs, no surrogates,
// nothing above U+10FFFF).
bool valid_utf8(std::string_view s);

} // namespace lvbtools::lvb
