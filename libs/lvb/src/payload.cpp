#include "lvbtools/lvb_payload.h"
#include "lvbtools/lvb_error.h"
#include "lvbtools/binutil.h"

#include <format>

namespace lvbtools::lvb {

using namespace lvbtools::binutil;

static void require_size(std::span<const uint8_t> entry, size_t need, const char* what) {
    if (entry.size() < need)
        throw Error(ErrorCode::CorruptSection,
                    std::format("{} entry is {} bytes, layout needs {}", what, entry.size(), need));
}

Info decode_info(std::span<const uint8_t> entry) {
    require_size(entry, kInfoSize, "INFO");
    return Info{
        .bdat_id = read_u32(entry, 0),
        .xfrm_index = read_u32(entry, 4),
        .shape = read_u16(entry, 8),
        .sequential_id = read_u16(entry, 10),
        .hash_id = read_u32(entry, 12),
    };
}

LegacyInfo decode_legacy_info(std::span<const uint8_t> entry) {
    require_size(entry, kLegacyInfoSize, "INFO");
    // Bytes 4-7 are unused in the legacy layout.
    return LegacyInfo{
        .name_id = read_u32(entry, 0),
        .xfrm_index = read_u32(entry, 8),
        .shape = read_u32(entry, 12),
    };
}

Transform decode_transform(std::span<const uint8_t> entry) {
    require_size(entry, kTransformSize, "XFRM");
    return Transform{.matrix = read_matrix4(entry, 0)};
}

Strings decode_strings(std::span<const uint8_t> entry) {
    return Strings(std::vector<uint8_t>(entry.begin(), entry.end()));
}

Debug decode_debug(std::span<const uint8_t> entry) {
    require_size(entry, kDebugSize, "DEBI");
    return Debug{
        .gimmick_id = read_u32(entry, 0),
        .type_id = read_u32(entry, 4),
        .string_id = read_u32(entry, 8),
        .parent_id = read_u32(entry, 12),
    };
}

Raw decode_raw(std::span<const uint8_t> entry) {
    return Raw{.bytes = std::vector<uint8_t>(entry.begin(), entry.end())};
}

std::string Strings::read(uint32_t offset) const {
    if (offset >= blob_.size())
        throw Error(ErrorCode::OffsetOutOfRange,
                    std::format("string offset {} is outside {}-byte string table",
                                offset, blob_.size()));
    auto end = find_zero(blob_, offset);
    if (!end)
        throw Error(ErrorCode::OffsetOutOfRange,
                    std::format("string at offset {} has no terminator", offset));

    std::string s(reinterpret_cast<const char*>(blob_.data() + offset), *end - offset);
    if (!valid_utf8(s))
        throw Error(ErrorCode::InvalidEncoding,
                    std::format("string at offset {} is not valid UTF-8", offset));
    return s;
}

std::optional<uint32_t> transform_index(const Payload& p) {
    if (auto* info = std::get_if<Info>(&p)) return info->xfrm_index;
    if (auto* legacy = std::get_if<LegacyInfo>(&p)) return legacy->xfrm_index;
    return std::nullopt;
}

const char* payload_name(const Payload& p) {
    switch (p.index()) {
        case 0: return "raw";
        case 1: return "info";
        case 2: return "legacy_info";
        case 3: return "transform";
        case 4: return "strings";
        case 5: return "debug";
        case 6: return "extension";
    }
    return "unknown";
}

bool valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            i++;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (s.size() - i < len) return false;

        for (size_t k = 1; k < len; k++) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates, out of Unicode range.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

} // namespace lvbtools::lvb
