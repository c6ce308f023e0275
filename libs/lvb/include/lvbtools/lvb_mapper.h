#pragma once

#include "lvbtools/lvb_payload.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace lvbtools::lvb {

// Decoder turns one entry's bytes into a payload. It must not assume any
// bytes beyond the slice it is given.
using Decoder = std::function<Payload(std::span<const uint8_t>)>;

// Resolver supplies a decoder for a section magic the core does not know,
// or nullopt to let the next resolver try. `modern` is the file's format
// family (version >= 5).
using Resolver = std::function<std::optional<Decoder>(std::string_view magic, bool modern)>;

enum class MapperKind { Builtin, Extension, Raw };

const char* to_string(MapperKind kind);

struct Mapper {
    Decoder decode;
    MapperKind kind = MapperKind::Raw;
};

// MapperRegistry resolves a section magic to a decoder: built-in types
// first, then extension resolvers in the order they were added, then Raw.
class MapperRegistry {
public:
    void add_resolver(Resolver resolver);

    [[nodiscard]] Mapper resolve(std::string_view magic, bool modern) const;
    [[nodiscard]] size_t resolver_count() const { return resolvers_.size(); }

    // builtin returns the decoder for INFO, XFRM, DEBI and STRG.
    static std::optional<Decoder> builtin(std::string_view magic, bool modern);

private:
    std::vector<Resolver> resolvers_;
};

// is_special_magic reports whether magic is one of the four cross-reference
// sections (INFO, XFRM, DEBI, STRG) rather than a gimmick table.
bool is_special_magic(std::string_view magic);

} // namespace lvbtools::lvb
