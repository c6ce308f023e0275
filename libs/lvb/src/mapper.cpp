#include "lvbtools/lvb_mapper.h"

#include <array>
#include <utility>

namespace lvbtools::lvb {

namespace {

constexpr std::array<std::string_view, 4> kSpecialMagics = {"INFO", "XFRM", "DEBI", "STRG"};

template <typename Fn>
Decoder wrap(Fn fn) {
    return [fn](std::span<const uint8_t> entry) -> Payload { return fn(entry); };
}

} // namespace

const char* to_string(MapperKind kind) {
    switch (kind) {
        case MapperKind::Builtin: return "builtin";
        case MapperKind::Extension: return "extension";
        case MapperKind::Raw: return "raw";
    }
    return "raw";
}

bool is_special_magic(std::string_view magic) {
    for (auto m : kSpecialMagics) {
        if (m == magic) return true;
    }
    return false;
}

std::optional<Decoder> MapperRegistry::builtin(std::string_view magic, bool modern) {
    if (magic == "INFO") {
        if (modern) return wrap(decode_info);
        return wrap(decode_legacy_info);
    }
    if (magic == "XFRM") return wrap(decode_transform);
    if (magic == "DEBI") return wrap(decode_debug);
    if (magic == "STRG") return wrap(decode_strings);
    return std::nullopt;
}

void MapperRegistry::add_resolver(Resolver resolver) {
    resolvers_.push_back(std::move(resolver));
}

Mapper MapperRegistry::resolve(std::string_view magic, bool modern) const {
    if (auto dec = builtin(magic, modern))
        return Mapper{.decode = std::move(*dec), .kind = MapperKind::Builtin};

    for (const auto& resolver : resolvers_) {
        if (!resolver) continue;
        if (auto dec = resolver(magic, modern); dec && *dec)
            return Mapper{.decode = std::move(*dec), .kind = MapperKind::Extension};
    }

    return Mapper{.decode = wrap(decode_raw), .kind = MapperKind::Raw};
}

} // namespace lvbtools::lvb
