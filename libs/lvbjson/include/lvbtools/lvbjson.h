#pragma once

#include "lvbtools/lvb.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace lvbtools::lvbjson {

using json = nlohmann::ordered_json;

struct JsonOptions {
    // Emit raw entry bytes as hex for Raw and Extension payloads.
    bool include_bytes = false;
};

// Full dump: {"version", "sections"} with gimmick sections only.
json to_json(const lvb::Container& c, const JsonOptions& opts = {});

json section_json(const lvb::Container& c, const lvb::Section& s, const JsonOptions& opts = {});

// entry_json emits name, resolved info and xform, then the payload's own fields.
json entry_json(const lvb::Container& c, const lvb::Entry& e, const JsonOptions& opts = {});

json payload_json(const lvb::Payload& p, const JsonOptions& opts = {});

// dump serializes j with the given indent (-1 for a single line). Bytes that
// are not valid UTF-8, such as an unknown section magic, become U+FFFD.
std::string dump(const json& j, int indent = 1);

// hex_id formats an id the way ids are written on the command line: <XXXXXXXX>.
std::string hex_id(uint32_t id);

std::string hex_encode(std::span<const uint8_t> data);

using Key = std::variant<std::string, uint32_t>;

// parse_key turns "<XXXXXXXX>" (8 uppercase hex digits) into a numeric id
// and returns any other text unchanged.
Key parse_key(std::string_view s);

} // namespace lvbtools::lvbjson
