#include "lvbtools/lvbjson.h"

#include <charconv>
#include <format>
#include <iomanip>
#include <regex>
#include <sstream>

namespace lvbtools::lvbjson {

namespace {

json field_value(const lvb::FieldValue& v) {
    return std::visit([](const auto& x) { return json(x); }, v);
}

struct PayloadVisitor {
    const JsonOptions& opts;

    json operator()(const lvb::Raw& raw) const {
        json j = json::object();
        if (opts.include_bytes) j["bytes"] = hex_encode(raw.bytes);
        return j;
    }

    json operator()(const lvb::Info& info) const {
        return {
            {"bdat_id", hex_id(info.bdat_id)},
            {"shape", info.shape},
            {"sequential_id", info.sequential_id},
            {"hash_id", hex_id(info.hash_id)},
        };
    }

    json operator()(const lvb::LegacyInfo& info) const {
        return {{"shape", info.shape}};
    }

    json operator()(const lvb::Transform& xf) const {
        json m = json::array();
        for (float v : xf.matrix) m.push_back(v);
        return m;
    }

    json operator()(const lvb::Strings& s) const {
        return {{"size", s.size()}};
    }

    json operator()(const lvb::Debug& dbg) const {
        return {
            {"gimmick_id", hex_id(dbg.gimmick_id)},
            {"type_id", dbg.type_id},
            {"string_id", dbg.string_id},
            {"parent_id", dbg.parent_id},
        };
    }

    json operator()(const lvb::Extension& ext) const {
        json j = {{"type", ext.type}};
        for (const auto& f : ext.fields) j[f.name] = field_value(f.value);
        if (opts.include_bytes) j["bytes"] = hex_encode(ext.bytes);
        return j;
    }
};

} // namespace

std::string hex_id(uint32_t id) {
    return std::format("<{:08X}>", id);
}

std::string dump(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string hex_encode(std::span<const uint8_t> data) {
    std::ostringstream ss;
    for (uint8_t b : data)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    return ss.str();
}

Key parse_key(std::string_view s) {
    static const std::regex hash_matcher("^<([0-9A-F]{8})>$");
    std::string str(s);
    std::smatch m;
    if (!std::regex_match(str, m, hash_matcher)) return str;

    uint32_t id = 0;
    auto digits = m[1].str();
    std::from_chars(digits.data(), digits.data() + digits.size(), id, 16);
    return id;
}

json payload_json(const lvb::Payload& p, const JsonOptions& opts) {
    return std::visit(PayloadVisitor{opts}, p);
}

json entry_json(const lvb::Container& c, const lvb::Entry& e, const JsonOptions& opts) {
    json j = {
        {"name", e.name ? json(*e.name) : json(nullptr)},
        {"info", nullptr},
        {"xform", nullptr},
    };
    if (const auto* info = c.info(e)) j["info"] = payload_json(*info, opts);
    if (const auto* xf = c.transform(e)) j["xform"] = payload_json(lvb::Payload{*xf}, opts);

    json own = payload_json(e.payload, opts);
    if (own.is_object()) {
        for (auto it = own.begin(); it != own.end(); ++it) j[it.key()] = it.value();
    } else {
        j["payload"] = std::move(own);
    }
    return j;
}

json section_json(const lvb::Container& c, const lvb::Section& s, const JsonOptions& opts) {
    json entries = json::array();
    for (const auto& e : s.entries) entries.push_back(entry_json(c, e, opts));
    return {
        {"magic", s.magic},
        {"entries", std::move(entries)},
    };
}

json to_json(const lvb::Container& c, const JsonOptions& opts) {
    json sections = json::array();
    for (const auto* s : c.gimmick_sections()) sections.push_back(section_json(c, *s, opts));
    return {
        {"version", c.version()},
        {"sections", std::move(sections)},
    };
}

} // namespace lvbtools::lvbjson
