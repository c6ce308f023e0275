#include "lvbtools/lvb.h"
#include "lvbtools/binutil.h"

#include <format>
#include <iterator>
#include <utility>

namespace lvbtools::lvb {

using namespace lvbtools::binutil;

static std::string printable_signature(std::span<const uint8_t> data) {
    std::string out;
    for (size_t i = 0; i < 4 && i < data.size(); i++) {
        auto c = data[i];
        if (c >= 0x20 && c < 0x7F) out += static_cast<char>(c);
        else out += std::format("\\x{:02X}", c);
    }
    return out;
}

Container read(std::span<const uint8_t> data, Options opts) {
    if (data.size() < kFileHeaderSize)
        throw Error(ErrorCode::MalformedHeader,
                    std::format("file is {} bytes, header needs {}", data.size(), kFileHeaderSize));
    if (read_signature(data, 0) != kSignature)
        throw Error(ErrorCode::MalformedHeader,
                    std::format("bad signature '{}', expected '{}'", printable_signature(data), kSignature));

    Container c;
    c.declared_size_ = read_u32(data, 4);
    c.version_ = read_u32(data, 8);
    c.hash_flags_ = read_u32(data, 12);
    c.modern_ = c.version_ >= kModernVersion;

    if (c.declared_size_ < kFileHeaderSize || c.declared_size_ > data.size())
        throw Error(ErrorCode::MalformedHeader,
                    std::format("declared size {} does not fit {}-byte file", c.declared_size_, data.size()));

    const MapperRegistry builtins;
    const MapperRegistry& registry = opts.registry ? *opts.registry : builtins;

    auto body = data.subspan(kFileHeaderSize, c.declared_size_ - kFileHeaderSize);
    size_t offset = 0;
    while (offset < body.size()) {
        Section s = decode_section(body, c.modern_, offset, registry);
        offset += s.size;
        c.sections_.push_back(std::move(s));
    }

    c.locate_special_sections(opts);
    c.link_entries(opts);
    c.overlay_debug_names(opts);
    return c;
}

Container read(std::istream& r, Options opts) {
    std::vector<uint8_t> data{std::istreambuf_iterator<char>(r), std::istreambuf_iterator<char>()};
    if (r.bad())
        throw Error(ErrorCode::ReadFailed, "failed to read input stream");
    return read(std::span<const uint8_t>(data), opts);
}

void Container::locate_special_sections(const Options& opts) {
    for (size_t i = 0; i < sections_.size(); i++) {
        const auto& magic = sections_[i].magic;
        std::optional<size_t>* slot = nullptr;
        if (magic == "INFO") slot = &info_pos_;
        else if (magic == "XFRM") slot = &xfrm_pos_;
        else if (magic == "STRG") slot = &strg_pos_;
        else if (magic == "DEBI") slot = &debi_pos_;
        if (!slot) continue;

        if (!slot->has_value()) {
            *slot = i;
            continue;
        }
        auto msg = std::format("duplicate {} section at offset {}", magic, sections_[i].offset);
        if (opts.strict)
            throw Error(ErrorCode::CorruptSection, msg);
        warnings_.push_back({ErrorCode::CorruptSection, msg + ", ignored"});
    }

    if (!info_pos_)
        throw Error(ErrorCode::MissingRequiredSection, "no INFO section");
    if (!xfrm_pos_)
        throw Error(ErrorCode::MissingRequiredSection, "no XFRM section");
    if (!strg_pos_)
        throw Error(ErrorCode::MissingRequiredSection, "no STRG section");
}

std::optional<std::string> Container::read_name(uint32_t offset, const Options& opts,
                                                const std::string& context) {
    try {
        return strings().read(offset);
    } catch (const Error& e) {
        if (opts.strict) throw;
        warnings_.push_back({e.code(), std::format("{}: {}", context, e.what())});
    }
    return std::nullopt;
}

void Container::link_entries(const Options& opts) {
    const auto& info = sections_[*info_pos_];
    const auto& xfrm = sections_[*xfrm_pos_];

    for (size_t si = 0; si < sections_.size(); si++) {
        auto& sec = sections_[si];
        if (is_special_magic(sec.magic)) continue;

        for (size_t i = 0; i < sec.entries.size(); i++) {
            auto& entry = sec.entries[i];
            size_t info_index = static_cast<size_t>(sec.info_base) + i;
            if (info_index >= info.entries.size())
                throw Error(ErrorCode::UnresolvedReference,
                            std::format("{} entry {} refers to INFO entry {}, INFO has {}",
                                        sec.magic, i, info_index, info.entries.size()));

            const auto& info_payload = info.entries[info_index].payload;
            auto xfrm_index = transform_index(info_payload);
            if (!xfrm_index)
                throw Error(ErrorCode::UnresolvedReference,
                            std::format("INFO entry {} holds a {} payload", info_index,
                                        payload_name(info_payload)));
            if (*xfrm_index >= xfrm.entries.size())
                throw Error(ErrorCode::UnresolvedReference,
                            std::format("INFO entry {} refers to XFRM entry {}, XFRM has {}",
                                        info_index, *xfrm_index, xfrm.entries.size()));

            entry.info_index = info_index;
            entry.xfrm_index = *xfrm_index;

            EntryRef ref{.section = si, .entry = i};
            if (auto* m = std::get_if<Info>(&info_payload)) {
                by_hash_[m->hash_id] = ref;
                by_bdat_[m->bdat_id] = ref;
            } else if (auto* l = std::get_if<LegacyInfo>(&info_payload)) {
                auto name = read_name(l->name_id, opts,
                                      std::format("name of {} entry {}", sec.magic, i));
                if (name) {
                    entry.name = *name;
                    by_name_[*name] = ref;
                }
            }
        }
    }
}

void Container::overlay_debug_names(const Options& opts) {
    if (!modern_ || !debi_pos_) return;

    const auto& debi = sections_[*debi_pos_];
    for (size_t i = 0; i < debi.entries.size(); i++) {
        auto* dbg = std::get_if<Debug>(&debi.entries[i].payload);
        if (!dbg) continue;
        auto it = by_hash_.find(dbg->gimmick_id);
        if (it == by_hash_.end()) continue;

        auto name = read_name(dbg->string_id, opts, std::format("debug name {}", i));
        if (name)
            sections_[it->second.section].entries[it->second.entry].name = std::move(*name);
    }
}

std::vector<const Section*> Container::gimmick_sections() const {
    std::vector<const Section*> out;
    for (const auto& s : sections_) {
        if (!is_special_magic(s.magic)) out.push_back(&s);
    }
    return out;
}

const Section* Container::section(std::string_view magic) const {
    for (const auto& s : sections_) {
        if (s.magic == magic && !is_special_magic(s.magic)) return &s;
    }
    return nullptr;
}

const Entry* Container::gimmick(std::string_view name) const {
    auto it = by_name_.find(std::string(name));
    return it == by_name_.end() ? nullptr : &entry(it->second);
}

const Entry* Container::gimmick(uint32_t hash_id) const {
    auto it = by_hash_.find(hash_id);
    return it == by_hash_.end() ? nullptr : &entry(it->second);
}

const Entry* Container::bdat_gimmick(uint32_t bdat_id) const {
    auto it = by_bdat_.find(bdat_id);
    return it == by_bdat_.end() ? nullptr : &entry(it->second);
}

const Payload* Container::info(const Entry& e) const {
    if (!e.info_index || !info_pos_) return nullptr;
    return &sections_[*info_pos_].entries.at(*e.info_index).payload;
}

const Transform* Container::transform(const Entry& e) const {
    if (!e.xfrm_index || !xfrm_pos_) return nullptr;
    return std::get_if<Transform>(&sections_[*xfrm_pos_].entries.at(*e.xfrm_index).payload);
}

const Strings& Container::strings() const {
    if (!strg_pos_)
        throw Error(ErrorCode::MissingRequiredSection, "no STRG section");
    return std::get<Strings>(sections_[*strg_pos_].entries.front().payload);
}

const Entry& Container::entry(EntryRef ref) const {
    return sections_.at(ref.section).entries.at(ref.entry);
}

size_t Container::gimmick_count() const {
    size_t n = 0;
    for (const auto& s : sections_) {
        if (!is_special_magic(s.magic)) n += s.entries.size();
    }
    return n;
}

} // namespace lvbtools::lvb
