#pragma once

#include "lvbtools/lvb_error.h"
#include "lvbtools/lvb_mapper.h"
#include "lvbtools/lvb_payload.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lvbtools::lvb {

constexpr std::string_view kSignature = "LVLB";
constexpr size_t kFileHeaderSize = 32;
constexpr size_t kSectionHeaderSize = 32;
// Files at this version and later use the modern Info layout.
constexpr uint32_t kModernVersion = 5;

struct Entry {
    Payload payload;
    std::optional<std::string> name;
    // Positions in the INFO and XFRM sections' entry lists, set for entries
    // of gimmick (non-special) sections once cross-references are resolved.
    std::optional<size_t> info_index;
    std::optional<size_t> xfrm_index;
};

struct Section {
    std::string magic;
    uint32_t size = 0;
    uint32_t version = 0;
    uint32_t entry_count = 0;
    uint32_t entry_size = 0;
    uint32_t info_base = 0;
    size_t offset = 0; // from the end of the file header
    MapperKind mapper = MapperKind::Raw;
    std::vector<Entry> entries;
};

struct Warning {
    ErrorCode code;
    std::string message;
};

struct Options {
    // Duplicate special sections and unreadable names become errors
    // instead of warnings.
    bool strict = false;
    // Extension resolvers; built-in decoders only when null.
    const MapperRegistry* registry = nullptr;
};

struct EntryRef {
    size_t section = 0;
    size_t entry = 0;
};

class Container;

// read decodes a whole LVB file held in memory.
Container read(std::span<const uint8_t> data, Options opts = {});

// read slurps the stream and decodes it.
Container read(std::istream& r, Options opts = {});

// decode_section decodes the section whose header starts at offset in body
// (the file contents after the file header).
Section decode_section(std::span<const uint8_t> body, bool modern, size_t offset,
                       const MapperRegistry& registry);

class Container {
public:
    Container() = default;

    [[nodiscard]] uint32_t version() const { return version_; }
    [[nodiscard]] bool modern() const { return modern_; }
    [[nodiscard]] uint32_t declared_size() const { return declared_size_; }
    [[nodiscard]] uint32_t hash_flags() const { return hash_flags_; }

    // All sections in file order, special ones included.
    [[nodiscard]] const std::vector<Section>& sections() const { return sections_; }

    // gimmick_sections lists the non-special sections in file order.
    [[nodiscard]] std::vector<const Section*> gimmick_sections() const;

    // section finds the first non-special section with the given magic.
    [[nodiscard]] const Section* section(std::string_view magic) const;

    // Legacy files index gimmicks by string-table name, modern files by hash id.
    [[nodiscard]] const Entry* gimmick(std::string_view name) const;
    [[nodiscard]] const Entry* gimmick(uint32_t hash_id) const;
    [[nodiscard]] const Entry* bdat_gimmick(uint32_t bdat_id) const;

    [[nodiscard]] const Payload* info(const Entry& e) const;
    [[nodiscard]] const Transform* transform(const Entry& e) const;
    [[nodiscard]] const Strings& strings() const;

    [[nodiscard]] const Entry& entry(EntryRef ref) const;

    [[nodiscard]] size_t gimmick_count() const;
    [[nodiscard]] size_t hash_index_size() const { return by_hash_.size(); }
    [[nodiscard]] size_t name_index_size() const { return by_name_.size(); }
    [[nodiscard]] size_t bdat_index_size() const { return by_bdat_.size(); }

    [[nodiscard]] const std::vector<Warning>& warnings() const { return warnings_; }

private:
    friend Container read(std::span<const uint8_t> data, Options opts);

    void locate_special_sections(const Options& opts);
    void link_entries(const Options& opts);
    void overlay_debug_names(const Options& opts);
    std::optional<std::string> read_name(uint32_t offset, const Options& opts,
                                         const std::string& context);

    uint32_t version_ = 0;
    bool modern_ = false;
    uint32_t declared_size_ = 0;
    uint32_t hash_flags_ = 0;

    std::vector<Section> sections_;
    std::optional<size_t> info_pos_;
    std::optional<size_t> xfrm_pos_;
    std::optional<size_t> strg_pos_;
    std::optional<size_t> debi_pos_;

    std::unordered_map<uint32_t, EntryRef> by_hash_;
    std::unordered_map<std::string, EntryRef> by_name_;
    std::unordered_map<uint32_t, EntryRef> by_bdat_;

    std::vector<Warning> warnings_;
};

} // namespace lvbtools::lvb
