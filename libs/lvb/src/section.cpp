#include "lvbtools/lvb.h"
#include "lvbtools/binutil.h"

#include <format>

namespace lvbtools::lvb {

using namespace lvbtools::binutil;

Section decode_section(std::span<const uint8_t> body, bool modern, size_t offset,
                       const MapperRegistry& registry) {
    if (offset > body.size() || body.size() - offset < kSectionHeaderSize)
        throw Error(ErrorCode::CorruptSection,
                    std::format("section header at offset {} runs past end of data ({} bytes)",
                                offset, body.size()));

    Section s;
    s.magic = read_signature(body, offset);
    s.size = read_u32(body, offset + 4);
    s.version = read_u32(body, offset + 8);
    s.entry_count = read_u32(body, offset + 12);
    s.entry_size = read_u32(body, offset + 16);
    s.info_base = read_u32(body, offset + 20);
    s.offset = offset;

    // The walker advances by size alone, so a size that cannot cover the
    // header or overruns the data would misalign everything after it.
    if (s.size < kSectionHeaderSize)
        throw Error(ErrorCode::CorruptSection,
                    std::format("{} section at offset {} declares size {}, smaller than its header",
                                s.magic, offset, s.size));
    if (body.size() - offset < s.size)
        throw Error(ErrorCode::CorruptSection,
                    std::format("{} section at offset {} declares size {}, only {} bytes remain",
                                s.magic, offset, s.size, body.size() - offset));

    auto mapper = registry.resolve(s.magic, modern);
    s.mapper = mapper.kind;

    size_t entry_start = offset + kSectionHeaderSize;
    size_t payload_size = s.size - kSectionHeaderSize;

    if (s.magic == "STRG") {
        s.entries.push_back(Entry{.payload = mapper.decode(slice(body, entry_start, payload_size))});
        return s;
    }

    if (s.entry_count > 0 && s.entry_size == 0)
        throw Error(ErrorCode::CorruptSection,
                    std::format("{} section at offset {}: {} entries of size 0",
                                s.magic, offset, s.entry_count));

    uint64_t table_size =static_cast<uint64_t>(s.entry_count) * s.entry_size;
    if (table_size > payload_size)
        throw Error(ErrorCode::CorruptSection,
                    std::format("{} section at offset {}: {} entries of {} bytes exceed {} payload bytes",
                                s.magic, offset, s.entry_count, s.entry_size, payload_size));

    s.entries.reserve(s.entry_count);
    for (uint32_t i = 0; i < s.entry_count; i++) {
        auto bytes = slice(body, entry_start + static_cast<size_t>(i) * s.entry_size, s.entry_size);
        s.entries.push_back(Entry{.payload = mapper.decode(bytes)});
    }
    return s;
}

} // namespace lvbtools::lvb
