#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace lvbtools::binutil {

// Assumes little-endian (x86/x64). Fail at compile time otherwise.
static_assert(std::endian::native == std::endian::little,
              "lvbtools requires a little-endian platform");

using Bytes = std::span<const uint8_t>;

// --- Read helpers (throw on out-of-range offsets) ---

inline void check_range(Bytes buf, size_t offset, size_t n, const char* what) {
    if (offset > buf.size() || buf.size() - offset < n)
        throw std::runtime_error(
            std::format("binutil: {} at offset {} is past end of {}-byte buffer",
                        what, offset, buf.size()));
}

template <typename T>
inline T read_le(Bytes buf, size_t offset, const char* what) {
    check_range(buf, offset, sizeof(T), what);
    T v;
    std::memcpy(&v, buf.data() + offset, sizeof(T));
    return v;
}

inline uint8_t read_u8(Bytes buf, size_t offset) {
    return read_le<uint8_t>(buf, offset, "u8");
}

inline uint16_t read_u16(Bytes buf, size_t offset) {
    return read_le<uint16_t>(buf, offset, "u16");
}

inline uint32_t read_u32(Bytes buf, size_t offset) {
    return read_le<uint32_t>(buf, offset, "u32");
}

inline float read_f32(Bytes buf, size_t offset) {
    return read_le<float>(buf, offset, "f32");
}

// read_matrix4 reads 16 consecutive f32 values (row-major 4x4).
inline std::array<float, 16> read_matrix4(Bytes buf, size_t offset) {
    check_range(buf, offset, 64, "4x4 matrix");
    std::array<float, 16> m{};
    std::memcpy(m.data(), buf.data() + offset, 64);
    return m;
}

inline std::string read_signature(Bytes buf, size_t offset) {
    check_range(buf, offset, 4, "signature");
    return {reinterpret_cast<const char*>(buf.data() + offset), 4};
}

inline Bytes slice(Bytes buf, size_t offset, size_t n) {
    check_range(buf, offset, n, "slice");
    return buf.subspan(offset, n);
}

// find_zero returns the index of the first zero byte at or after offset,
// or nullopt if the buffer ends first.
inline std::optional<size_t> find_zero(Bytes buf, size_t offset) {
    for (size_t i = offset; i < buf.size(); i++) {
        if (buf[i] == 0) return i;
    }
    return std::nullopt;
}

// --- Write helpers (append to a byte vector) ---

inline void write_u16(std::vector<uint8_t>& out, uint16_t v) {
    uint8_t b[2];
    std::memcpy(b, &v, 2);
    out.insert(out.end(), b, b + 2);
}

inline void write_u32(std::vector<uint8_t>& out, uint32_t v) {
    uint8_t b[4];
    std::memcpy(b, &v, 4);
    out.insert(out.end(), b, b + 4);
}

inline void write_f32(std::vector<uint8_t>& out, float v) {
    uint8_t b[4];
    std::memcpy(b, &v, 4);
    out.insert(out.end(), b, b + 4);
}

inline void write_signature(std::vector<uint8_t>& out, const std::string& sig) {
    if (sig.size() != 4)
        throw std::runtime_error(std::format("binutil: signature '{}' is not 4 bytes", sig));
    out.insert(out.end(), sig.begin(), sig.end());
}

inline void write_asciiz(std::vector<uint8_t>& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0);
}

} // namespace lvbtools::binutil
