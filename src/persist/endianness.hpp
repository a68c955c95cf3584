#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace persist {

inline constexpr std::uint16_t byteswap16(std::uint16_t v) noexcept {
    return static_cast<std::uint16_t>(((v & 0xFF00u) >> 8) | ((v & 0x00FFu) << 8));
}

inline constexpr std::uint32_t byteswap32(std::uint32_t v) noexcept {
    return ((v & 0xFF000000u) >> 24) |
           ((v & 0x00FF0000u) >> 8) |
           ((v & 0x0000FF00u) << 8) |
           ((v & 0x000000FFu) << 24);
}

// Recording streams and action logs are big-endian; ZIP structures are little-endian.
inline constexpr std::uint32_t to_be32(std::uint32_t v) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return v;
    }
    return byteswap32(v);
}

inline constexpr std::uint32_t from_be32(std::uint32_t v) noexcept { return to_be32(v); }

inline constexpr std::uint16_t to_le16(std::uint16_t v) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return v;
    }
    return byteswap16(v);
}

inline constexpr std::uint16_t from_le16(std::uint16_t v) noexcept { return to_le16(v); }

inline constexpr std::uint32_t to_le32(std::uint32_t v) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return v;
    }
    return byteswap32(v);
}

inline constexpr std::uint32_t from_le32(std::uint32_t v) noexcept { return to_le32(v); }

inline std::uint32_t read_u32_be(const std::byte* p) noexcept {
    std::uint32_t v{};
    std::memcpy(&v, p, sizeof(v));
    return from_be32(v);
}

inline void write_u32_be(std::uint32_t v, std::byte* p) noexcept {
    const auto be = to_be32(v);
    std::memcpy(p, &be, sizeof(be));
}

inline std::uint16_t read_u16_le(const std::byte* p) noexcept {
    std::uint16_t v{};
    std::memcpy(&v, p, sizeof(v));
    return from_le16(v);
}

inline std::uint32_t read_u32_le(const std::byte* p) noexcept {
    std::uint32_t v{};
    std::memcpy(&v, p, sizeof(v));
    return from_le32(v);
}

inline void write_u16_le(std::uint16_t v, std::byte* p) noexcept {
    const auto le = to_le16(v);
    std::memcpy(p, &le, sizeof(le));
}

inline void write_u32_le(std::uint32_t v, std::byte* p) noexcept {
    const auto le = to_le32(v);
    std::memcpy(p, &le, sizeof(le));
}

} // namespace persist
