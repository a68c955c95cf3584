#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "persist/entry_stream.hpp"
#include "persist/replay_status.hpp"

namespace persist {

// Little-endian base-128 groups: 7 value bits per byte, high bit set on every
// byte except the last. Values are encoded as raw two's-complement bit
// patterns (no zigzag), so negative numbers always take the full width.
inline constexpr std::size_t max_varint32_size = 5;
inline constexpr std::size_t max_varint64_size = 10;

inline constexpr std::uint8_t varint_segment_bits = 0x7F;
inline constexpr std::uint8_t varint_continue_bit = 0x80;

[[nodiscard]] inline constexpr std::size_t varint32_size(std::int32_t value) noexcept {
    auto v = static_cast<std::uint32_t>(value);
    std::size_t n = 1;
    while (v >= varint_continue_bit) {
        v >>= 7;
        ++n;
    }
    return n;
}

[[nodiscard]] inline constexpr std::size_t varint64_size(std::int64_t value) noexcept {
    auto v = static_cast<std::uint64_t>(value);
    std::size_t n = 1;
    while (v >= varint_continue_bit) {
        v >>= 7;
        ++n;
    }
    return n;
}

// `out` must have room for max_varint32_size bytes. Returns bytes written.
inline std::size_t encode_varint32(std::int32_t value, std::byte* out) noexcept {
    auto v = static_cast<std::uint32_t>(value);
    std::size_t n = 0;
    while (v >= varint_continue_bit) {
        out[n++] = static_cast<std::byte>((v & varint_segment_bits) | varint_continue_bit);
        v >>= 7;
    }
    out[n++] = static_cast<std::byte>(v);
    return n;
}

inline std::size_t encode_varint64(std::int64_t value, std::byte* out) noexcept {
    auto v = static_cast<std::uint64_t>(value);
    std::size_t n = 0;
    while (v >= varint_continue_bit) {
        out[n++] = static_cast<std::byte>((v & varint_segment_bits) | varint_continue_bit);
        v >>= 7;
    }
    out[n++] = static_cast<std::byte>(v);
    return n;
}

namespace detail {

template <typename Signed, typename Unsigned, std::size_t MaxBytes>
inline ReplayStatus decode_varint(std::span<const std::byte> in, Signed& out, std::size_t& consumed) noexcept {
    Unsigned value = 0;
    consumed = 0;
    for (std::size_t i = 0; i < MaxBytes; ++i) {
        if (i >= in.size()) {
            return ReplayStatus::TruncatedInput;
        }
        const auto byte = static_cast<std::uint8_t>(in[i]);
        value |= static_cast<Unsigned>(byte & varint_segment_bits) << (7 * i);
        if ((byte & varint_continue_bit) == 0) {
            consumed = i + 1;
            out = static_cast<Signed>(value);
            return ReplayStatus::Ok;
        }
    }
    return ReplayStatus::MalformedVarint;
}

template <typename Signed, typename Unsigned, std::size_t MaxBytes>
inline ReplayStatus read_varint(IEntrySource& src, Signed& out, std::size_t& consumed) noexcept {
    Unsigned value = 0;
    consumed = 0;
    for (std::size_t i = 0; i < MaxBytes; ++i) {
        std::byte b{};
        std::size_t got = 0;
        const IoResult r = read_fully(src, &b, 1, got);
        if (!r.ok) {
            return ReplayStatus::IoError;
        }
        if (got == 0) {
            return i == 0 ? ReplayStatus::EndOfStream : ReplayStatus::TruncatedInput;
        }
        ++consumed;
        const auto byte = static_cast<std::uint8_t>(b);
        value |= static_cast<Unsigned>(byte & varint_segment_bits) << (7 * i);
        if ((byte & varint_continue_bit) == 0) {
            out = static_cast<Signed>(value);
            return ReplayStatus::Ok;
        }
    }
    return ReplayStatus::MalformedVarint;
}

} // namespace detail

// Decodes from the front of `in`. TruncatedInput when `in` ends before the
// terminating byte, MalformedVarint when the byte limit is exhausted.
inline ReplayStatus decode_varint32(std::span<const std::byte> in, std::int32_t& out, std::size_t& consumed) noexcept {
    return detail::decode_varint<std::int32_t, std::uint32_t, max_varint32_size>(in, out, consumed);
}

inline ReplayStatus decode_varint64(std::span<const std::byte> in, std::int64_t& out, std::size_t& consumed) noexcept {
    return detail::decode_varint<std::int64_t, std::uint64_t, max_varint64_size>(in, out, consumed);
}

// Stream variants. EndOfStream when the entry ends before the first byte.
inline ReplayStatus read_varint32(IEntrySource& src, std::int32_t& out, std::size_t& consumed) noexcept {
    return detail::read_varint<std::int32_t, std::uint32_t, max_varint32_size>(src, out, consumed);
}

inline ReplayStatus read_varint64(IEntrySource& src, std::int64_t& out, std::size_t& consumed) noexcept {
    return detail::read_varint<std::int64_t, std::uint64_t, max_varint64_size>(src, out, consumed);
}

} // namespace persist
