#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace util {

// Raw 16-byte RFC 4122 UUID, ordered bytewise.
using Uuid = std::array<std::uint8_t, 16>;

// Canonical lowercase 8-4-4-4-12 form.
std::string to_string(const Uuid& id);

// Accepts the hyphenated form or 32 bare hex digits, either case.
std::optional<Uuid> parse_uuid(std::string_view text) noexcept;

} // namespace util
