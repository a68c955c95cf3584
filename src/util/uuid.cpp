#include "util/uuid.hpp"

namespace util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_string(const Uuid& id) {
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHexDigits[id[i] >> 4]);
        out.push_back(kHexDigits[id[i] & 0x0F]);
    }
    return out;
}

std::optional<Uuid> parse_uuid(std::string_view text) noexcept {
    const bool hyphenated = text.size() == 36;
    if (!hyphenated && text.size() != 32) {
        return std::nullopt;
    }
    if (hyphenated && (text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-')) {
        return std::nullopt;
    }
    Uuid id{};
    std::size_t pos = 0;
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (hyphenated && (pos == 8 || pos == 13 || pos == 18 || pos == 23)) {
            ++pos;
        }
        const int hi = hex_value(text[pos]);
        const int lo = hex_value(text[pos + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        id[i] = static_cast<std::uint8_t>((hi << 4) | lo);
        pos += 2;
    }
    return id;
}

} // namespace util
