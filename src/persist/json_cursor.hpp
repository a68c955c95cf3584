#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace persist {

// Minimal forward-only JSON reader for the flat documents this tool handles
// (archive metadata, merge job files). Errors are reported through `err`;
// nothing throws.
class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept;
    bool consume(char c) noexcept;
    bool expect(char c) noexcept;
    char peek() const noexcept;

    std::optional<std::string> parse_string(std::string& err);
    std::optional<std::uint64_t> parse_uint64(std::string& err);
    std::optional<std::int64_t> parse_int64(std::string& err);
    std::optional<bool> parse_bool(std::string& err);
    bool parse_literal(std::string_view literal, std::string& err);

    // Skips any value, including nested objects and arrays.
    bool skip_value(std::string& err, int depth = 0);

    bool eof() const noexcept;
    std::size_t position() const noexcept { return pos_; }

private:
    bool parse_hex4(std::uint32_t& out) noexcept;
    bool skip_number(std::string& err);

    mutable std::size_t pos_{0};
    std::string_view src_;
};

// Appends `value` as a quoted JSON string.
void append_json_string(std::string& out, std::string_view value);

bool load_text_file(const std::filesystem::path& path, std::string& out, std::string& error);

} // namespace persist
