#include "persist/json_cursor.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <fstream>

namespace persist {

namespace {

constexpr int kMaxNesting = 64;

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

void JsonCursor::skip_ws() const noexcept {
    while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
        ++pos_;
    }
}

bool JsonCursor::consume(char c) noexcept {
    skip_ws();
    if (pos_ < src_.size() && src_[pos_] == c) {
        ++pos_;
        return true;
    }
    return false;
}

bool JsonCursor::expect(char c) noexcept {
    skip_ws();
    if (pos_ >= src_.size() || src_[pos_] != c) {
        return false;
    }
    ++pos_;
    return true;
}

char JsonCursor::peek() const noexcept {
    skip_ws();
    return pos_ < src_.size() ? src_[pos_] : '\0';
}

bool JsonCursor::parse_hex4(std::uint32_t& out) noexcept {
    if (pos_ + 4 > src_.size()) {
        return false;
    }
    std::uint32_t v = 0;
    const auto conv = std::from_chars(src_.data() + pos_, src_.data() + pos_ + 4, v, 16);
    if (conv.ec != std::errc() || conv.ptr != src_.data() + pos_ + 4) {
        return false;
    }
    pos_ += 4;
    out = v;
    return true;
}

std::optional<std::string> JsonCursor::parse_string(std::string& err) {
    skip_ws();
    if (pos_ >= src_.size() || src_[pos_] != '"') {
        err = "Expected string";
        return std::nullopt;
    }
    ++pos_; // skip opening quote
    std::string out;
    while (pos_ < src_.size()) {
        const char c = src_[pos_++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (pos_ >= src_.size()) {
            err = "Invalid escape";
            return std::nullopt;
        }
        const char esc = src_[pos_++];
        switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                std::uint32_t cp = 0;
                if (!parse_hex4(cp)) {
                    err = "Invalid \\u escape";
                    return std::nullopt;
                }
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    std::uint32_t low = 0;
                    if (pos_ + 2 > src_.size() || src_[pos_] != '\\' || src_[pos_ + 1] != 'u') {
                        err = "Unpaired surrogate";
                        return std::nullopt;
                    }
                    pos_ += 2;
                    if (!parse_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
                        err = "Unpaired surrogate";
                        return std::nullopt;
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    err = "Unpaired surrogate";
                    return std::nullopt;
                }
                append_utf8(out, cp);
                break;
            }
            default:
                err = "Unsupported escape sequence";
                return std::nullopt;
        }
    }
    err = "Unterminated string";
    return std::nullopt;
}

std::optional<std::uint64_t> JsonCursor::parse_uint64(std::string& err) {
    skip_ws();
    const std::size_t start = pos_;
    while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
        ++pos_;
    }
    if (start == pos_) {
        err = "Expected integer";
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* begin = src_.data() + start;
    const auto* end = src_.data() + pos_;
    const auto conv = std::from_chars(begin, end, value);
    if (conv.ec != std::errc()) {
        err = "Invalid integer";
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> JsonCursor::parse_int64(std::string& err) {
    skip_ws();
    const std::size_t start = pos_;
    if (pos_ < src_.size() && src_[pos_] == '-') {
        ++pos_;
    }
    const std::size_t digits = pos_;
    while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
        ++pos_;
    }
    if (digits == pos_) {
        err = "Expected integer";
        return std::nullopt;
    }
    std::int64_t value = 0;
    const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
    if (conv.ec != std::errc()) {
        err = "Invalid integer";
        return std::nullopt;
    }
    return value;
}

std::optional<bool> JsonCursor::parse_bool(std::string& err) {
    skip_ws();
    if (src_.substr(pos_).starts_with("true")) {
        pos_ += 4;
        return true;
    }
    if (src_.substr(pos_).starts_with("false")) {
        pos_ += 5;
        return false;
    }
    err = "Expected boolean";
    return std::nullopt;
}

bool JsonCursor::parse_literal(std::string_view literal, std::string& err) {
    skip_ws();
    if (src_.substr(pos_).compare(0, literal.size(), literal) == 0) {
        pos_ += literal.size();
        return true;
    }
    err = "Expected literal";
    return false;
}

bool JsonCursor::skip_number(std::string& err) {
    const std::size_t start = pos_;
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E') {
            ++pos_;
        } else {
            break;
        }
    }
    if (start == pos_) {
        err = "Unexpected character";
        return false;
    }
    return true;
}

bool JsonCursor::skip_value(std::string& err, int depth) {
    if (depth > kMaxNesting) {
        err = "Nesting too deep";
        return false;
    }
    const char c = peek();
    if (c == '"') {
        return parse_string(err).has_value();
    }
    if (c == 't' || c == 'f') {
        return parse_bool(err).has_value();
    }
    if (c == 'n') {
        return parse_literal("null", err);
    }
    if (c == '{' || c == '[') {
        const char close = c == '{' ? '}' : ']';
        ++pos_;
        if (consume(close)) {
            return true;
        }
        while (true) {
            if (c == '{') {
                if (!parse_string(err)) {
                    return false;
                }
                if (!expect(':')) {
                    err = "Expected ':'";
                    return false;
                }
            }
            if (!skip_value(err, depth + 1)) {
                return false;
            }
            if (consume(close)) {
                return true;
            }
            if (!consume(',')) {
                err = "Expected ','";
                return false;
            }
        }
    }
    return skip_number(err);
}

bool JsonCursor::eof() const noexcept {
    skip_ws();
    return pos_ >= src_.size();
}

void append_json_string(std::string& out, std::string_view value) {
    out.push_back('"');
    for (const char c : value) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buf;
            } else {
                out.push_back(c);
            }
        }
    }
    out.push_back('"');
}

bool load_text_file(const std::filesystem::path& path, std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    return true;
}

} // namespace persist
