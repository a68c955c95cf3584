#include "api/merge_config.hpp"

#include <charconv>
#include <limits>

#include "persist/archive.hpp"
#include "persist/json_cursor.hpp"

namespace api {

namespace {

bool parse_id_array(persist::JsonCursor& cur, std::vector<std::uint8_t>& out, std::string& error) {
    if (!cur.expect('[')) {
        error = "Expected array";
        return false;
    }
    out.clear();
    if (cur.consume(']')) {
        return true;
    }
    while (true) {
        // Ids may be written as numbers or as hex strings.
        if (cur.peek() == '"') {
            auto text = cur.parse_string(error);
            if (!text) return false;
            auto id = parse_packet_id(*text);
            if (!id) {
                error = "Invalid packet id: " + *text;
                return false;
            }
            out.push_back(*id);
        } else {
            auto v = cur.parse_uint64(error);
            if (!v) return false;
            if (*v > 0xFF) {
                error = "Packet id out of range";
                return false;
            }
            out.push_back(static_cast<std::uint8_t>(*v));
        }
        if (cur.consume(']')) {
            return true;
        }
        if (!cur.expect(',')) {
            error = "Expected ','";
            return false;
        }
    }
}

bool parse_path_array(persist::JsonCursor& cur, std::vector<std::filesystem::path>& out, std::string& error) {
    if (!cur.expect('[')) {
        error = "Expected array";
        return false;
    }
    out.clear();
    if (cur.consume(']')) {
        return true;
    }
    while (true) {
        auto v = cur.parse_string(error);
        if (!v) return false;
        out.emplace_back(*v);
        if (cur.consume(']')) {
            return true;
        }
        if (!cur.expect(',')) {
            error = "Expected ','";
            return false;
        }
    }
}

} // namespace

std::optional<std::uint8_t> parse_packet_id(std::string_view text) noexcept {
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    unsigned value = 0;
    const auto conv = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (conv.ec != std::errc() || conv.ptr != text.data() + text.size() || value > 0xFF) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(value);
}

bool validate_merge_config(const MergeConfig& cfg, std::string& error) {
    if (cfg.inputs.empty()) {
        error = "No input provided; use --input <archive|dir>[,...]";
        return false;
    }
    if (cfg.compression_level < persist::min_compression_level ||
        cfg.compression_level > persist::max_compression_level) {
        error = "Compression level must be between -1 and 9";
        return false;
    }
    if (cfg.quiet && cfg.verbose) {
        error = "--quiet and --verbose are mutually exclusive";
        return false;
    }
    if ((cfg.dump || !cfg.dump_chunk.empty()) && cfg.inputs.size() != 1) {
        error = "Dump mode takes exactly one input";
        return false;
    }
    if ((cfg.dump || !cfg.dump_chunk.empty()) && !cfg.output.empty()) {
        error = "Dump mode does not write output";
        return false;
    }
    for (const auto& in : cfg.inputs) {
        if (!cfg.output.empty() && in == cfg.output) {
            error = "Output must differ from every input: " + in.string();
            return false;
        }
    }
    return true;
}

bool parse_merge_job(std::string_view text, MergeConfig& cfg, std::string& error) {
    persist::JsonCursor cur(text);
    if (!cur.expect('{')) {
        error = "Expected object";
        return false;
    }
    MergeConfig job = cfg;
    if (!cur.consume('}')) {
        while (true) {
            auto key = cur.parse_string(error);
            if (!key) return false;
            if (!cur.expect(':')) {
                error = "Expected ':'";
                return false;
            }
            if (*key == "inputs") {
                if (!parse_path_array(cur, job.inputs, error)) return false;
            } else if (*key == "output") {
                auto v = cur.parse_string(error);
                if (!v) return false;
                job.output = *v;
            } else if (*key == "include") {
                if (!parse_id_array(cur, job.include_ids, error)) return false;
            } else if (*key == "exclude") {
                if (!parse_id_array(cur, job.exclude_ids, error)) return false;
            } else if (*key == "unknown_packets") {
                auto v = cur.parse_bool(error);
                if (!v) return false;
                job.admit_unknown = *v;
            } else if (*key == "compression_level") {
                auto v = cur.parse_int64(error);
                if (!v) return false;
                if (*v < persist::min_compression_level || *v > persist::max_compression_level) {
                    error = "compression_level out of range";
                    return false;
                }
                job.compression_level = static_cast<int>(*v);
            } else if (*key == "interval") {
                auto v = cur.parse_uint64(error);
                if (!v) return false;
                if (*v > std::numeric_limits<std::uint32_t>::max()) {
                    error = "interval out of range";
                    return false;
                }
                job.interval = static_cast<std::uint32_t>(*v);
            } else if (*key == "reset_id") {
                if (cur.peek() == '"') {
                    auto text = cur.parse_string(error);
                    if (!text) return false;
                    auto id = parse_packet_id(*text);
                    if (!id) {
                        error = "Invalid reset_id: " + *text;
                        return false;
                    }
                    job.reset_id = *id;
                } else {
                    auto v = cur.parse_int64(error);
                    if (!v) return false;
                    if (*v < std::numeric_limits<std::int32_t>::min() ||
                        *v > std::numeric_limits<std::int32_t>::max()) {
                        error = "reset_id out of range";
                        return false;
                    }
                    job.reset_id = static_cast<std::int32_t>(*v);
                }
            } else {
                error = "Unknown key: " + *key;
                return false;
            }
            if (cur.consume('}')) {
                break;
            }
            if (!cur.expect(',')) {
                error = "Expected ','";
                return false;
            }
        }
    }
    if (!cur.eof()) {
        error = "Trailing characters after object";
        return false;
    }
    cfg = std::move(job);
    return true;
}

bool load_merge_job(const std::filesystem::path& path, MergeConfig& cfg, std::string& error) {
    std::string contents;
    if (!persist::load_text_file(path, contents, error)) {
        return false;
    }
    if (!parse_merge_job(contents, cfg, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

} // namespace api
