#include "persist/metadata_codec.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

#include "persist/json_cursor.hpp"
#include "util/log.hpp"

namespace persist {

namespace {

constexpr std::size_t kMaxMetadataBytes = 1024 * 1024;

bool parse_string_field(JsonCursor& cur, std::string& out, std::string& error) {
    auto v = cur.parse_string(error);
    if (!v) {
        return false;
    }
    out = std::move(*v);
    return true;
}

template <typename T>
bool parse_unsigned_field(JsonCursor& cur, T& out, std::string& error) {
    auto v = cur.parse_uint64(error);
    if (!v) {
        return false;
    }
    if (*v > std::numeric_limits<T>::max()) {
        error = "Integer out of range";
        return false;
    }
    out = static_cast<T>(*v);
    return true;
}

bool parse_players(JsonCursor& cur, std::set<util::Uuid>& out, std::string& error) {
    if (!cur.expect('[')) {
        error = "Expected array";
        return false;
    }
    if (cur.consume(']')) {
        return true;
    }
    while (true) {
        auto text = cur.parse_string(error);
        if (!text) {
            return false;
        }
        auto id = util::parse_uuid(*text);
        if (!id) {
            error = "Invalid player uuid: " + *text;
            return false;
        }
        out.insert(*id);
        if (cur.consume(']')) {
            return true;
        }
        if (!cur.expect(',')) {
            error = "Expected ','";
            return false;
        }
    }
}

// Every field is required; the order here is the serialized order.
constexpr std::array<std::string_view, 12> kFieldNames{
    "singleplayer", "serverName", "customServerName", "duration", "date", "mcversion",
    "fileFormat", "fileFormatVersion", "protocol", "generator", "selfId", "players",
};

int field_index(std::string_view key) noexcept {
    for (std::size_t i = 0; i < kFieldNames.size(); ++i) {
        if (kFieldNames[i] == key) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool parse_field(JsonCursor& cur, int field, core::SessionMetadata& meta, std::string& error) {
    switch (field) {
    case 0: {
        auto v = cur.parse_bool(error);
        if (!v) return false;
        meta.singleplayer = *v;
        return true;
    }
    case 1: return parse_string_field(cur, meta.server_name, error);
    case 2: return parse_string_field(cur, meta.custom_server_name, error);
    case 3: return parse_unsigned_field(cur, meta.duration, error);
    case 4: return parse_unsigned_field(cur, meta.date, error);
    case 5: return parse_string_field(cur, meta.mc_version, error);
    case 6: return parse_string_field(cur, meta.file_format, error);
    case 7: return parse_unsigned_field(cur, meta.file_format_version, error);
    case 8: return parse_unsigned_field(cur, meta.protocol, error);
    case 9: return parse_string_field(cur, meta.generator, error);
    case 10: {
        auto v = cur.parse_int64(error);
        if (!v) return false;
        if (*v < std::numeric_limits<std::int32_t>::min() ||
            *v > std::numeric_limits<std::int32_t>::max()) {
            error = "selfId out of range";
            return false;
        }
        meta.self_id = static_cast<std::int32_t>(*v);
        return true;
    }
    case 11: return parse_players(cur, meta.players, error);
    }
    return false;
}

} // namespace

bool parse_metadata(std::string_view text, core::SessionMetadata& out, std::string& error) {
    JsonCursor cur(text);
    if (!cur.expect('{')) {
        error = "Expected object";
        return false;
    }
    core::SessionMetadata meta;
    std::uint32_t seen = 0;
    if (!cur.consume('}')) {
        while (true) {
            auto key = cur.parse_string(error);
            if (!key) {
                return false;
            }
            if (!cur.expect(':')) {
                error = "Expected ':'";
                return false;
            }
            const int field = field_index(*key);
            if (field < 0) {
                if (!cur.skip_value(error)) return false;
            } else {
                if ((seen & (1u << field)) != 0) {
                    error = "Duplicate key: " + *key;
                    return false;
                }
                seen |= 1u << field;
                if (cur.peek() == 'n') {
                    error = "Null value for key: " + *key;
                    return false;
                }
                if (!parse_field(cur, field, meta, error)) return false;
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
    for (std::size_t i = 0; i < kFieldNames.size(); ++i) {
        if ((seen & (1u << i)) == 0) {
            error = "Missing key: " + std::string(kFieldNames[i]);
            return false;
        }
    }
    out = std::move(meta);
    return true;
}

std::string serialize_metadata(const core::SessionMetadata& meta) {
    std::string out;
    out.reserve(256 + meta.players.size() * 40);
    out += "{\"singleplayer\":";
    out += meta.singleplayer ? "true" : "false";
    out += ",\"serverName\":";
    append_json_string(out, meta.server_name);
    out += ",\"customServerName\":";
    append_json_string(out, meta.custom_server_name);
    out += ",\"duration\":";
    out += std::to_string(meta.duration);
    out += ",\"date\":";
    out += std::to_string(meta.date);
    out += ",\"mcversion\":";
    append_json_string(out, meta.mc_version);
    out += ",\"fileFormat\":";
    append_json_string(out, meta.file_format);
    out += ",\"fileFormatVersion\":";
    out += std::to_string(meta.file_format_version);
    out += ",\"protocol\":";
    out += std::to_string(meta.protocol);
    out += ",\"generator\":";
    append_json_string(out, meta.generator);
    out += ",\"selfId\":";
    out += std::to_string(meta.self_id);
    out += ",\"players\":[";
    bool first = true;
    for (const auto& id : meta.players) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        append_json_string(out, util::to_string(id));
    }
    out += "]}";
    return out;
}

MetadataResult read_metadata(IArchiveReader& archive, core::SessionMetadata& out) {
    std::unique_ptr<IEntrySource> src;
    const StorageResult opened = archive.open_entry_for_read(metadata_entry_name, src);
    if (!opened.ok()) {
        return MetadataResult{opened.status, "cannot open " + std::string(metadata_entry_name)};
    }

    std::string text;
    std::vector<std::byte> chunk(16 * 1024);
    while (true) {
        std::size_t got = 0;
        const IoResult r = src->read(chunk.data(), chunk.size(), got);
        if (!r.ok) {
            return MetadataResult{ReplayStatus::IoError,
                                  "read failed: errno=" + std::to_string(r.error_code)};
        }
        if (got == 0) {
            break;
        }
        text.append(reinterpret_cast<const char*>(chunk.data()), got);
        if (text.size() > kMaxMetadataBytes) {
            return MetadataResult{ReplayStatus::MetadataFormatError, "metadata document too large"};
        }
    }

    std::string error;
    if (!parse_metadata(text, out, error)) {
        return MetadataResult{ReplayStatus::MetadataFormatError, std::move(error)};
    }
    return MetadataResult{};
}

MetadataResult write_metadata(IArchiveWriter& archive,
                              const core::SessionMetadata& meta,
                              int compression_level) {
    std::unique_ptr<IEntrySink> sink;
    const StorageResult opened = archive.open_entry_for_write(metadata_entry_name, compression_level, sink);
    if (!opened.ok()) {
        return MetadataResult{opened.status, "cannot open " + std::string(metadata_entry_name) +
                                                 " for write: errno=" + std::to_string(opened.error_code)};
    }
    const std::string text = serialize_metadata(meta);
    IoResult r = write_all(*sink, text.data(), text.size());
    if (!r.ok) {
        const IoResult closed = sink->close();
        if (!closed.ok) {
            LOG_SLOW_WARN("metadata sink close after failed write: errno=%d", closed.error_code);
        }
        return MetadataResult{ReplayStatus::IoError, "write failed: errno=" + std::to_string(r.error_code)};
    }
    r = sink->close();
    if (!r.ok) {
        return MetadataResult{ReplayStatus::IoError, "close failed: errno=" + std::to_string(r.error_code)};
    }
    return MetadataResult{};
}

} // namespace persist
