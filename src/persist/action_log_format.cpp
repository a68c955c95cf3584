#include "persist/action_log_format.hpp"

#include <array>
#include <cerrno>

#include "persist/endianness.hpp"
#include "persist/varint.hpp"

namespace persist {

namespace {

struct ActionName {
    std::string_view name;
    ActionKind kind;
};

constexpr std::array<ActionName, 7> kActionNames{{
    {"flashback:action/next_tick", ActionKind::NextTick},
    {"flashback:action/game_packet", ActionKind::GamePacket},
    {"flashback:action/configuration_packet", ActionKind::ConfigurationPacket},
    {"flashback:action/create_local_player", ActionKind::CreateLocalPlayer},
    {"flashback:action/move_entities", ActionKind::MoveEntities},
    {"flashback:action/level_chunk_cached", ActionKind::LevelChunkCached},
    {"flashback:action/accurate_player_position", ActionKind::AccuratePlayerPosition},
}};

// EndOfStream if nothing was read, TruncatedInput if the entry ended early.
ActionLogReadResult read_exact(IEntrySource& src, std::byte* dst, std::size_t len) noexcept {
    std::size_t got = 0;
    const IoResult r = read_fully(src, dst, len, got);
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    if (got == 0 && len != 0) {
        return {ReplayStatus::EndOfStream, 0};
    }
    if (got < len) {
        return {ReplayStatus::TruncatedInput, 0};
    }
    return {ReplayStatus::Ok, 0};
}

ActionLogReadResult read_i32_be(IEntrySource& src, std::int32_t& out) noexcept {
    std::array<std::byte, 4> buf{};
    const ActionLogReadResult r = read_exact(src, buf.data(), buf.size());
    if (r.status == ReplayStatus::Ok) {
        out = static_cast<std::int32_t>(read_u32_be(buf.data()));
    }
    return r;
}

// Any end of entry inside the header counts as truncation.
ActionLogReadResult header_status(ActionLogReadResult r) noexcept {
    if (r.status == ReplayStatus::EndOfStream) {
        r.status = ReplayStatus::TruncatedInput;
    }
    return r;
}

ActionLogReadResult read_name(IEntrySource& src, std::string& out) noexcept {
    std::int32_t len = 0;
    std::size_t consumed = 0;
    const ReplayStatus st = read_varint32(src, len, consumed);
    if (st != ReplayStatus::Ok) {
        return header_status({st, 0});
    }
    if (len < 0 || static_cast<std::uint32_t>(len) > max_action_name_length) {
        return {ReplayStatus::MalformedRecord, 0};
    }
    out.resize(static_cast<std::size_t>(len));
    return header_status(read_exact(src, reinterpret_cast<std::byte*>(out.data()), out.size()));
}

IoResult write_i32_be(IEntrySink& sink, std::int32_t v) noexcept {
    std::array<std::byte, 4> buf{};
    write_u32_be(static_cast<std::uint32_t>(v), buf.data());
    return write_all(sink, buf.data(), buf.size());
}

IoResult write_varint(IEntrySink& sink, std::int32_t v) noexcept {
    std::array<std::byte, max_varint32_size> buf{};
    const std::size_t n = encode_varint32(v, buf.data());
    return write_all(sink, buf.data(), n);
}

} // namespace

ActionKind action_kind_from_name(std::string_view name) noexcept {
    for (const auto& entry : kActionNames) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return ActionKind::Unknown;
}

const char* action_kind_name(ActionKind kind) noexcept {
    switch (kind) {
    case ActionKind::NextTick: return "next_tick";
    case ActionKind::GamePacket: return "game_packet";
    case ActionKind::ConfigurationPacket: return "configuration_packet";
    case ActionKind::CreateLocalPlayer: return "create_local_player";
    case ActionKind::MoveEntities: return "move_entities";
    case ActionKind::LevelChunkCached: return "level_chunk_cached";
    case ActionKind::AccuratePlayerPosition: return "accurate_player_position";
    case ActionKind::Unknown: return "unknown";
    }
    return "unknown";
}

ActionLogReadResult read_chunk_header(IEntrySource& src, ActionLogChunkHeader& out) noexcept {
    std::int32_t magic = 0;
    ActionLogReadResult r = header_status(read_i32_be(src, magic));
    if (r.status != ReplayStatus::Ok) {
        return r;
    }
    if (magic != action_log_magic) {
        return {ReplayStatus::MalformedRecord, 0};
    }

    std::int32_t count = 0;
    std::size_t consumed = 0;
    const ReplayStatus st = read_varint32(src, count, consumed);
    if (st != ReplayStatus::Ok) {
        return header_status({st, 0});
    }
    if (count < 0 || static_cast<std::uint32_t>(count) > max_action_count) {
        return {ReplayStatus::MalformedRecord, 0};
    }

    ActionLogChunkHeader header;
    header.action_names.resize(static_cast<std::size_t>(count));
    header.actions.reserve(header.action_names.size());
    for (auto& name : header.action_names) {
        r = read_name(src, name);
        if (r.status != ReplayStatus::Ok) {
            return r;
        }
        header.actions.push_back(action_kind_from_name(name));
    }

    std::int32_t snapshot_size = 0;
    r = header_status(read_i32_be(src, snapshot_size));
    if (r.status != ReplayStatus::Ok) {
        return r;
    }
    if (snapshot_size < 0 || static_cast<std::uint32_t>(snapshot_size) > max_action_snapshot_length) {
        return {ReplayStatus::MalformedRecord, 0};
    }
    header.snapshot.resize(static_cast<std::size_t>(snapshot_size));
    r = header_status(read_exact(src, header.snapshot.data(), header.snapshot.size()));
    if (r.status != ReplayStatus::Ok) {
        return r;
    }
    out = std::move(header);
    return {ReplayStatus::Ok, 0};
}

ActionLogReadResult read_action(IEntrySource& src,
                                const ActionLogChunkHeader& header,
                                ActionRecord& out) noexcept {
    std::int32_t index = 0;
    std::size_t consumed = 0;
    const ReplayStatus st = read_varint32(src, index, consumed);
    if (st != ReplayStatus::Ok) {
        return {st, 0};
    }
    if (index < 0 || static_cast<std::size_t>(index) >= header.actions.size()) {
        return {ReplayStatus::MalformedRecord, 0};
    }

    std::int32_t length = 0;
    ActionLogReadResult r = header_status(read_i32_be(src, length));
    if (r.status != ReplayStatus::Ok) {
        return r;
    }
    if (length < 0 || static_cast<std::uint32_t>(length) > max_action_payload_length) {
        return {ReplayStatus::MalformedRecord, 0};
    }
    std::vector<std::byte> payload(static_cast<std::size_t>(length));
    r = header_status(read_exact(src, payload.data(), payload.size()));
    if (r.status != ReplayStatus::Ok) {
        return r;
    }
    out.action_index = index;
    out.kind = header.actions[static_cast<std::size_t>(index)];
    out.payload = std::move(payload);
    return {ReplayStatus::Ok, 0};
}

IoResult write_chunk_header(IEntrySink& sink,
                            std::span<const std::string> action_names,
                            std::span<const std::byte> snapshot) noexcept {
    IoResult r = write_i32_be(sink, action_log_magic);
    if (!r.ok) return r;
    r = write_varint(sink, static_cast<std::int32_t>(action_names.size()));
    if (!r.ok) return r;
    for (const auto& name : action_names) {
        r = write_varint(sink, static_cast<std::int32_t>(name.size()));
        if (!r.ok) return r;
        r = write_all(sink, name.data(), name.size());
        if (!r.ok) return r;
    }
    r = write_i32_be(sink, static_cast<std::int32_t>(snapshot.size()));
    if (!r.ok) return r;
    return write_all(sink, snapshot.data(), snapshot.size());
}

IoResult write_action(IEntrySink& sink, std::int32_t action_index, std::span<const std::byte> payload) noexcept {
    IoResult r = write_varint(sink, action_index);
    if (!r.ok) return r;
    r = write_i32_be(sink, static_cast<std::int32_t>(payload.size()));
    if (!r.ok) return r;
    return write_all(sink, payload.data(), payload.size());
}

ActionLogReadResult ActionLogChunkReader::open(IArchiveReader& archive, std::string_view entry_name) noexcept {
    std::unique_ptr<IEntrySource> src;
    const StorageResult opened = archive.open_entry_for_read(entry_name, src);
    if (!opened.ok()) {
        src_.reset();
        last_ = {opened.status, opened.error_code};
        return last_;
    }
    return open(std::move(src));
}

ActionLogReadResult ActionLogChunkReader::open(std::unique_ptr<IEntrySource> src) noexcept {
    src_ = std::move(src);
    header_ = ActionLogChunkHeader{};
    stats_ = ActionLogStats{};
    if (!src_) {
        last_ = {ReplayStatus::InvalidArgument, EBADF};
        return last_;
    }
    last_ = read_chunk_header(*src_, header_);
    return last_;
}

ActionLogReadResult ActionLogChunkReader::next(ActionRecord& out) noexcept {
    if (last_.status != ReplayStatus::Ok) {
        return last_;
    }
    last_ = read_action(*src_, header_, out);
    if (last_.status != ReplayStatus::Ok) {
        return last_;
    }
    ++stats_.actions_read;
    switch (out.kind) {
    case ActionKind::NextTick: ++stats_.ticks; break;
    case ActionKind::GamePacket: ++stats_.game_packets; break;
    case ActionKind::Unknown: ++stats_.unknown_actions; break;
    default: break;
    }
    return last_;
}

} // namespace persist
