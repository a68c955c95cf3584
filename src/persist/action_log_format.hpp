#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "persist/archive.hpp"
#include "persist/entry_stream.hpp"
#include "persist/replay_status.hpp"

namespace persist {

// Action-log chunk contract (the tick-based replay format):
//   chunk  = [i32 magic_be][varint action_count][action_name x count]
//            [i32 snapshot_size_be][snapshot bytes][record...]
//   name   = [varint byte_len][utf-8 bytes]
//   record = [varint action_index][i32 payload_len_be][payload]
// Records run until the end of the entry. Only the framing is handled here.

inline constexpr std::int32_t action_log_magic = -679417724;
inline constexpr std::uint32_t max_action_name_length = 32767 * 4;
inline constexpr std::uint32_t max_action_payload_length = 64u * 1024u * 1024u;
inline constexpr std::uint32_t max_action_count = 4096;
inline constexpr std::uint32_t max_action_snapshot_length = 64u * 1024u * 1024u;

enum class ActionKind : std::uint8_t {
    NextTick,
    GamePacket,
    ConfigurationPacket,
    CreateLocalPlayer,
    MoveEntities,
    LevelChunkCached,
    AccuratePlayerPosition,
    Unknown
};

// Unrecognized names map to Unknown.
ActionKind action_kind_from_name(std::string_view name) noexcept;
const char* action_kind_name(ActionKind kind) noexcept;

struct ActionLogChunkHeader {
    std::vector<std::string> action_names;
    std::vector<ActionKind> actions;
    std::vector<std::byte> snapshot;
};

struct ActionRecord {
    std::int32_t action_index{0};
    ActionKind kind{ActionKind::Unknown};
    std::vector<std::byte> payload;
};

struct ActionLogReadResult {
    ReplayStatus status{ReplayStatus::EndOfStream};
    int error_code{0};
};

// A bad magic number, negative sizes, oversized names or an oversized
// snapshot are MalformedRecord.
ActionLogReadResult read_chunk_header(IEntrySource& src, ActionLogChunkHeader& out) noexcept;

// EndOfStream only before the first byte of a record. An index outside the
// header's action table is MalformedRecord.
ActionLogReadResult read_action(IEntrySource& src,
                                const ActionLogChunkHeader& header,
                                ActionRecord& out) noexcept;

IoResult write_chunk_header(IEntrySink& sink,
                            std::span<const std::string> action_names,
                            std::span<const std::byte> snapshot) noexcept;
IoResult write_action(IEntrySink& sink, std::int32_t action_index, std::span<const std::byte> payload) noexcept;

struct ActionLogStats {
    std::uint64_t actions_read{0};
    std::uint64_t ticks{0};
    std::uint64_t game_packets{0};
    std::uint64_t unknown_actions{0};
};

// Single-pass reader over one chunk entry. NextTick records advance the tick
// counter; every record, tick markers included, is handed back.
class ActionLogChunkReader {
public:
    // Opens the entry and parses its header.
    ActionLogReadResult open(IArchiveReader& archive, std::string_view entry_name) noexcept;
    ActionLogReadResult open(std::unique_ptr<IEntrySource> src) noexcept;

    ActionLogReadResult next(ActionRecord& out) noexcept;

    const ActionLogChunkHeader& header() const noexcept { return header_; }
    const ActionLogStats& stats() const noexcept { return stats_; }
    // Tick the most recently returned record belongs to.
    std::uint64_t tick() const noexcept { return stats_.ticks; }

private:
    std::unique_ptr<IEntrySource> src_;
    ActionLogChunkHeader header_;
    ActionLogStats stats_{};
    ActionLogReadResult last_{ReplayStatus::Ok, 0};
};

} // namespace persist
