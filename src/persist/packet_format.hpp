#pragma once

#include <cstddef>
#include <cstdint>

#include "core/packet.hpp"
#include "persist/entry_stream.hpp"
#include "persist/replay_status.hpp"

namespace persist {

// Recording stream contract:
//   records concatenated with no separators, terminated by end of entry
//   record = [u32 time_be][u32 total_length_be][varint id][payload]
// total_length counts the varint id bytes plus the payload, not the header.

inline constexpr std::size_t packet_header_size = 8;

// Upper bound on total_length accepted by the reader; larger values are
// treated as corrupt framing instead of being allocated.
inline constexpr std::uint32_t max_packet_length = 64u * 1024u * 1024u;

struct PacketReadResult {
    ReplayStatus status{ReplayStatus::EndOfStream};
    int error_code{0};
};

struct PacketWriteResult {
    ReplayStatus status{ReplayStatus::Ok};
    int error_code{0};
    std::size_t bytes_written{0};
};

// Reads one record. EndOfStream only when the entry ends before the first
// header byte; an end anywhere later is TruncatedInput.
PacketReadResult read_packet(IEntrySource& src, core::Packet& out) noexcept;

// total_length is derived from the id and data, never taken from the caller.
PacketWriteResult write_packet(const core::Packet& packet, IEntrySink& sink) noexcept;

// Size of the encoded record including its header.
std::size_t encoded_packet_size(const core::Packet& packet) noexcept;

} // namespace persist
