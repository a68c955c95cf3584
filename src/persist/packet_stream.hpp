#pragma once

#include <cstdint>
#include <memory>

#include "core/packet.hpp"
#include "core/protocol_phase.hpp"
#include "persist/archive.hpp"
#include "persist/packet_format.hpp"

namespace persist {

struct PacketStreamStats {
    std::uint64_t packets_read{0};
    std::uint64_t bytes_read{0};
    std::uint64_t phase_transitions{0};
};

// Single-pass reader over one recording stream. Each packet comes back tagged
// with the phase it was read in. Not restartable; reopen the backend to scan
// again. Stopping early leaves the rest of the entry unread.
class PacketStreamReader {
public:
    PacketStreamReader() = default;
    explicit PacketStreamReader(std::unique_ptr<IEntrySource> src) : src_(std::move(src)) {}

    // Opens the recording entry of `archive`.
    StorageResult open(IArchiveReader& archive) noexcept;

    // Ok with a packet, EndOfStream once exhausted, or the failure that ended
    // the scan. After anything but Ok further calls return the same status.
    PacketReadResult next(core::Packet& out, core::ProtocolPhase& phase) noexcept;

    core::ProtocolPhase phase() const noexcept { return tracker_.phase; }
    const PacketStreamStats& stats() const noexcept { return stats_; }
    bool is_open() const noexcept { return src_ != nullptr; }

private:
    std::unique_ptr<IEntrySource> src_;
    core::PhaseTracker tracker_{};
    PacketStreamStats stats_{};
    PacketReadResult last_{ReplayStatus::Ok, 0};
};

struct PacketWriterStats {
    std::uint64_t packets_written{0};
    std::uint64_t bytes_written{0};
};

// Appends packets to the recording entry of an output backend. close() must
// be called before the backend opens another entry.
class PacketStreamWriter {
public:
    PacketStreamWriter() = default;
    ~PacketStreamWriter();
    PacketStreamWriter(const PacketStreamWriter&) = delete;
    PacketStreamWriter& operator=(const PacketStreamWriter&) = delete;

    StorageResult open(IArchiveWriter& archive, int compression_level) noexcept;
    PacketWriteResult write(const core::Packet& packet) noexcept;
    IoResult close() noexcept;

    bool is_open() const noexcept { return sink_ != nullptr; }
    const PacketWriterStats& stats() const noexcept { return stats_; }

private:
    std::unique_ptr<IEntrySink> sink_;
    PacketWriterStats stats_{};
};

} // namespace persist
