#include "persist/packet_stream.hpp"

#include <cerrno>

#include "util/log.hpp"

namespace persist {

StorageResult PacketStreamReader::open(IArchiveReader& archive) noexcept {
    src_.reset();
    core::reset_tracker(tracker_);
    stats_ = PacketStreamStats{};
    last_ = PacketReadResult{ReplayStatus::Ok, 0};
    return archive.open_entry_for_read(recording_entry_name, src_);
}

PacketReadResult PacketStreamReader::next(core::Packet& out, core::ProtocolPhase& phase) noexcept {
    if (last_.status != ReplayStatus::Ok) {
        return last_;
    }
    if (!src_) {
        last_ = PacketReadResult{ReplayStatus::InvalidArgument, EBADF};
        return last_;
    }
    const PacketReadResult res = read_packet(*src_, out);
    if (res.status != ReplayStatus::Ok) {
        last_ = res;
        return res;
    }
    ++stats_.packets_read;
    stats_.bytes_read += encoded_packet_size(out);
    const std::uint64_t before = tracker_.transitions;
    phase = core::observe_packet(tracker_, out.id());
    if (tracker_.transitions != before) {
        ++stats_.phase_transitions;
        LOG_SLOW_DEBUG("packet %llu (id=0x%02x) moves stream to %s",
                       static_cast<unsigned long long>(stats_.packets_read),
                       static_cast<unsigned>(out.id()),
                       core::phase_name(tracker_.phase));
    }
    return res;
}

PacketStreamWriter::~PacketStreamWriter() {
    if (sink_) {
        const IoResult r = close();
        if (!r.ok) {
            LOG_SLOW_ERROR("recording entry close failed: errno=%d", r.error_code);
        }
    }
}

StorageResult PacketStreamWriter::open(IArchiveWriter& archive, int compression_level) noexcept {
    if (sink_) {
        return StorageResult{ReplayStatus::WriteSessionActive, EBUSY};
    }
    stats_ = PacketWriterStats{};
    return archive.open_entry_for_write(recording_entry_name, compression_level, sink_);
}

PacketWriteResult PacketStreamWriter::write(const core::Packet& packet) noexcept {
    if (!sink_) {
        return PacketWriteResult{ReplayStatus::InvalidArgument, EBADF, 0};
    }
    const PacketWriteResult res = write_packet(packet, *sink_);
    if (res.status == ReplayStatus::Ok) {
        ++stats_.packets_written;
        stats_.bytes_written += res.bytes_written;
    }
    return res;
}

IoResult PacketStreamWriter::close() noexcept {
    if (!sink_) {
        return {true, 0};
    }
    const IoResult r = sink_->close();
    sink_.reset();
    return r;
}

} // namespace persist
