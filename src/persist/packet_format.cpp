#include "persist/packet_format.hpp"

#include <array>
#include <cerrno>
#include <span>
#include <vector>

#include "persist/endianness.hpp"
#include "persist/varint.hpp"

namespace persist {

PacketReadResult read_packet(IEntrySource& src, core::Packet& out) noexcept {
    std::array<std::byte, packet_header_size> header{};
    std::size_t got = 0;
    IoResult r = read_fully(src, header.data(), header.size(), got);
    if (!r.ok) {
        return PacketReadResult{ReplayStatus::IoError, r.error_code};
    }
    if (got == 0) {
        return PacketReadResult{ReplayStatus::EndOfStream, 0};
    }
    if (got < header.size()) {
        return PacketReadResult{ReplayStatus::TruncatedInput, 0};
    }

    const std::uint32_t time = read_u32_be(header.data());
    const std::uint32_t total_length = read_u32_be(header.data() + 4);
    if (total_length == 0 || total_length > max_packet_length) {
        return PacketReadResult{ReplayStatus::MalformedRecord, 0};
    }

    std::vector<std::byte> body(total_length);
    r = read_fully(src, body.data(), body.size(), got);
    if (!r.ok) {
        return PacketReadResult{ReplayStatus::IoError, r.error_code};
    }
    if (got < body.size()) {
        return PacketReadResult{ReplayStatus::TruncatedInput, 0};
    }

    std::int32_t id = 0;
    std::size_t id_len = 0;
    const ReplayStatus st = decode_varint32(std::span<const std::byte>(body.data(), body.size()), id, id_len);
    if (st == ReplayStatus::TruncatedInput) {
        // The record is complete but its length cannot hold the identifier.
        return PacketReadResult{ReplayStatus::MalformedRecord, 0};
    }
    if (st != ReplayStatus::Ok) {
        return PacketReadResult{st, 0};
    }
    body.erase(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(id_len));
    out = core::Packet(time, id, std::move(body));
    return PacketReadResult{ReplayStatus::Ok, 0};
}

std::size_t encoded_packet_size(const core::Packet& packet) noexcept {
    return packet_header_size + varint32_size(packet.id()) + packet.data().size();
}

PacketWriteResult write_packet(const core::Packet& packet, IEntrySink& sink) noexcept {
    const std::size_t id_len = varint32_size(packet.id());
    const std::size_t total_length = id_len + packet.data().size();
    if (total_length > max_packet_length) {
        return PacketWriteResult{ReplayStatus::InvalidArgument, EFBIG, 0};
    }

    std::array<std::byte, packet_header_size + max_varint32_size> head{};
    write_u32_be(packet.time(), head.data());
    write_u32_be(static_cast<std::uint32_t>(total_length), head.data() + 4);
    encode_varint32(packet.id(), head.data() + packet_header_size);

    struct iovec iov[2];
    iov[0].iov_base = head.data();
    iov[0].iov_len = packet_header_size + id_len;
    int iovcnt = 1;
    if (!packet.data().empty()) {
        iov[1].iov_base = const_cast<std::byte*>(packet.data().data());
        iov[1].iov_len = packet.data().size();
        iovcnt = 2;
    }
    const IoResult r = writev_fully(sink, iov, iovcnt);
    if (!r.ok) {
        return PacketWriteResult{ReplayStatus::IoError, r.error_code, 0};
    }
    return PacketWriteResult{ReplayStatus::Ok, 0, packet_header_size + total_length};
}

} // namespace persist
