#include <chrono>
#include <iostream>
#include <vector>

#include "core/packet.hpp"
#include "core/packet_filter.hpp"
#include "persist/entry_stream.hpp"
#include "persist/packet_format.hpp"

int main() {
    constexpr std::size_t iterations = 100000;
    const core::PacketFilterMask mask = core::PacketFilterBuilder(true, true).exclude(0x03).build();

    persist::MemoryEntrySink sink;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        const core::Packet p(static_cast<std::uint32_t>(i), static_cast<std::int32_t>(i & 0xFF),
                             std::vector<std::byte>(64));
        if (!mask.admits(p.id())) {
            continue;
        }
        if (persist::write_packet(p, sink).status != persist::ReplayStatus::Ok) {
            std::cerr << "encode failed at " << i << '\n';
            return 1;
        }
    }
    auto mid = std::chrono::steady_clock::now();

    persist::MemoryEntrySource src(sink.data());
    core::Packet p;
    std::size_t decoded = 0;
    while (persist::read_packet(src, p).status == persist::ReplayStatus::Ok) {
        ++decoded;
    }
    auto end = std::chrono::steady_clock::now();

    const auto enc_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mid - start).count();
    const auto dec_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - mid).count();
    std::cout << "Encode " << iterations << " packets took " << enc_ns << " ns (" << (enc_ns / iterations)
              << " ns/packet)\n";
    std::cout << "Decode " << decoded << " packets took " << dec_ns << " ns ("
              << (decoded == 0 ? 0 : dec_ns / static_cast<long long>(decoded)) << " ns/packet)\n";
    return 0;
}
