#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <vector>

#include "core/packet.hpp"

namespace api {

struct PacketStatsRow {
    std::int32_t id{0};
    std::uint64_t count{0};
    std::uint64_t total_size{0};

    std::uint64_t average_size() const noexcept { return count == 0 ? 0 : total_size / count; }
};

// Per-identifier packet counts and payload sizes. Safe to feed from several
// merges running on different threads.
class PacketStats {
public:
    void record(const core::Packet& packet);

    // Most frequent first; ties broken by the larger id.
    std::vector<PacketStatsRow> rows() const;

    std::uint64_t total_packets() const;
    std::uint64_t total_bytes() const;

    void render_table(std::ostream& out) const;

private:
    mutable std::mutex mtx_;
    std::map<std::int32_t, PacketStatsRow> by_id_;
};

} // namespace api
