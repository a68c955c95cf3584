#include "api/packet_stats.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace api {

void PacketStats::record(const core::Packet& packet) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& row = by_id_[packet.id()];
    row.id = packet.id();
    ++row.count;
    row.total_size += packet.data().size();
}

std::vector<PacketStatsRow> PacketStats::rows() const {
    std::vector<PacketStatsRow> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        out.reserve(by_id_.size());
        for (const auto& [id, row] : by_id_) {
            out.push_back(row);
        }
    }
    std::sort(out.begin(), out.end(), [](const PacketStatsRow& a, const PacketStatsRow& b) {
        if (a.count != b.count) {
            return a.count > b.count;
        }
        return a.id > b.id;
    });
    return out;
}

std::uint64_t PacketStats::total_packets() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::uint64_t total = 0;
    for (const auto& [id, row] : by_id_) {
        total += row.count;
    }
    return total;
}

std::uint64_t PacketStats::total_bytes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::uint64_t total = 0;
    for (const auto& [id, row] : by_id_) {
        total += row.total_size;
    }
    return total;
}

void PacketStats::render_table(std::ostream& out) const {
    char line[96];
    std::snprintf(line, sizeof(line), "%-10s | %12s | %14s | %10s\n", "packet", "count", "total size", "avg size");
    out << line;
    out << std::string(10, '-') << "-+-" << std::string(12, '-') << "-+-"
        << std::string(14, '-') << "-+-" << std::string(10, '-') << '\n';
    for (const auto& row : rows()) {
        char id_text[16];
        if (row.id >= 0 && row.id <= 0xFF) {
            std::snprintf(id_text, sizeof(id_text), "0x%02x", static_cast<unsigned>(row.id));
        } else {
            std::snprintf(id_text, sizeof(id_text), "%d", row.id);
        }
        std::snprintf(line, sizeof(line), "%-10s | %12llu | %14llu | %10llu\n",
                      id_text,
                      static_cast<unsigned long long>(row.count),
                      static_cast<unsigned long long>(row.total_size),
                      static_cast<unsigned long long>(row.average_size()));
        out << line;
    }
}

} // namespace api
