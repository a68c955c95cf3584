#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace core {

// One record of a recording stream. `time` is the offset from the start of
// the source stream; only the merge engine rewrites it.
class Packet {
public:
    Packet() = default;
    Packet(std::uint32_t time, std::int32_t id, std::vector<std::byte> data)
        : time_(time), id_(id), data_(std::move(data)) {}

    std::uint32_t time() const noexcept { return time_; }
    std::int32_t id() const noexcept { return id_; }
    const std::vector<std::byte>& data() const noexcept { return data_; }

    // Re-bases the timestamp onto a merged timeline.
    void rebase_time(std::uint32_t time) noexcept { time_ = time; }

    bool operator==(const Packet&) const = default;

private:
    std::uint32_t time_{0};
    std::int32_t id_{0};
    std::vector<std::byte> data_;
};

} // namespace core
