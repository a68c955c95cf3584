#include "core/packet_filter.hpp"

namespace core {

PacketFilterMask::PacketFilterMask(bool default_admit, bool admit_unknown) noexcept
    : admit_unknown_(admit_unknown) {
    table_.fill(default_admit);
}

PacketFilterBuilder& PacketFilterBuilder::include(std::int32_t id) noexcept {
    if (id >= 0 && static_cast<std::size_t>(id) < PacketFilterMask::table_size) {
        mask_.table_[static_cast<std::size_t>(id)] = true;
    }
    return *this;
}

PacketFilterBuilder& PacketFilterBuilder::exclude(std::int32_t id) noexcept {
    if (id >= 0 && static_cast<std::size_t>(id) < PacketFilterMask::table_size) {
        mask_.table_[static_cast<std::size_t>(id)] = false;
    }
    return *this;
}

PacketFilterBuilder& PacketFilterBuilder::include(std::span<const std::uint8_t> ids) noexcept {
    for (const auto id : ids) {
        include(static_cast<std::int32_t>(id));
    }
    return *this;
}

PacketFilterBuilder& PacketFilterBuilder::exclude(std::span<const std::uint8_t> ids) noexcept {
    for (const auto id : ids) {
        exclude(static_cast<std::int32_t>(id));
    }
    return *this;
}

PacketFilterMask make_filter_mask(std::span<const std::uint8_t> include_ids,
                                  std::span<const std::uint8_t> exclude_ids,
                                  bool admit_unknown) noexcept {
    PacketFilterBuilder builder(include_ids.empty(), admit_unknown);
    builder.exclude(exclude_ids);
    builder.include(include_ids);
    return builder.build();
}

} // namespace core
