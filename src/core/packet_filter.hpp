#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace core {

// Admit/reject decision per packet identifier. Identifiers 0..255 are looked
// up in the table; anything else (including negatives) follows the single
// unknown-packet policy. Immutable once built.
class PacketFilterMask {
public:
    static constexpr std::size_t table_size = 256;

    PacketFilterMask() noexcept : PacketFilterMask(true, true) {}
    PacketFilterMask(bool default_admit, bool admit_unknown) noexcept;

    bool admits(std::int32_t id) const noexcept {
        if (id >= 0 && static_cast<std::size_t>(id) < table_size) {
            return table_[static_cast<std::size_t>(id)];
        }
        return admit_unknown_;
    }

    bool admit_unknown() const noexcept { return admit_unknown_; }

private:
    friend class PacketFilterBuilder;

    std::array<bool, table_size> table_{};
    bool admit_unknown_{true};
};

// Applies include/exclude operations in call order; the last operation on an
// identifier decides. Ids outside the table are ignored.
class PacketFilterBuilder {
public:
    PacketFilterBuilder(bool default_admit, bool admit_unknown) noexcept
        : mask_(default_admit, admit_unknown) {}

    PacketFilterBuilder& include(std::int32_t id) noexcept;
    PacketFilterBuilder& exclude(std::int32_t id) noexcept;
    PacketFilterBuilder& include(std::span<const std::uint8_t> ids) noexcept;
    PacketFilterBuilder& exclude(std::span<const std::uint8_t> ids) noexcept;

    PacketFilterMask build() const noexcept { return mask_; }

private:
    PacketFilterMask mask_;
};

// Configuration-level construction: everything is admitted by default unless
// an include list is given; excludes are applied before includes so an id
// named in both lists is admitted.
PacketFilterMask make_filter_mask(std::span<const std::uint8_t> include_ids,
                                  std::span<const std::uint8_t> exclude_ids,
                                  bool admit_unknown) noexcept;

} // namespace core
