#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "util/uuid.hpp"

namespace core {

// Session-level description stored next to a recording stream. Field names
// of the on-disk document are fixed by existing archives (see metadata_codec).
struct SessionMetadata {
    bool singleplayer{false};
    std::string server_name;
    std::string custom_server_name;
    std::uint64_t duration{0};
    std::uint64_t date{0};
    std::string mc_version;
    std::string file_format;
    std::uint32_t file_format_version{0};
    std::uint32_t protocol{0};
    std::string generator;
    std::int32_t self_id{-1};
    std::set<util::Uuid> players;

    bool operator==(const SessionMetadata&) const = default;
};

inline constexpr std::string_view merged_file_format = "MCPR";
inline constexpr std::uint32_t merged_file_format_version = 14;
inline constexpr std::string_view merged_generator = "replaystitch";

// Set union; participants are never removed.
inline void merge_players(SessionMetadata& into, const SessionMetadata& from) {
    into.players.insert(from.players.begin(), from.players.end());
}

} // namespace core
