#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace api {

// Clientbound respawn in protocol 767; later protocols renumber it.
inline constexpr std::int32_t default_reset_packet_id = 0x47;
inline constexpr int default_packet_compression_level = 9;

struct MergeConfig {
    std::vector<std::filesystem::path> inputs{};
    std::filesystem::path output{};    // empty = dry run

    std::vector<std::uint8_t> include_ids{};
    std::vector<std::uint8_t> exclude_ids{};
    bool admit_unknown{true};

    int compression_level{default_packet_compression_level};
    std::uint32_t interval{0};         // gap inserted between inputs
    std::int32_t reset_id{default_reset_packet_id};

    std::uint64_t max_packets{0};      // 0 = unlimited
    bool details{false};               // print per-packet stats table
    bool dump{false};
    std::string dump_chunk{};          // action-log chunk entry to dump instead

    bool quiet{false};
    bool verbose{false};
};

// Accepts "2b", "0x2B" or "0X2b". Values above 0xFF are rejected.
std::optional<std::uint8_t> parse_packet_id(std::string_view text) noexcept;

bool validate_merge_config(const MergeConfig& cfg, std::string& error);

// Loads a JSON job file into `cfg`. Only keys present in the file are
// overwritten; unknown keys are an error.
bool load_merge_job(const std::filesystem::path& path, MergeConfig& cfg, std::string& error);
bool parse_merge_job(std::string_view text, MergeConfig& cfg, std::string& error);

} // namespace api
