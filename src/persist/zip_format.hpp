#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "persist/endianness.hpp"

namespace persist {

// ZIP container records used by ZipArchiveWriter and ZipArchiveReader. All
// integers are little-endian. The writer always emits:
//   per entry:  [local file header][deflate data][data descriptor]
//   trailer:    [central directory headers...][end of central directory]
// with general-purpose flag bit 3 set, so the local header carries zero CRC
// and sizes and the data descriptor carries the real values. ZIP64 is not
// supported; archives past the classic 32-bit limits are rejected.
//
// Local file header (30 bytes + name):
//  offset size field
//       0   4   signature 0x04034b50
//       4   2   version needed
//       6   2   flags
//       8   2   method (0 stored, 8 deflate)
//      10   2   dos time
//      12   2   dos date
//      14   4   crc32
//      18   4   compressed size
//      22   4   uncompressed size
//      26   2   name length
//      28   2   extra length
//
// Central directory header (46 bytes + name + extra + comment):
//       0   4   signature 0x02014b50
//       4   2   version made by
//       6   2   version needed
//       8   2   flags
//      10   2   method
//      12   2   dos time
//      14   2   dos date
//      16   4   crc32
//      20   4   compressed size
//      24   4   uncompressed size
//      28   2   name length
//      30   2   extra length
//      32   2   comment length
//      34   2   disk number start
//      36   2   internal attributes
//      38   4   external attributes
//      42   4   local header offset
//
// End of central directory (22 bytes + comment):
//       0   4   signature 0x06054b50
//       4   2   disk number
//       6   2   central directory disk
//       8   2   entries on this disk
//      10   2   total entries
//      12   4   central directory size
//      16   4   central directory offset
//      20   2   comment length

inline constexpr std::uint32_t zip_local_header_sig = 0x04034b50u;
inline constexpr std::uint32_t zip_data_descriptor_sig = 0x08074b50u;
inline constexpr std::uint32_t zip_central_header_sig = 0x02014b50u;
inline constexpr std::uint32_t zip_eocd_sig = 0x06054b50u;

inline constexpr std::size_t zip_local_header_size = 30;
inline constexpr std::size_t zip_data_descriptor_size = 16;
inline constexpr std::size_t zip_central_header_size = 46;
inline constexpr std::size_t zip_eocd_size = 22;
inline constexpr std::size_t zip_max_comment_size = 0xFFFF;

inline constexpr std::uint16_t zip_version = 20;
inline constexpr std::uint16_t zip_flag_data_descriptor = 0x0008;
inline constexpr std::uint16_t zip_method_stored = 0;
inline constexpr std::uint16_t zip_method_deflate = 8;

// Entries are stamped 1980-01-01 00:00 so identical input produces identical archives.
inline constexpr std::uint16_t zip_dos_time = 0;
inline constexpr std::uint16_t zip_dos_date = (0u << 9) | (1u << 5) | 1u;

inline constexpr std::uint64_t zip_max_offset = 0xFFFFFFFFull;
inline constexpr std::size_t zip_max_entries = 0xFFFF;

struct ZipEntryInfo {
    std::string name;
    std::uint16_t flags{0};
    std::uint16_t method{zip_method_deflate};
    std::uint32_t crc32{0};
    std::uint32_t compressed_size{0};
    std::uint32_t uncompressed_size{0};
    std::uint32_t local_header_offset{0};
};

struct ZipEocd {
    std::uint16_t entries{0};
    std::uint32_t central_dir_size{0};
    std::uint32_t central_dir_offset{0};
};

inline void encode_local_header(std::string_view name,
                                std::uint16_t method,
                                std::array<std::byte, zip_local_header_size>& out) noexcept {
    out.fill(std::byte{0});
    std::byte* p = out.data();
    write_u32_le(zip_local_header_sig, p + 0);
    write_u16_le(zip_version, p + 4);
    write_u16_le(zip_flag_data_descriptor, p + 6);
    write_u16_le(method, p + 8);
    write_u16_le(zip_dos_time, p + 10);
    write_u16_le(zip_dos_date, p + 12);
    write_u16_le(static_cast<std::uint16_t>(name.size()), p + 26);
}

inline void encode_data_descriptor(const ZipEntryInfo& info,
                                   std::array<std::byte, zip_data_descriptor_size>& out) noexcept {
    std::byte* p = out.data();
    write_u32_le(zip_data_descriptor_sig, p + 0);
    write_u32_le(info.crc32, p + 4);
    write_u32_le(info.compressed_size, p + 8);
    write_u32_le(info.uncompressed_size, p + 12);
}

inline void encode_central_header(const ZipEntryInfo& info,
                                  std::array<std::byte, zip_central_header_size>& out) noexcept {
    out.fill(std::byte{0});
    std::byte* p = out.data();
    write_u32_le(zip_central_header_sig, p + 0);
    write_u16_le(zip_version, p + 4);
    write_u16_le(zip_version, p + 6);
    write_u16_le(info.flags, p + 8);
    write_u16_le(info.method, p + 10);
    write_u16_le(zip_dos_time, p + 12);
    write_u16_le(zip_dos_date, p + 14);
    write_u32_le(info.crc32, p + 16);
    write_u32_le(info.compressed_size, p + 20);
    write_u32_le(info.uncompressed_size, p + 24);
    write_u16_le(static_cast<std::uint16_t>(info.name.size()), p + 28);
    write_u32_le(info.local_header_offset, p + 42);
}

inline void encode_eocd(const ZipEocd& eocd, std::array<std::byte, zip_eocd_size>& out) noexcept {
    out.fill(std::byte{0});
    std::byte* p = out.data();
    write_u32_le(zip_eocd_sig, p + 0);
    write_u16_le(eocd.entries, p + 8);
    write_u16_le(eocd.entries, p + 10);
    write_u32_le(eocd.central_dir_size, p + 12);
    write_u32_le(eocd.central_dir_offset, p + 16);
}

// Scans backwards for the end-of-central-directory record. `tail` holds the
// last bytes of the file (at most 22 + 65535).
inline bool find_eocd(std::span<const std::byte> tail, ZipEocd& out) noexcept {
    if (tail.size() < zip_eocd_size) {
        return false;
    }
    for (std::size_t pos = tail.size() - zip_eocd_size + 1; pos-- > 0;) {
        const std::byte* p = tail.data() + pos;
        if (read_u32_le(p) != zip_eocd_sig) {
            continue;
        }
        const std::uint16_t comment_len = read_u16_le(p + 20);
        if (pos + zip_eocd_size + comment_len != tail.size()) {
            continue;
        }
        if (read_u16_le(p + 4) != 0 || read_u16_le(p + 6) != 0) {
            return false; // multi-disk archives are not supported
        }
        out.entries = read_u16_le(p + 10);
        out.central_dir_size = read_u32_le(p + 12);
        out.central_dir_offset = read_u32_le(p + 16);
        return true;
    }
    return false;
}

// Parses one central directory header at the front of `data`; `consumed` is
// the full record length including the variable fields.
inline bool parse_central_header(std::span<const std::byte> data,
                                 ZipEntryInfo& out,
                                 std::size_t& consumed) noexcept {
    if (data.size() < zip_central_header_size) {
        return false;
    }
    const std::byte* p = data.data();
    if (read_u32_le(p) != zip_central_header_sig) {
        return false;
    }
    const std::size_t name_len = read_u16_le(p + 28);
    const std::size_t extra_len = read_u16_le(p + 30);
    const std::size_t comment_len = read_u16_le(p + 32);
    const std::size_t total = zip_central_header_size + name_len + extra_len + comment_len;
    if (total > data.size()) {
        return false;
    }
    out.flags = read_u16_le(p + 8);
    out.method = read_u16_le(p + 10);
    out.crc32 = read_u32_le(p + 16);
    out.compressed_size = read_u32_le(p + 20);
    out.uncompressed_size = read_u32_le(p + 24);
    out.local_header_offset = read_u32_le(p + 42);
    out.name.assign(reinterpret_cast<const char*>(p + zip_central_header_size), name_len);
    consumed = total;
    return true;
}

// Returns the offset of entry data relative to the local header start.
inline bool parse_local_header(std::span<const std::byte> header, std::size_t& data_offset) noexcept {
    if (header.size() < zip_local_header_size) {
        return false;
    }
    const std::byte* p = header.data();
    if (read_u32_le(p) != zip_local_header_sig) {
        return false;
    }
    data_offset = zip_local_header_size + read_u16_le(p + 26) + read_u16_le(p + 28);
    return true;
}

inline bool has_archive_extension(std::string_view filename) noexcept {
    auto ends_with_ci = [&](std::string_view suffix) {
        if (filename.size() < suffix.size()) {
            return false;
        }
        const auto tail = filename.substr(filename.size() - suffix.size());
        for (std::size_t i = 0; i < suffix.size(); ++i) {
            char c = tail[i];
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            if (c != suffix[i]) {
                return false;
            }
        }
        return true;
    };
    return ends_with_ci(".mcpr") || ends_with_ci(".zip");
}

} // namespace persist
