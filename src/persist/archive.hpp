#pragma once

#include <memory>
#include <string_view>

#include "persist/entry_stream.hpp"
#include "persist/replay_status.hpp"

namespace persist {

inline constexpr std::string_view recording_entry_name = "recording.tmcpr";
inline constexpr std::string_view metadata_entry_name = "metaData.json";

// zlib levels: -1 selects the library default, 0..9 trade speed for size.
inline constexpr int default_compression_level = -1;
inline constexpr int min_compression_level = -1;
inline constexpr int max_compression_level = 9;

struct StorageResult {
    ReplayStatus status{ReplayStatus::Ok};
    int error_code{0};

    bool ok() const noexcept { return status == ReplayStatus::Ok; }
};

// Named-entry read capability of a storage backend.
class IArchiveReader {
public:
    virtual ~IArchiveReader() = default;
    virtual StorageResult open_entry_for_read(std::string_view name,
                                              std::unique_ptr<IEntrySource>& out) noexcept = 0;
};

// Named-entry write capability of a storage backend.
//
// `compression_level` applies to this write session only and is ignored by
// backends that store entries uncompressed.
//
// Archive-backed writers are sequential: the sink returned for one entry must
// be closed before the next entry is opened, otherwise WriteSessionActive is
// returned. finish() completes the container; no entry can be opened after it.
class IArchiveWriter {
public:
    virtual ~IArchiveWriter() = default;
    virtual StorageResult open_entry_for_write(std::string_view name,
                                               int compression_level,
                                               std::unique_ptr<IEntrySink>& out) noexcept = 0;
    virtual StorageResult finish() noexcept = 0;
};

} // namespace persist
