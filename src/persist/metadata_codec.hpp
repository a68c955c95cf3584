#pragma once

#include <string>
#include <string_view>

#include "core/session_metadata.hpp"
#include "persist/archive.hpp"
#include "persist/replay_status.hpp"

namespace persist {

struct MetadataResult {
    ReplayStatus status{ReplayStatus::Ok};
    std::string error;

    bool ok() const noexcept { return status == ReplayStatus::Ok; }
};

// Parses the flat metadata document. All twelve fields are required and none
// may be null; unknown keys are skipped.
bool parse_metadata(std::string_view text, core::SessionMetadata& out, std::string& error);

// Emits a single-line object with the fixed field names; players are written
// in canonical hyphenated form, in set order.
std::string serialize_metadata(const core::SessionMetadata& meta);

// Reads and parses the metadata entry. A missing entry reports EntryNotFound,
// an unparsable document MetadataFormatError.
MetadataResult read_metadata(IArchiveReader& archive, core::SessionMetadata& out);

MetadataResult write_metadata(IArchiveWriter& archive,
                              const core::SessionMetadata& meta,
                              int compression_level = default_compression_level);

} // namespace persist
