#pragma once

#include <cstdint>

namespace persist {

// Failure taxonomy shared by the codecs, the storage backends and the merge
// engine. EndOfStream is the clean exhaustion signal of a record stream and is
// never reported as a failure.
enum class ReplayStatus : std::uint8_t {
    Ok = 0,
    EndOfStream,
    TruncatedInput,
    MalformedVarint,
    MalformedRecord,
    EntryNotFound,
    IoError,
    MetadataFormatError,
    WriteSessionActive,
    InvalidArgument,
};

inline const char* status_name(ReplayStatus s) noexcept {
    switch (s) {
    case ReplayStatus::Ok: return "Ok";
    case ReplayStatus::EndOfStream: return "EndOfStream";
    case ReplayStatus::TruncatedInput: return "TruncatedInput";
    case ReplayStatus::MalformedVarint: return "MalformedVarint";
    case ReplayStatus::MalformedRecord: return "MalformedRecord";
    case ReplayStatus::EntryNotFound: return "EntryNotFound";
    case ReplayStatus::IoError: return "IoError";
    case ReplayStatus::MetadataFormatError: return "MetadataFormatError";
    case ReplayStatus::WriteSessionActive: return "WriteSessionActive";
    case ReplayStatus::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

inline bool is_failure(ReplayStatus s) noexcept {
    return s != ReplayStatus::Ok && s != ReplayStatus::EndOfStream;
}

} // namespace persist
