#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "persist/archive.hpp"
#include "persist/zip_format.hpp"

namespace persist {

class ZipArchiveReader : public IArchiveReader {
public:
    ZipArchiveReader() = default;

    // Loads the central directory. Corrupt containers report IoError with EBADMSG.
    StorageResult open(const std::string& path) noexcept;

    StorageResult open_entry_for_read(std::string_view name,
                                      std::unique_ptr<IEntrySource>& out) noexcept override;

    const std::vector<ZipEntryInfo>& entries() const noexcept { return entries_; }

private:
    std::string path_;
    std::vector<ZipEntryInfo> entries_;
    bool opened_{false};
};

class ZipEntrySink;

// Sequential-write ZIP container. Each open_entry_for_write() starts a write
// session whose sink must be closed before the next one; sinks hold a pointer
// back to the writer and must not outlive it.
class ZipArchiveWriter : public IArchiveWriter {
public:
    ZipArchiveWriter();
    ~ZipArchiveWriter() override;
    ZipArchiveWriter(const ZipArchiveWriter&) = delete;
    ZipArchiveWriter& operator=(const ZipArchiveWriter&) = delete;

    StorageResult open(const std::string& path) noexcept;

    StorageResult open_entry_for_write(std::string_view name,
                                       int compression_level,
                                       std::unique_ptr<IEntrySink>& out) noexcept override;
    StorageResult finish() noexcept override;

    bool session_active() const noexcept { return session_active_; }
    bool finished() const noexcept { return finished_; }

private:
    friend class ZipEntrySink;

    IoResult write_raw(const void* data, std::size_t len) noexcept;
    IoResult end_session(ZipEntryInfo info) noexcept;
    // Releases the session of a failed entry without recording it.
    void abort_session() noexcept;

    PosixFileSink file_;
    std::uint64_t offset_{0};
    std::vector<ZipEntryInfo> entries_;
    bool session_active_{false};
    bool finished_{false};
};

} // namespace persist
