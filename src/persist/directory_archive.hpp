#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include "persist/archive.hpp"

namespace persist {

// Entries map to plain files directly under `root`. Reading and writing may be
// interleaved freely; there is no write-session ordering.
class DirectoryArchive : public IArchiveReader, public IArchiveWriter {
public:
    explicit DirectoryArchive(std::filesystem::path root);

    StorageResult open_entry_for_read(std::string_view name,
                                      std::unique_ptr<IEntrySource>& out) noexcept override;
    StorageResult open_entry_for_write(std::string_view name,
                                       int compression_level,
                                       std::unique_ptr<IEntrySink>& out) noexcept override;
    StorageResult finish() noexcept override { return {}; }

    bool exists(std::string_view name) const noexcept;
    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace persist
