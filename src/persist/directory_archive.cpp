#include "persist/directory_archive.hpp"

#include <cerrno>
#include <system_error>

namespace persist {

DirectoryArchive::DirectoryArchive(std::filesystem::path root)
    : root_(std::move(root)) {}

bool DirectoryArchive::exists(std::string_view name) const noexcept {
    std::error_code ec;
    return std::filesystem::is_regular_file(root_ / std::filesystem::path(name), ec);
}

StorageResult DirectoryArchive::open_entry_for_read(std::string_view name,
                                                    std::unique_ptr<IEntrySource>& out) noexcept {
    const auto path = root_ / std::filesystem::path(name);
    auto source = std::make_unique<FileEntrySource>();
    IoResult r = source->open(path.string());
    if (!r.ok) {
        if (r.error_code == ENOENT) {
            return {ReplayStatus::EntryNotFound, r.error_code};
        }
        return {ReplayStatus::IoError, r.error_code};
    }
    out = std::move(source);
    return {};
}

StorageResult DirectoryArchive::open_entry_for_write(std::string_view name,
                                                     int /*compression_level*/,
                                                     std::unique_ptr<IEntrySink>& out) noexcept {
    const auto path = root_ / std::filesystem::path(name);
    auto sink = std::make_unique<PosixFileSink>();
    IoResult r = sink->open(path.string());
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    out = std::move(sink);
    return {};
}

} // namespace persist
