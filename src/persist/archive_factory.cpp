#include "persist/archive_factory.hpp"

#include <cerrno>
#include <system_error>

#include "persist/directory_archive.hpp"
#include "persist/zip_archive.hpp"
#include "persist/zip_format.hpp"

namespace persist {

BackendKind output_backend_kind(const std::filesystem::path& path) noexcept {
    return has_archive_extension(path.filename().string()) ? BackendKind::ZipArchive : BackendKind::Directory;
}

StorageResult open_archive_reader(const std::filesystem::path& path,
                                  std::unique_ptr<IArchiveReader>& out) noexcept {
    std::error_code ec;
    const auto st = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(st)) {
        return {ReplayStatus::EntryNotFound, ENOENT};
    }
    if (std::filesystem::is_directory(st)) {
        out = std::make_unique<DirectoryArchive>(path);
        return {};
    }
    auto zip = std::make_unique<ZipArchiveReader>();
    const StorageResult res = zip->open(path.string());
    if (!res.ok()) {
        return res;
    }
    out = std::move(zip);
    return {};
}

StorageResult open_archive_writer(const std::filesystem::path& path,
                                  std::unique_ptr<IArchiveWriter>& out) noexcept {
    if (output_backend_kind(path) == BackendKind::ZipArchive) {
        auto zip = std::make_unique<ZipArchiveWriter>();
        const StorageResult res = zip->open(path.string());
        if (!res.ok()) {
            return res;
        }
        out = std::move(zip);
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return {ReplayStatus::IoError, ec.value()};
    }
    if (!std::filesystem::is_directory(path, ec)) {
        return {ReplayStatus::IoError, ENOTDIR};
    }
    out = std::make_unique<DirectoryArchive>(path);
    return {};
}

} // namespace persist
