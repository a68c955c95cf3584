#pragma once

#include <filesystem>
#include <memory>

#include "persist/archive.hpp"

namespace persist {

enum class BackendKind { Directory, ZipArchive };

// Output selection: a known archive extension (.mcpr, .zip) picks the ZIP
// backend, anything else is treated as a directory that is created on demand.
BackendKind output_backend_kind(const std::filesystem::path& path) noexcept;

// Input selection: an existing directory opens as a directory backend, a
// regular file opens as a ZIP archive regardless of extension.
StorageResult open_archive_reader(const std::filesystem::path& path,
                                  std::unique_ptr<IArchiveReader>& out) noexcept;

StorageResult open_archive_writer(const std::filesystem::path& path,
                                  std::unique_ptr<IArchiveWriter>& out) noexcept;

} // namespace persist
