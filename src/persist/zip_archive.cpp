#include "persist/zip_archive.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <limits>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "util/log.hpp"

namespace persist {

namespace {

constexpr std::size_t kInflateChunk = 64 * 1024;
constexpr std::size_t kDeflateChunk = 64 * 1024;
constexpr std::size_t kMaxZlibFeed = 1u << 30;

IoResult pread_exact(int fd, std::byte* dst, std::size_t len, std::uint64_t offset) noexcept {
    std::size_t done = 0;
    while (done < len) {
        ssize_t ret = ::pread(fd, dst + done, len - done, static_cast<off_t>(offset + done));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return {false, errno};
        }
        if (ret == 0) {
            return {false, EBADMSG};
        }
        done += static_cast<std::size_t>(ret);
    }
    return {true, 0};
}

class ZipEntrySource : public IEntrySource {
public:
    ZipEntrySource(int fd, ZipEntryInfo info, std::uint64_t data_offset)
        : fd_(fd)
        , info_(std::move(info))
        , next_in_offset_(data_offset)
        , remaining_in_(info_.compressed_size) {}

    ~ZipEntrySource() override {
        if (inflating_) {
            inflateEnd(&zs_);
        }
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    ZipEntrySource(const ZipEntrySource&) = delete;
    ZipEntrySource& operator=(const ZipEntrySource&) = delete;

    IoResult init() noexcept {
        if (info_.method == zip_method_stored) {
            return {true, 0};
        }
        if (info_.method != zip_method_deflate) {
            return {false, ENOTSUP};
        }
        if (inflateInit2(&zs_, -MAX_WBITS) != Z_OK) {
            return {false, ENOMEM};
        }
        inflating_ = true;
        input_.resize(kInflateChunk);
        return {true, 0};
    }

    IoResult read(std::byte* dst, std::size_t len, std::size_t& bytes_read) noexcept override {
        bytes_read = 0;
        if (done_ || len == 0) {
            return {true, 0};
        }
        IoResult r = info_.method == zip_method_stored ? read_stored(dst, len, bytes_read)
                                                       : read_deflated(dst, len, bytes_read);
        if (!r.ok) {
            return r;
        }
        crc_ = crc32(crc_, reinterpret_cast<const Bytef*>(dst), static_cast<uInt>(bytes_read));
        produced_ += bytes_read;
        if (produced_ > info_.uncompressed_size) {
            return {false, EBADMSG};
        }
        if (done_ && (crc_ != info_.crc32 || produced_ != info_.uncompressed_size)) {
            LOG_SLOW_ERROR("zip entry %s failed integrity check", info_.name.c_str());
            return {false, EBADMSG};
        }
        return {true, 0};
    }

private:
    IoResult read_stored(std::byte* dst, std::size_t len, std::size_t& bytes_read) noexcept {
        const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(len, remaining_in_));
        if (n > 0) {
            IoResult r = pread_exact(fd_, dst, n, next_in_offset_);
            if (!r.ok) {
                return r;
            }
        }
        next_in_offset_ += n;
        remaining_in_ -= n;
        bytes_read = n;
        if (remaining_in_ == 0) {
            done_ = true;
        }
        return {true, 0};
    }

    IoResult read_deflated(std::byte* dst, std::size_t len, std::size_t& bytes_read) noexcept {
        const std::size_t want = std::min(len, kMaxZlibFeed);
        zs_.next_out = reinterpret_cast<Bytef*>(dst);
        zs_.avail_out = static_cast<uInt>(want);
        while (zs_.avail_out == want) {
            if (zs_.avail_in == 0 && remaining_in_ > 0) {
                const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(input_.size(), remaining_in_));
                IoResult r = pread_exact(fd_, input_.data(), n, next_in_offset_);
                if (!r.ok) {
                    return r;
                }
                next_in_offset_ += n;
                remaining_in_ -= n;
                zs_.next_in = reinterpret_cast<Bytef*>(input_.data());
                zs_.avail_in = static_cast<uInt>(n);
            }
            const int ret = inflate(&zs_, Z_NO_FLUSH);
            if (ret == Z_STREAM_END) {
                done_ = true;
                break;
            }
            if (ret == Z_BUF_ERROR && zs_.avail_in == 0 && remaining_in_ == 0) {
                return {false, EBADMSG}; // compressed data ended early
            }
            if (ret == Z_MEM_ERROR) {
                return {false, ENOMEM};
            }
            if (ret != Z_OK && ret != Z_BUF_ERROR) {
                return {false, EBADMSG};
            }
        }
        bytes_read = want - zs_.avail_out;
        return {true, 0};
    }

    int fd_{-1};
    ZipEntryInfo info_;
    z_stream zs_{};
    bool inflating_{false};
    bool done_{false};
    std::vector<std::byte> input_;
    std::uint64_t next_in_offset_{0};
    std::uint64_t remaining_in_{0};
    std::uint64_t produced_{0};
    uLong crc_{0};
};

} // namespace

class ZipEntrySink : public IEntrySink {
public:
    ZipEntrySink(ZipArchiveWriter* writer, std::string name, std::uint32_t local_header_offset)
        : writer_(writer) {
        info_.name = std::move(name);
        info_.flags = zip_flag_data_descriptor;
        info_.method = zip_method_deflate;
        info_.local_header_offset = local_header_offset;
    }

    ~ZipEntrySink() override {
        if (open_) {
            const IoResult r = close();
            if (!r.ok) {
                LOG_SLOW_ERROR("zip entry %s close on destruction failed: errno=%d", info_.name.c_str(), r.error_code);
            }
        }
    }

    ZipEntrySink(const ZipEntrySink&) = delete;
    ZipEntrySink& operator=(const ZipEntrySink&) = delete;

    IoResult start(int compression_level) noexcept {
        std::array<std::byte, zip_local_header_size> header{};
        encode_local_header(info_.name, info_.method, header);
        IoResult r = writer_->write_raw(header.data(), header.size());
        if (!r.ok) {
            return r;
        }
        r = writer_->write_raw(info_.name.data(), info_.name.size());
        if (!r.ok) {
            return r;
        }
        if (deflateInit2(&zs_, compression_level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            return {false, ENOMEM};
        }
        output_.resize(kDeflateChunk);
        open_ = true;
        return {true, 0};
    }

    IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept override {
        bytes_written = 0;
        if (!open_) {
            return {false, error_code_ != 0 ? error_code_ : EBADF};
        }
        for (int i = 0; i < iovcnt; ++i) {
            const auto* p = static_cast<const Bytef*>(iov[i].iov_base);
            std::size_t remaining = iov[i].iov_len;
            while (remaining > 0) {
                const std::size_t n = std::min(remaining, kMaxZlibFeed);
                crc_ = crc32(crc_, p, static_cast<uInt>(n));
                zs_.next_in = const_cast<Bytef*>(p);
                zs_.avail_in = static_cast<uInt>(n);
                IoResult r = pump(Z_NO_FLUSH);
                if (!r.ok) {
                    return fail(r);
                }
                p += n;
                remaining -= n;
                bytes_written += n;
                uncompressed_ += n;
            }
        }
        return {true, 0};
    }

    IoResult close() noexcept override {
        if (!open_) {
            return {error_code_ == 0, error_code_};
        }
        zs_.next_in = nullptr;
        zs_.avail_in = 0;
        IoResult r = pump(Z_FINISH);
        if (!r.ok) {
            return fail(r);
        }
        if (uncompressed_ > zip_max_offset || compressed_ > zip_max_offset) {
            return fail({false, EFBIG});
        }
        open_ = false;
        deflateEnd(&zs_);
        info_.crc32 = static_cast<std::uint32_t>(crc_);
        info_.compressed_size = static_cast<std::uint32_t>(compressed_);
        info_.uncompressed_size = static_cast<std::uint32_t>(uncompressed_);
        std::array<std::byte, zip_data_descriptor_size> descriptor{};
        encode_data_descriptor(info_, descriptor);
        r = writer_->write_raw(descriptor.data(), descriptor.size());
        if (!r.ok) {
            error_code_ = r.error_code;
            writer_->abort_session();
            return r;
        }
        return writer_->end_session(std::move(info_));
    }

    std::uint64_t current_size() const noexcept override { return uncompressed_; }
    bool is_open() const noexcept override { return open_; }

private:
    // The entry is dropped from the central directory and the writer is free
    // for finish(); later calls on this sink report the same error.
    IoResult fail(IoResult r) noexcept {
        open_ = false;
        deflateEnd(&zs_);
        error_code_ = r.error_code != 0 ? r.error_code : EIO;
        writer_->abort_session();
        return r;
    }

    IoResult pump(int flush) noexcept {
        while (true) {
            zs_.next_out = reinterpret_cast<Bytef*>(output_.data());
            zs_.avail_out = static_cast<uInt>(output_.size());
            const int ret = deflate(&zs_, flush);
            if (ret == Z_STREAM_ERROR) {
                return {false, EINVAL};
            }
            const std::size_t have = output_.size() - zs_.avail_out;
            if (have > 0) {
                IoResult r = writer_->write_raw(output_.data(), have);
                if (!r.ok) {
                    return r;
                }
                compressed_ += have;
            }
            if (flush == Z_FINISH) {
                if (ret == Z_STREAM_END) {
                    return {true, 0};
                }
            } else if (zs_.avail_in == 0 && zs_.avail_out != 0) {
                return {true, 0};
            }
        }
    }

    ZipArchiveWriter* writer_;
    ZipEntryInfo info_;
    z_stream zs_{};
    std::vector<std::byte> output_;
    uLong crc_{0};
    int error_code_{0};
    std::uint64_t uncompressed_{0};
    std::uint64_t compressed_{0};
    bool open_{false};
};

StorageResult ZipArchiveReader::open(const std::string& path) noexcept {
    entries_.clear();
    opened_ = false;
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return {errno == ENOENT ? ReplayStatus::EntryNotFound : ReplayStatus::IoError, errno};
    }
    struct FdGuard {
        int fd;
        ~FdGuard() { ::close(fd); }
    } guard{fd};

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        return {ReplayStatus::IoError, errno};
    }
    const auto file_size = static_cast<std::uint64_t>(st.st_size);
    if (file_size < zip_eocd_size) {
        return {ReplayStatus::IoError, EBADMSG};
    }
    const std::size_t tail_len = static_cast<std::size_t>(
        std::min<std::uint64_t>(file_size, zip_eocd_size + zip_max_comment_size));
    std::vector<std::byte> tail(tail_len);
    IoResult r = pread_exact(fd, tail.data(), tail.size(), file_size - tail_len);
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    ZipEocd eocd{};
    if (!find_eocd(tail, eocd)) {
        return {ReplayStatus::IoError, EBADMSG};
    }
    if (static_cast<std::uint64_t>(eocd.central_dir_offset) + eocd.central_dir_size > file_size) {
        return {ReplayStatus::IoError, EBADMSG};
    }
    std::vector<std::byte> central(eocd.central_dir_size);
    r = pread_exact(fd, central.data(), central.size(), eocd.central_dir_offset);
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    std::size_t pos = 0;
    entries_.reserve(eocd.entries);
    for (std::uint16_t i = 0; i < eocd.entries; ++i) {
        ZipEntryInfo info;
        std::size_t consumed = 0;
        if (!parse_central_header(std::span<const std::byte>(central).subspan(pos), info, consumed)) {
            entries_.clear();
            return {ReplayStatus::IoError, EBADMSG};
        }
        pos += consumed;
        entries_.push_back(std::move(info));
    }
    path_ = path;
    opened_ = true;
    return {};
}

StorageResult ZipArchiveReader::open_entry_for_read(std::string_view name,
                                                    std::unique_ptr<IEntrySource>& out) noexcept {
    if (!opened_) {
        return {ReplayStatus::IoError, EBADF};
    }
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [&](const ZipEntryInfo& e) { return e.name == name; });
    if (it == entries_.end()) {
        return {ReplayStatus::EntryNotFound, ENOENT};
    }
    if ((it->flags & 0x0001u) != 0) {
        return {ReplayStatus::IoError, ENOTSUP}; // encrypted
    }
    const int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return {ReplayStatus::IoError, errno};
    }
    std::array<std::byte, zip_local_header_size> header{};
    IoResult r = pread_exact(fd, header.data(), header.size(), it->local_header_offset);
    std::size_t data_offset = 0;
    if (!r.ok || !parse_local_header(header, data_offset)) {
        ::close(fd);
        return {ReplayStatus::IoError, r.ok ? EBADMSG : r.error_code};
    }
    auto source = std::make_unique<ZipEntrySource>(fd, *it, it->local_header_offset + data_offset);
    r = source->init();
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    out = std::move(source);
    return {};
}

ZipArchiveWriter::ZipArchiveWriter() = default;

ZipArchiveWriter::~ZipArchiveWriter() {
    if (!finished_ && !session_active_ && file_.is_open()) {
        const StorageResult res = finish();
        if (!res.ok()) {
            LOG_SLOW_ERROR("zip archive finalize on destruction failed: %s", status_name(res.status));
        }
    }
}

StorageResult ZipArchiveWriter::open(const std::string& path) noexcept {
    IoResult r = file_.open(path);
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    offset_ = 0;
    entries_.clear();
    session_active_ = false;
    finished_ = false;
    return {};
}

IoResult ZipArchiveWriter::write_raw(const void* data, std::size_t len) noexcept {
    IoResult r = write_all(file_, data, len);
    if (r.ok) {
        offset_ += len;
    }
    return r;
}

IoResult ZipArchiveWriter::end_session(ZipEntryInfo info) noexcept {
    entries_.push_back(std::move(info));
    session_active_ = false;
    return {true, 0};
}

void ZipArchiveWriter::abort_session() noexcept {
    session_active_ = false;
}

StorageResult ZipArchiveWriter::open_entry_for_write(std::string_view name,
                                                     int compression_level,
                                                     std::unique_ptr<IEntrySink>& out) noexcept {
    if (finished_ || !file_.is_open()) {
        return {ReplayStatus::InvalidArgument, EBADF};
    }
    if (session_active_) {
        return {ReplayStatus::WriteSessionActive, EBUSY};
    }
    if (compression_level < min_compression_level || compression_level > max_compression_level) {
        return {ReplayStatus::InvalidArgument, EINVAL};
    }
    if (name.empty() || name.size() > std::numeric_limits<std::uint16_t>::max()) {
        return {ReplayStatus::InvalidArgument, EINVAL};
    }
    if (entries_.size() >= zip_max_entries || offset_ > zip_max_offset) {
        return {ReplayStatus::IoError, EFBIG};
    }
    auto sink = std::make_unique<ZipEntrySink>(this, std::string(name), static_cast<std::uint32_t>(offset_));
    IoResult r = sink->start(compression_level);
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    session_active_ = true;
    out = std::move(sink);
    return {};
}

StorageResult ZipArchiveWriter::finish() noexcept {
    if (finished_) {
        return {};
    }
    if (session_active_) {
        return {ReplayStatus::WriteSessionActive, EBUSY};
    }
    if (!file_.is_open()) {
        return {ReplayStatus::IoError, EBADF};
    }
    const std::uint64_t central_offset = offset_;
    for (const auto& e : entries_) {
        std::array<std::byte, zip_central_header_size> header{};
        encode_central_header(e, header);
        IoResult r = write_raw(header.data(), header.size());
        if (r.ok) {
            r = write_raw(e.name.data(), e.name.size());
        }
        if (!r.ok) {
            return {ReplayStatus::IoError, r.error_code};
        }
    }
    const std::uint64_t central_size = offset_ - central_offset;
    if (central_offset > zip_max_offset || central_size > zip_max_offset) {
        return {ReplayStatus::IoError, EFBIG};
    }
    ZipEocd eocd{};
    eocd.entries = static_cast<std::uint16_t>(entries_.size());
    eocd.central_dir_size = static_cast<std::uint32_t>(central_size);
    eocd.central_dir_offset = static_cast<std::uint32_t>(central_offset);
    std::array<std::byte, zip_eocd_size> trailer{};
    encode_eocd(eocd, trailer);
    IoResult r = write_raw(trailer.data(), trailer.size());
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    r = file_.close();
    if (!r.ok) {
        return {ReplayStatus::IoError, r.error_code};
    }
    finished_ = true;
    return {};
}

} // namespace persist
