#include "persist/entry_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace persist {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

} // namespace

IoResult read_fully(IEntrySource& src, std::byte* dst, std::size_t len, std::size_t& got) noexcept {
    got = 0;
    while (got < len) {
        std::size_t n = 0;
        IoResult r = src.read(dst + got, len - got, n);
        if (!r.ok) {
            if (r.error_code == EINTR) {
                continue;
            }
            return r;
        }
        if (n == 0) {
            break;
        }
        got += n;
    }
    return {true, 0};
}

IoResult writev_fully(IEntrySink& sink, struct iovec* iov, int iovcnt) noexcept {
    int idx = 0;
    while (idx < iovcnt) {
        if (iov[idx].iov_len == 0) {
            ++idx;
            continue;
        }
        std::size_t bytes_written = 0;
        IoResult r = sink.writev(&iov[idx], iovcnt - idx, bytes_written);
        if (!r.ok) {
            if (r.error_code == EINTR) {
                continue;
            }
            return r;
        }
        if (bytes_written == 0) {
            return {false, EIO};
        }
        std::size_t advance = bytes_written;
        while (advance > 0 && idx < iovcnt) {
            if (advance < iov[idx].iov_len) {
                iov[idx].iov_base = static_cast<char*>(iov[idx].iov_base) + advance;
                iov[idx].iov_len -= advance;
                advance = 0;
            } else {
                advance -= iov[idx].iov_len;
                ++idx;
            }
        }
    }
    return {true, 0};
}

IoResult write_all(IEntrySink& sink, const void* data, std::size_t len) noexcept {
    struct iovec iov {};
    iov.iov_base = const_cast<void*>(data);
    iov.iov_len = len;
    return writev_fully(sink, &iov, 1);
}

FileEntrySource::FileEntrySource() = default;
FileEntrySource::~FileEntrySource() { close(); }

IoResult FileEntrySource::open(const std::string& path) noexcept {
    close();
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return {false, errno};
    }
    fd_ = fd;
    buffer_.resize(kReadChunk);
    pos_ = 0;
    filled_ = 0;
    return {true, 0};
}

void FileEntrySource::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pos_ = 0;
    filled_ = 0;
}

IoResult FileEntrySource::read(std::byte* dst, std::size_t len, std::size_t& bytes_read) noexcept {
    bytes_read = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    if (len == 0) {
        return {true, 0};
    }
    if (pos_ == filled_) {
        ssize_t ret = ::read(fd_, buffer_.data(), buffer_.size());
        if (ret < 0) {
            return {false, errno};
        }
        pos_ = 0;
        filled_ = static_cast<std::size_t>(ret);
        if (filled_ == 0) {
            return {true, 0};
        }
    }
    const std::size_t n = std::min(len, filled_ - pos_);
    std::memcpy(dst, buffer_.data() + pos_, n);
    pos_ += n;
    bytes_read = n;
    return {true, 0};
}

PosixFileSink::PosixFileSink() = default;

PosixFileSink::~PosixFileSink() {
    // Destruction without close() still lands buffered bytes; errors are lost here.
    if (fd_ >= 0) {
        (void)close();
    }
}

IoResult PosixFileSink::open(const std::string& path) noexcept {
    if (fd_ >= 0) {
        IoResult r = close();
        if (!r.ok) {
            return r;
        }
    }
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {false, errno};
    }
    fd_ = fd;
    size_bytes_ = 0;
    buffer_.clear();
    buffer_.reserve(buffer_capacity);
    return {true, 0};
}

IoResult PosixFileSink::flush() noexcept {
    std::size_t off = 0;
    while (off < buffer_.size()) {
        ssize_t ret = ::write(fd_, buffer_.data() + off, buffer_.size() - off);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(off));
            return {false, err};
        }
        off += static_cast<std::size_t>(ret);
    }
    buffer_.clear();
    return {true, 0};
}

IoResult PosixFileSink::close() noexcept {
    if (fd_ < 0) {
        return {true, 0};
    }
    IoResult r = flush();
    if (::close(fd_) != 0 && r.ok) {
        r = {false, errno};
    }
    fd_ = -1;
    buffer_.clear();
    return r;
}

IoResult PosixFileSink::writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept {
    bytes_written = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    for (int i = 0; i < iovcnt; ++i) {
        const auto* p = static_cast<const std::byte*>(iov[i].iov_base);
        std::size_t remaining = iov[i].iov_len;
        while (remaining > 0) {
            if (buffer_.size() == buffer_capacity) {
                IoResult r = flush();
                if (!r.ok) {
                    return r;
                }
            }
            const std::size_t n = std::min(remaining, buffer_capacity - buffer_.size());
            buffer_.insert(buffer_.end(), p, p + n);
            p += n;
            remaining -= n;
            bytes_written += n;
            size_bytes_ += n;
        }
    }
    return {true, 0};
}

bool PosixFileSink::is_open() const noexcept { return fd_ >= 0; }

IoResult MemoryEntrySource::read(std::byte* dst, std::size_t len, std::size_t& bytes_read) noexcept {
    const std::size_t n = std::min(len, data_.size() - pos_);
    if (n > 0) {
        std::memcpy(dst, data_.data() + pos_, n);
    }
    pos_ += n;
    bytes_read = n;
    return {true, 0};
}

IoResult MemoryEntrySink::writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept {
    bytes_written = 0;
    if (!open_) {
        return {false, EBADF};
    }
    for (int i = 0; i < iovcnt; ++i) {
        const auto* p = static_cast<const std::byte*>(iov[i].iov_base);
        data_.insert(data_.end(), p, p + iov[i].iov_len);
        bytes_written += iov[i].iov_len;
    }
    return {true, 0};
}

IoResult MemoryEntrySink::close() noexcept {
    open_ = false;
    return {true, 0};
}

} // namespace persist
