#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/uio.h>

namespace persist {

struct IoResult {
    bool ok{false};
    int error_code{0};
};

// Readable byte stream of one named entry. A successful read of zero bytes
// marks the end of the entry.
class IEntrySource {
public:
    virtual ~IEntrySource() = default;
    virtual IoResult read(std::byte* dst, std::size_t len, std::size_t& bytes_read) noexcept = 0;
};

// Writable byte stream of one named entry. close() flushes and completes the
// entry; for archive-backed sinks it also ends the write session.
class IEntrySink {
public:
    virtual ~IEntrySink() = default;
    virtual IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept = 0;
    virtual IoResult close() noexcept = 0;
    virtual std::uint64_t current_size() const noexcept = 0;
    virtual bool is_open() const noexcept = 0;
};

// Reads until `len` bytes arrived or the entry ended; `got` reports how many.
IoResult read_fully(IEntrySource& src, std::byte* dst, std::size_t len, std::size_t& got) noexcept;

// Retries short writes and EINTR until every iovec is consumed.
IoResult writev_fully(IEntrySink& sink, struct iovec* iov, int iovcnt) noexcept;

IoResult write_all(IEntrySink& sink, const void* data, std::size_t len) noexcept;

class FileEntrySource : public IEntrySource {
public:
    FileEntrySource();
    ~FileEntrySource() override;
    FileEntrySource(const FileEntrySource&) = delete;
    FileEntrySource& operator=(const FileEntrySource&) = delete;

    IoResult open(const std::string& path) noexcept;
    void close() noexcept;
    IoResult read(std::byte* dst, std::size_t len, std::size_t& bytes_read) noexcept override;
    bool is_open() const noexcept { return fd_ >= 0; }

private:
    int fd_{-1};
    std::vector<std::byte> buffer_;
    std::size_t pos_{0};
    std::size_t filled_{0};
};

// Create/truncate file sink with a userspace write buffer.
class PosixFileSink : public IEntrySink {
public:
    static constexpr std::size_t buffer_capacity = 64 * 1024;

    PosixFileSink();
    ~PosixFileSink() override;
    PosixFileSink(const PosixFileSink&) = delete;
    PosixFileSink& operator=(const PosixFileSink&) = delete;

    IoResult open(const std::string& path) noexcept;
    IoResult close() noexcept override;
    IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept override;
    std::uint64_t current_size() const noexcept override { return size_bytes_; }
    bool is_open() const noexcept override;

private:
    IoResult flush() noexcept;

    int fd_{-1};
    std::uint64_t size_bytes_{0};
    std::vector<std::byte> buffer_;
};

class MemoryEntrySource : public IEntrySource {
public:
    explicit MemoryEntrySource(std::vector<std::byte> data) : data_(std::move(data)) {}

    IoResult read(std::byte* dst, std::size_t len, std::size_t& bytes_read) noexcept override;

private:
    std::vector<std::byte> data_;
    std::size_t pos_{0};
};

class MemoryEntrySink : public IEntrySink {
public:
    IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept override;
    IoResult close() noexcept override;
    std::uint64_t current_size() const noexcept override { return data_.size(); }
    bool is_open() const noexcept override { return open_; }

    const std::vector<std::byte>& data() const noexcept { return data_; }

private:
    std::vector<std::byte> data_;
    bool open_{true};
};

} // namespace persist
