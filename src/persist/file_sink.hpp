#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/uio.h>

namespace persist {

struct IoResult {
    bool ok{false};
    int error_code{0};
};

// Append-only byte sink behind the journal writer. Tests script failures
// through their own implementation.
class IFileSink {
public:
    virtual ~IFileSink() = default;
    virtual IoResult open(const std::string& path) noexcept = 0;
    virtual void close() noexcept = 0;
    virtual IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept = 0;
    virtual IoResult sync() noexcept = 0;
    virtual std::uint64_t current_size() const noexcept = 0;
    virtual bool is_open() const noexcept = 0;
    virtual const std::string& path() const noexcept = 0;
};

// Appends to a regular file. With sync_new_files the parent directory is
// fsynced after a file is created, so a rotated journal file survives a crash
// together with its name.
class PosixFileSink : public IFileSink {
public:
    explicit PosixFileSink(bool sync_new_files = false) noexcept : sync_new_files_(sync_new_files) {}
    ~PosixFileSink() override;

    PosixFileSink(const PosixFileSink&) = delete;
    PosixFileSink& operator=(const PosixFileSink&) = delete;

    IoResult open(const std::string& path) noexcept override;
    void close() noexcept override;
    IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept override;
    // fdatasync; the journal calls it after each flushed batch.
    IoResult sync() noexcept override;
    std::uint64_t current_size() const noexcept override { return size_bytes_; }
    bool is_open() const noexcept override { return fd_ >= 0; }
    const std::string& path() const noexcept override { return path_; }

private:
    IoResult sync_parent_dir(const std::string& path) noexcept;

    bool sync_new_files_{false};
    int fd_{-1};
    std::uint64_t size_bytes_{0};
    std::string path_;
};

} // namespace persist
