#include "persist/file_sink.hpp"

#include <cerrno>
#include <new>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace persist {

PosixFileSink::~PosixFileSink() { close(); }

IoResult PosixFileSink::open(const std::string& path) noexcept {
    close();
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {false, errno};
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return {false, err};
    }
    if (sync_new_files_ && st.st_size == 0) {
        const IoResult dir = sync_parent_dir(path);
        if (!dir.ok) {
            ::close(fd);
            return dir;
        }
    }
    fd_ = fd;
    size_bytes_ = static_cast<std::uint64_t>(st.st_size);
    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        path_.clear();
    }
    return {true, 0};
}

void PosixFileSink::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

IoResult PosixFileSink::writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept {
    bytes_written = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    const ssize_t ret = ::writev(fd_, iov, iovcnt);
    if (ret < 0) {
        return {false, errno};
    }
    bytes_written = static_cast<std::size_t>(ret);
    size_bytes_ += static_cast<std::uint64_t>(ret);
    return {true, 0};
}

IoResult PosixFileSink::sync_parent_dir(const std::string& path) noexcept {
    const auto slash = path.find_last_of('/');
    std::string dir;
    try {
        dir = slash == std::string::npos ? std::string(".") : path.substr(0, slash == 0 ? 1 : slash);
    } catch (const std::bad_alloc&) {
        return {false, ENOMEM};
    }
    const int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        return {false, errno};
    }
    const int rc = ::fsync(dfd);
    const int err = errno;
    ::close(dfd);
    if (rc != 0) {
        return {false, err};
    }
    return {true, 0};
}

IoResult PosixFileSink::sync() noexcept {
    if (fd_ < 0) {
        return {false, EBADF};
    }
    if (::fdatasync(fd_) != 0) {
        return {false, errno};
    }
    return {true, 0};
}

} // namespace persist
