// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/disk/file_writer.hpp>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hubfetch::disk {

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(const std::filesystem::path& path,
                                 std::uint64_t size,
                                 bool truncate) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error_code(DiskErrc::invalid_path);
        }
    }

    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }

    // Sparse allocation of the declared size; chunks fill it in any order
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        int err = errno;
        ::close(fd);
        return errno_to_error_code(err, DiskErrc::write_error);
    }

    path_ = path;
    fd_.store(fd, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd, p, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        p += n;
        offset += static_cast<std::uint64_t>(n);
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (::fdatasync(fd) != 0) {
        return errno_to_error_code(errno, DiskErrc::sync_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    // Guard against double-close
    int fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}

//=============================================================================
// promote
//=============================================================================

std::error_code promote(const std::filesystem::path& from,
                        const std::filesystem::path& to) noexcept {
    std::error_code ec;
    if (to.has_parent_path()) {
        std::filesystem::create_directories(to.parent_path(), ec);
        if (ec) {
            return make_error_code(DiskErrc::invalid_path);
        }
    }

    if (std::rename(from.c_str(), to.c_str()) != 0) {
        return errno_to_error_code(errno, DiskErrc::rename_error);
    }

    // Persist the rename itself
    auto dir = to.has_parent_path() ? to.parent_path() : std::filesystem::path(".");
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) {
        int rc = ::fsync(dfd);
        int err = errno;
        ::close(dfd);
        if (rc != 0) {
            return errno_to_error_code(err, DiskErrc::sync_error);
        }
    }
    return {};
}

} // namespace hubfetch::disk
