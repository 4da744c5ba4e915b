// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace reel::disk {

namespace {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOSPC:
        case EDQUOT:
            return make_error_code(DiskErrc::disk_full);
        case EACCES:
        case EPERM:
        case EROFS:
            return make_error_code(DiskErrc::access_denied);
        case ENOENT:
        case ENOTDIR:
            return make_error_code(DiskErrc::invalid_path);
        default:
            return make_error_code(fallback);
    }
}

} // namespace

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_))
    , bytes_written_(other.bytes_written_)
    , closed_(other.closed_.exchange(true, std::memory_order_acq_rel)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
        bytes_written_ = other.bytes_written_;
        closed_.store(other.closed_.exchange(true, std::memory_order_acq_rel),
                      std::memory_order_release);
    }
    return *this;
}

std::error_code FileWriter::open_append(std::string_view path) noexcept {
    if (!closed_.load(std::memory_order_acquire)) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    path_ = std::string(path);
    bytes_written_ = 0;

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return from_errno(errno, DiskErrc::open_failed);
    }

    fd_ = fd;
    closed_.store(false, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* p = static_cast<const char*>(data);
    std::size_t left = size;
    while (left > 0) {
        ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_error);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
        bytes_written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already closed
    }

    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// Filesystem helpers
//=============================================================================

std::error_code ensure_parent_dir(const std::filesystem::path& target) noexcept {
    std::error_code ec;
    auto parent = target.parent_path();
    if (parent.empty()) {
        return {};  // Relative file in the working directory
    }

    std::filesystem::create_directories(parent, ec);
    if (std::filesystem::is_directory(parent, ec)) {
        return {};
    }
    return make_error_code(DiskErrc::create_dir_failed);
}

std::uint64_t file_size_or_zero(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::error_code remove_file(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return make_error_code(DiskErrc::delete_failed);
    }
    return {};
}

} // namespace reel::disk
