// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/disk/error.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace reel::disk {

// Append-only writer for a transfer target. Owns one file descriptor.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open for append, creating the file if needed. Existing bytes are kept.
    [[nodiscard]] std::error_code open_append(std::string_view path) noexcept;

    // Append the whole buffer (retries short writes)
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush file data to the device
    [[nodiscard]] std::error_code flush() noexcept;

    // Close file. Safe to call any number of times.
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    int fd_{-1};
    std::string path_;
    std::uint64_t bytes_written_{0};
    std::atomic<bool> closed_{true};  // Guard against double-close
};

// Create the parent directory of target (recursively) or confirm it exists
[[nodiscard]] std::error_code ensure_parent_dir(const std::filesystem::path& target) noexcept;

// Size of a regular file, 0 if it does not exist
[[nodiscard]] std::uint64_t file_size_or_zero(const std::filesystem::path& path) noexcept;

// Delete a file. A file that is already gone is not an error.
[[nodiscard]] std::error_code remove_file(const std::filesystem::path& path) noexcept;

} // namespace reel::disk
