// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/disk/error.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace hubfetch::disk {

// Positional writer shared by all workers of one job.
// Writes go through pwrite(2) at absolute offsets, so concurrent writes to
// disjoint ranges need no lock and a repeated write of a range is idempotent.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Open (creating parent directories) and size the file to `size` bytes.
    // With `truncate` any existing content is discarded first.
    [[nodiscard]] std::error_code open(const std::filesystem::path& path,
                                       std::uint64_t size,
                                       bool truncate) noexcept;

    // Write exactly `size` bytes at `offset` (thread-safe)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Make written data durable
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_.load(std::memory_order_acquire) >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::atomic<int> fd_{-1};
    std::filesystem::path path_;
};

// Atomically move `from` over `to` and persist the directory entry
[[nodiscard]] std::error_code promote(const std::filesystem::path& from,
                                      const std::filesystem::path& to) noexcept;

} // namespace hubfetch::disk
