// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/config.hpp>
#include <hubfetch/core/remote.hpp>
#include <hubfetch/core/transfer_manager.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace hubfetch::core {

enum class SyncStatus : std::uint8_t {
    complete,   // Every file complete
    partial,    // At least one file failed
    cancelled   // Stopped before every file finished
};

[[nodiscard]] std::string_view to_string(SyncStatus status) noexcept;

// Repository-wide progress, summed over files
struct RepositoryProgress {
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};
    std::uint32_t files_done{0};
    std::uint32_t files_total{0};
    std::uint32_t active_workers{0};
    std::string current_file;           // Most recently reporting file

    [[nodiscard]] double percent() const noexcept {
        if (bytes_total == 0) return 100.0;
        return static_cast<double>(bytes_done) * 100.0 / static_cast<double>(bytes_total);
    }
};

using RepositoryProgressCallback = std::function<void(const RepositoryProgress&)>;

struct SyncResult {
    SyncStatus status{SyncStatus::complete};
    std::string repo_id;
    std::string revision;
    std::filesystem::path target_dir;
    std::vector<JobOutcome> files;      // Manifest order
    std::error_code error;              // Set when the manifest itself failed

    [[nodiscard]] std::size_t count(JobState state) const noexcept;
};

// True when `path` passes the include (empty = all) and exclude globs
[[nodiscard]] bool matches_patterns(std::string_view path,
                                    const std::vector<std::string>& include,
                                    const std::vector<std::string>& exclude);

// Downloads every file of a manifest, a few files at a time
class RepositorySync {
public:
    RepositorySync(const TransferConfig& config,
                   MetadataResolver& resolver,
                   RangeFetcher& fetcher);

    RepositorySync(const RepositorySync&) = delete;
    RepositorySync& operator=(const RepositorySync&) = delete;

    // List `repo_id` and download it to <destination_root>/<repo_id>
    [[nodiscard]] SyncResult sync(const std::string& repo_id, std::stop_token stop = {});

    // Download the (already filtered) manifest into `target_dir`
    [[nodiscard]] SyncResult sync(const Manifest& manifest,
                                  const std::filesystem::path& target_dir,
                                  std::stop_token stop = {});

    // Called from file lanes concurrently, no lock held
    void progress_callback(RepositoryProgressCallback cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    // Per-file outcome as soon as each file finishes
    void file_callback(std::function<void(const JobOutcome&)> cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        file_callback_ = std::move(cb);
    }

private:
    TransferConfig config_;
    MetadataResolver& resolver_;
    RangeFetcher& fetcher_;

    RepositoryProgressCallback callback_;
    std::function<void(const JobOutcome&)> file_callback_;
    std::mutex callback_mutex_;
};

} // namespace hubfetch::core
