// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/chunk.hpp>
#include <hubfetch/core/config.hpp>
#include <hubfetch/core/error.hpp>
#include <hubfetch/core/remote.hpp>
#include <hubfetch/core/transfer_worker.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace hubfetch::core {

// Job state machine
enum class JobState : std::uint8_t {
    planning,     // Resolving metadata, loading the ledger
    downloading,  // Chunks in the pool
    verifying,    // Hashing the assembled file
    complete,     // Promoted to its final path
    failed,       // Terminal, work files kept
    cancelled     // Stopped on request, work files kept
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

// Read-only view derived from chunk statuses
struct ProgressSnapshot {
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};
    std::uint32_t active_workers{0};
    std::string current_file;
    std::uint32_t chunks_done{0};
    std::uint32_t chunks_total{0};

    [[nodiscard]] double percent() const noexcept {
        if (bytes_total == 0) return 100.0;
        return static_cast<double>(bytes_done) * 100.0 / static_cast<double>(bytes_total);
    }
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

// One file's download from planning to finalization
struct TransferJob {
    RemoteFileDescriptor file;
    std::vector<ChunkSpec> chunks;
    std::filesystem::path temp_path;
    std::filesystem::path ledger_path;
    std::filesystem::path final_path;
    JobState state{JobState::planning};
    bool resumed{false};

    [[nodiscard]] ProgressSnapshot snapshot(std::uint32_t active_workers = 0) const;
};

// What happened to one file
struct JobOutcome {
    std::string repo_id;
    std::string path;
    JobState state{JobState::planning};
    std::error_code error;
    std::optional<ChunkFailure> chunk_failure;
    std::filesystem::path final_path;
    std::filesystem::path temp_path;        // Kept on failure and cancellation
    std::uint64_t bytes{0};
    bool skipped{false};                    // Final file was already in place

    [[nodiscard]] bool ok() const noexcept { return state == JobState::complete; }
};

// Where a job keeps its .part and .ledger files
struct WorkPaths {
    std::filesystem::path temp;
    std::filesystem::path ledger;
};

[[nodiscard]] WorkPaths work_paths(const std::filesystem::path& destination_root,
                                   const RemoteFileDescriptor& file);

// Top-level orchestrator for single files
class TransferManager {
public:
    // `workers` overrides config.max_concurrency (0 keeps it)
    TransferManager(const TransferConfig& config,
                    MetadataResolver& resolver,
                    RangeFetcher& fetcher,
                    std::uint32_t workers = 0);

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Resolve `path` in `repo_id` and download it to <destination_root>/<path>
    [[nodiscard]] JobOutcome download_file(const std::string& repo_id,
                                           const std::string& path,
                                           std::stop_token stop = {});

    // Download an already resolved file to `final_path`
    [[nodiscard]] JobOutcome download(const RemoteFileDescriptor& file,
                                      const std::filesystem::path& final_path,
                                      std::stop_token stop = {});

    // Called on chunk completion, at most once per progress_interval
    // (the final snapshot always goes through). Worker threads call it
    // concurrently and without any manager lock held.
    void progress_callback(ProgressCallback cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::uint32_t workers() const noexcept { return workers_; }

private:
    // Planning: ledger, temporary file and chunk list
    [[nodiscard]] std::error_code plan(TransferJob& job,
                                       std::unique_ptr<ResumeLedger>& ledger,
                                       disk::FileWriter& writer);

    // Verifying and promotion
    [[nodiscard]] std::error_code finalize(TransferJob& job,
                                           ResumeLedger& ledger,
                                           std::stop_token stop);

    void emit(const ProgressSnapshot& snapshot, bool force);

    TransferConfig config_;
    MetadataResolver& resolver_;
    RangeFetcher& fetcher_;
    std::uint32_t workers_;

    ProgressCallback callback_;
    std::mutex callback_mutex_;
    std::chrono::steady_clock::time_point last_emit_{};
};

} // namespace hubfetch::core
