// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/repository_sync.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fnmatch.h>
#include <thread>

namespace hubfetch::core {

std::string_view to_string(SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::complete:  return "complete";
        case SyncStatus::partial:   return "partial";
        case SyncStatus::cancelled: return "cancelled";
        default:                    return "unknown";
    }
}

std::size_t SyncResult::count(JobState state) const noexcept {
    return static_cast<std::size_t>(std::count_if(files.begin(), files.end(),
        [state](const JobOutcome& o) { return o.state == state; }));
}

bool matches_patterns(std::string_view path,
                      const std::vector<std::string>& include,
                      const std::vector<std::string>& exclude) {
    const std::string p(path);
    auto hit = [&p](const std::string& pattern) {
        return ::fnmatch(pattern.c_str(), p.c_str(), 0) == 0;
    };

    if (!include.empty() && std::none_of(include.begin(), include.end(), hit)) {
        return false;
    }
    return std::none_of(exclude.begin(), exclude.end(), hit);
}

//=============================================================================
// RepositorySync
//=============================================================================

RepositorySync::RepositorySync(const TransferConfig& config,
                               MetadataResolver& resolver,
                               RangeFetcher& fetcher)
    : config_(config)
    , resolver_(resolver)
    , fetcher_(fetcher) {}

SyncResult RepositorySync::sync(const std::string& repo_id, std::stop_token stop) {
    SyncResult result;
    result.repo_id = repo_id;
    result.status = SyncStatus::partial;

    if (auto ec = config_.validate()) {
        result.error = ec;
        return result;
    }

    auto listed = resolver_.list(repo_id);
    if (!listed) {
        spdlog::error("{}: cannot list repository: {}", repo_id, listed.error().message());
        result.error = listed.error();
        return result;
    }

    Manifest selected;
    selected.repo_id = listed->repo_id;
    selected.revision = listed->revision;
    for (auto& file : listed->files) {
        if (matches_patterns(file.path, config_.include_patterns, config_.exclude_patterns)) {
            selected.files.push_back(std::move(file));
        }
    }
    spdlog::info("{}@{}: {} of {} files selected ({} bytes)",
                 repo_id, selected.revision, selected.files.size(),
                 listed->files.size(), selected.total_bytes());

    return sync(selected, std::filesystem::path(config_.destination_root_path) / repo_id, stop);
}

SyncResult RepositorySync::sync(const Manifest& manifest,
                                const std::filesystem::path& target_dir,
                                std::stop_token stop) {
    SyncResult result;
    result.repo_id = manifest.repo_id;
    result.revision = manifest.revision;
    result.target_dir = target_dir;

    const auto total = manifest.files.size();

    // Files never reached stay cancelled
    result.files.resize(total);
    for (std::size_t i = 0; i < total; ++i) {
        auto& o = result.files[i];
        o.repo_id = manifest.files[i].repo_id;
        o.path = manifest.files[i].path;
        o.final_path = target_dir / manifest.files[i].path;
        o.state = JobState::cancelled;
        o.error = make_error_code(TransferErrc::cancelled);
    }

    if (auto ec = config_.validate()) {
        result.error = ec;
        for (auto& o : result.files) {
            o.state = JobState::failed;
            o.error = ec;
        }
        result.status = SyncStatus::partial;
        return result;
    }

    std::mutex mutex;
    std::size_t next = 0;
    RepositoryProgress progress;
    progress.bytes_total = manifest.total_bytes();
    progress.files_total = static_cast<std::uint32_t>(total);
    std::vector<std::uint64_t> file_bytes(total, 0);
    std::vector<std::uint32_t> file_workers(total, 0);

    // The callback runs unlocked, so it may be slow or replace itself
    auto publish = [&](const RepositoryProgress& snap) {
        RepositoryProgressCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            cb = callback_;
        }
        if (cb) cb(snap);
    };

    auto drain = [&] {
        for (;;) {
            std::size_t index = 0;
            {
                std::lock_guard lock(mutex);
                if (next >= total || stop.stop_requested()) {
                    return;
                }
                index = next++;
            }

            const auto& file = manifest.files[index];
            TransferManager manager(config_, resolver_, fetcher_, config_.workers_per_file());
            manager.progress_callback([&, index](const ProgressSnapshot& snap) {
                RepositoryProgress copy;
                {
                    std::lock_guard lock(mutex);
                    file_bytes[index] = snap.bytes_done;
                    file_workers[index] = snap.active_workers;
                    progress.bytes_done = 0;
                    progress.active_workers = 0;
                    for (std::size_t i = 0; i < total; ++i) {
                        progress.bytes_done += file_bytes[i];
                        progress.active_workers += file_workers[i];
                    }
                    progress.current_file = snap.current_file;
                    copy = progress;
                }
                publish(copy);
            });

            auto outcome = manager.download(file, target_dir / file.path, stop);

            {
                std::lock_guard lock(mutex);
                file_workers[index] = 0;
                if (outcome.ok()) {
                    ++progress.files_done;
                }
                result.files[index] = outcome;
            }

            std::function<void(const JobOutcome&)> on_file;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                on_file = file_callback_;
            }
            if (on_file) on_file(outcome);
        }
    };

    const auto lanes = std::min<std::size_t>(std::max<std::uint32_t>(config_.parallel_files, 1), total);
    if (lanes > 0) {
        spdlog::debug("{}: {} file(s) at a time, {} worker(s) each",
                      manifest.repo_id, lanes, config_.workers_per_file());
        std::vector<std::jthread> threads;
        threads.reserve(lanes);
        for (std::size_t i = 0; i < lanes; ++i) {
            threads.emplace_back(drain);
        }
    }

    const auto failed = result.count(JobState::failed);
    const auto cancelled = result.count(JobState::cancelled);
    if (cancelled > 0) {
        result.status = SyncStatus::cancelled;
    } else if (failed > 0) {
        result.status = SyncStatus::partial;
    } else {
        result.status = SyncStatus::complete;
    }

    spdlog::info("{}: sync {} ({} complete, {} failed, {} cancelled)",
                 manifest.repo_id, to_string(result.status),
                 result.count(JobState::complete), failed, cancelled);

    for (const auto& o : result.files) {
        if (o.state == JobState::failed) {
            spdlog::warn("{}: {}", o.path, o.error.message());
        }
    }
    return result;
}

} // namespace hubfetch::core
