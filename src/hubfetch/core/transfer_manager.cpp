// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/transfer_manager.hpp>
#include <hubfetch/core/checksum.hpp>
#include <hubfetch/core/resume_ledger.hpp>
#include <hubfetch/core/worker_pool.hpp>
#include <hubfetch/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <limits>

namespace hubfetch::core {

namespace {

// Hub paths are relative and must stay inside the destination
bool is_safe_relative(const std::string& path) {
    std::filesystem::path p(path);
    if (path.empty() || p.is_absolute() || p.has_root_name()) {
        return false;
    }
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::planning:    return "planning";
        case JobState::downloading: return "downloading";
        case JobState::verifying:   return "verifying";
        case JobState::complete:    return "complete";
        case JobState::failed:      return "failed";
        case JobState::cancelled:   return "cancelled";
        default:                    return "unknown";
    }
}

ProgressSnapshot TransferJob::snapshot(std::uint32_t active_workers) const {
    ProgressSnapshot snap;
    snap.bytes_total = file.size;
    snap.bytes_done = ChunkPlanner::done_bytes(chunks);
    snap.active_workers = active_workers;
    snap.current_file = file.path;
    snap.chunks_total = static_cast<std::uint32_t>(chunks.size());
    for (const auto& chunk : chunks) {
        if (chunk.status == ChunkStatus::done) ++snap.chunks_done;
    }
    return snap;
}

WorkPaths work_paths(const std::filesystem::path& destination_root,
                     const RemoteFileDescriptor& file) {
    auto dir = destination_root / WORK_DIR_NAME;
    auto key = file.file_key();
    return {dir / (key + ".part"), dir / (key + ".ledger")};
}

//=============================================================================
// TransferManager
//=============================================================================

TransferManager::TransferManager(const TransferConfig& config,
                                 MetadataResolver& resolver,
                                 RangeFetcher& fetcher,
                                 std::uint32_t workers)
    : config_(config)
    , resolver_(resolver)
    , fetcher_(fetcher)
    , workers_(workers == 0 ? config.max_concurrency : workers) {}

JobOutcome TransferManager::download_file(const std::string& repo_id,
                                          const std::string& path,
                                          std::stop_token stop) {
    JobOutcome outcome;
    outcome.repo_id = repo_id;
    outcome.path = path;

    if (auto ec = config_.validate()) {
        outcome.state = JobState::failed;
        outcome.error = ec;
        return outcome;
    }

    auto resolved = resolver_.resolve(repo_id, path);
    if (!resolved) {
        spdlog::error("{}/{}: metadata lookup failed: {}", repo_id, path, resolved.error().message());
        outcome.state = JobState::failed;
        outcome.error = resolved.error();
        return outcome;
    }

    return download(*resolved, std::filesystem::path(config_.destination_root_path) / path, stop);
}

JobOutcome TransferManager::download(const RemoteFileDescriptor& file,
                                     const std::filesystem::path& final_path,
                                     std::stop_token stop) {
    TransferJob job;
    job.file = file;
    job.final_path = final_path;

    JobOutcome outcome;
    outcome.repo_id = file.repo_id;
    outcome.path = file.path;
    outcome.final_path = final_path;

    auto finish = [&](JobState state, std::error_code ec) {
        job.state = state;
        outcome.state = state;
        outcome.error = ec;
        outcome.bytes = ChunkPlanner::done_bytes(job.chunks);
        if (state == JobState::complete) {
            outcome.bytes = file.size;
            outcome.temp_path.clear();
        }

        auto snap = job.snapshot();
        if (state == JobState::complete) {
            snap.bytes_done = file.size;
        }
        emit(snap, true);

        switch (state) {
            case JobState::complete:
                spdlog::info("{}: complete ({} bytes){}", file.path, file.size,
                             outcome.skipped ? ", already present" : "");
                break;
            case JobState::cancelled:
                spdlog::info("{}: cancelled, {} of {} bytes kept for resume",
                             file.path, outcome.bytes, file.size);
                break;
            default:
                spdlog::warn("{}: failed: {}", file.path, ec.message());
                break;
        }
        return outcome;
    };

    // Planning
    if (auto ec = config_.validate()) {
        return finish(JobState::failed, ec);
    }
    if (!is_safe_relative(file.path)) {
        spdlog::error("{}: refusing path outside the destination", file.path);
        return finish(JobState::failed, make_error_code(TransferErrc::metadata_error));
    }
    if (file.size > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return finish(JobState::failed, make_error_code(TransferErrc::invalid_size));
    }

    std::error_code fs_ec;
    if (std::filesystem::is_regular_file(final_path, fs_ec) &&
        std::filesystem::file_size(final_path, fs_ec) == file.size && !fs_ec) {
        outcome.skipped = true;
        return finish(JobState::complete, {});
    }

    spdlog::info("{}: starting download of {} ({} bytes)", file.repo_id, file.path, file.size);

    std::unique_ptr<ResumeLedger> ledger;
    disk::FileWriter writer;
    if (auto ec = plan(job, ledger, writer)) {
        return finish(JobState::failed, ec);
    }
    outcome.temp_path = job.temp_path;

    // Downloading
    job.state = JobState::downloading;
    TransferWorker worker(fetcher_, job.file, writer, *ledger, RetryPolicy::from_config(config_));
    WorkerPool pool(workers_);

    auto result = pool.run(job.chunks, worker, stop, [&](const PoolProgress& p) {
        ProgressSnapshot snap;
        snap.bytes_done = p.bytes_done;
        snap.bytes_total = file.size;
        snap.active_workers = p.active_workers;
        snap.current_file = file.path;
        snap.chunks_done = p.chunks_done;
        snap.chunks_total = p.chunks_total;
        emit(snap, false);
    });

    writer.close();

    if (result.failure) {
        outcome.chunk_failure = result.failure;
        spdlog::warn("{}: chunk {} failed after {} attempt(s): {}",
                     file.path, result.failure->index, result.failure->attempts,
                     result.failure->cause.message());
        return finish(JobState::failed, make_error_code(TransferErrc::chunk_failed));
    }
    if (result.cancelled) {
        return finish(JobState::cancelled, make_error_code(TransferErrc::cancelled));
    }

    // Verifying
    if (auto ec = finalize(job, *ledger, stop)) {
        if (ec == TransferErrc::cancelled) {
            return finish(JobState::cancelled, ec);
        }
        return finish(JobState::failed, ec);
    }
    return finish(JobState::complete, {});
}

std::error_code TransferManager::plan(TransferJob& job,
                                      std::unique_ptr<ResumeLedger>& ledger,
                                      disk::FileWriter& writer) {
    const auto& file = job.file;
    auto paths = work_paths(config_.destination_root_path, file);
    job.temp_path = paths.temp;
    job.ledger_path = paths.ledger;

    ChunkPlanner planner(config_.chunk_size_bytes);
    const auto size = static_cast<std::int64_t>(file.size);
    const bool ranged = file.accepts_ranges;
    const auto count = ranged ? planner.chunk_count(file.size) : (file.size > 0 ? 1 : 0);
    if (count > MAX_CHUNKS) {
        spdlog::error("{}: {} chunks of {} bytes exceed the ledger index range",
                      file.path, count, config_.chunk_size_bytes);
        return make_error_code(TransferErrc::invalid_size);
    }

    LedgerIdentity identity;
    identity.repo_id = file.repo_id;
    identity.path = file.path;
    identity.revision = file.revision;
    identity.file_size = file.size;
    identity.chunk_size = ranged ? config_.chunk_size_bytes : size;
    identity.chunk_count = static_cast<std::uint32_t>(count);
    identity.digest = file.digest;

    std::error_code fs_ec;
    const bool intact = std::filesystem::is_regular_file(job.temp_path, fs_ec) &&
                        std::filesystem::file_size(job.temp_path, fs_ec) == file.size && !fs_ec;

    auto opened = ResumeLedger::open(job.ledger_path, identity, intact);
    if (!opened) {
        return opened.error();
    }
    ledger = std::move(*opened);
    job.resumed = ledger->resumed();

    // A fresh ledger means the partial file is discarded too
    if (auto ec = writer.open(job.temp_path, file.size, !job.resumed)) {
        return ec;
    }

    auto chunks = ranged
        ? planner.plan(file.file_key(), size, ledger->completed())
        : planner.plan_single(file.file_key(), size, ledger->is_done(0));
    if (!chunks) {
        return chunks.error();
    }
    job.chunks = std::move(*chunks);

    if (!ranged) {
        spdlog::info("{}: server does not accept ranges, single-stream download", file.path);
    }
    if (job.resumed) {
        spdlog::info("{}: resuming, {}/{} chunks already done",
                     file.path, ledger->completed().size(), job.chunks.size());
    }
    return {};
}

std::error_code TransferManager::finalize(TransferJob& job,
                                          ResumeLedger& ledger,
                                          std::stop_token stop) {
    job.state = JobState::verifying;

    if (config_.verify_digests && job.file.digest) {
        auto ec = ChecksumVerifier::verify(job.temp_path, *job.file.digest);
        if (ec) {
            if (ec == TransferErrc::integrity_mismatch) {
                if (auto mark_ec = ledger.record_integrity_failure()) {
                    spdlog::warn("{}: could not mark ledger: {}", job.file.path, mark_ec.message());
                }
                spdlog::warn("{}: keeping {} for inspection", job.file.path, job.temp_path.string());
            }
            return ec;
        }
    }

    if (stop.stop_requested()) {
        return make_error_code(TransferErrc::cancelled);
    }

    if (auto ec = disk::promote(job.temp_path, job.final_path)) {
        return ec;
    }

    // The file is already in place; a leftover ledger is only stale state
    if (auto ec = ledger.remove()) {
        spdlog::warn("{}: could not remove ledger: {}", job.file.path, ec.message());
    }
    return {};
}

void TransferManager::emit(const ProgressSnapshot& snapshot, bool force) {
    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (!callback_) {
            return;
        }

        auto now = std::chrono::steady_clock::now();
        const auto interval = config_.progress_interval;
        if (!force && interval.count() > 0 &&
            last_emit_ != std::chrono::steady_clock::time_point{} &&
            now - last_emit_ < interval) {
            return;
        }
        last_emit_ = now;
        cb = callback_;
    }
    // Invoked unlocked; workers may report concurrently
    cb(snapshot);
}

} // namespace hubfetch::core
