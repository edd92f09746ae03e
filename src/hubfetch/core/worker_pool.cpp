// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/worker_pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <thread>

namespace hubfetch::core {

WorkerPool::WorkerPool(std::uint32_t workers) noexcept
    : workers_(workers == 0 ? 1 : workers) {}

PoolResult WorkerPool::run(std::vector<ChunkSpec>& chunks,
                           const TransferWorker& worker,
                           std::stop_token stop,
                           const ProgressHook& on_chunk_done) {
    return run(chunks,
               [&worker](const ChunkSpec& chunk, std::stop_token st) { return worker.run(chunk, st); },
               stop, on_chunk_done);
}

PoolResult WorkerPool::run(std::vector<ChunkSpec>& chunks,
                           const ChunkTask& task,
                           std::stop_token stop,
                           const ProgressHook& on_chunk_done) {
    std::mutex mutex;
    std::deque<std::size_t> queue;
    PoolResult result;
    PoolProgress progress;
    std::uint32_t active = 0;
    peak_ = 0;

    progress.chunks_total = static_cast<std::uint32_t>(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].status == ChunkStatus::done) {
            ++progress.chunks_done;
            progress.bytes_done += chunks[i].length;
        } else {
            chunks[i].status = ChunkStatus::pending;
            queue.push_back(i);
        }
    }

    if (queue.empty()) {
        return result;
    }

    auto drain = [&] {
        for (;;) {
            std::size_t slot = 0;
            ChunkSpec chunk;
            {
                std::lock_guard lock(mutex);
                if (queue.empty() || result.failure || stop.stop_requested()) {
                    return;
                }
                slot = queue.front();
                queue.pop_front();
                chunks[slot].status = ChunkStatus::in_flight;
                chunk = chunks[slot];
                ++active;
                peak_ = std::max(peak_, active);
            }

            auto outcome = task(chunk, stop);

            PoolProgress snapshot;
            {
                std::lock_guard lock(mutex);
                --active;
                if (outcome) {
                    chunks[slot].status = ChunkStatus::done;
                    ++result.completed;
                    ++progress.chunks_done;
                    progress.bytes_done += chunk.length;
                } else if (outcome.error().cause == TransferErrc::cancelled) {
                    // Gave up between attempts; resumable later
                    chunks[slot].status = ChunkStatus::pending;
                } else {
                    chunks[slot].status = ChunkStatus::failed;
                    if (!result.failure) {
                        result.failure = outcome.error();
                    }
                }
                progress.active_workers = active;
                snapshot = progress;
            }

            if (outcome && on_chunk_done) {
                on_chunk_done(snapshot);
            }
        }
    };

    const auto thread_count = std::min<std::size_t>(workers_, queue.size());
    spdlog::debug("dispatching {} chunks on {} workers", queue.size(), thread_count);
    {
        std::vector<std::jthread> threads;
        threads.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back(drain);
        }
    }   // jthreads join here

    if (!result.failure && stop.stop_requested()) {
        result.cancelled = std::any_of(chunks.begin(), chunks.end(),
            [](const ChunkSpec& c) { return c.status != ChunkStatus::done; });
    }
    return result;
}

} // namespace hubfetch::core
