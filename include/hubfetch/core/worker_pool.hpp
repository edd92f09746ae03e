// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/chunk.hpp>
#include <hubfetch/core/transfer_worker.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace hubfetch::core {

// Counters taken under the pool lock after each completed chunk
struct PoolProgress {
    std::uint32_t chunks_done{0};
    std::uint32_t chunks_total{0};
    std::uint64_t bytes_done{0};
    std::uint32_t active_workers{0};
};

struct PoolResult {
    std::uint32_t completed{0};             // Chunks finished by this run
    std::optional<ChunkFailure> failure;    // First chunk that failed
    bool cancelled{false};
};

// Bounded set of threads draining one job's chunk queue (FIFO).
// Chunk statuses are only changed here, under the pool lock.
class WorkerPool {
public:
    using ChunkTask = std::function<std::expected<void, ChunkFailure>(const ChunkSpec&, std::stop_token)>;
    using ProgressHook = std::function<void(const PoolProgress&)>;

    explicit WorkerPool(std::uint32_t workers) noexcept;

    // Runs every non-done chunk through `task` with at most workers() in
    // flight. After the first failure or a stop request nothing new is
    // dispatched; chunks already running finish. Chunks that were never
    // dispatched stay pending.
    PoolResult run(std::vector<ChunkSpec>& chunks,
                   const ChunkTask& task,
                   std::stop_token stop,
                   const ProgressHook& on_chunk_done = {});

    // Convenience overload driving a TransferWorker
    PoolResult run(std::vector<ChunkSpec>& chunks,
                   const TransferWorker& worker,
                   std::stop_token stop,
                   const ProgressHook& on_chunk_done = {});

    [[nodiscard]] std::uint32_t workers() const noexcept { return workers_; }

    // Largest number of tasks seen running at once during the last run()
    [[nodiscard]] std::uint32_t peak_concurrency() const noexcept { return peak_; }

private:
    std::uint32_t workers_;
    std::uint32_t peak_{0};
};

} // namespace hubfetch::core
