// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/chunk.hpp>
#include <hubfetch/core/config.hpp>
#include <hubfetch/core/error.hpp>
#include <hubfetch/core/remote.hpp>
#include <hubfetch/core/resume_ledger.hpp>
#include <hubfetch/disk/file_writer.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>

namespace hubfetch::core {

// Why a chunk gave up
struct ChunkFailure {
    std::string file_id;
    std::uint32_t index{0};
    std::uint32_t attempts{0};
    std::error_code cause;
};

// Exponential backoff with jitter between attempts
struct RetryPolicy {
    std::uint32_t max_attempts{DEFAULT_RETRY_LIMIT};
    std::chrono::milliseconds initial_delay{BACKOFF_INITIAL};
    std::chrono::milliseconds max_delay{BACKOFF_MAX};
    double backoff_factor{2.0};
    bool jitter{true};

    [[nodiscard]] static RetryPolicy from_config(const TransferConfig& config) noexcept;

    // Delay before attempt `attempt + 1`, given `attempt` (1-based) just failed.
    // Never above max_delay.
    [[nodiscard]] std::chrono::milliseconds delay_after(std::uint32_t attempt) const;
};

// Fetches one chunk, writes it at its offset and records it in the ledger.
// One instance is shared by all threads of a pool.
class TransferWorker {
public:
    TransferWorker(RangeFetcher& fetcher,
                   const RemoteFileDescriptor& file,
                   disk::FileWriter& writer,
                   ResumeLedger& ledger,
                   RetryPolicy policy) noexcept;

    // Download `chunk` until it is done or out of attempts. A stop request is
    // honoured between attempts, never inside one; the failure cause is then
    // `cancelled`.
    [[nodiscard]] std::expected<void, ChunkFailure>
    run(const ChunkSpec& chunk, std::stop_token stop) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    // One request; {} when exactly chunk.length bytes were written
    [[nodiscard]] std::error_code attempt(const ChunkSpec& chunk) const;

    RangeFetcher& fetcher_;
    const RemoteFileDescriptor& file_;
    disk::FileWriter& writer_;
    ResumeLedger& ledger_;
    RetryPolicy policy_;
};

} // namespace hubfetch::core
