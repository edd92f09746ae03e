// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/transfer_worker.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <random>

namespace hubfetch::core {

namespace {

// Sleep for `delay` unless a stop is requested first; true when stopped
bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    return cv.wait_for(lock, stop, delay, [] { return false; }) || stop.stop_requested();
}

} // namespace

//=============================================================================
// RetryPolicy
//=============================================================================

RetryPolicy RetryPolicy::from_config(const TransferConfig& config) noexcept {
    RetryPolicy policy;
    policy.max_attempts = config.retry_limit;
    policy.initial_delay = config.backoff_initial;
    policy.max_delay = config.backoff_max;
    return policy;
}

std::chrono::milliseconds RetryPolicy::delay_after(std::uint32_t attempt) const {
    const auto exponent = attempt == 0 ? 0.0 : static_cast<double>(attempt - 1);
    const double base = static_cast<double>(initial_delay.count()) * std::pow(backoff_factor, exponent);
    const double capped = std::min(base, static_cast<double>(max_delay.count()));

    auto delay = static_cast<std::int64_t>(capped);
    if (jitter && delay > 0) {
        // Up to +25%, still bounded by max_delay
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<std::int64_t> dist(0, delay / 4);
        delay = std::min<std::int64_t>(delay + dist(rng), max_delay.count());
    }
    return std::chrono::milliseconds{delay};
}

//=============================================================================
// TransferWorker
//=============================================================================

TransferWorker::TransferWorker(RangeFetcher& fetcher,
                               const RemoteFileDescriptor& file,
                               disk::FileWriter& writer,
                               ResumeLedger& ledger,
                               RetryPolicy policy) noexcept
    : fetcher_(fetcher)
    , file_(file)
    , writer_(writer)
    , ledger_(ledger)
    , policy_(policy) {}

std::error_code TransferWorker::attempt(const ChunkSpec& chunk) const {
    RangeRequest request;
    request.file = &file_;
    request.start = chunk.offset;
    request.length = chunk.length;
    request.whole_object = !file_.accepts_ranges;

    std::uint64_t received = 0;
    std::error_code sink_error;

    auto sink = [&](const std::byte* data, std::size_t size) -> std::error_code {
        if (received + size > chunk.length) {
            sink_error = make_error_code(TransferErrc::invalid_range);
            return sink_error;
        }
        if (auto ec = writer_.write(chunk.offset + received, data, size)) {
            sink_error = ec;
            return ec;
        }
        received += size;
        return {};
    };

    auto ec = fetcher_.fetch(request, sink);

    // The sink's own verdict wins over however the fetcher reported the abort
    if (sink_error) {
        return sink_error;
    }
    if (ec) {
        return ec;
    }
    if (received < chunk.length) {
        return make_error_code(TransferErrc::short_body);
    }
    return {};
}

std::expected<void, ChunkFailure>
TransferWorker::run(const ChunkSpec& chunk, std::stop_token stop) const {
    ChunkFailure failure;
    failure.file_id = chunk.file_id;
    failure.index = chunk.index;

    const auto max_attempts = std::max<std::uint32_t>(policy_.max_attempts, 1);

    for (std::uint32_t attempt_no = 1; attempt_no <= max_attempts; ++attempt_no) {
        failure.attempts = attempt_no;

        spdlog::debug("{} chunk {}: attempt {} [{}, {})",
                      file_.path, chunk.index, attempt_no, chunk.offset, chunk.end());

        auto ec = attempt(chunk);
        if (!ec) {
            // Durable data first, then the ledger record
            if (auto flush_ec = writer_.flush()) {
                failure.cause = flush_ec;
                return std::unexpected(failure);
            }
            if (auto ledger_ec = ledger_.record_done(chunk.index)) {
                failure.cause = ledger_ec;
                return std::unexpected(failure);
            }
            spdlog::debug("{} chunk {}: done", file_.path, chunk.index);
            return {};
        }

        failure.cause = ec;

        if (!is_transient(ec)) {
            spdlog::warn("{} chunk {}: {} (not retried)", file_.path, chunk.index, ec.message());
            return std::unexpected(failure);
        }

        if (attempt_no == max_attempts) {
            break;
        }

        auto delay = policy_.delay_after(attempt_no);
        spdlog::warn("{} chunk {}: {}, retry {}/{} in {} ms",
                     file_.path, chunk.index, ec.message(),
                     attempt_no + 1, max_attempts, delay.count());

        if (interruptible_sleep(delay, stop)) {
            failure.cause = make_error_code(TransferErrc::cancelled);
            return std::unexpected(failure);
        }
    }

    spdlog::warn("{} chunk {}: giving up after {} attempts: {}",
                 file_.path, chunk.index, failure.attempts, failure.cause.message());
    return std::unexpected(failure);
}

} // namespace hubfetch::core
