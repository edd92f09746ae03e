// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace hubfetch::core {

constexpr std::uint64_t MAX_CHUNKS = std::numeric_limits<std::uint32_t>::max();

// Chunk state machine
enum class ChunkStatus : std::uint8_t {
    pending,    // Waiting in the queue
    in_flight,  // Owned by a worker
    done,       // Written, flushed and recorded in the ledger
    failed      // Exhausted its attempts
};

[[nodiscard]] std::string_view to_string(ChunkStatus status) noexcept;

// A contiguous byte range of one file
struct ChunkSpec {
    std::string file_id;
    std::uint32_t index{0};
    std::uint64_t offset{0};
    std::uint64_t length{0};
    ChunkStatus status{ChunkStatus::pending};

    [[nodiscard]] std::uint64_t end() const noexcept { return offset + length; }
};

// Splits [0, size) into fixed-size chunks
class ChunkPlanner {
public:
    explicit ChunkPlanner(std::int64_t chunk_size) noexcept : chunk_size_(chunk_size) {}

    // Ordered chunks covering [0, total_size); indices in `done` start as done.
    // invalid_size when total_size < 0 or chunk_size <= 0.
    [[nodiscard]] std::expected<std::vector<ChunkSpec>, std::error_code>
    plan(std::string_view file_id,
         std::int64_t total_size,
         const std::vector<std::uint32_t>& done = {}) const;

    // One chunk for the whole file (servers without range support)
    [[nodiscard]] std::expected<std::vector<ChunkSpec>, std::error_code>
    plan_single(std::string_view file_id,
                std::int64_t total_size,
                bool done = false) const;

    // Number of chunks plan() would produce; plan() rejects counts above MAX_CHUNKS
    [[nodiscard]] std::uint64_t chunk_count(std::uint64_t total_size) const noexcept;

    [[nodiscard]] std::int64_t chunk_size() const noexcept { return chunk_size_; }

    // Indices still to schedule, in order
    [[nodiscard]] static std::vector<std::uint32_t> pending(const std::vector<ChunkSpec>& chunks);

    // Sum of done chunk lengths
    [[nodiscard]] static std::uint64_t done_bytes(const std::vector<ChunkSpec>& chunks) noexcept;

private:
    std::int64_t chunk_size_;
};

} // namespace hubfetch::core
