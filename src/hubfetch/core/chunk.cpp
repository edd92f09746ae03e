// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/chunk.hpp>
#include <algorithm>

namespace hubfetch::core {

std::string_view to_string(ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::pending:   return "pending";
        case ChunkStatus::in_flight: return "in-flight";
        case ChunkStatus::done:      return "done";
        case ChunkStatus::failed:    return "failed";
        default:                     return "unknown";
    }
}

//=============================================================================
// ChunkPlanner
//=============================================================================

std::expected<std::vector<ChunkSpec>, std::error_code>
ChunkPlanner::plan(std::string_view file_id,
                   std::int64_t total_size,
                   const std::vector<std::uint32_t>& done) const {
    if (total_size < 0 || chunk_size_ <= 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_size));
    }

    const auto size = static_cast<std::uint64_t>(total_size);
    const auto step = static_cast<std::uint64_t>(chunk_size_);

    // Chunk indices are 32-bit ledger keys
    const auto count = chunk_count(size);
    if (count > MAX_CHUNKS) {
        return std::unexpected(make_error_code(TransferErrc::invalid_size));
    }

    std::vector<ChunkSpec> chunks;
    chunks.reserve(count);

    std::uint32_t index = 0;
    for (std::uint64_t offset = 0; offset < size; offset += step) {
        ChunkSpec chunk;
        chunk.file_id = std::string(file_id);
        chunk.index = index++;
        chunk.offset = offset;
        chunk.length = std::min(step, size - offset);  // Last chunk gets the remainder
        chunks.push_back(std::move(chunk));
    }

    // Resumed chunks; out-of-range indices are ignored
    for (auto idx : done) {
        if (idx < chunks.size()) {
            chunks[idx].status = ChunkStatus::done;
        }
    }

    return chunks;
}

std::expected<std::vector<ChunkSpec>, std::error_code>
ChunkPlanner::plan_single(std::string_view file_id,
                          std::int64_t total_size,
                          bool done) const {
    if (total_size < 0 || chunk_size_ <= 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_size));
    }

    std::vector<ChunkSpec> chunks;
    if (total_size == 0) {
        return chunks;
    }

    ChunkSpec chunk;
    chunk.file_id = std::string(file_id);
    chunk.length = static_cast<std::uint64_t>(total_size);
    chunk.status = done ? ChunkStatus::done : ChunkStatus::pending;
    chunks.push_back(std::move(chunk));
    return chunks;
}

std::uint64_t ChunkPlanner::chunk_count(std::uint64_t total_size) const noexcept {
    if (chunk_size_ <= 0) return 0;
    const auto step = static_cast<std::uint64_t>(chunk_size_);
    return total_size / step + (total_size % step != 0 ? 1 : 0);
}

std::vector<std::uint32_t> ChunkPlanner::pending(const std::vector<ChunkSpec>& chunks) {
    std::vector<std::uint32_t> result;
    for (const auto& chunk : chunks) {
        if (chunk.status != ChunkStatus::done) {
            result.push_back(chunk.index);
        }
    }
    return result;
}

std::uint64_t ChunkPlanner::done_bytes(const std::vector<ChunkSpec>& chunks) noexcept {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks) {
        if (chunk.status == ChunkStatus::done) {
            total += chunk.length;
        }
    }
    return total;
}

} // namespace hubfetch::core
