// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hubfetch::core {

enum class DigestAlgorithm : std::uint8_t {
    sha256,    // LFS objects
    git_sha1,  // Git blob id of regular repository files
};

struct Digest {
    DigestAlgorithm algorithm{DigestAlgorithm::sha256};
    std::string hex;

    bool operator==(const Digest&) const = default;
};

[[nodiscard]] std::string_view to_string(DigestAlgorithm algorithm) noexcept;
[[nodiscard]] std::optional<DigestAlgorithm> digest_algorithm_from_string(std::string_view name) noexcept;

// Remote file metadata, immutable once resolved
struct RemoteFileDescriptor {
    std::string repo_id;
    std::string path;                 // Relative path inside the repository
    std::uint64_t size{0};
    std::optional<Digest> digest;
    std::string revision;             // Commit or etag the metadata was taken from
    bool accepts_ranges{true};

    // Stable identity of this file, used to name its work files
    [[nodiscard]] std::string file_key() const;
};

// Files of one repository revision
struct Manifest {
    std::string repo_id;
    std::string revision;
    std::vector<RemoteFileDescriptor> files;

    [[nodiscard]] std::uint64_t total_bytes() const noexcept;
};

struct RangeRequest {
    const RemoteFileDescriptor* file{nullptr};
    std::uint64_t start{0};
    std::uint64_t length{0};
    bool whole_object{false};          // Plain GET without a Range header
};

// Receives body bytes in order; a returned error aborts the transfer
using ChunkSink = std::function<std::error_code(const std::byte* data, std::size_t size)>;

// Resolves remote metadata for files and repositories
class MetadataResolver {
public:
    virtual ~MetadataResolver() = default;

    [[nodiscard]] virtual std::expected<RemoteFileDescriptor, std::error_code>
    resolve(const std::string& repo_id, const std::string& path) = 0;

    [[nodiscard]] virtual std::expected<Manifest, std::error_code>
    list(const std::string& repo_id) = 0;
};

// Streams a byte range of a remote file
class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;

    // Must be callable from several threads at once
    [[nodiscard]] virtual std::error_code fetch(const RangeRequest& request,
                                                const ChunkSink& sink) = 0;
};

} // namespace hubfetch::core
