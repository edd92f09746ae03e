// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/remote.hpp>
#include <hubfetch/core/checksum.hpp>

namespace hubfetch::core {

std::string_view to_string(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::sha256:   return "sha256";
        case DigestAlgorithm::git_sha1: return "git-sha1";
        default:                        return "unknown";
    }
}

std::optional<DigestAlgorithm> digest_algorithm_from_string(std::string_view name) noexcept {
    if (name == "sha256") return DigestAlgorithm::sha256;
    if (name == "git-sha1") return DigestAlgorithm::git_sha1;
    return std::nullopt;
}

std::string RemoteFileDescriptor::file_key() const {
    std::string identity = repo_id;
    identity += '\n';
    identity += path;
    return ChecksumVerifier::digest_of(identity, DigestAlgorithm::sha256).substr(0, 32);
}

std::uint64_t Manifest::total_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
    }
    return total;
}

} // namespace hubfetch::core
