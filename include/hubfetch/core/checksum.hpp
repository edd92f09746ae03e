// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/remote.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace hubfetch::core {

// Incremental digest over a byte stream (OpenSSL EVP)
class Hasher {
public:
    explicit Hasher(DigestAlgorithm algorithm);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    // For git_sha1 the object header needs the size before any content
    void begin_blob(std::uint64_t size);

    void update(const void* data, std::size_t size);

    // Lowercase hex; the hasher cannot be reused afterwards
    [[nodiscard]] std::string finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class ChecksumVerifier {
public:
    // Digest of a whole file
    [[nodiscard]] static std::expected<std::string, std::error_code>
    compute(const std::filesystem::path& path, DigestAlgorithm algorithm);

    // {} on match, integrity_mismatch otherwise
    [[nodiscard]] static std::error_code
    verify(const std::filesystem::path& path, const Digest& expected);

    [[nodiscard]] static std::string digest_of(std::string_view data, DigestAlgorithm algorithm);

    // Case-insensitive hex comparison
    [[nodiscard]] static bool matches(std::string_view actual_hex, std::string_view expected_hex) noexcept;
};

} // namespace hubfetch::core
