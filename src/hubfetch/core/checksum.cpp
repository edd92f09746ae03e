// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/checksum.hpp>
#include <hubfetch/core/config.hpp>
#include <hubfetch/disk/error.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <new>
#include <vector>

namespace hubfetch::core {

namespace {

const EVP_MD* evp_for(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::git_sha1: return EVP_sha1();
        case DigestAlgorithm::sha256:
        default:                        return EVP_sha256();
    }
}

} // namespace

//=============================================================================
// Hasher
//=============================================================================

struct Hasher::Impl {
    EVP_MD_CTX* ctx{nullptr};
    DigestAlgorithm algorithm;

    explicit Impl(DigestAlgorithm algo) : algorithm(algo) {
        ctx = EVP_MD_CTX_new();
        if (!ctx || EVP_DigestInit_ex(ctx, evp_for(algo), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            throw std::bad_alloc();
        }
    }

    ~Impl() { EVP_MD_CTX_free(ctx); }
};

Hasher::Hasher(DigestAlgorithm algorithm)
    : impl_(std::make_unique<Impl>(algorithm)) {}

Hasher::~Hasher() = default;
Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

void Hasher::begin_blob(std::uint64_t size) {
    if (impl_->algorithm != DigestAlgorithm::git_sha1) return;

    // "blob <size>\0"
    std::string header = "blob " + std::to_string(size);
    header.push_back('\0');
    update(header.data(), header.size());
}

void Hasher::update(const void* data, std::size_t size) {
    EVP_DigestUpdate(impl_->ctx, data, size);
}

std::string Hasher::finish() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(impl_->ctx, md, &len);

    static constexpr char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += HEX[md[i] >> 4];
        hex += HEX[md[i] & 0x0F];
    }
    return hex;
}

//=============================================================================
// ChecksumVerifier
//=============================================================================

std::expected<std::string, std::error_code>
ChecksumVerifier::compute(const std::filesystem::path& path, DigestAlgorithm algorithm) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    Hasher hasher(algorithm);
    hasher.begin_blob(size);

    std::vector<char> buffer(HASH_BUFFER_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = file.gcount();
        if (got > 0) {
            hasher.update(buffer.data(), static_cast<std::size_t>(got));
        }
    }
    if (file.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    return hasher.finish();
}

std::error_code ChecksumVerifier::verify(const std::filesystem::path& path, const Digest& expected) {
    auto actual = compute(path, expected.algorithm);
    if (!actual) {
        return actual.error();
    }

    if (!matches(*actual, expected.hex)) {
        spdlog::warn("Digest mismatch for {}: expected {} {}, got {}",
                     path.string(), to_string(expected.algorithm), expected.hex, *actual);
        return make_error_code(TransferErrc::integrity_mismatch);
    }
    return {};
}

std::string ChecksumVerifier::digest_of(std::string_view data, DigestAlgorithm algorithm) {
    Hasher hasher(algorithm);
    hasher.begin_blob(data.size());
    hasher.update(data.data(), data.size());
    return hasher.finish();
}

bool ChecksumVerifier::matches(std::string_view actual_hex, std::string_view expected_hex) noexcept {
    return std::ranges::equal(actual_hex, expected_hex, [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace hubfetch::core
