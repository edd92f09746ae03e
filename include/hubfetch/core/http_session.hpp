// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/config.hpp>
#include <hubfetch/core/error.hpp>
#include <hubfetch/core/remote.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace hubfetch::core {

// HTTP response headers (names lowercased)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::uint64_t content_length{0};
    bool accepts_ranges{false};

    [[nodiscard]] std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

// curl timeout options for one request; 0 disables a limit
struct RequestTimeouts {
    long connect_seconds{0};
    long total_seconds{0};
    long low_speed_bytes{0};        // CURLOPT_LOW_SPEED_LIMIT
    long low_speed_seconds{0};      // CURLOPT_LOW_SPEED_TIME
};

// libcurl client for a Hugging Face compatible hub.
// resolve() and list() read metadata, fetch() streams byte ranges; every call
// uses its own easy handle, DNS and TLS sessions are shared.
class HttpSession final : public MetadataResolver, public RangeFetcher {
public:
    explicit HttpSession(const TransferConfig& config);
    ~HttpSession() override;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<RemoteFileDescriptor, std::error_code>
    resolve(const std::string& repo_id, const std::string& path) override;

    [[nodiscard]] std::expected<Manifest, std::error_code>
    list(const std::string& repo_id) override;

    [[nodiscard]] std::error_code fetch(const RangeRequest& request,
                                        const ChunkSink& sink) override;

    // HEAD without following redirects
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url);

    // Small GET with the body kept in memory (API calls)
    [[nodiscard]] std::expected<std::string, std::error_code>
    get_text(const std::string& url);

    // {endpoint}/{repo}/resolve/{revision}/{path}
    [[nodiscard]] std::string resolve_url(std::string_view repo_id,
                                          std::string_view revision,
                                          std::string_view path) const;

    // {endpoint}/api/models/{repo}/revision/{revision}?blobs=true
    [[nodiscard]] std::string manifest_url(std::string_view repo_id) const;

    // Build a descriptor from the HEAD answer of a resolve URL
    [[nodiscard]] static std::expected<RemoteFileDescriptor, std::error_code>
    descriptor_from_headers(const std::string& repo_id,
                            const std::string& path,
                            const std::string& requested_revision,
                            const HttpResponse& response);

    // Parse the model info document returned for manifest_url()
    [[nodiscard]] static std::expected<Manifest, std::error_code>
    parse_manifest(const std::string& repo_id, std::string_view json_text);

    // Percent-encode each path segment, keeping '/'
    [[nodiscard]] static std::string encode_path(std::string_view path);

    // Strip W/ and quotes from an ETag value
    [[nodiscard]] static std::string normalize_etag(std::string_view etag);

    // Metadata calls are capped in total; body transfers are only cut off
    // when they stall, so a large object may take as long as it needs
    [[nodiscard]] static RequestTimeouts timeouts_for(const TransferConfig& config,
                                                      bool body_transfer) noexcept;

    // Classify a CURLcode
    [[nodiscard]] static std::error_code error_from_curl(int curl_code) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    void apply_common_options(void* curl, bool body_transfer) const;

    TransferConfig config_;
    void* share_{nullptr};                  // CURLSH*
    std::array<std::mutex, 16> share_locks_;
};

} // namespace hubfetch::core
