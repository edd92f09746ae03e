// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace hubfetch::core {

constexpr std::int64_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;        // 8 MiB
constexpr std::uint32_t DEFAULT_CONCURRENCY = 3;
constexpr std::uint32_t DEFAULT_RETRY_LIMIT = 5;                    // Total attempts per chunk

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t REQUEST_TIMEOUT_SEC = 60;                  // Metadata requests only
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;                     // Body transfers below 1 B/s

constexpr std::chrono::milliseconds BACKOFF_INITIAL{500};
constexpr std::chrono::milliseconds BACKOFF_MAX{30'000};

constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;              // 256 KB
constexpr std::size_t HASH_BUFFER_SIZE = 4 * 1024 * 1024;          // 4 MB

constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::string_view DEFAULT_ENDPOINT = "https://huggingface.co";
constexpr std::string_view DEFAULT_REVISION = "main";
constexpr std::string_view WORK_DIR_NAME = ".hubfetch";

// Transfer configuration, built once at startup and passed by const reference
struct TransferConfig {
    std::int64_t chunk_size_bytes{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_concurrency{DEFAULT_CONCURRENCY};
    std::uint32_t retry_limit{DEFAULT_RETRY_LIMIT};
    std::uint32_t request_timeout_seconds{REQUEST_TIMEOUT_SEC};
    std::uint32_t connect_timeout_seconds{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_seconds{STALL_TIMEOUT_SEC};
    std::chrono::milliseconds backoff_initial{BACKOFF_INITIAL};
    std::chrono::milliseconds backoff_max{BACKOFF_MAX};
    std::uint32_t parallel_files{1};
    std::chrono::milliseconds progress_interval{0};   // 0 = every chunk completion
    std::string destination_root_path{default_destination_root()};
    std::string hub_endpoint{DEFAULT_ENDPOINT};
    std::string revision{DEFAULT_REVISION};
    bool verify_digests{true};
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    std::string log_level{"info"};

    // invalid_config on the first violated rule (the key is logged)
    [[nodiscard]] std::error_code validate() const;

    // Workers given to each file when parallel_files run side by side
    [[nodiscard]] std::uint32_t workers_per_file() const noexcept {
        auto files = parallel_files == 0 ? 1u : parallel_files;
        auto share = max_concurrency / files;
        return share == 0 ? 1u : share;
    }

    // $HOME/hf_models, or ./hf_models without a home directory
    [[nodiscard]] static std::string default_destination_root();
};

// Load a JSON configuration file on top of the defaults
[[nodiscard]] std::expected<TransferConfig, std::error_code>
load_config(std::string_view path);

// Same, from an in-memory JSON document
[[nodiscard]] std::expected<TransferConfig, std::error_code>
parse_config(std::string_view json_text);

} // namespace hubfetch::core
