// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/config.hpp>
#include <hubfetch/core/error.hpp>
#include <hubfetch/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace hubfetch::core {

namespace {

std::error_code reject(std::string_view key, std::string_view rule) {
    spdlog::error("config: '{}' {}", key, rule);
    return make_error_code(TransferErrc::invalid_config);
}

template<typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    }
}

void read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = std::chrono::milliseconds{j.at(key).get<std::int64_t>()};
    }
}

} // namespace

std::string TransferConfig::default_destination_root() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (std::filesystem::path(home) / "hf_models").string();
    }
    return "hf_models";
}

std::error_code TransferConfig::validate() const {
    if (chunk_size_bytes <= 0) {
        return reject("chunk_size_bytes", "must be positive");
    }
    if (max_concurrency == 0) {
        return reject("max_concurrency", "must be positive");
    }
    if (retry_limit == 0) {
        return reject("retry_limit", "must allow at least one attempt");
    }
    if (request_timeout_seconds == 0) {
        return reject("request_timeout_seconds", "must be positive");
    }
    if (connect_timeout_seconds == 0) {
        return reject("connect_timeout_seconds", "must be positive");
    }
    if (stall_timeout_seconds == 0) {
        return reject("stall_timeout_seconds", "must be positive");
    }
    if (backoff_initial.count() <= 0) {
        return reject("backoff_initial_ms", "must be positive");
    }
    if (backoff_max < backoff_initial) {
        return reject("backoff_max_ms", "must not be below backoff_initial_ms");
    }
    if (parallel_files == 0 || parallel_files > max_concurrency) {
        return reject("parallel_files", "must be between 1 and max_concurrency");
    }
    if (progress_interval.count() < 0) {
        return reject("progress_interval_ms", "must not be negative");
    }
    if (destination_root_path.empty()) {
        return reject("destination_root_path", "must not be empty");
    }
    if (!hub_endpoint.starts_with("http://") && !hub_endpoint.starts_with("https://")) {
        return reject("hub_endpoint", "must be an http(s) URL");
    }
    if (revision.empty()) {
        return reject("revision", "must not be empty");
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        return reject("log_level", "is not a known level");
    }
    return {};
}

std::expected<TransferConfig, std::error_code>
parse_config(std::string_view json_text) {
    TransferConfig cfg;
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(reject("<root>", "must be a JSON object"));
        }

        read_key(j, "chunk_size_bytes", cfg.chunk_size_bytes);
        read_key(j, "max_concurrency", cfg.max_concurrency);
        read_key(j, "retry_limit", cfg.retry_limit);
        read_key(j, "request_timeout_seconds", cfg.request_timeout_seconds);
        read_key(j, "connect_timeout_seconds", cfg.connect_timeout_seconds);
        read_key(j, "stall_timeout_seconds", cfg.stall_timeout_seconds);
        read_millis(j, "backoff_initial_ms", cfg.backoff_initial);
        read_millis(j, "backoff_max_ms", cfg.backoff_max);
        read_key(j, "parallel_files", cfg.parallel_files);
        read_millis(j, "progress_interval_ms", cfg.progress_interval);
        read_key(j, "destination_root_path", cfg.destination_root_path);
        read_key(j, "hub_endpoint", cfg.hub_endpoint);
        read_key(j, "revision", cfg.revision);
        read_key(j, "verify_digests", cfg.verify_digests);
        read_key(j, "include_patterns", cfg.include_patterns);
        read_key(j, "exclude_patterns", cfg.exclude_patterns);
        read_key(j, "log_level", cfg.log_level);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("config: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }

    if (auto ec = cfg.validate()) {
        return std::unexpected(ec);
    }
    return cfg;
}

std::expected<TransferConfig, std::error_code>
load_config(std::string_view path) {
    std::ifstream file{std::string(path)};
    if (!file) {
        spdlog::error("config: cannot open {}", path);
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = parse_config(ss.str());
    if (cfg) {
        spdlog::debug("Loaded config from {}", path);
    }
    return cfg;
}

} // namespace hubfetch::core
