// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace hubfetch::cli {

// CLI result (process exit code)
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    file,   // One file of a repository
    repo,   // Every file of a repository
    info    // Metadata only
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::string repo_id;
    std::string path;
    std::string output_dir;
    std::string config_path;
    std::string revision;
    std::optional<std::uint32_t> workers;
    std::optional<std::uint32_t> parallel_files;
    std::optional<std::int64_t> chunk_size;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;      // First parse problem, empty when fine
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Defaults, then the config file, then command-line overrides
[[nodiscard]] std::expected<core::TransferConfig, std::error_code>
build_config(const CliArgs& args);

// Download a single file
[[nodiscard]] CliResult download_file(const CliArgs& args, const core::TransferConfig& config);

// Download a whole repository
[[nodiscard]] CliResult download_repo(const CliArgs& args, const core::TransferConfig& config);

// Show file or repository metadata without downloading
[[nodiscard]] CliResult info(const CliArgs& args, const core::TransferConfig& config);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace hubfetch::cli
