// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/cli/commands.hpp>
#include <hubfetch/cli/progress_bar.hpp>
#include <hubfetch/core/http_session.hpp>
#include <hubfetch/core/repository_sync.hpp>
#include <hubfetch/core/transfer_manager.hpp>
#include <hubfetch/version.hpp>
#include <fmt/format.h>
#include <charconv>
#include <iostream>
#include <memory>
#include <mutex>

using namespace hubfetch::core;

namespace hubfetch::cli {

namespace {

template<typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || p != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

void print_outcome(const JobOutcome& o) {
    switch (o.state) {
        case JobState::complete:
            std::cout << "  ok        " << o.path
                      << (o.skipped ? " (already present)" : "") << '\n';
            break;
        case JobState::cancelled:
            std::cout << "  cancelled " << o.path << '\n';
            break;
        default:
            std::cout << "  FAILED    " << o.path << ": " << o.error.message();
            if (o.chunk_failure) {
                std::cout << fmt::format(" (chunk {} after {} attempt(s): {})",
                                         o.chunk_failure->index, o.chunk_failure->attempts,
                                         o.chunk_failure->cause.message());
            }
            if (!o.temp_path.empty()) {
                std::cout << "\n            partial data kept in " << o.temp_path.string();
            }
            std::cout << '\n';
            break;
    }
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    std::vector<std::string> positional;

    auto fail = [&args](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) return std::string(argv[++i]);
            fail("missing value for " + arg);
            return std::nullopt;
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value()) args.output_dir = *v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value()) args.config_path = *v;
        } else if (arg == "-r" || arg == "--revision") {
            if (auto v = value()) args.revision = *v;
        } else if (arg == "-n" || arg == "--workers") {
            if (auto v = value()) {
                args.workers = parse_number<std::uint32_t>(*v);
                if (!args.workers) fail("invalid worker count: " + *v);
            }
        } else if (arg == "--parallel-files") {
            if (auto v = value()) {
                args.parallel_files = parse_number<std::uint32_t>(*v);
                if (!args.parallel_files) fail("invalid file count: " + *v);
            }
        } else if (arg == "--chunk-size") {
            if (auto v = value()) {
                args.chunk_size = parse_number<std::int64_t>(*v);
                if (!args.chunk_size) fail("invalid chunk size: " + *v);
            }
        } else if (arg == "--include") {
            if (auto v = value()) args.include_patterns.push_back(*v);
        } else if (arg == "--exclude") {
            if (auto v = value()) args.exclude_patterns.push_back(*v);
        } else if (arg.starts_with("-") && arg.size() > 1) {
            fail("unknown option: " + arg);
        } else {
            positional.push_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        return args;
    }

    const auto& cmd = positional[0];
    if (cmd == "file") {
        args.command = Command::file;
        if (positional.size() != 3) fail("usage: file <repo> <path>");
    } else if (cmd == "repo") {
        args.command = Command::repo;
        if (positional.size() != 2) fail("usage: repo <repo>");
    } else if (cmd == "info") {
        args.command = Command::info;
        if (positional.size() < 2 || positional.size() > 3) fail("usage: info <repo> [path]");
    } else {
        fail("unknown command: " + cmd);
    }

    if (positional.size() > 1) args.repo_id = positional[1];
    if (positional.size() > 2) args.path = positional[2];
    return args;
}

std::expected<TransferConfig, std::error_code> build_config(const CliArgs& args) {
    TransferConfig config;
    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (!args.output_dir.empty()) config.destination_root_path = args.output_dir;
    if (!args.revision.empty()) config.revision = args.revision;
    if (args.workers) config.max_concurrency = *args.workers;
    if (args.parallel_files) config.parallel_files = *args.parallel_files;
    if (args.chunk_size) config.chunk_size_bytes = *args.chunk_size;
    if (!args.include_patterns.empty()) config.include_patterns = args.include_patterns;
    if (!args.exclude_patterns.empty()) config.exclude_patterns = args.exclude_patterns;
    if (args.verbose) config.log_level = "debug";
    if (args.quiet) config.log_level = "warn";

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download_file(const CliArgs& args, const TransferConfig& config) {
    HttpSession session(config);
    TransferManager manager(config, session, session);

    auto bar = std::make_unique<ProgressBar>(0, args.path);
    std::mutex bar_mutex;
    if (!args.quiet) {
        manager.progress_callback([&bar, &bar_mutex](const ProgressSnapshot& p) {
            // Skip a redraw rather than hold up a worker
            std::unique_lock lock(bar_mutex, std::try_to_lock);
            if (!lock) return;
            bar->total(p.bytes_total);
            bar->update(p.bytes_done);
        });
    }

    if (!args.quiet) {
        std::cout << "Repository: " << args.repo_id << '\n'
                  << "File:       " << args.path << '\n'
                  << "Save dir:   " << config.destination_root_path << '\n';
    }

    auto outcome = manager.download_file(args.repo_id, args.path);

    if (!args.quiet) {
        if (outcome.ok()) bar->finish();
        else bar->clear();
    }

    if (outcome.ok()) {
        std::cout << "Saved to " << outcome.final_path.string() << std::endl;
        return 0;
    }

    print_outcome(outcome);
    return 1;
}

CliResult download_repo(const CliArgs& args, const TransferConfig& config) {
    HttpSession session(config);
    RepositorySync sync(config, session, session);

    auto bar = std::make_unique<ProgressBar>(0, args.repo_id);
    std::mutex bar_mutex;
    if (!args.quiet) {
        sync.progress_callback([&bar, &bar_mutex](const RepositoryProgress& p) {
            std::unique_lock lock(bar_mutex, std::try_to_lock);
            if (!lock) return;
            bar->total(p.bytes_total);
            bar->label(fmt::format("{}/{} {}", p.files_done, p.files_total, p.current_file));
            bar->update(p.bytes_done);
        });

        std::cout << "Repository: " << args.repo_id << '\n'
                  << "Save dir:   " << config.destination_root_path << '\n'
                  << "Workers:    " << config.max_concurrency
                  << " (" << config.parallel_files << " file(s) at a time)\n";
    }

    auto result = sync.sync(args.repo_id);

    if (!args.quiet) {
        if (result.status == SyncStatus::complete) bar->finish();
        else bar->clear();
    }

    if (result.error) {
        std::cerr << "Error: " << args.repo_id << ": " << result.error.message() << std::endl;
        return 1;
    }

    std::cout << fmt::format("{} files: {} complete, {} failed, {} cancelled ({})\n",
                             result.files.size(),
                             result.count(JobState::complete),
                             result.count(JobState::failed),
                             result.count(JobState::cancelled),
                             to_string(result.status));
    for (const auto& o : result.files) {
        if (!o.ok() || args.verbose) {
            print_outcome(o);
        }
    }
    if (result.status == SyncStatus::complete) {
        std::cout << "Saved to " << result.target_dir.string() << std::endl;
        return 0;
    }
    return 1;
}

CliResult info(const CliArgs& args, const TransferConfig& config) {
    HttpSession session(config);

    if (!args.path.empty()) {
        auto file = session.resolve(args.repo_id, args.path);
        if (!file) {
            std::cerr << "Error: " << args.repo_id << "/" << args.path << ": "
                      << file.error().message() << std::endl;
            return std::unexpected(file.error());
        }

        std::cout << "Repository: " << file->repo_id << '\n';
        std::cout << "Path:       " << file->path << '\n';
        std::cout << "Revision:   " << file->revision << '\n';
        std::cout << "Size:       " << file->size << " (" << ProgressBar::format_bytes(file->size) << ")\n";
        if (file->digest) {
            std::cout << "Digest:     " << to_string(file->digest->algorithm) << ' ' << file->digest->hex << '\n';
        }
        std::cout << "Ranges:     " << (file->accepts_ranges ? "yes" : "no") << std::endl;
        return 0;
    }

    auto manifest = session.list(args.repo_id);
    if (!manifest) {
        std::cerr << "Error: " << args.repo_id << ": " << manifest.error().message() << std::endl;
        return std::unexpected(manifest.error());
    }

    std::cout << "Repository: " << manifest->repo_id << '\n';
    std::cout << "Revision:   " << manifest->revision << '\n';
    for (const auto& f : manifest->files) {
        std::cout << fmt::format("  {:>10}  {}\n", ProgressBar::format_bytes(f.size), f.path);
    }
    std::cout << fmt::format("{} files, {}\n", manifest->files.size(),
                             ProgressBar::format_bytes(manifest->total_bytes()));
    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "hubfetch " << version.to_string() << " - resumable model repository downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " file <REPO> <PATH> [OPTIONS]\n";
    std::cout << "  " << program_name << " repo <REPO> [OPTIONS]\n";
    std::cout << "  " << program_name << " info <REPO> [PATH]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version information\n";
    std::cout << "  -V, --verbose             Debug logging\n";
    std::cout << "  -q, --quiet               Warnings only, no progress bar\n";
    std::cout << "  -c, --config <FILE>       JSON configuration file\n";
    std::cout << "  -d, --directory <DIR>     Destination root (default: ~/hf_models)\n";
    std::cout << "  -r, --revision <REV>      Branch, tag or commit (default: main)\n";
    std::cout << "  -n, --workers <N>         Concurrent connections (default: 3)\n";
    std::cout << "      --parallel-files <K>  Files downloaded side by side (repo)\n";
    std::cout << "      --chunk-size <BYTES>  Chunk size (default: 8388608)\n";
    std::cout << "      --include <GLOB>      Only files matching GLOB (repo, repeatable)\n";
    std::cout << "      --exclude <GLOB>      Skip files matching GLOB (repo, repeatable)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " file TheBloke/Llama-2-7B-GGUF llama-2-7b.Q4_K_M.gguf\n";
    std::cout << "  " << program_name << " repo bert-base-uncased -n 8 --exclude '*.h5'\n";
    std::cout << "\n";
    std::cout << "Interrupted downloads resume where they stopped when run again.\n";
}

void print_version() {
    std::cout << "hubfetch " << version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " with libcurl, OpenSSL, spdlog\n";
}

} // namespace hubfetch::cli
