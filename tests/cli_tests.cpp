// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hubfetch/cli/commands.hpp>
#include <hubfetch/cli/progress_bar.hpp>
#include <hubfetch/core/error.hpp>
#include <hubfetch/disk/error.hpp>
#include "fakes.hpp"
#include <sstream>

using namespace hubfetch::cli;
using hubfetch::core::TransferErrc;

namespace {

CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "hubfetch");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(words.size()), argv.data());
}

} // namespace

TEST_CASE("Command line parsing", "[cli]") {
    SECTION("Single file") {
        auto args = parse({"file", "org/model", "weights/model.bin", "-n", "8", "-d", "/data"});
        CHECK(args.error.empty());
        CHECK(args.command == Command::file);
        CHECK(args.repo_id == "org/model");
        CHECK(args.path == "weights/model.bin");
        REQUIRE(args.workers);
        CHECK(*args.workers == 8);
        CHECK(args.output_dir == "/data");
    }

    SECTION("Repository with filters") {
        auto args = parse({"repo", "bert-base-uncased", "--include", "*.json",
                           "--exclude", "*.h5", "--exclude", "*.msgpack",
                           "--parallel-files", "2", "--chunk-size", "1048576", "-r", "v1.0"});
        CHECK(args.error.empty());
        CHECK(args.command == Command::repo);
        CHECK(args.repo_id == "bert-base-uncased");
        CHECK(args.include_patterns == std::vector<std::string>{"*.json"});
        CHECK(args.exclude_patterns == std::vector<std::string>{"*.h5", "*.msgpack"});
        REQUIRE(args.parallel_files);
        CHECK(*args.parallel_files == 2);
        REQUIRE(args.chunk_size);
        CHECK(*args.chunk_size == 1048576);
        CHECK(args.revision == "v1.0");
    }

    SECTION("Info with and without a path") {
        auto repo = parse({"info", "org/model"});
        CHECK(repo.error.empty());
        CHECK(repo.command == Command::info);
        CHECK(repo.path.empty());

        auto file = parse({"info", "org/model", "config.json"});
        CHECK(file.error.empty());
        CHECK(file.path == "config.json");
    }

    SECTION("Help and version") {
        CHECK(parse({"-h"}).help);
        CHECK(parse({"file", "--help"}).help);
        CHECK(parse({"--version"}).version);
    }

    SECTION("No arguments") {
        auto args = parse({});
        CHECK(args.command == Command::none);
        CHECK(args.error.empty());
    }

    SECTION("Errors") {
        CHECK_FALSE(parse({"file", "org/model"}).error.empty());
        CHECK_FALSE(parse({"repo"}).error.empty());
        CHECK_FALSE(parse({"fetch", "org/model"}).error.empty());
        CHECK_FALSE(parse({"repo", "org/model", "--bogus"}).error.empty());
        CHECK_FALSE(parse({"repo", "org/model", "-n", "many"}).error.empty());
        CHECK_FALSE(parse({"repo", "org/model", "-n"}).error.empty());
    }

    SECTION("Flags") {
        auto args = parse({"-V", "repo", "org/model", "-q"});
        CHECK(args.verbose);
        CHECK(args.quiet);
        CHECK(args.command == Command::repo);
    }
}

TEST_CASE("Configuration from the command line", "[cli]") {
    SECTION("Overrides") {
        auto args = parse({"repo", "org/model", "-n", "8", "--parallel-files", "2",
                           "-d", "/data/models", "-V", "--exclude", "*.h5"});
        auto config = build_config(args);
        REQUIRE(config);
        CHECK(config->max_concurrency == 8);
        CHECK(config->parallel_files == 2);
        CHECK(config->workers_per_file() == 4);
        CHECK(config->destination_root_path == "/data/models");
        CHECK(config->log_level == "debug");
        CHECK(config->exclude_patterns == std::vector<std::string>{"*.h5"});
    }

    SECTION("Quiet") {
        auto config = build_config(parse({"repo", "org/model", "-q"}));
        REQUIRE(config);
        CHECK(config->log_level == "warn");
    }

    SECTION("Invalid combination") {
        auto config = build_config(parse({"repo", "org/model", "-n", "2", "--parallel-files", "3"}));
        REQUIRE_FALSE(config);
        CHECK(config.error() == TransferErrc::invalid_config);
    }

    SECTION("Config file under command-line flags") {
        hubfetch::test::TempDir dir;
        auto path = dir.path() / "hubfetch.json";
        hubfetch::test::write_file(path, R"({"max_concurrency": 6, "revision": "dev"})");

        auto config = build_config(parse({"repo", "org/model", "-c", path.string(), "-r", "v2"}));
        REQUIRE(config);
        CHECK(config->max_concurrency == 6);
        CHECK(config->revision == "v2");
    }

    SECTION("Missing config file") {
        auto config = build_config(parse({"repo", "org/model", "-c", "/nonexistent/hubfetch.json"}));
        REQUIRE_FALSE(config);
        CHECK(config.error() == hubfetch::disk::DiskErrc::file_not_found);
    }
}

TEST_CASE("Progress bar formatting", "[cli]") {
    SECTION("Bytes") {
        CHECK(ProgressBar::format_bytes(0) == "0 B");
        CHECK(ProgressBar::format_bytes(512) == "512 B");
        CHECK(ProgressBar::format_bytes(2048) == "2 KB");
        CHECK(ProgressBar::format_bytes(5 * 1024 * 1024 + 512 * 1024) == "5.5 MB");
        CHECK(ProgressBar::format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
        CHECK(ProgressBar::format_speed(2048) == "2 KB/s");
    }

    SECTION("Time") {
        CHECK(ProgressBar::format_time(45) == "45s");
        CHECK(ProgressBar::format_time(125) == "2m 5s");
        CHECK(ProgressBar::format_time(3725) == "1h 02m 5s");
    }

    SECTION("Bar line") {
        std::ostringstream out;
        ProgressBar bar(100, "model.bin", &out);

        auto half = bar.render(50);
        CHECK(half.starts_with("model.bin: [===============>"));
        CHECK(half.find(" 50% (50 B/100 B)") != std::string::npos);

        auto full = bar.render(100);
        CHECK(full.find("[" + std::string(30, '=') + "]") != std::string::npos);
        CHECK(full.find("100%") != std::string::npos);
    }

    SECTION("Redraws only on visible change") {
        std::ostringstream out;
        ProgressBar bar(1000, {}, &out);
        bar.update(100);
        auto first = out.str();
        bar.update(101);
        CHECK(out.str() == first);
        bar.update(200);
        CHECK(out.str().size() > first.size());

        bar.finish();
        CHECK(out.str().ends_with("\n"));
    }

    SECTION("Label change forces a redraw") {
        std::ostringstream out;
        ProgressBar bar(1000, "a", &out);
        bar.update(100);
        auto first = out.str();
        bar.label("b");
        bar.update(100);
        CHECK(out.str().size() > first.size());
        CHECK(bar.label() == "b");
    }
}
