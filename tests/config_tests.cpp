// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hubfetch/core/config.hpp>
#include <hubfetch/core/error.hpp>
#include <hubfetch/disk/error.hpp>
#include "fakes.hpp"

using namespace hubfetch::core;

TEST_CASE("Configuration defaults", "[config]") {
    TransferConfig config;
    CHECK(config.chunk_size_bytes == 8 * 1024 * 1024);
    CHECK(config.max_concurrency == 3);
    CHECK(config.retry_limit == 5);
    CHECK(config.request_timeout_seconds == 60);
    CHECK(config.stall_timeout_seconds == 15);
    CHECK(config.parallel_files == 1);
    CHECK(config.hub_endpoint == "https://huggingface.co");
    CHECK(config.revision == "main");
    CHECK(config.verify_digests);
    CHECK(config.destination_root_path.ends_with("hf_models"));
    CHECK_FALSE(config.validate());
}

TEST_CASE("Configuration validation", "[config]") {
    TransferConfig config;

    SECTION("Chunk size must be positive") {
        config.chunk_size_bytes = 0;
        CHECK(config.validate() == TransferErrc::invalid_config);
    }

    SECTION("Concurrency bounds") {
        config.max_concurrency = 0;
        CHECK(config.validate() == TransferErrc::invalid_config);
        for (std::uint32_t n : {1u, 2u, 3u, 4u, 6u, 8u, 100u, 512u}) {
            config.max_concurrency = n;
            CHECK_FALSE(config.validate());
        }
    }

    SECTION("Timeouts must be positive") {
        config.stall_timeout_seconds = 0;
        CHECK(config.validate() == TransferErrc::invalid_config);
    }

    SECTION("At least one attempt") {
        config.retry_limit = 0;
        CHECK(config.validate() == TransferErrc::invalid_config);
    }

    SECTION("Backoff ordering") {
        config.backoff_initial = std::chrono::milliseconds{1000};
        config.backoff_max = std::chrono::milliseconds{10};
        CHECK(config.validate() == TransferErrc::invalid_config);
    }

    SECTION("Parallel files cannot exceed the worker budget") {
        config.max_concurrency = 4;
        config.parallel_files = 5;
        CHECK(config.validate() == TransferErrc::invalid_config);
        config.parallel_files = 0;
        CHECK(config.validate() == TransferErrc::invalid_config);
    }

    SECTION("Endpoint must be http(s)") {
        config.hub_endpoint = "ftp://example.com";
        CHECK(config.validate() == TransferErrc::invalid_config);
    }

    SECTION("Empty destination") {
        config.destination_root_path.clear();
        CHECK(config.validate() == TransferErrc::invalid_config);
    }

    SECTION("Log level") {
        config.log_level = "chatty";
        CHECK(config.validate() == TransferErrc::invalid_config);
        config.log_level = "off";
        CHECK_FALSE(config.validate());
        config.log_level = "debug";
        CHECK_FALSE(config.validate());
    }
}

TEST_CASE("Workers per file", "[config]") {
    TransferConfig config;
    config.max_concurrency = 8;

    config.parallel_files = 1;
    CHECK(config.workers_per_file() == 8);
    config.parallel_files = 2;
    CHECK(config.workers_per_file() == 4);
    config.parallel_files = 3;
    CHECK(config.workers_per_file() == 2);
    config.parallel_files = 8;
    CHECK(config.workers_per_file() == 1);
}

TEST_CASE("Parsing JSON configuration", "[config]") {
    SECTION("Keys override defaults") {
        auto config = parse_config(R"({
            "chunk_size_bytes": 1048576,
            "max_concurrency": 6,
            "parallel_files": 2,
            "backoff_initial_ms": 100,
            "backoff_max_ms": 2000,
            "stall_timeout_seconds": 45,
            "destination_root_path": "/tmp/models",
            "verify_digests": false,
            "exclude_patterns": ["*.h5", "*.msgpack"],
            "log_level": "debug"
        })");
        REQUIRE(config);
        CHECK(config->chunk_size_bytes == 1048576);
        CHECK(config->max_concurrency == 6);
        CHECK(config->parallel_files == 2);
        CHECK(config->backoff_initial == std::chrono::milliseconds{100});
        CHECK(config->backoff_max == std::chrono::milliseconds{2000});
        CHECK(config->stall_timeout_seconds == 45);
        CHECK(config->destination_root_path == "/tmp/models");
        CHECK_FALSE(config->verify_digests);
        CHECK(config->exclude_patterns == std::vector<std::string>{"*.h5", "*.msgpack"});
        CHECK(config->retry_limit == DEFAULT_RETRY_LIMIT);
    }

    SECTION("Empty object gives defaults") {
        auto config = parse_config("{}");
        REQUIRE(config);
        CHECK(config->max_concurrency == DEFAULT_CONCURRENCY);
    }

    SECTION("Wrong type") {
        auto config = parse_config(R"({"max_concurrency": "lots"})");
        REQUIRE_FALSE(config);
        CHECK(config.error() == TransferErrc::invalid_config);
    }

    SECTION("Malformed JSON") {
        auto config = parse_config("{ not json");
        REQUIRE_FALSE(config);
        CHECK(config.error() == TransferErrc::invalid_config);
    }

    SECTION("Not an object") {
        CHECK_FALSE(parse_config("[1, 2, 3]"));
    }

    SECTION("Values are validated") {
        auto config = parse_config(R"({"chunk_size_bytes": -1})");
        REQUIRE_FALSE(config);
        CHECK(config.error() == TransferErrc::invalid_config);
    }
}

TEST_CASE("Loading configuration files", "[config]") {
    hubfetch::test::TempDir dir;

    SECTION("Missing file") {
        auto config = load_config((dir.path() / "missing.json").string());
        REQUIRE_FALSE(config);
        CHECK(config.error() == hubfetch::disk::DiskErrc::file_not_found);
    }

    SECTION("Existing file") {
        auto path = dir.path() / "hubfetch.json";
        hubfetch::test::write_file(path, R"({"revision": "v1.0", "retry_limit": 2})");
        auto config = load_config(path.string());
        REQUIRE(config);
        CHECK(config->revision == "v1.0");
        CHECK(config->retry_limit == 2);
    }
}
