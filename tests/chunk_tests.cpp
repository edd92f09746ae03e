// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hubfetch/core/chunk.hpp>
#include <hubfetch/core/config.hpp>
#include <limits>

using namespace hubfetch::core;

constexpr std::int64_t MiB = 1024 * 1024;

TEST_CASE("Chunk layout", "[chunk]") {
    ChunkPlanner planner(8 * MiB);

    SECTION("20 MiB in 8 MiB chunks") {
        auto chunks = planner.plan("f", 20 * MiB);
        REQUIRE(chunks);
        REQUIRE(chunks->size() == 3);

        CHECK((*chunks)[0].offset == 0);
        CHECK((*chunks)[0].length == 8 * MiB);
        CHECK((*chunks)[1].offset == 8 * MiB);
        CHECK((*chunks)[1].length == 8 * MiB);
        CHECK((*chunks)[2].offset == 16 * MiB);
        CHECK((*chunks)[2].length == 4 * MiB);

        for (const auto& c : *chunks) {
            CHECK(c.status == ChunkStatus::pending);
            CHECK(c.file_id == "f");
        }
    }

    SECTION("Exact multiple has no empty tail") {
        auto chunks = planner.plan("f", 16 * MiB);
        REQUIRE(chunks);
        REQUIRE(chunks->size() == 2);
        CHECK(chunks->back().end() == static_cast<std::uint64_t>(16 * MiB));
    }

    SECTION("File smaller than one chunk") {
        auto chunks = planner.plan("f", 100);
        REQUIRE(chunks);
        REQUIRE(chunks->size() == 1);
        CHECK((*chunks)[0].length == 100);
    }

    SECTION("Empty file has no chunks") {
        auto chunks = planner.plan("f", 0);
        REQUIRE(chunks);
        CHECK(chunks->empty());
        CHECK(planner.chunk_count(0) == 0);
    }
}

TEST_CASE("Chunks tile the file", "[chunk]") {
    auto chunk_size = GENERATE(as<std::int64_t>{}, 1, 7, 4096, 8 * MiB);
    auto total = GENERATE(as<std::int64_t>{}, 1, 4095, 4096, 100'001, 20 * MiB + 3);

    ChunkPlanner planner(chunk_size);
    auto chunks = planner.plan("f", total);
    REQUIRE(chunks);
    REQUIRE(chunks->size() == planner.chunk_count(static_cast<std::uint64_t>(total)));

    std::uint64_t expected_offset = 0;
    for (std::size_t i = 0; i < chunks->size(); ++i) {
        const auto& c = (*chunks)[i];
        CHECK(c.index == i);
        CHECK(c.offset == expected_offset);
        CHECK(c.length > 0);
        CHECK(c.length <= static_cast<std::uint64_t>(chunk_size));
        if (i + 1 < chunks->size()) {
            CHECK(c.length == static_cast<std::uint64_t>(chunk_size));
        }
        expected_offset = c.end();
    }
    CHECK(expected_offset == static_cast<std::uint64_t>(total));
}

TEST_CASE("Invalid sizes are rejected", "[chunk]") {
    SECTION("Negative total") {
        ChunkPlanner planner(8 * MiB);
        auto chunks = planner.plan("f", -1);
        REQUIRE_FALSE(chunks);
        CHECK(chunks.error() == TransferErrc::invalid_size);
    }

    SECTION("Zero chunk size") {
        ChunkPlanner planner(0);
        auto chunks = planner.plan("f", 100);
        REQUIRE_FALSE(chunks);
        CHECK(chunks.error() == TransferErrc::invalid_size);
    }

    SECTION("More chunks than 32-bit indices can name") {
        ChunkPlanner planner(1);
        const auto total = static_cast<std::int64_t>(MAX_CHUNKS) + 1;
        CHECK(planner.chunk_count(static_cast<std::uint64_t>(total)) == MAX_CHUNKS + 1);
        auto chunks = planner.plan("f", total);
        REQUIRE_FALSE(chunks);
        CHECK(chunks.error() == TransferErrc::invalid_size);
    }

    SECTION("Chunk count at the top of the size range") {
        ChunkPlanner planner(8 * MiB);
        const auto total = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        CHECK(planner.chunk_count(total) == total / (8 * MiB) + 1);
    }

    SECTION("Negative chunk size") {
        ChunkPlanner planner(-5);
        CHECK_FALSE(planner.plan("f", 100));
        CHECK_FALSE(planner.plan_single("f", 100));
        CHECK(planner.chunk_count(100) == 0);
    }
}

TEST_CASE("Done chunks are seeded from the ledger", "[chunk]") {
    ChunkPlanner planner(4);
    auto chunks = planner.plan("f", 16, {0, 2, 99});
    REQUIRE(chunks);
    REQUIRE(chunks->size() == 4);

    CHECK((*chunks)[0].status == ChunkStatus::done);
    CHECK((*chunks)[1].status == ChunkStatus::pending);
    CHECK((*chunks)[2].status == ChunkStatus::done);
    CHECK((*chunks)[3].status == ChunkStatus::pending);

    CHECK(ChunkPlanner::pending(*chunks) == std::vector<std::uint32_t>{1, 3});
    CHECK(ChunkPlanner::done_bytes(*chunks) == 8);
}

TEST_CASE("Single-stream plan", "[chunk]") {
    ChunkPlanner planner(8 * MiB);

    SECTION("One chunk spans the whole file") {
        auto chunks = planner.plan_single("f", 20 * MiB);
        REQUIRE(chunks);
        REQUIRE(chunks->size() == 1);
        CHECK((*chunks)[0].offset == 0);
        CHECK((*chunks)[0].length == 20 * MiB);
        CHECK((*chunks)[0].status == ChunkStatus::pending);
    }

    SECTION("Already done") {
        auto chunks = planner.plan_single("f", 10, true);
        REQUIRE(chunks);
        REQUIRE(chunks->size() == 1);
        CHECK((*chunks)[0].status == ChunkStatus::done);
        CHECK(ChunkPlanner::pending(*chunks).empty());
    }

    SECTION("Empty file") {
        auto chunks = planner.plan_single("f", 0);
        REQUIRE(chunks);
        CHECK(chunks->empty());
    }
}

TEST_CASE("Chunk status names", "[chunk]") {
    CHECK(to_string(ChunkStatus::pending) == "pending");
    CHECK(to_string(ChunkStatus::in_flight) == "in-flight");
    CHECK(to_string(ChunkStatus::done) == "done");
    CHECK(to_string(ChunkStatus::failed) == "failed");
}
