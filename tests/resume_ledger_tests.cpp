// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hubfetch/core/resume_ledger.hpp>
#include "fakes.hpp"

using namespace hubfetch::core;
using hubfetch::test::TempDir;
using hubfetch::test::read_file;
using hubfetch::test::write_file;

namespace {

LedgerIdentity sample_identity() {
    LedgerIdentity id;
    id.repo_id = "org/model";
    id.path = "weights/model.safetensors";
    id.revision = "0123456789abcdef0123456789abcdef01234567";
    id.file_size = 20;
    id.chunk_size = 8;
    id.chunk_count = 3;
    id.digest = Digest{DigestAlgorithm::sha256, std::string(64, 'a')};
    return id;
}

} // namespace

TEST_CASE("Fresh ledger", "[ledger]") {
    TempDir dir;
    auto path = dir.path() / "work" / "abc.ledger";

    auto ledger = ResumeLedger::open(path, sample_identity(), false);
    REQUIRE(ledger);
    CHECK_FALSE((*ledger)->resumed());
    CHECK((*ledger)->completed().empty());
    CHECK(std::filesystem::exists(path));

    auto contents = ResumeLedger::read(path);
    REQUIRE(contents);
    CHECK(contents->identity == sample_identity());
    CHECK(contents->done.empty());
    CHECK_FALSE(contents->integrity_failed);
}

TEST_CASE("Recorded chunks survive a reopen", "[ledger]") {
    TempDir dir;
    auto path = dir.path() / "abc.ledger";

    {
        auto ledger = ResumeLedger::open(path, sample_identity(), true);
        REQUIRE(ledger);
        CHECK_FALSE((*ledger)->record_done(2));
        CHECK_FALSE((*ledger)->record_done(0));
        CHECK_FALSE((*ledger)->record_done(0));   // Repeat is a no-op
        CHECK((*ledger)->is_done(0));
        CHECK_FALSE((*ledger)->is_done(1));
    }

    auto text = read_file(path);
    CHECK(text.ends_with("done 2\ndone 0\n"));

    auto reopened = ResumeLedger::open(path, sample_identity(), true);
    REQUIRE(reopened);
    CHECK((*reopened)->resumed());
    CHECK((*reopened)->completed() == std::vector<std::uint32_t>{0, 2});

    SECTION("Appending continues the same file") {
        CHECK_FALSE((*reopened)->record_done(1));
        auto contents = ResumeLedger::read(path);
        REQUIRE(contents);
        CHECK(contents->done == std::vector<std::uint32_t>{2, 0, 1});
    }
}

TEST_CASE("Out-of-range chunk index", "[ledger]") {
    TempDir dir;
    auto ledger = ResumeLedger::open(dir.path() / "x.ledger", sample_identity(), true);
    REQUIRE(ledger);
    CHECK((*ledger)->record_done(3) == TransferErrc::invalid_range);
    CHECK_FALSE((*ledger)->is_done(3));
}

TEST_CASE("Stale ledgers are discarded", "[ledger]") {
    TempDir dir;
    auto path = dir.path() / "abc.ledger";
    {
        auto ledger = ResumeLedger::open(path, sample_identity(), true);
        REQUIRE(ledger);
        REQUIRE_FALSE((*ledger)->record_done(1));
    }

    SECTION("Remote file changed") {
        auto id = sample_identity();
        id.revision = "ffffffffffffffffffffffffffffffffffffffff";
        auto ledger = ResumeLedger::open(path, id, true);
        REQUIRE(ledger);
        CHECK_FALSE((*ledger)->resumed());
        CHECK((*ledger)->completed().empty());

        auto contents = ResumeLedger::read(path);
        REQUIRE(contents);
        CHECK(contents->identity.revision == id.revision);
        CHECK(contents->done.empty());
    }

    SECTION("Chunk size changed") {
        auto id = sample_identity();
        id.chunk_size = 4;
        id.chunk_count = 5;
        auto ledger = ResumeLedger::open(path, id, true);
        REQUIRE(ledger);
        CHECK_FALSE((*ledger)->resumed());
    }

    SECTION("Partial data file missing") {
        auto ledger = ResumeLedger::open(path, sample_identity(), false);
        REQUIRE(ledger);
        CHECK_FALSE((*ledger)->resumed());
        CHECK((*ledger)->completed().empty());
    }

    SECTION("Previous attempt failed verification") {
        {
            auto ledger = ResumeLedger::open(path, sample_identity(), true);
            REQUIRE(ledger);
            REQUIRE((*ledger)->resumed());
            REQUIRE_FALSE((*ledger)->record_integrity_failure());
        }
        auto contents = ResumeLedger::read(path);
        REQUIRE(contents);
        CHECK(contents->integrity_failed);

        auto ledger = ResumeLedger::open(path, sample_identity(), true);
        REQUIRE(ledger);
        CHECK_FALSE((*ledger)->resumed());
        CHECK((*ledger)->completed().empty());
    }
}

TEST_CASE("Damaged ledger files", "[ledger]") {
    TempDir dir;
    auto path = dir.path() / "abc.ledger";

    SECTION("Torn trailing record is dropped") {
        {
            auto ledger = ResumeLedger::open(path, sample_identity(), true);
            REQUIRE(ledger);
            REQUIRE_FALSE((*ledger)->record_done(0));
        }
        // Simulate a crash in the middle of appending "done 2\n"
        write_file(path, read_file(path) + "done 2");

        auto contents = ResumeLedger::read(path);
        REQUIRE(contents);
        CHECK(contents->done == std::vector<std::uint32_t>{0});

        auto ledger = ResumeLedger::open(path, sample_identity(), true);
        REQUIRE(ledger);
        CHECK((*ledger)->resumed());
        CHECK((*ledger)->completed() == std::vector<std::uint32_t>{0});

        REQUIRE_FALSE((*ledger)->record_done(1));
        CHECK(read_file(path).ends_with("done 0\ndone 1\n"));
    }

    SECTION("Garbage is not a ledger") {
        write_file(path, "this is not a ledger\n");
        auto contents = ResumeLedger::read(path);
        REQUIRE_FALSE(contents);
        CHECK(contents.error() == TransferErrc::ledger_corrupt);

        auto ledger = ResumeLedger::open(path, sample_identity(), true);
        REQUIRE(ledger);
        CHECK_FALSE((*ledger)->resumed());
    }

    SECTION("Unknown and out-of-range records are ignored") {
        {
            auto ledger = ResumeLedger::open(path, sample_identity(), true);
            REQUIRE(ledger);
        }
        write_file(path, read_file(path) + "done 1\nsomething else\ndone 99\ndone x\n");

        auto ledger = ResumeLedger::open(path, sample_identity(), true);
        REQUIRE(ledger);
        CHECK((*ledger)->resumed());
        CHECK((*ledger)->completed() == std::vector<std::uint32_t>{1});
    }
}

TEST_CASE("Ledger without a digest", "[ledger]") {
    TempDir dir;
    auto path = dir.path() / "abc.ledger";
    auto id = sample_identity();
    id.digest.reset();

    {
        auto ledger = ResumeLedger::open(path, id, true);
        REQUIRE(ledger);
    }
    auto contents = ResumeLedger::read(path);
    REQUIRE(contents);
    CHECK_FALSE(contents->identity.digest);
    CHECK(contents->identity == id);
}

TEST_CASE("Removing a ledger", "[ledger]") {
    TempDir dir;
    auto path = dir.path() / "abc.ledger";
    auto ledger = ResumeLedger::open(path, sample_identity(), true);
    REQUIRE(ledger);
    REQUIRE(std::filesystem::exists(path));

    CHECK_FALSE((*ledger)->remove());
    CHECK_FALSE(std::filesystem::exists(path));

    auto missing = ResumeLedger::read(path);
    CHECK_FALSE(missing);
}
