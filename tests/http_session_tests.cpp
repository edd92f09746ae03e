// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hubfetch/core/http_session.hpp>

using namespace hubfetch::core;

namespace {

constexpr const char* SHA256 = "3a1b3f6a3d5fe3c7b4a9e4f9b2c1d0e8f7a6b5c4d3e2f1a0b9c8d7e6f5a4b3c2";
constexpr const char* BLOB = "3b18e512dba79e4c8300dd08aeb37f8e728b8dad";
constexpr const char* COMMIT = "0123456789abcdef0123456789abcdef01234567";

} // namespace

TEST_CASE("Descriptor from resolve headers", "[http]") {
    SECTION("LFS file behind a redirect") {
        HttpResponse response;
        response.status_code = 302;
        response.headers["location"] = "https://cdn-lfs.example.com/object?sig=abc";
        response.headers["x-linked-size"] = "4368438272";
        response.headers["x-linked-etag"] = std::string("\"") + SHA256 + "\"";
        response.headers["etag"] = "\"abc\"";
        response.headers["x-repo-commit"] = COMMIT;
        response.headers["content-length"] = "1243";

        auto file = HttpSession::descriptor_from_headers("org/model", "model.gguf", "main", response);
        REQUIRE(file);
        CHECK(file->repo_id == "org/model");
        CHECK(file->path == "model.gguf");
        CHECK(file->size == 4368438272ULL);
        REQUIRE(file->digest);
        CHECK(file->digest->algorithm == DigestAlgorithm::sha256);
        CHECK(file->digest->hex == SHA256);
        CHECK(file->revision == COMMIT);
        CHECK(file->accepts_ranges);
    }

    SECTION("Regular file served directly") {
        HttpResponse response;
        response.status_code = 200;
        response.headers["content-length"] = "12";
        response.headers["etag"] = std::string("W/\"") + BLOB + "\"";
        response.accepts_ranges = true;

        auto file = HttpSession::descriptor_from_headers("org/model", "config.json", "v2", response);
        REQUIRE(file);
        CHECK(file->size == 12);
        REQUIRE(file->digest);
        CHECK(file->digest->algorithm == DigestAlgorithm::git_sha1);
        CHECK(file->digest->hex == BLOB);
        CHECK(file->revision == "v2");
        CHECK(file->accepts_ranges);
    }

    SECTION("No range support") {
        HttpResponse response;
        response.status_code = 200;
        response.headers["content-length"] = "100";

        auto file = HttpSession::descriptor_from_headers("org/model", "a.txt", "main", response);
        REQUIRE(file);
        CHECK_FALSE(file->accepts_ranges);
        CHECK_FALSE(file->digest);
    }

    SECTION("Missing size") {
        HttpResponse response;
        response.status_code = 200;
        response.headers["etag"] = BLOB;

        auto file = HttpSession::descriptor_from_headers("org/model", "a.txt", "main", response);
        REQUIRE_FALSE(file);
        CHECK(file.error() == TransferErrc::metadata_error);
    }
}

TEST_CASE("Manifest parsing", "[http]") {
    SECTION("Mixed LFS and regular files") {
        std::string json = std::string(R"({
            "id": "org/model",
            "sha": ")") + COMMIT + R"(",
            "siblings": [
                {"rfilename": "config.json", "size": 570, "blobId": ")" + BLOB + R"("},
                {"rfilename": "weights/model.safetensors", "size": 440473133, "blobId": "x",
                 "lfs": {"sha256": ")" + SHA256 + R"(", "size": 440473133, "pointerSize": 135}},
                {"rfilename": "README.md", "size": 0}
            ]
        })";

        auto manifest = HttpSession::parse_manifest("org/model", json);
        REQUIRE(manifest);
        CHECK(manifest->repo_id == "org/model");
        CHECK(manifest->revision == COMMIT);
        REQUIRE(manifest->files.size() == 3);

        const auto& config = manifest->files[0];
        CHECK(config.path == "config.json");
        CHECK(config.size == 570);
        REQUIRE(config.digest);
        CHECK(config.digest->algorithm == DigestAlgorithm::git_sha1);
        CHECK(config.revision == COMMIT);

        const auto& weights = manifest->files[1];
        CHECK(weights.path == "weights/model.safetensors");
        CHECK(weights.size == 440473133);
        REQUIRE(weights.digest);
        CHECK(weights.digest->algorithm == DigestAlgorithm::sha256);
        CHECK(weights.digest->hex == SHA256);

        CHECK(manifest->files[2].size == 0);
        CHECK_FALSE(manifest->files[2].digest);

        CHECK(manifest->total_bytes() == 570 + 440473133);
    }

    SECTION("Sibling without a size") {
        auto manifest = HttpSession::parse_manifest("org/model",
            R"({"sha": "abc", "siblings": [{"rfilename": "a.txt"}]})");
        REQUIRE_FALSE(manifest);
        CHECK(manifest.error() == TransferErrc::metadata_error);
    }

    SECTION("No file list") {
        auto manifest = HttpSession::parse_manifest("org/model", R"({"sha": "abc"})");
        REQUIRE_FALSE(manifest);
        CHECK(manifest.error() == TransferErrc::metadata_error);
    }

    SECTION("Malformed JSON") {
        auto manifest = HttpSession::parse_manifest("org/model", "<html>");
        REQUIRE_FALSE(manifest);
        CHECK(manifest.error() == TransferErrc::metadata_error);
    }
}

TEST_CASE("URL helpers", "[http]") {
    CHECK(HttpSession::encode_path("weights/model-00001.safetensors") == "weights/model-00001.safetensors");
    CHECK(HttpSession::encode_path("my file#1.txt") == "my%20file%231.txt");

    CHECK(HttpSession::normalize_etag("\"abc\"") == "abc");
    CHECK(HttpSession::normalize_etag("W/\"abc\"") == "abc");
    CHECK(HttpSession::normalize_etag("abc") == "abc");

    TransferConfig config;
    config.hub_endpoint = "https://hub.example.com/";
    config.revision = "refs/pr/1";
    HttpSession session(config);

    CHECK(session.resolve_url("org/model", "main", "sub dir/a.bin") ==
          "https://hub.example.com/org/model/resolve/main/sub%20dir/a.bin");
    CHECK(session.manifest_url("org/model") ==
          "https://hub.example.com/api/models/org/model/revision/refs/pr/1?blobs=true");
}

TEST_CASE("Request timeouts", "[http]") {
    TransferConfig config;
    config.connect_timeout_seconds = 10;
    config.request_timeout_seconds = 60;
    config.stall_timeout_seconds = 15;

    SECTION("Metadata requests have a total limit") {
        auto t = HttpSession::timeouts_for(config, false);
        CHECK(t.connect_seconds == 10);
        CHECK(t.total_seconds == 60);
        CHECK(t.low_speed_bytes == 0);
        CHECK(t.low_speed_seconds == 0);
    }

    SECTION("Body transfers are only cut off when stalled") {
        auto t = HttpSession::timeouts_for(config, true);
        CHECK(t.connect_seconds == 10);
        CHECK(t.total_seconds == 0);
        CHECK(t.low_speed_bytes == 1);
        CHECK(t.low_speed_seconds == 15);
    }
}
