// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hubfetch/core/remote.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <vector>

namespace hubfetch::core {

// What a ledger was written for; a mismatch on load makes it stale
struct LedgerIdentity {
    std::string repo_id;
    std::string path;
    std::string revision;
    std::uint64_t file_size{0};
    std::int64_t chunk_size{0};
    std::uint32_t chunk_count{0};
    std::optional<Digest> digest;     // File-level digest placeholder

    bool operator==(const LedgerIdentity&) const = default;
};

// Parsed contents of a .ledger file
struct LedgerContents {
    LedgerIdentity identity;
    std::vector<std::uint32_t> done;
    bool integrity_failed{false};
};

// Append-only record of completed chunks for one file.
//
// Layout (text, one record per line):
//   hubfetch-ledger 1
//   <repo id>
//   <path>
//   <revision>
//   <file size> <chunk size> <chunk count>
//   <digest algorithm> <digest hex>        ("- -" when unknown)
//   done <chunk index>                     (one per completed chunk)
//   integrity-failed                       (assembled file did not verify)
//
// Each record is fsync'ed before record_done() returns.
class ResumeLedger {
public:
    static constexpr std::string_view MAGIC = "hubfetch-ledger";
    static constexpr int VERSION = 1;

    ~ResumeLedger();

    ResumeLedger(const ResumeLedger&) = delete;
    ResumeLedger& operator=(const ResumeLedger&) = delete;

    // Load the ledger at `path` when it matches `identity` and the data file
    // is intact; otherwise start a fresh one (the caller must then restart the
    // data file from empty, see resumed()).
    [[nodiscard]] static std::expected<std::unique_ptr<ResumeLedger>, std::error_code>
    open(const std::filesystem::path& path,
         const LedgerIdentity& identity,
         bool data_file_intact);

    // Parse without opening for append
    [[nodiscard]] static std::expected<LedgerContents, std::error_code>
    read(const std::filesystem::path& path);

    // True when previous progress was kept
    [[nodiscard]] bool resumed() const noexcept { return resumed_; }

    // Completed chunk indices, ascending
    [[nodiscard]] std::vector<std::uint32_t> completed() const;

    [[nodiscard]] bool is_done(std::uint32_t index) const;

    // Durably record a finished chunk (serialized across workers)
    [[nodiscard]] std::error_code record_done(std::uint32_t index);

    // Mark the assembled file as failed verification; the next open restarts
    [[nodiscard]] std::error_code record_integrity_failure();

    // Close and delete the ledger file
    [[nodiscard]] std::error_code remove();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const LedgerIdentity& identity() const noexcept { return identity_; }

private:
    ResumeLedger(std::filesystem::path path, LedgerIdentity identity);

    [[nodiscard]] std::error_code start_fresh();
    [[nodiscard]] std::error_code reopen_for_append(std::uint64_t valid_length);
    [[nodiscard]] std::error_code append_record(const std::string& line);

    std::filesystem::path path_;
    LedgerIdentity identity_;
    std::vector<bool> done_;
    bool resumed_{false};
    int fd_{-1};
    mutable std::shared_mutex mutex_;
};

} // namespace hubfetch::core
