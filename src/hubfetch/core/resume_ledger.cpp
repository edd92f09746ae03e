// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/resume_ledger.hpp>
#include <hubfetch/core/error.hpp>
#include <hubfetch/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <charconv>
#include <fcntl.h>
#include <fstream>
#include <mutex>
#include <sstream>
#include <unistd.h>

namespace hubfetch::core {

namespace {

constexpr std::size_t HEADER_LINES = 6;

template<typename T>
bool parse_number(std::string_view text, T& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

struct ParsedLedger {
    LedgerContents contents;
    std::uint64_t valid_length{0};   // Bytes up to the last complete line
};

std::expected<ParsedLedger, std::error_code> parse_ledger(std::string_view text) {
    ParsedLedger parsed;

    // A torn trailing record (crash mid-append) is dropped
    auto last_newline = text.rfind('\n');
    parsed.valid_length = last_newline == std::string_view::npos ? 0 : last_newline + 1;
    text = text.substr(0, parsed.valid_length);

    std::vector<std::string_view> lines;
    while (!text.empty()) {
        auto nl = text.find('\n');
        lines.push_back(text.substr(0, nl));
        text.remove_prefix(nl + 1);
    }

    if (lines.size() < HEADER_LINES) {
        return std::unexpected(make_error_code(TransferErrc::ledger_corrupt));
    }

    std::string expected_magic = std::string(ResumeLedger::MAGIC) + " " + std::to_string(ResumeLedger::VERSION);
    if (lines[0] != expected_magic) {
        return std::unexpected(make_error_code(TransferErrc::ledger_corrupt));
    }

    auto& id = parsed.contents.identity;
    id.repo_id = std::string(lines[1]);
    id.path = std::string(lines[2]);
    id.revision = std::string(lines[3]);

    {
        std::istringstream iss{std::string(lines[4])};
        if (!(iss >> id.file_size >> id.chunk_size >> id.chunk_count)) {
            return std::unexpected(make_error_code(TransferErrc::ledger_corrupt));
        }
    }

    {
        auto line = lines[5];
        auto space = line.find(' ');
        if (space == std::string_view::npos) {
            return std::unexpected(make_error_code(TransferErrc::ledger_corrupt));
        }
        auto algo = line.substr(0, space);
        auto hex = line.substr(space + 1);
        if (algo != "-") {
            auto parsed_algo = digest_algorithm_from_string(algo);
            if (!parsed_algo) {
                return std::unexpected(make_error_code(TransferErrc::ledger_corrupt));
            }
            id.digest = Digest{*parsed_algo, std::string(hex)};
        }
    }

    constexpr std::string_view DONE_PREFIX = "done ";
    for (std::size_t i = HEADER_LINES; i < lines.size(); ++i) {
        auto line = lines[i];
        if (line == "integrity-failed") {
            parsed.contents.integrity_failed = true;
        } else if (line.starts_with(DONE_PREFIX)) {
            std::uint32_t index = 0;
            if (parse_number(line.substr(DONE_PREFIX.size()), index)) {
                parsed.contents.done.push_back(index);
            }
        }
        // Anything else is ignored
    }

    return parsed;
}

std::string format_header(const LedgerIdentity& id) {
    std::ostringstream ss;
    ss << ResumeLedger::MAGIC << ' ' << ResumeLedger::VERSION << '\n';
    ss << id.repo_id << '\n';
    ss << id.path << '\n';
    ss << id.revision << '\n';
    ss << id.file_size << ' ' << id.chunk_size << ' ' << id.chunk_count << '\n';
    if (id.digest) {
        ss << to_string(id.digest->algorithm) << ' ' << id.digest->hex << '\n';
    } else {
        ss << "- -\n";
    }
    return ss.str();
}

std::expected<std::string, std::error_code> slurp(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
    return ss.str();
}

std::error_code write_all(int fd, const std::string& data) noexcept {
    const char* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return disk::errno_to_error_code(errno, disk::DiskErrc::write_error);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        return disk::errno_to_error_code(errno, disk::DiskErrc::sync_error);
    }
    return {};
}

} // namespace

//=============================================================================
// ResumeLedger
//=============================================================================

ResumeLedger::ResumeLedger(std::filesystem::path path, LedgerIdentity identity)
    : path_(std::move(path))
    , identity_(std::move(identity))
    , done_(identity_.chunk_count, false) {}

ResumeLedger::~ResumeLedger() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::expected<std::unique_ptr<ResumeLedger>, std::error_code>
ResumeLedger::open(const std::filesystem::path& path,
                   const LedgerIdentity& identity,
                   bool data_file_intact) {
    std::unique_ptr<ResumeLedger> ledger(new ResumeLedger(path, identity));

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
        }
    }

    if (std::filesystem::exists(path, ec)) {
        std::expected<ParsedLedger, std::error_code> parsed = std::unexpected(ec);
        if (auto text = slurp(path)) {
            parsed = parse_ledger(*text);
        } else {
            parsed = std::unexpected(text.error());
        }

        if (!parsed) {
            spdlog::warn("Discarding unreadable ledger {}: {}", path.string(), parsed.error().message());
        } else if (parsed->contents.identity != identity) {
            spdlog::warn("Discarding stale ledger {}: remote file or chunk size changed", path.string());
        } else if (!data_file_intact) {
            spdlog::warn("Discarding ledger {}: partial file missing or resized", path.string());
        } else if (parsed->contents.integrity_failed) {
            spdlog::warn("Discarding ledger {}: previous attempt failed verification", path.string());
        } else {
            for (auto index : parsed->contents.done) {
                if (index < identity.chunk_count) {
                    ledger->done_[index] = true;
                } else {
                    spdlog::warn("Ledger {}: ignoring out-of-range chunk {}", path.string(), index);
                }
            }
            if (auto reopen_ec = ledger->reopen_for_append(parsed->valid_length)) {
                return std::unexpected(reopen_ec);
            }
            ledger->resumed_ = true;
            return ledger;
        }
    }

    if (auto fresh_ec = ledger->start_fresh()) {
        return std::unexpected(fresh_ec);
    }
    return ledger;
}

std::expected<LedgerContents, std::error_code>
ResumeLedger::read(const std::filesystem::path& path) {
    auto text = slurp(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto parsed = parse_ledger(*text);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return std::move(parsed->contents);
}

std::error_code ResumeLedger::start_fresh() {
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return disk::errno_to_error_code(errno, disk::DiskErrc::write_error);
    }
    fd_ = fd;
    resumed_ = false;
    done_.assign(identity_.chunk_count, false);
    return write_all(fd_, format_header(identity_));
}

std::error_code ResumeLedger::reopen_for_append(std::uint64_t valid_length) {
    int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
        return disk::errno_to_error_code(errno, disk::DiskErrc::write_error);
    }
    // Cut a torn trailing record so the next append starts on a fresh line
    if (::ftruncate(fd, static_cast<off_t>(valid_length)) != 0) {
        int err = errno;
        ::close(fd);
        return disk::errno_to_error_code(err, disk::DiskErrc::write_error);
    }
    fd_ = fd;
    return {};
}

std::error_code ResumeLedger::append_record(const std::string& line) {
    if (fd_ < 0) {
        return make_error_code(disk::DiskErrc::handle_invalid);
    }
    return write_all(fd_, line);
}

std::vector<std::uint32_t> ResumeLedger::completed() const {
    std::shared_lock lock(mutex_);
    std::vector<std::uint32_t> result;
    for (std::uint32_t i = 0; i < done_.size(); ++i) {
        if (done_[i]) result.push_back(i);
    }
    return result;
}

bool ResumeLedger::is_done(std::uint32_t index) const {
    std::shared_lock lock(mutex_);
    return index < done_.size() && done_[index];
}

std::error_code ResumeLedger::record_done(std::uint32_t index) {
    std::unique_lock lock(mutex_);
    if (index >= done_.size()) {
        return make_error_code(TransferErrc::invalid_range);
    }
    if (done_[index]) {
        return {};
    }

    if (auto ec = append_record("done " + std::to_string(index) + "\n")) {
        return ec;
    }
    done_[index] = true;
    return {};
}

std::error_code ResumeLedger::record_integrity_failure() {
    std::unique_lock lock(mutex_);
    return append_record("integrity-failed\n");
}

std::error_code ResumeLedger::remove() {
    std::unique_lock lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return disk::errno_to_error_code(ec.value(), disk::DiskErrc::write_error);
    }
    return {};
}

} // namespace hubfetch::core
