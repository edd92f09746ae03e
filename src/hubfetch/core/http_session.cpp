// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/core/http_session.hpp>
#include <hubfetch/version.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace hubfetch::core {

namespace {

static_assert(CURL_LOCK_DATA_LAST <= 16, "share lock table too small");

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block (redirect hops)
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t text_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t total = size * nitems;
    body->append(ptr, total);
    return total;
}

// State for a streaming range read
struct StreamState {
    CURL* curl{nullptr};
    const ChunkSink* sink{nullptr};
    const RangeRequest* request{nullptr};
    bool checked_status{false};
    long status{0};
    std::error_code error;          // Set when we aborted the transfer
};

std::size_t stream_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* st = static_cast<StreamState*>(userdata);
    std::size_t total = size * nitems;

    if (!st->checked_status) {
        st->checked_status = true;
        curl_easy_getinfo(st->curl, CURLINFO_RESPONSE_CODE, &st->status);

        if (st->status >= 400) {
            st->error = error_from_http_status(st->status);
            return 0;
        }

        // A 200 to a ranged request is only the range we asked for when that
        // range is the whole file
        const auto* file = st->request->file;
        if (!st->request->whole_object && st->status != 206 &&
            !(st->request->start == 0 && file && st->request->length == file->size)) {
            st->error = make_error_code(TransferErrc::invalid_range);
            return 0;
        }
    }

    if (auto ec = (*st->sink)(reinterpret_cast<const std::byte*>(ptr), total)) {
        st->error = ec;
        return 0;   // Abort the transfer
    }
    return total;
}

std::uint64_t parse_u64(std::string_view text, bool& ok) noexcept {
    std::uint64_t value = 0;
    auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    ok = ec == std::errc{} && p == text.data() + text.size() && !text.empty();
    return value;
}

bool is_hex(std::string_view s, std::size_t length) noexcept {
    return s.size() == length &&
           std::all_of(s.begin(), s.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

void lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* locks = static_cast<std::array<std::mutex, 16>*>(userptr);
    (*locks)[static_cast<std::size_t>(data)].lock();
}

void unlock_share(CURL*, curl_lock_data data, void* userptr) {
    auto* locks = static_cast<std::array<std::mutex, 16>*>(userptr);
    (*locks)[static_cast<std::size_t>(data)].unlock();
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(const TransferConfig& config)
    : config_(config) {
    // Share DNS cache and SSL sessions between requests
    CURLSH* share = curl_share_init();
    if (share) {
        curl_share_setopt(share, CURLSHOPT_LOCKFUNC, lock_share);
        curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, unlock_share);
        curl_share_setopt(share, CURLSHOPT_USERDATA, &share_locks_);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        share_ = share;
    }
}

HttpSession::~HttpSession() {
    if (share_) {
        curl_share_cleanup(static_cast<CURLSH*>(share_));
    }
}

RequestTimeouts HttpSession::timeouts_for(const TransferConfig& config, bool body_transfer) noexcept {
    RequestTimeouts t;
    t.connect_seconds = static_cast<long>(config.connect_timeout_seconds);
    if (body_transfer) {
        t.low_speed_bytes = 1;
        t.low_speed_seconds = static_cast<long>(config.stall_timeout_seconds);
    } else {
        t.total_seconds = static_cast<long>(config.request_timeout_seconds);
    }
    return t;
}

void HttpSession::apply_common_options(void* handle, bool body_transfer) const {
    auto* curl = static_cast<CURL*>(handle);
    static const std::string user_agent = "hubfetch/" + version.to_string();
    const auto timeouts = timeouts_for(config_, body_transfer);

    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeouts.connect_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeouts.total_seconds);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, timeouts.low_speed_bytes);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeouts.low_speed_seconds);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    if (share_) {
        curl_easy_setopt(curl, CURLOPT_SHARE, static_cast<CURLSH*>(share_));
    }
}

std::string HttpSession::resolve_url(std::string_view repo_id,
                                     std::string_view revision,
                                     std::string_view path) const {
    std::string url = config_.hub_endpoint;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += '/';
    url += repo_id;
    url += "/resolve/";
    url += encode_path(revision);
    url += '/';
    url += encode_path(path);
    return url;
}

std::string HttpSession::manifest_url(std::string_view repo_id) const {
    std::string url = config_.hub_endpoint;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += "/api/models/";
    url += repo_id;
    url += "/revision/";
    url += encode_path(config_.revision);
    url += "?blobs=true";
    return url;
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    HttpResponse response{};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 0L);
    apply_common_options(curl.ptr, false);

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {}: {}", url, curl_easy_strerror(result));
        return std::unexpected(error_from_curl(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    if (http_code >= 400) {
        return std::unexpected(error_from_http_status(http_code));
    }

    bool ok = false;
    auto length = parse_u64(response.header("content-length"), ok);
    response.content_length = ok ? length : 0;
    response.accepts_ranges = response.header("accept-ranges").find("bytes") != std::string::npos;

    return response;
}

std::expected<std::string, std::error_code>
HttpSession::get_text(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    std::string body;
    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    apply_common_options(curl.ptr, false);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, text_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("GET {}: {}", url, curl_easy_strerror(result));
        return std::unexpected(error_from_curl(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        return std::unexpected(error_from_http_status(http_code));
    }
    return body;
}

std::expected<RemoteFileDescriptor, std::error_code>
HttpSession::resolve(const std::string& repo_id, const std::string& path) {
    auto url = resolve_url(repo_id, config_.revision, path);

    // Relative redirects (renamed repositories) are followed here; an absolute
    // one points at the LFS store and already carries the metadata we need
    for (std::uint32_t hop = 0; hop <= MAX_REDIRECTS; ++hop) {
        auto response = head(url);
        if (!response) {
            spdlog::debug("resolve {}/{}: {}", repo_id, path, response.error().message());
            return std::unexpected(response.error());
        }

        const auto status = response->status_code;
        const auto location = response->header("location");
        const bool redirect = status >= 300 && status < 400;

        if (redirect && location.starts_with("/") && response->header("x-linked-size").empty()) {
            std::string base = config_.hub_endpoint;
            while (!base.empty() && base.back() == '/') base.pop_back();
            url = base + location;
            continue;
        }

        return descriptor_from_headers(repo_id, path, config_.revision, *response);
    }

    return std::unexpected(make_error_code(TransferErrc::client_error));
}

std::expected<Manifest, std::error_code>
HttpSession::list(const std::string& repo_id) {
    auto body = get_text(manifest_url(repo_id));
    if (!body) {
        return std::unexpected(body.error());
    }
    return parse_manifest(repo_id, *body);
}

std::error_code HttpSession::fetch(const RangeRequest& request, const ChunkSink& sink) {
    if (!request.file) {
        return make_error_code(TransferErrc::invalid_range);
    }
    const auto& file = *request.file;

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(TransferErrc::network_error);
    }

    auto revision = file.revision.empty() ? config_.revision : file.revision;
    auto url = resolve_url(file.repo_id, revision, file.path);

    StreamState state;
    state.curl = curl.ptr;
    state.sink = &sink;
    state.request = &request;

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    apply_common_options(curl.ptr, true);

    std::string range;
    if (!request.whole_object) {
        if (request.length == 0) {
            return {};
        }
        range = std::to_string(request.start) + "-" + std::to_string(request.start + request.length - 1);
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(WRITE_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, stream_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &state);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (state.error) {
        return state.error;
    }
    if (result != CURLE_OK) {
        spdlog::debug("GET {} [{}]: {}", file.path, range, curl_easy_strerror(result));
        return error_from_curl(result);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        return error_from_http_status(http_code);
    }
    return {};
}

//=============================================================================
// Parsing helpers
//=============================================================================

std::expected<RemoteFileDescriptor, std::error_code>
HttpSession::descriptor_from_headers(const std::string& repo_id,
                                     const std::string& path,
                                     const std::string& requested_revision,
                                     const HttpResponse& response) {
    RemoteFileDescriptor file;
    file.repo_id = repo_id;
    file.path = path;

    bool ok = false;
    const auto linked_size = response.header("x-linked-size");
    if (!linked_size.empty()) {
        file.size = parse_u64(linked_size, ok);
    } else {
        file.size = parse_u64(response.header("content-length"), ok);
    }
    if (!ok) {
        spdlog::error("{}: hub did not report a size", path);
        return std::unexpected(make_error_code(TransferErrc::metadata_error));
    }

    // LFS objects carry their sha256 in x-linked-etag, regular files their git blob id in etag
    auto linked_etag = normalize_etag(response.header("x-linked-etag"));
    auto etag = normalize_etag(response.header("etag"));
    if (is_hex(linked_etag, 64)) {
        file.digest = Digest{DigestAlgorithm::sha256, linked_etag};
    } else if (linked_etag.empty() && is_hex(etag, 40)) {
        file.digest = Digest{DigestAlgorithm::git_sha1, etag};
    } else if (is_hex(etag, 64)) {
        file.digest = Digest{DigestAlgorithm::sha256, etag};
    }

    auto commit = response.header("x-repo-commit");
    file.revision = commit.empty() ? requested_revision : commit;

    const bool lfs_redirect = response.status_code >= 300 && response.status_code < 400 &&
                              !response.header("location").empty();
    file.accepts_ranges = response.accepts_ranges || lfs_redirect;

    return file;
}

std::expected<Manifest, std::error_code>
HttpSession::parse_manifest(const std::string& repo_id, std::string_view json_text) {
    try {
        auto j = nlohmann::json::parse(json_text);

        Manifest manifest;
        manifest.repo_id = repo_id;
        manifest.revision = j.value("sha", std::string{});

        if (!j.contains("siblings") || !j.at("siblings").is_array()) {
            spdlog::error("{}: model info has no file list", repo_id);
            return std::unexpected(make_error_code(TransferErrc::metadata_error));
        }

        for (const auto& sibling : j.at("siblings")) {
            RemoteFileDescriptor file;
            file.repo_id = repo_id;
            file.path = sibling.at("rfilename").get<std::string>();
            file.revision = manifest.revision;

            const auto lfs = sibling.find("lfs");
            if (lfs != sibling.end() && lfs->is_object()) {
                file.size = lfs->at("size").get<std::uint64_t>();
                auto sha = lfs->value("sha256", std::string{});
                if (is_hex(sha, 64)) {
                    file.digest = Digest{DigestAlgorithm::sha256, sha};
                }
            } else if (sibling.contains("size")) {
                file.size = sibling.at("size").get<std::uint64_t>();
                auto blob = sibling.value("blobId", std::string{});
                if (is_hex(blob, 40)) {
                    file.digest = Digest{DigestAlgorithm::git_sha1, blob};
                }
            } else {
                spdlog::error("{}: no size for {} (was blobs=true honoured?)", repo_id, file.path);
                return std::unexpected(make_error_code(TransferErrc::metadata_error));
            }

            manifest.files.push_back(std::move(file));
        }
        return manifest;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("{}: malformed model info: {}", repo_id, e.what());
        return std::unexpected(make_error_code(TransferErrc::metadata_error));
    }
}

std::string HttpSession::encode_path(std::string_view path) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += c;
        } else {
            out += '%';
            out += HEX[u >> 4];
            out += HEX[u & 0x0F];
        }
    }
    return out;
}

std::string HttpSession::normalize_etag(std::string_view etag) {
    if (etag.starts_with("W/")) {
        etag.remove_prefix(2);
    }
    while (!etag.empty() && (etag.front() == '"' || etag.front() == ' ')) etag.remove_prefix(1);
    while (!etag.empty() && (etag.back() == '"' || etag.back() == ' ')) etag.remove_suffix(1);
    return std::string(etag);
}

std::error_code HttpSession::error_from_curl(int curl_code) noexcept {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TransferErrc::timeout);
        case CURLE_PARTIAL_FILE:
            return make_error_code(TransferErrc::short_body);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(TransferErrc::client_error);
        case CURLE_RANGE_ERROR:
            return make_error_code(TransferErrc::invalid_range);
        default:
            return make_error_code(TransferErrc::network_error);
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace hubfetch::core
