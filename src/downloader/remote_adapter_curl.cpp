/*
 * fetchkit/src/downloader/remote_adapter_curl.cpp
 *
 * Notes
 * - probe(): HEAD (NOBODY) with redirects followed; falls back to a GET that is abandoned at the
 *   first body byte when the server rejects HEAD. For ftp:// NOBODY issues SIZE.
 * - open(): pull-based body stream driven through a private multi handle, so the caller decides
 *   how many bytes to take per read (see AdaptiveChunker).
 * - HTTP offsets go out as "Range: bytes=<offset>-"; FTP offsets as REST before RETR, after an
 *   anonymous login and a single CWD to the parent directory. Transfers are binary (TYPE I).
 * - Timeouts bound connect and stalls (low-speed limit), never the whole transfer.
 *
 * Build
 * - Linked via CURL::libcurl. Depends on spdlog for logging.
 */

#include <fetchkit/downloader/downloader.hpp>
#include <fetchkit/downloader/url_normalizer.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fetchkit::downloader {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where, std::string_view url) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    err.url = std::string(url);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_HTTP_RETURNED_ERROR:
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_FTP_COULDNT_RETR_FILE:
        case CURLE_FTP_COULDNT_USE_REST:
        case CURLE_RANGE_ERROR:
            err.code = ErrorCode::ServerError;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_LOGIN_DENIED:
        case CURLE_WEIRD_SERVER_REPLY:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

bool isFtp(std::string_view url) {
    return urlScheme(url) == "ftp";
}

std::optional<std::uint64_t> declaredLength(CURL* curl) {
    curl_off_t len = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len) != CURLE_OK || len < 0)
        return std::nullopt;
    return static_cast<std::uint64_t>(len);
}

// Unique ownership of an easy handle
struct EasyDeleter {
    void operator()(CURL* c) const noexcept {
        if (c)
            curl_easy_cleanup(c);
    }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

// Common CURL easy handle configuration
void configure_common(CURL* curl, std::string_view url, std::chrono::milliseconds timeout,
                      const DownloaderConfig& cfg) {
    curl_easy_setopt(curl, CURLOPT_URL, std::string(url).c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Connect timeout plus stall detection; a slow but steady transfer is never cut off
    const long timeoutMs = std::max<long>(static_cast<long>(timeout.count()), 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, std::max<long>(timeoutMs / 1000, 1L));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    // 4xx/5xx become transfer errors instead of error pages written into the .part file
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.tlsInsecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.tlsInsecure ? 0L : 2L);
    if (!cfg.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, cfg.caPath.c_str());
    }

    // FTP: one CWD into the parent directory, then RETR <name>; binary transfers
    curl_easy_setopt(curl, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    curl_easy_setopt(curl, CURLOPT_TRANSFERTEXT, 0L);

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

// Probe write callback: stop at the first body byte (the GET fallback only wants headers)
struct ProbeContext {
    bool sawBody{false};
};

size_t probe_write_cb(char*, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ProbeContext*>(userdata);
    if (ctx && size * nmemb > 0)
        ctx->sawBody = true;
    return 0; // abort => CURLE_WRITE_ERROR, expected
}

/*
 * Body stream over a single easy handle attached to its own multi handle. Bytes delivered by
 * libcurl's write callback queue in pending_ until read() hands them out.
 */
class CurlByteStream final : public IByteStream {
public:
    CurlByteStream(EasyHandle easy, std::string url) : easy_(std::move(easy)), url_(std::move(url)) {
        multi_ = curl_multi_init();
    }

    ~CurlByteStream() override {
        if (multi_) {
            if (easy_)
                curl_multi_remove_handle(multi_, easy_.get());
            curl_multi_cleanup(multi_);
        }
    }

    CurlByteStream(const CurlByteStream&) = delete;
    CurlByteStream& operator=(const CurlByteStream&) = delete;

    // Attach and pump until the first body byte or completion; headers are known afterwards.
    Expected<void> start() {
        if (!multi_) {
            return Error{ErrorCode::Unknown, "curl_multi_init failed", url_};
        }
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, &CurlByteStream::write_cb);
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, this);

        if (auto mc = curl_multi_add_handle(multi_, easy_.get()); mc != CURLM_OK) {
            return Error{ErrorCode::Unknown,
                         std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc),
                         url_};
        }

        while (pending_.size() == readPos_ && !done_) {
            if (auto r = pump(); !r.ok())
                return r;
        }
        if (done_ && result_ != CURLE_OK) {
            return makeCurlError(result_, "open", url_);
        }

        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status_);
        contentLength_ = declaredLength(easy_.get());
        spdlog::debug("opened {} (status {}, length {})", url_, status_,
                      contentLength_ ? std::to_string(*contentLength_) : std::string("unknown"));
        return Expected<void>{};
    }

    Expected<std::size_t> read(std::span<std::byte> buffer) override {
        while (pending_.size() == readPos_ && !done_) {
            if (auto r = pump(); !r.ok())
                return r.error();
        }

        if (pending_.size() > readPos_) {
            const auto n = std::min(buffer.size(), pending_.size() - readPos_);
            std::memcpy(buffer.data(), pending_.data() + readPos_, n);
            readPos_ += n;
            if (readPos_ == pending_.size()) {
                pending_.clear();
                readPos_ = 0;
            }
            return n;
        }

        if (result_ != CURLE_OK) {
            return makeCurlError(result_, "read", url_);
        }
        return std::size_t{0};
    }

    [[nodiscard]] long status() const override { return status_; }

    [[nodiscard]] std::optional<std::uint64_t> contentLength() const override {
        return contentLength_;
    }

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlByteStream*>(userdata);
        const size_t total = size * nmemb;
        if (self == nullptr)
            return 0;
        auto* bytes = reinterpret_cast<const std::byte*>(ptr);
        self->pending_.insert(self->pending_.end(), bytes, bytes + total);
        return total;
    }

    Expected<void> pump() {
        int running = 0;
        if (auto mc = curl_multi_perform(multi_, &running); mc != CURLM_OK) {
            return Error{ErrorCode::Unknown,
                         std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc),
                         url_};
        }

        int msgsLeft = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &msgsLeft)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
                done_ = true;
                result_ = msg->data.result;
            }
        }

        if (!done_ && running > 0 && pending_.size() == readPos_) {
            if (auto mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr); mc != CURLM_OK) {
                return Error{ErrorCode::Unknown,
                             std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc),
                             url_};
            }
        }
        return Expected<void>{};
    }

    EasyHandle easy_;
    CURLM* multi_{nullptr};
    std::string url_;
    std::vector<std::byte> pending_;
    std::size_t readPos_{0};
    bool done_{false};
    CURLcode result_{CURLE_OK};
    long status_{0};
    std::optional<std::uint64_t> contentLength_{};
};

class CurlRemoteAdapter final : public IRemoteAdapter {
public:
    explicit CurlRemoteAdapter(DownloaderConfig cfg) : cfg_(std::move(cfg)) {
        static std::once_flag globalInit;
        std::call_once(globalInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    Expected<ResourceInfo> probe(std::string_view url,
                                 std::chrono::milliseconds timeout) override {
        EasyHandle curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed", std::string(url)};
        }

        configure_common(curl.get(), url, timeout, cfg_);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        // The probe is a single open operation; bound it as a whole.
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                         std::max<long>(static_cast<long>(timeout.count()), 1L));

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK && !isFtp(url)) {
            // Some servers reject HEAD; open with GET and hang up at the first body byte
            spdlog::debug("HEAD probe failed ({}), retrying with GET", curl_easy_strerror(rc));
            ProbeContext pctx;
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 0L);
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, probe_write_cb);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &pctx);
            rc = curl_easy_perform(curl.get());
            if (rc == CURLE_WRITE_ERROR && pctx.sawBody)
                rc = CURLE_OK;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "probe", url);
        }

        ResourceInfo info;
        char* effective = nullptr;
        if (curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK &&
            effective != nullptr) {
            info.effectiveUrl = effective;
        } else {
            info.effectiveUrl = std::string(url);
        }
        info.contentLength = declaredLength(curl.get());

        spdlog::debug("probe {} -> {} (length {})", url, info.effectiveUrl,
                      info.contentLength ? std::to_string(*info.contentLength)
                                         : std::string("unknown"));
        return info;
    }

    Expected<std::unique_ptr<IByteStream>> open(std::string_view url, std::uint64_t offset,
                                                std::chrono::milliseconds timeout) override {
        EasyHandle curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed", std::string(url)};
        }

        configure_common(curl.get(), url, timeout, cfg_);
        if (offset > 0) {
            if (isFtp(url)) {
                // REST <offset> before RETR
                curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE,
                                 static_cast<curl_off_t>(offset));
            } else {
                // Range: bytes=<offset>- ; a server may ignore it and answer 200
                const std::string range = std::to_string(offset) + "-";
                curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
            }
        }

        auto stream = std::make_unique<CurlByteStream>(std::move(curl), std::string(url));
        if (auto r = stream->start(); !r.ok()) {
            return r.error();
        }
        return std::unique_ptr<IByteStream>(std::move(stream));
    }

private:
    DownloaderConfig cfg_;
};

} // namespace

std::unique_ptr<IRemoteAdapter> makeCurlRemoteAdapter(const DownloaderConfig& cfg) {
    return std::make_unique<CurlRemoteAdapter>(cfg);
}

} // namespace fetchkit::downloader
