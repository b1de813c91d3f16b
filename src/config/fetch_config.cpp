#include <fetchkit/config/config_helpers.h>
#include <fetchkit/config/fetch_config.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <string>

namespace fetchkit::config {

using downloader::DownloaderConfig;
using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

namespace {

constexpr const char* kSection = "fetch";

Error bad_value(const std::filesystem::path& path, const std::string& key,
                const std::string& value, const char* expected) {
    return Error{ErrorCode::InvalidArgument, "Invalid value for [fetch] " + key + " in " +
                                                 path.string() + ": '" + value + "' (expected " +
                                                 expected + ")"};
}

std::optional<std::chrono::milliseconds> parse_seconds(const std::string& s) {
    if (s.empty())
        return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const double secs = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(secs) || secs <= 0.0)
        return std::nullopt;
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(secs * 1000.0));
}

} // namespace

Expected<DownloaderConfig> load_downloader_config(const std::filesystem::path& config_path) {
    DownloaderConfig cfg;

    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        spdlog::debug("No config file at {}; using defaults", config_path.string());
        return cfg;
    }

    auto value = [&](const char* key) { return parse_config_value(config_path, kSection, key); };

    if (auto v = value("timeout"); !v.empty()) {
        auto ms = parse_seconds(v);
        if (!ms)
            return bad_value(config_path, "timeout", v, "a positive number of seconds");
        cfg.defaultTimeout = *ms;
    }
    if (auto v = value("chunk_size"); !v.empty()) {
        auto n = parse_u64(v);
        if (!n || *n == 0)
            return bad_value(config_path, "chunk_size", v, "a positive byte count");
        cfg.initialChunkSize = static_cast<std::size_t>(*n);
    }
    if (auto v = value("max_chunk_size"); !v.empty()) {
        auto n = parse_u64(v);
        if (!n || *n == 0)
            return bad_value(config_path, "max_chunk_size", v, "a positive byte count");
        cfg.maxChunkSize = static_cast<std::size_t>(*n);
    }
    if (cfg.maxChunkSize < cfg.initialChunkSize) {
        return Error{ErrorCode::InvalidArgument,
                     "[fetch] max_chunk_size must not be smaller than chunk_size in " +
                         config_path.string()};
    }
    if (auto v = value("hash_algo"); !v.empty()) {
        auto algo = downloader::parseHashAlgo(v);
        if (!algo)
            return bad_value(config_path, "hash_algo", v, "md5, sha256 or sha512");
        cfg.defaultChecksumAlgo = *algo;
    }
    if (auto v = value("resume"); !v.empty()) {
        auto b = parse_bool(v);
        if (!b)
            return bad_value(config_path, "resume", v, "true or false");
        cfg.resume = *b;
    }
    if (auto v = value("user_agent"); !v.empty()) {
        cfg.userAgent = v;
    }
    if (auto v = value("tls_insecure"); !v.empty()) {
        auto b = parse_bool(v);
        if (!b)
            return bad_value(config_path, "tls_insecure", v, "true or false");
        cfg.tlsInsecure = *b;
    }
    if (auto v = value("ca_path"); !v.empty()) {
        cfg.caPath = expand_tilde(v).string();
    }

    spdlog::debug("Loaded downloader config from {}", config_path.string());
    return cfg;
}

} // namespace fetchkit::config
