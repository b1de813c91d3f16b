#include <CLI/CLI.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <fetchkit/config/config_helpers.h>
#include <fetchkit/config/fetch_config.h>
#include <fetchkit/downloader/fetcher.hpp>
#include <fetchkit/downloader/size_format.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace {

using namespace fetchkit::downloader;

struct CliOptions {
    std::string url;
    std::string path;
    std::string kind{"file"};
    bool replace{false};
    bool noResume{false};
    std::string hash;
    std::string hashAlgo;
    std::optional<double> timeoutSecs;
    std::string configPath;
    bool quiet{false};
    bool verbose{false};
};

// Log a line per 10% step (or per chunk once in a while when the size is unknown)
ProgressCallback makeProgressPrinter() {
    auto lastDecile = std::make_shared<int>(-1);
    auto lastUnknown = std::make_shared<std::uint64_t>(0);
    return [lastDecile, lastUnknown](const ProgressEvent& ev) {
        switch (ev.stage) {
            case ProgressStage::Resolving:
                spdlog::debug("Resolving {}", ev.url);
                return;
            case ProgressStage::Verifying:
                spdlog::info("Verifying checksum...");
                return;
            case ProgressStage::Extracting:
            case ProgressStage::Finalizing:
                return;
            case ProgressStage::Downloading:
                break;
        }
        if (ev.totalBytes && ev.percentage) {
            const int decile = static_cast<int>(std::floor(*ev.percentage / 10.0f));
            if (decile == *lastDecile)
                return;
            *lastDecile = decile;
            spdlog::info("{:5.1f}% {} / {}", *ev.percentage, sizeofFmt(ev.downloadedBytes),
                         sizeofFmt(*ev.totalBytes));
        } else if (ev.downloadedBytes >= *lastUnknown + 10ull * 1024 * 1024) {
            *lastUnknown = ev.downloadedBytes;
            spdlog::info("{} received", sizeofFmt(ev.downloadedBytes));
        }
    };
}

int runDownload(const CliOptions& opts) {
    const auto configPath = fetchkit::config::resolve_config_path(opts.configPath);
    auto cfg = fetchkit::config::load_downloader_config(configPath);
    if (!cfg.ok()) {
        spdlog::error("{}", cfg.error().message);
        return 2;
    }

    auto kind = archiveKindFromString(opts.kind);
    if (!kind.ok()) {
        spdlog::error("{}", kind.error().message);
        return 2;
    }

    Fetcher fetcher(cfg.value());
    auto request = fetcher.makeRequest(opts.url, opts.path);
    request.kind = kind.value();
    request.replace = opts.replace;
    request.verbose = !opts.quiet;
    if (opts.noResume)
        request.resume = false;
    if (opts.timeoutSecs) {
        request.timeout =
            std::chrono::milliseconds(static_cast<std::int64_t>(*opts.timeoutSecs * 1000.0));
    }

    if (!opts.hash.empty()) {
        Checksum checksum;
        checksum.algo = cfg.value().defaultChecksumAlgo;
        std::string hex = opts.hash;
        // "<algo>:<hex>" overrides --hash-algo
        if (auto colon = hex.find(':'); colon != std::string::npos) {
            auto algo = parseHashAlgo(hex.substr(0, colon));
            if (!algo) {
                spdlog::error("Unknown hash algorithm in '{}'", hex);
                return 2;
            }
            checksum.algo = *algo;
            hex = hex.substr(colon + 1);
        } else if (!opts.hashAlgo.empty()) {
            checksum.algo = *parseHashAlgo(opts.hashAlgo);
        }
        checksum.hex = hex;
        request.checksum = checksum;
    }

    auto result = fetcher.download(request, opts.quiet ? ProgressCallback{} : makeProgressPrinter());
    if (!result.ok()) {
        const auto& err = result.error();
        spdlog::error("[{}] {}", errorCodeName(err.code), err.message);
        return 1;
    }
    fmt::print("{}\n", result.value().string());
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"fetchkit - resumable HTTP/HTTPS/FTP downloads with optional verification and "
                 "archive extraction"};

    CliOptions opts;
    app.add_option("url", opts.url,
                   "Source URL (http, https or ftp). Google Drive, Dropbox and GitHub share "
                   "links are rewritten to direct downloads.")
        ->required()
        ->check(CLI::NonEmpty);
    app.add_option("path", opts.path,
                   "Destination file, or destination folder when --kind is an archive.")
        ->required();
    app.add_option("-k,--kind", opts.kind, "Artifact kind: [file|zip|tar|tar.gz] (default: file).")
        ->check(CLI::IsMember({"file", "none", "zip", "tar", "tar.gz"}));
    app.add_flag("--replace", opts.replace, "Re-download even if the destination exists.");
    app.add_flag("--no-resume", opts.noResume,
                 "Ignore an existing .part file and start from byte 0.");
    app.add_option("--hash", opts.hash, "Expected digest, '<hex>' or '<algo>:<hex>'.");
    app.add_option("--hash-algo", opts.hashAlgo,
                   "Digest algorithm for --hash: [md5|sha256|sha512] (default: md5).")
        ->check(CLI::IsMember({"md5", "sha256", "sha512"}));
    app.add_option("--timeout", opts.timeoutSecs,
                   "Connect/stall timeout in seconds (default: 10).")
        ->check(CLI::PositiveNumber);
    app.add_option("--config", opts.configPath,
                   "Config file (default: $FETCHKIT_CONFIG or "
                   "$XDG_CONFIG_HOME/fetchkit/config.toml).");
    auto* quiet = app.add_flag("-q,--quiet", opts.quiet, "Only report errors.");
    app.add_flag("-v,--verbose", opts.verbose, "Log protocol details.")->excludes(quiet);

    CLI11_PARSE(app, argc, argv);

    if (opts.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    try {
        return runDownload(opts);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
