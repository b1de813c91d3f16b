/*
 * fetchkit/src/downloader/fetcher.cpp
 *
 * Fetcher: validation, provider URL rewriting, replace policy and placement (direct file or
 * extracted archive) around a TransferEngine.
 */

#include <fetchkit/config/config_helpers.h>
#include <fetchkit/downloader/fetcher.hpp>
#include <fetchkit/downloader/transfer_engine.hpp>
#include <fetchkit/downloader/url_normalizer.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace fetchkit::downloader {

namespace fs = std::filesystem;

Expected<ArchiveKind> archiveKindFromString(std::string_view name) {
    if (auto kind = parseArchiveKind(name))
        return *kind;
    return Error{ErrorCode::InvalidArgument,
                 "kind must be one of file, zip, tar, tar.gz; got '" + std::string(name) + "'"};
}

Fetcher::Fetcher(DownloaderConfig cfg, std::shared_ptr<IRemoteAdapter> remote,
                 std::shared_ptr<IDiskWriter> disk, std::shared_ptr<IArchiveExtractor> extractor)
    : config_(std::move(cfg)), remote_(std::move(remote)), disk_(std::move(disk)),
      extractor_(std::move(extractor)) {
    if (!remote_)
        remote_ = makeCurlRemoteAdapter(config_);
    if (!disk_)
        disk_ = makeDiskWriter();
    if (!extractor_)
        extractor_ = makeArchiveExtractor();
}

DownloadRequest Fetcher::makeRequest(std::string url, fs::path destination) const {
    DownloadRequest req;
    req.url = std::move(url);
    req.destination = std::move(destination);
    req.resume = config_.resume;
    req.timeout = config_.defaultTimeout;
    return req;
}

Expected<fs::path> Fetcher::download(const DownloadRequest& request,
                                     const ProgressCallback& onProgress) {
    try {
        return downloadImpl(request, onProgress);
    } catch (const std::exception& e) {
        spdlog::error("download of {} aborted: {}", request.url, e.what());
        return Error{ErrorCode::Unknown, e.what(), request.url};
    }
}

Expected<fs::path> Fetcher::downloadImpl(const DownloadRequest& request,
                                         const ProgressCallback& onProgress) {
    const auto milestone = request.verbose ? spdlog::level::info : spdlog::level::debug;

    // Pre-checks; none of these touch the network
    switch (request.kind) {
        case ArchiveKind::None:
        case ArchiveKind::Zip:
        case ArchiveKind::Tar:
        case ArchiveKind::TarGz:
            break;
        default:
            return Error{ErrorCode::InvalidArgument, "kind must be one of file, zip, tar, tar.gz"};
    }
    if (request.destination.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "You must specify a path. For current directory use ."};
    }
    if (request.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty URL"};
    }
    if (request.checksum) {
        if (auto vr = validateChecksum(*request.checksum); !vr.ok())
            return vr.error();
    }

    const fs::path destination = config::expand_tilde(request.destination.string());
    const std::string url = normalizeUrl(request.url);
    if (url != request.url) {
        spdlog::debug("Rewrote {} -> {}", request.url, url);
    }

    std::error_code ec;
    if (!request.replace && fs::exists(fs::symlink_status(destination, ec))) {
        spdlog::log(milestone, "Replace is false and data exists, so doing nothing. "
                               "Use replace=true to re-download the data.");
        return destination;
    }

    if (request.kind != ArchiveKind::None) {
        return fetchArchive(request, url, destination, onProgress);
    }

    if (auto parent = destination.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory " + parent.string() + ": " + ec.message()};
        }
    }

    TransferEngine engine(remote_, disk_, EngineOptions::fromConfig(config_, request.verbose));
    engine.setPhaseListener(onPhase_);
    auto fetched =
        engine.fetch(url, destination, request.resume, request.checksum, request.timeout,
                     onProgress);
    if (!fetched.ok())
        return fetched;

    spdlog::log(milestone, "Successfully downloaded file to {}", fetched.value().string());
    return fetched;
}

Expected<fs::path> Fetcher::fetchArchive(const DownloadRequest& request, const std::string& url,
                                         const fs::path& destination,
                                         const ProgressCallback& onProgress) {
    const auto milestone = request.verbose ? spdlog::level::info : spdlog::level::debug;
    const char* kindName = archiveKindName(request.kind);

    // Staging (archive + extracted tree) is removed on every path out of this scope
    auto staging = ScopedTempDir::create();
    if (!staging.ok())
        return staging.error();
    const auto archivePath = staging.value().path() / (std::string("tmp.") + kindName);
    const auto extractedDir = staging.value().path() / "extracted";

    TransferEngine engine(remote_, disk_, EngineOptions::fromConfig(config_, request.verbose));
    engine.setPhaseListener(onPhase_);
    auto fetched = engine.fetch(url, archivePath, request.resume, request.checksum,
                                request.timeout, onProgress);
    if (!fetched.ok())
        return fetched.error();

    spdlog::log(milestone, "Extracting {} file...", kindName);
    if (onProgress) {
        ProgressEvent ev;
        ev.url = request.url;
        ev.stage = ProgressStage::Extracting;
        onProgress(ev);
    }
    if (auto xr = extractor_->extract(archivePath, request.kind, extractedDir); !xr.ok()) {
        const auto& cause = xr.error();
        return Error{cause.code, "Failed to extract " + std::string(kindName) +
                                     " archive from " + request.url + ": " + cause.message,
                     request.url};
    }

    // The destination appears only once there is something to place in it
    std::error_code ec;
    if (!fs::is_directory(destination, ec)) {
        spdlog::log(milestone, "Creating data folder...");
    }
    if (auto mr = disk_->mergeInto(extractedDir, destination); !mr.ok())
        return mr.error();

    spdlog::log(milestone, "Successfully downloaded / unzipped to {}", destination.string());
    return destination;
}

} // namespace fetchkit::downloader
