#pragma once

/*
 * fetchkit Fetcher - request-level entry point
 *
 * Applies the placement policy around a TransferEngine:
 *   - empty destination          -> InvalidArgument
 *   - replace == false, exists   -> no-op, destination returned, no network traffic
 *   - archive kind set           -> fetch into a scoped temp dir, extract, merge into destination
 *   - otherwise                  -> fetch straight to destination (parent dirs created)
 *
 * Provider share links are rewritten with normalizeUrl() before anything is fetched.
 */

#include <fetchkit/downloader/downloader.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace fetchkit::downloader {

class Fetcher {
public:
    /**
     * Null collaborators are replaced by the production implementations (libcurl, local disk,
     * libarchive).
     */
    explicit Fetcher(DownloaderConfig cfg = {}, std::shared_ptr<IRemoteAdapter> remote = nullptr,
                     std::shared_ptr<IDiskWriter> disk = nullptr,
                     std::shared_ptr<IArchiveExtractor> extractor = nullptr);

    Expected<std::filesystem::path> download(const DownloadRequest& request,
                                             const ProgressCallback& onProgress = {});

    /**
     * Observe engine state transitions of subsequent downloads.
     */
    void setPhaseListener(PhaseListener listener) { onPhase_ = std::move(listener); }

    /**
     * Request pre-filled with this fetcher's configured defaults.
     */
    [[nodiscard]] DownloadRequest makeRequest(std::string url,
                                              std::filesystem::path destination) const;

private:
    Expected<std::filesystem::path> downloadImpl(const DownloadRequest& request,
                                                 const ProgressCallback& onProgress);
    Expected<std::filesystem::path> fetchArchive(const DownloadRequest& request,
                                                 const std::string& url,
                                                 const std::filesystem::path& destination,
                                                 const ProgressCallback& onProgress);

    DownloaderConfig config_;
    std::shared_ptr<IRemoteAdapter> remote_;
    std::shared_ptr<IDiskWriter> disk_;
    std::shared_ptr<IArchiveExtractor> extractor_;
    PhaseListener onPhase_;
};

/**
 * parseArchiveKind() with an error naming the accepted kinds.
 */
Expected<ArchiveKind> archiveKindFromString(std::string_view name);

} // namespace fetchkit::downloader
