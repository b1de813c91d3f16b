#pragma once

/*
 * fetchkit Transfer Engine
 *
 * Drives a single resumable transfer of one URL into "<destination>.part" and commits it:
 *
 *   Init -> SizeProbe -> ResumeDecision -> Streaming -> Verify -> Commit
 *
 * with Failed reachable from every state. The HTTP strategy may pass through RestartFromZero
 * when a server rejects or ignores a range request.
 *
 * When the remote declares no length the engine runs in unknown-size mode: the size checks are
 * skipped and the transfer completes when the stream is exhausted.
 */

#include <fetchkit/downloader/adaptive_chunker.hpp>
#include <fetchkit/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fetchkit::downloader {

/**
 * Mutable bookkeeping for one active transfer. Owned by TransferEngine::fetch().
 */
struct TransferState {
    std::filesystem::path destination;
    std::filesystem::path partPath;
    std::string url;                        // canonical URL (after redirects)
    std::uint64_t initialSize{0};           // bytes already in the part file when streaming began
    std::optional<std::uint64_t> fileSize{}; // nullopt in unknown-size mode
    std::size_t chunkSize{kDefaultChunkSize};
    std::uint64_t bytesRead{0}; // bytes received from the remote by this call
};

/**
 * Per-fetch collaborators handed to a strategy.
 */
struct StreamContext {
    std::string sourceUrl; // URL reported in progress events
    std::chrono::milliseconds timeout{10000};
    AdaptiveChunker::Options chunker{};
    ProgressCallback onProgress;
    PhaseListener onPhase;
};

/**
 * Protocol-specific streaming step. Appends the remaining bytes of state.url to state.partPath,
 * starting at state.initialSize.
 */
class ITransferStrategy {
public:
    virtual ~ITransferStrategy() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual Expected<void> stream(TransferState& state, IRemoteAdapter& remote,
                                  IDiskWriter& disk, const StreamContext& ctx) = 0;
};

/**
 * Range-based resume. Falls back to a full restart when the range is rejected or ignored.
 */
std::unique_ptr<ITransferStrategy> makeHttpStrategy();

/**
 * REST-based resume. Re-checks SIZE on the canonical URL before RETR.
 */
std::unique_ptr<ITransferStrategy> makeFtpStrategy();

/**
 * Strategy for the URL's scheme: http/https or ftp. Anything else is InvalidArgument.
 */
Expected<std::unique_ptr<ITransferStrategy>> strategyForUrl(std::string_view url);

struct EngineOptions {
    AdaptiveChunker::Options chunker{};
    bool verbose{true}; // milestones at info level; debug otherwise

    static EngineOptions fromConfig(const DownloaderConfig& cfg, bool verbose = true);
};

class TransferEngine {
public:
    TransferEngine(std::shared_ptr<IRemoteAdapter> remote, std::shared_ptr<IDiskWriter> disk,
                   EngineOptions opts = {});

    /**
     * Fetch url into destination. Returns the destination path once the part file has been
     * verified and renamed into place.
     */
    Expected<std::filesystem::path> fetch(std::string_view url,
                                          const std::filesystem::path& destination, bool resume,
                                          const std::optional<Checksum>& expectedHash,
                                          std::chrono::milliseconds timeout,
                                          const ProgressCallback& onProgress = {});

    void setPhaseListener(PhaseListener listener) { onPhase_ = std::move(listener); }

    [[nodiscard]] TransferPhase phase() const noexcept { return phase_; }

private:
    void enter(TransferPhase next);
    Error fail(Error err);

    std::shared_ptr<IRemoteAdapter> remote_;
    std::shared_ptr<IDiskWriter> disk_;
    EngineOptions opts_;
    PhaseListener onPhase_;
    TransferPhase phase_{TransferPhase::Init};
};

[[nodiscard]] const char* transferPhaseName(TransferPhase phase) noexcept;

/**
 * "<destination>.part"
 */
[[nodiscard]] std::filesystem::path partPathFor(const std::filesystem::path& destination);

} // namespace fetchkit::downloader
