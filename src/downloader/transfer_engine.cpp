/*
 * fetchkit/src/downloader/transfer_engine.cpp
 *
 * TransferEngine: probe, resume decision, streaming (delegated to a per-scheme strategy),
 * verification and commit of a single URL.
 *
 * Failure handling:
 * - Nothing is retried; every failure ends in TransferPhase::Failed with one Error.
 * - The part file survives transfer and checksum failures; it is the resume token for the next
 *   call and the evidence for a checksum mismatch.
 * - The destination is touched only by the final commit.
 */

#include <fetchkit/downloader/size_format.hpp>
#include <fetchkit/downloader/transfer_engine.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace fetchkit::downloader {

namespace fs = std::filesystem;

const char* transferPhaseName(TransferPhase phase) noexcept {
    switch (phase) {
        case TransferPhase::Init:
            return "Init";
        case TransferPhase::SizeProbe:
            return "SizeProbe";
        case TransferPhase::ResumeDecision:
            return "ResumeDecision";
        case TransferPhase::Streaming:
            return "Streaming";
        case TransferPhase::RestartFromZero:
            return "RestartFromZero";
        case TransferPhase::Verify:
            return "Verify";
        case TransferPhase::Commit:
            return "Commit";
        case TransferPhase::Failed:
            return "Failed";
    }
    return "Unknown";
}

fs::path partPathFor(const fs::path& destination) {
    fs::path part = destination;
    part += kPartSuffix;
    return part;
}

EngineOptions EngineOptions::fromConfig(const DownloaderConfig& cfg, bool verbose) {
    EngineOptions opts;
    opts.chunker.startSize = cfg.initialChunkSize;
    opts.chunker.maxSize = cfg.maxChunkSize;
    opts.chunker.fastThreshold = cfg.fastReadThreshold;
    opts.chunker.slowThreshold = cfg.slowReadThreshold;
    opts.verbose = verbose;
    return opts;
}

TransferEngine::TransferEngine(std::shared_ptr<IRemoteAdapter> remote,
                               std::shared_ptr<IDiskWriter> disk, EngineOptions opts)
    : remote_(std::move(remote)), disk_(std::move(disk)), opts_(opts) {
    if (!disk_)
        disk_ = makeDiskWriter();
}

void TransferEngine::enter(TransferPhase next) {
    if (phase_ != next) {
        spdlog::debug("transfer: {} -> {}", transferPhaseName(phase_), transferPhaseName(next));
    }
    phase_ = next;
    if (onPhase_)
        onPhase_(next);
}

Error TransferEngine::fail(Error err) {
    enter(TransferPhase::Failed);
    return err;
}

Expected<fs::path> TransferEngine::fetch(std::string_view url, const fs::path& destination,
                                         bool resume,
                                         const std::optional<Checksum>& expectedHash,
                                         std::chrono::milliseconds timeout,
                                         const ProgressCallback& onProgress) {
    const auto milestone = opts_.verbose ? spdlog::level::info : spdlog::level::debug;
    const std::string sourceUrl(url);

    // ---- Init ----
    enter(TransferPhase::Init);
    if (url.empty())
        return fail(Error{ErrorCode::InvalidArgument, "Empty URL"});
    if (destination.empty())
        return fail(Error{ErrorCode::InvalidArgument,
                          "You must specify a path. For current directory use ."});
    if (expectedHash) {
        if (auto vr = validateChecksum(*expectedHash); !vr.ok())
            return fail(vr.error());
    }
    auto strategy = strategyForUrl(url);
    if (!strategy.ok())
        return fail(strategy.error());
    if (!remote_)
        return fail(Error{ErrorCode::InvalidArgument, "No remote adapter configured", sourceUrl});

    TransferState state;
    state.destination = destination;
    state.partPath = partPathFor(destination);
    state.chunkSize = opts_.chunker.startSize;

    // ---- SizeProbe ----
    enter(TransferPhase::SizeProbe);
    if (onProgress) {
        ProgressEvent ev;
        ev.url = sourceUrl;
        ev.stage = ProgressStage::Resolving;
        onProgress(ev);
    }
    auto resolved = remote_->probe(url, timeout);
    if (!resolved.ok()) {
        return fail(Error{ErrorCode::ProbeFailed,
                          "Failed to resolve " + sourceUrl + ": " + resolved.error().message,
                          sourceUrl});
    }
    state.url = resolved.value().effectiveUrl.empty() ? sourceUrl
                                                      : resolved.value().effectiveUrl;
    auto sized = remote_->probe(state.url, timeout);
    if (!sized.ok()) {
        return fail(Error{ErrorCode::ProbeFailed,
                          "Failed to read size of " + state.url + ": " + sized.error().message,
                          state.url});
    }
    state.fileSize = sized.value().contentLength;

    if (state.fileSize) {
        spdlog::log(milestone, "Downloading data from {} ({})", state.url,
                    sizeofFmt(*state.fileSize));
    } else {
        spdlog::log(milestone, "Downloading data from {} (unknown size)", state.url);
    }

    // ---- ResumeDecision ----
    enter(TransferPhase::ResumeDecision);
    if (resume) {
        auto existing = disk_->partialSize(state.partPath);
        if (!existing.ok())
            return fail(existing.error());
        if (existing.value())
            state.initialSize = *existing.value();
    }
    if (state.fileSize && state.initialSize > *state.fileSize) {
        return fail(Error{ErrorCode::ResumeInconsistent,
                          "Local file (" + sizeofFmt(state.initialSize) +
                              ") is larger than remote file (" + sizeofFmt(*state.fileSize) +
                              "), cannot resume download of " + state.partPath.string(),
                          state.url});
    }

    // ---- Streaming ----
    const bool complete =
        state.fileSize && state.initialSize > 0 && state.initialSize == *state.fileSize;
    if (complete) {
        spdlog::debug("{} already holds all {} bytes; nothing to stream", state.partPath.string(),
                      *state.fileSize);
    } else {
        enter(TransferPhase::Streaming);
        StreamContext ctx;
        ctx.sourceUrl = sourceUrl;
        ctx.timeout = timeout;
        ctx.chunker = opts_.chunker;
        ctx.onProgress = onProgress;
        ctx.onPhase = [this](TransferPhase p) { enter(p); };

        auto sr = strategy.value()->stream(state, *remote_, *disk_, ctx);
        if (!sr.ok()) {
            const auto& cause = sr.error();
            return fail(Error{cause.code,
                              "Error while fetching file " + sourceUrl + ": " + cause.message,
                              sourceUrl});
        }
        spdlog::debug("{} transfer read {} bytes (final chunk size {})",
                      strategy.value()->name(), state.bytesRead, state.chunkSize);
    }

    auto onDisk = disk_->partialSize(state.partPath);
    if (!onDisk.ok())
        return fail(onDisk.error());
    const auto partBytes = onDisk.value().value_or(0);
    if (state.fileSize && partBytes != *state.fileSize) {
        return fail(Error{ErrorCode::NetworkError,
                          "Error while fetching file " + sourceUrl + ": received " +
                              std::to_string(partBytes) + " of " +
                              std::to_string(*state.fileSize) + " bytes",
                          sourceUrl});
    }

    // ---- Verify ----
    if (expectedHash) {
        enter(TransferPhase::Verify);
        if (onProgress) {
            ProgressEvent ev;
            ev.url = sourceUrl;
            ev.downloadedBytes = partBytes;
            ev.totalBytes = state.fileSize;
            ev.stage = ProgressStage::Verifying;
            onProgress(ev);
        }
        auto digest = hashFile(state.partPath, expectedHash->algo);
        if (!digest.ok())
            return fail(digest.error());
        if (digest.value().hex != expectedHash->hex) {
            return fail(Error{ErrorCode::ChecksumMismatch,
                              std::string(hashAlgoName(expectedHash->algo)) + " hash of " +
                                  state.partPath.string() + " (" + digest.value().hex +
                                  ") does not match expected " + expectedHash->hex +
                                  "; part file kept for inspection",
                              sourceUrl});
        }
    }

    // ---- Commit ----
    enter(TransferPhase::Commit);
    auto committed = disk_->commit(state.partPath, state.destination);
    if (!committed.ok())
        return fail(committed.error());

    if (onProgress) {
        ProgressEvent ev;
        ev.url = sourceUrl;
        ev.downloadedBytes = partBytes;
        ev.totalBytes = state.fileSize ? state.fileSize : std::optional<std::uint64_t>(partBytes);
        ev.percentage = 100.0f;
        ev.stage = ProgressStage::Finalizing;
        onProgress(ev);
    }
    return committed;
}

} // namespace fetchkit::downloader
