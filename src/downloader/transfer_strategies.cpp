/*
 * fetchkit/src/downloader/transfer_strategies.cpp
 *
 * Streaming strategies used by TransferEngine:
 * - HttpStrategy: resumes with "Range: bytes=<initialSize>-". A rejected range (failed open) or
 *   an ignored one (200 instead of 206) moves to RestartFromZero: the part file is truncated and
 *   the body is read from offset 0.
 * - FtpStrategy: resumes with REST <initialSize>. SIZE is re-checked on the canonical URL first.
 *
 * Both read the body through AdaptiveChunker and append every chunk to the part file.
 */

#include <fetchkit/downloader/size_format.hpp>
#include <fetchkit/downloader/transfer_engine.hpp>
#include <fetchkit/downloader/url_normalizer.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace fetchkit::downloader {

namespace {

constexpr long kHttpOk = 200;

void emitProgress(const StreamContext& ctx, const TransferState& state, std::uint64_t position,
                  std::uint64_t chunkBytes) {
    if (!ctx.onProgress)
        return;
    ProgressEvent ev;
    ev.url = ctx.sourceUrl;
    ev.downloadedBytes = position;
    ev.totalBytes = state.fileSize;
    ev.chunkBytes = chunkBytes;
    if (state.fileSize && *state.fileSize > 0) {
        ev.percentage = static_cast<float>(static_cast<double>(position) * 100.0 /
                                           static_cast<double>(*state.fileSize));
    }
    ev.stage = ProgressStage::Downloading;
    ctx.onProgress(ev);
}

// Pull the body through the chunker into the part file. Appends when initialSize > 0,
// otherwise starts the part file over.
Expected<void> pumpBody(IByteStream& body, TransferState& state, IDiskWriter& disk,
                        const StreamContext& ctx) {
    const bool truncate = state.initialSize == 0;
    auto opened = disk.openPart(state.partPath, truncate);
    if (!opened.ok())
        return opened.error();
    auto writer = std::move(opened).value();

    AdaptiveChunker chunker(body, ctx.chunker);
    std::uint64_t position = state.initialSize;
    emitProgress(ctx, state, position, 0);

    while (true) {
        auto chunk = chunker.next();
        if (!chunk.ok()) {
            // Keep what arrived so a later call can resume from it
            if (auto cr = writer->close(); !cr.ok()) {
                spdlog::warn("Failed to flush partial file {}: {}", state.partPath.string(),
                             cr.error().message);
            }
            state.chunkSize = chunker.chunkSize();
            return chunk.error();
        }
        const auto data = chunk.value();
        if (data.empty())
            break;

        if (auto wr = writer->append(data); !wr.ok()) {
            if (auto cr = writer->close(); !cr.ok()) {
                spdlog::debug("close after failed write: {}", cr.error().message);
            }
            return wr.error();
        }
        position += data.size();
        state.bytesRead += data.size();
        emitProgress(ctx, state, position, data.size());
    }

    state.chunkSize = chunker.chunkSize();
    return writer->close();
}

class HttpStrategy final : public ITransferStrategy {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "http"; }

    Expected<void> stream(TransferState& state, IRemoteAdapter& remote, IDiskWriter& disk,
                          const StreamContext& ctx) override {
        const bool ranged = state.initialSize > 0;
        if (ranged) {
            spdlog::debug("Resuming {} at byte {}", state.url, state.initialSize);
        }

        auto opened = remote.open(state.url, state.initialSize, ctx.timeout);
        if (!opened.ok()) {
            if (!ranged)
                return opened.error();
            spdlog::warn("Range request rejected by server ({}); restarting from zero",
                         opened.error().message);
            restartFromZero(state, ctx);
            opened = remote.open(state.url, 0, ctx.timeout);
            if (!opened.ok())
                return opened.error();
        } else if (ranged && opened.value()->status() == kHttpOk) {
            spdlog::warn("Server ignored range request for {}; restarting from zero", state.url);
            restartFromZero(state, ctx);
        }
        auto body = std::move(opened).value();

        // The response covers [initialSize, end); together they must add up to the probed size
        if (state.fileSize) {
            if (auto length = body->contentLength()) {
                const auto totalSize = *length + state.initialSize;
                if (totalSize != *state.fileSize) {
                    return Error{ErrorCode::ResumeInconsistent,
                                 "Remote size changed: expected " +
                                     std::to_string(*state.fileSize) + " bytes, server sent " +
                                     std::to_string(totalSize),
                                 state.url};
                }
            } else {
                spdlog::debug("No Content-Length on {}; relying on final size check", state.url);
            }
        }

        return pumpBody(*body, state, disk, ctx);
    }

private:
    static void restartFromZero(TransferState& state, const StreamContext& ctx) {
        state.initialSize = 0;
        if (ctx.onPhase) {
            ctx.onPhase(TransferPhase::RestartFromZero);
            ctx.onPhase(TransferPhase::Streaming);
        }
    }
};

class FtpStrategy final : public ITransferStrategy {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "ftp"; }

    Expected<void> stream(TransferState& state, IRemoteAdapter& remote, IDiskWriter& disk,
                          const StreamContext& ctx) override {
        if (state.fileSize) {
            auto info = remote.probe(state.url, ctx.timeout);
            if (!info.ok())
                return info.error();
            const auto& remoteSize = info.value().contentLength;
            if (!remoteSize) {
                return Error{ErrorCode::ResumeInconsistent,
                             "Remote size unknown: expected " + sizeofFmt(*state.fileSize) +
                                 ", SIZE reports nothing",
                             state.url};
            }
            if (*remoteSize != *state.fileSize) {
                return Error{ErrorCode::ResumeInconsistent,
                             "Remote size changed: expected " + sizeofFmt(*state.fileSize) +
                                 ", SIZE reports " + sizeofFmt(*remoteSize),
                             state.url};
            }
        }

        if (state.initialSize > 0) {
            spdlog::debug("REST {} before RETR of {}", state.initialSize, state.url);
        }
        auto opened = remote.open(state.url, state.initialSize, ctx.timeout);
        if (!opened.ok())
            return opened.error();
        auto body = std::move(opened).value();
        return pumpBody(*body, state, disk, ctx);
    }
};

} // namespace

std::unique_ptr<ITransferStrategy> makeHttpStrategy() {
    return std::make_unique<HttpStrategy>();
}

std::unique_ptr<ITransferStrategy> makeFtpStrategy() {
    return std::make_unique<FtpStrategy>();
}

Expected<std::unique_ptr<ITransferStrategy>> strategyForUrl(std::string_view url) {
    const auto scheme = urlScheme(url);
    if (scheme == "http" || scheme == "https")
        return makeHttpStrategy();
    if (scheme == "ftp")
        return makeFtpStrategy();
    return Error{ErrorCode::InvalidArgument,
                 "Unsupported URL scheme '" + scheme + "' (expected http, https or ftp)",
                 std::string(url)};
}

} // namespace fetchkit::downloader
