#pragma once

#include <fetchkit/downloader/downloader.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <span>
#include <vector>

namespace fetchkit::downloader {

/**
 * Read-side chunk sizing policy over an IByteStream.
 *
 * Each next() performs one read of chunkSize() bytes. A read that completes faster than the
 * fast threshold doubles the chunk size (up to maxSize); a read slower than the slow threshold
 * halves it, never below the starting size. An empty span marks the end of the stream.
 */
class AdaptiveChunker {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Options {
        std::size_t startSize{kDefaultChunkSize};
        std::size_t maxSize{kMaxChunkSize};
        std::chrono::milliseconds fastThreshold{5};
        std::chrono::milliseconds slowThreshold{100};
    };

    AdaptiveChunker(IByteStream& stream, Options opts, ClockFn clock = {});

    /**
     * Next chunk; valid until the following call. Empty at end of stream.
     */
    Expected<std::span<const std::byte>> next();

    /**
     * Apply the sizing rule for a read that took elapsed. Exposed for tests.
     */
    void observe(std::chrono::nanoseconds elapsed) noexcept;

    [[nodiscard]] std::size_t chunkSize() const noexcept { return chunkSize_; }

private:
    IByteStream& stream_;
    Options opts_;
    ClockFn clock_;
    std::size_t chunkSize_;
    std::vector<std::byte> buffer_;
};

} // namespace fetchkit::downloader
