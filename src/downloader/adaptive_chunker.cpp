#include <fetchkit/downloader/adaptive_chunker.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace fetchkit::downloader {

AdaptiveChunker::AdaptiveChunker(IByteStream& stream, Options opts, ClockFn clock)
    : stream_(stream), opts_(opts), clock_(std::move(clock)),
      chunkSize_(std::max<std::size_t>(opts.startSize, 1)) {
    if (!clock_)
        clock_ = [] { return Clock::now(); };
    opts_.startSize = chunkSize_;
    opts_.maxSize = std::max(opts_.maxSize, chunkSize_);
}

Expected<std::span<const std::byte>> AdaptiveChunker::next() {
    if (buffer_.size() < chunkSize_)
        buffer_.resize(chunkSize_);

    const auto t0 = clock_();
    auto r = stream_.read(std::span<std::byte>(buffer_.data(), chunkSize_));
    const auto dt = clock_() - t0;
    if (!r.ok())
        return r.error();

    const auto got = r.value();
    // Size the next read only on data-bearing reads; the EOF read carries no signal.
    if (got > 0)
        observe(std::chrono::duration_cast<std::chrono::nanoseconds>(dt));
    return std::span<const std::byte>(buffer_.data(), got);
}

void AdaptiveChunker::observe(std::chrono::nanoseconds elapsed) noexcept {
    const auto before = chunkSize_;
    if (elapsed < opts_.fastThreshold) {
        chunkSize_ = std::min(chunkSize_ * 2, opts_.maxSize);
    } else if (elapsed > opts_.slowThreshold && chunkSize_ > opts_.startSize) {
        chunkSize_ = std::max(chunkSize_ / 2, opts_.startSize);
    }
    if (chunkSize_ != before) {
        spdlog::trace("chunk size {} -> {} (read took {} us)", before, chunkSize_,
                      std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    }
}

} // namespace fetchkit::downloader
