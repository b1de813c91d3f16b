#pragma once

#include <cstdint>
#include <string>

namespace fetchkit::downloader {

/**
 * Human-readable byte count on the 1024 ladder bytes/kB/MB/GB/TB/PB.
 * Decimals per unit: bytes 0, kB 0, MB 1, GB/TB/PB 2.
 *   0 -> "0 bytes", 1 -> "1 byte", 1000 -> "1000 bytes", 1048576 -> "1.0 MB"
 */
[[nodiscard]] std::string sizeofFmt(std::uint64_t num);

} // namespace fetchkit::downloader
