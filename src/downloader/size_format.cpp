#include <fetchkit/downloader/size_format.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstddef>
#include <string_view>

namespace fetchkit::downloader {

namespace {

constexpr std::array<std::string_view, 6> kUnits = {"bytes", "kB", "MB", "GB", "TB", "PB"};
constexpr std::array<int, 6> kDecimals = {0, 0, 1, 2, 2, 2};

} // namespace

std::string sizeofFmt(std::uint64_t num) {
    if (num == 0)
        return "0 bytes";
    if (num == 1)
        return "1 byte";

    // Exact powers of 1024 land on the larger unit (1048576 -> 1.0 MB).
    std::size_t exponent = 0;
    long double scale = 1.0L;
    while (exponent + 1 < kUnits.size() &&
           static_cast<long double>(num) >= scale * 1024.0L) {
        scale *= 1024.0L;
        ++exponent;
    }

    const double quotient = static_cast<double>(static_cast<long double>(num) / scale);
    return fmt::format("{:.{}f} {}", quotient, kDecimals[exponent], kUnits[exponent]);
}

} // namespace fetchkit::downloader
