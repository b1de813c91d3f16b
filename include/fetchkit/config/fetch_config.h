#pragma once

#include <fetchkit/downloader/downloader.hpp>

#include <filesystem>

namespace fetchkit::config {

/**
 * @brief Load downloader defaults from the [fetch] section of a config.toml
 *
 * Recognised keys:
 *   timeout        seconds, decimals allowed (10)
 *   chunk_size     initial read size in bytes (8192)
 *   max_chunk_size upper bound for adaptive chunk growth (67108864)
 *   hash_algo      md5 | sha256 | sha512 (md5)
 *   resume         true | false (true)
 *   user_agent     string
 *   tls_insecure   true | false (false)
 *   ca_path        CA bundle path, "~" expanded
 *
 * A missing file yields the defaults. A present but malformed value is InvalidArgument.
 */
downloader::Expected<downloader::DownloaderConfig>
load_downloader_config(const std::filesystem::path& config_path);

} // namespace fetchkit::config
