#pragma once

#include <span>
#include <string>
#include <string_view>

namespace fetchkit::downloader {

/**
 * One share-link rewrite. matches() is a cheap host-marker test; rewrite() returns the direct
 * download URL (or the input unchanged when the link is malformed for that provider).
 */
struct ProviderRule {
    std::string_view name;
    std::string_view hostMarker;
    std::string (*rewrite)(std::string_view url);

    [[nodiscard]] bool matches(std::string_view url) const noexcept {
        return url.find(hostMarker) != std::string_view::npos;
    }
};

/**
 * Ordered rule table; the first matching rule wins.
 */
[[nodiscard]] std::span<const ProviderRule> providerRules() noexcept;

/**
 * Rewrite hosting-provider share links into direct-download URLs. Pure; unrecognized URLs are
 * returned unchanged and this never fails.
 */
[[nodiscard]] std::string normalizeUrl(std::string_view url);

/**
 * Lower-cased scheme of url ("https", "ftp"), or empty when there is no "://".
 */
[[nodiscard]] std::string urlScheme(std::string_view url);

} // namespace fetchkit::downloader
