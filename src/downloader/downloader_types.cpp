#include <fetchkit/downloader/downloader.hpp>

#include <cctype>
#include <string>

namespace fetchkit::downloader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

} // namespace

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::ProbeFailed:
            return "ProbeFailed";
        case ErrorCode::ResumeInconsistent:
            return "ResumeInconsistent";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TlsVerificationFailed";
        case ErrorCode::ServerError:
            return "ServerError";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::ArchiveError:
            return "ArchiveError";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

const char* hashAlgoName(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::Md5:
            return "md5";
        case HashAlgo::Sha256:
            return "sha256";
        case HashAlgo::Sha512:
            return "sha512";
    }
    return "md5";
}

std::optional<HashAlgo> parseHashAlgo(std::string_view name) {
    auto n = to_lower(name);
    if (n == "md5")
        return HashAlgo::Md5;
    if (n == "sha256")
        return HashAlgo::Sha256;
    if (n == "sha512")
        return HashAlgo::Sha512;
    return std::nullopt;
}

const char* archiveKindName(ArchiveKind kind) noexcept {
    switch (kind) {
        case ArchiveKind::None:
            return "file";
        case ArchiveKind::Zip:
            return "zip";
        case ArchiveKind::Tar:
            return "tar";
        case ArchiveKind::TarGz:
            return "tar.gz";
    }
    return "file";
}

std::optional<ArchiveKind> parseArchiveKind(std::string_view name) {
    if (name == "file" || name == "none")
        return ArchiveKind::None;
    if (name == "zip")
        return ArchiveKind::Zip;
    if (name == "tar")
        return ArchiveKind::Tar;
    if (name == "tar.gz")
        return ArchiveKind::TarGz;
    return std::nullopt;
}

} // namespace fetchkit::downloader
