#pragma once

/*
 * fetchkit Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * downloader subsystem. It intentionally contains no implementation details.
 *
 * Design principles:
 * - A transfer accumulates into "<destination>.part" and is committed by atomic rename
 * - The .part file is the only resume token; nothing else is persisted between runs
 * - Clear separation of concerns (remote adapter, integrity verification, disk writer,
 *   archive extraction)
 * - Errors are values (Expected<T>); no exception crosses a public API
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace fetchkit::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Md5, // default; matches the 32-character digests published next to most datasets
    Sha256,
    Sha512
};

/**
 * Archive kinds the placement manager knows how to unpack.
 */
enum class ArchiveKind { None, Zip, Tar, TarGz };

/**
 * Progress stages during a single download lifecycle.
 */
enum class ProgressStage { Resolving, Downloading, Verifying, Extracting, Finalizing };

/**
 * Transfer engine states. RestartFromZero is entered when an HTTP server rejects or ignores
 * a range request and the body is re-read from offset 0.
 */
enum class TransferPhase {
    Init,
    SizeProbe,
    ResumeDecision,
    Streaming,
    RestartFromZero,
    Verify,
    Commit,
    Failed
};

/**
 * Canonical error codes for downloader operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,    // malformed request; raised before any network activity
    ProbeFailed,        // remote size/redirects could not be resolved
    ResumeInconsistent, // local partial larger than remote, or remote changed mid-transfer
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    IoError,
    ChecksumMismatch,
    ArchiveError,
    Unknown
};

inline constexpr std::size_t kDefaultChunkSize = 8192;          // 2^13
inline constexpr std::size_t kMaxChunkSize = 64ull * 1024 * 1024; // 64 MiB
inline constexpr std::size_t kHashBlockSize = 1024 * 1024;       // 2^20
inline constexpr std::string_view kPartSuffix = ".part";

// ===================
// Small data objects
// ===================

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Md5};
    std::string hex; // lower-case hex, compared case-sensitively
};

/**
 * Downloader defaults, overridable from the [fetch] section of config.toml.
 */
struct DownloaderConfig {
    std::chrono::milliseconds defaultTimeout{10000};
    std::size_t initialChunkSize{kDefaultChunkSize};
    std::size_t maxChunkSize{kMaxChunkSize};
    std::chrono::milliseconds fastReadThreshold{5};
    std::chrono::milliseconds slowReadThreshold{100};
    HashAlgo defaultChecksumAlgo{HashAlgo::Md5};
    bool resume{true};
    std::string userAgent{"fetchkit/1.0"};
    bool tlsInsecure{false};
    std::string caPath; // empty = system default
};

/**
 * A single download request. Immutable once handed to the Fetcher.
 */
struct DownloadRequest {
    std::string url;
    std::filesystem::path destination;
    ArchiveKind kind{ArchiveKind::None};
    bool resume{true};
    std::optional<Checksum> checksum;
    std::chrono::milliseconds timeout{10000};
    bool replace{false};
    bool verbose{true};
};

/**
 * Streaming progress event for a single URL.
 */
struct ProgressEvent {
    std::string url;
    std::uint64_t downloadedBytes{0};          // position in the .part file
    std::optional<std::uint64_t> totalBytes{}; // nullopt in unknown-size mode
    std::uint64_t chunkBytes{0};               // bytes written by this event
    std::optional<float> percentage{};         // 0.0 - 100.0 (approx)
    ProgressStage stage{ProgressStage::Downloading};
};

/**
 * Canonical error object. url is set for errors raised while talking to a remote.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::string url{};
};

/**
 * Resolved remote metadata returned by a probe.
 */
struct ResourceInfo {
    std::string effectiveUrl;                     // after redirects
    std::optional<std::uint64_t> contentLength{}; // nullopt when undeclared
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using PhaseListener = std::function<void(TransferPhase)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Pull-based response body. read() blocks until at least one byte is available, the body
 * ends (returns 0), or the transfer fails.
 */
class IByteStream {
public:
    virtual ~IByteStream() = default;

    virtual Expected<std::size_t> read(std::span<std::byte> buffer) = 0;

    /**
     * Protocol status of the opened response (HTTP status code; FTP reply code or 0).
     */
    [[nodiscard]] virtual long status() const = 0;

    /**
     * Declared length of this response body (not of the whole resource when ranged).
     */
    [[nodiscard]] virtual std::optional<std::uint64_t> contentLength() const = 0;
};

/**
 * Remote adapter abstraction (libcurl-based implementation satisfies this for http, https
 * and ftp). Every call is a single blocking network operation bounded by timeout.
 */
class IRemoteAdapter {
public:
    virtual ~IRemoteAdapter() = default;

    /**
     * Open the resource, follow redirects, capture the canonical URL and declared size.
     */
    virtual Expected<ResourceInfo> probe(std::string_view url,
                                         std::chrono::milliseconds timeout) = 0;

    /**
     * Open the resource for reading starting at offset. For HTTP a non-zero offset is sent as
     * a Range header; for FTP it is sent as REST before RETR. The returned stream has already
     * received the response headers.
     */
    virtual Expected<std::unique_ptr<IByteStream>>
    open(std::string_view url, std::uint64_t offset, std::chrono::milliseconds timeout) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Append-only handle on an open .part file.
 */
class IPartWriter {
public:
    virtual ~IPartWriter() = default;
    virtual Expected<void> append(std::span<const std::byte> data) = 0;

    /**
     * Flush and fsync; the handle is unusable afterwards.
     */
    virtual Expected<void> close() = 0;
};

/**
 * Disk writer for .part files, atomic commit and placement of extracted archives.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Current size of a partial file, or nullopt if it does not exist.
     */
    virtual Expected<std::optional<std::uint64_t>>
    partialSize(const std::filesystem::path& partFile) = 0;

    /**
     * Open a .part file for appending (truncate=false) or for a fresh write (truncate=true).
     */
    virtual Expected<std::unique_ptr<IPartWriter>> openPart(const std::filesystem::path& partFile,
                                                            bool truncate) = 0;

    /**
     * Atomically move the validated .part file to its final path. On EXDEV, copy+fsync into a
     * sibling temporary and rename that instead.
     */
    virtual Expected<std::filesystem::path> commit(const std::filesystem::path& partFile,
                                                   const std::filesystem::path& destination) = 0;

    /**
     * Move every top-level entry of sourceDir into destDir. Either all entries land, or destDir
     * is restored to its previous contents.
     */
    virtual Expected<void> mergeInto(const std::filesystem::path& sourceDir,
                                     const std::filesystem::path& destDir) = 0;
};

/**
 * Archive extraction collaborator. Extracts archiveFile into destDir (created if absent).
 */
class IArchiveExtractor {
public:
    virtual ~IArchiveExtractor() = default;
    virtual Expected<void> extract(const std::filesystem::path& archiveFile, ArchiveKind kind,
                                   const std::filesystem::path& destDir) = 0;
};

/**
 * Scoped temporary directory. Created in the constructor, removed (recursively) when the
 * owning scope exits, on success and failure alike.
 */
class ScopedTempDir {
public:
    static Expected<ScopedTempDir> create(std::string_view prefix = "fetchkit-");

    ScopedTempDir() = default;
    ~ScopedTempDir();
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit ScopedTempDir(std::filesystem::path p) : path_(std::move(p)) {}
    void release() noexcept;

    std::filesystem::path path_;
};

// ======================
// Small helpers
// ======================

[[nodiscard]] const char* errorCodeName(ErrorCode code) noexcept;
[[nodiscard]] const char* hashAlgoName(HashAlgo algo) noexcept;
[[nodiscard]] std::optional<HashAlgo> parseHashAlgo(std::string_view name);
[[nodiscard]] const char* archiveKindName(ArchiveKind kind) noexcept;

/**
 * Parse an archive kind. Accepts "file"/"none", "zip", "tar" and "tar.gz".
 */
[[nodiscard]] std::optional<ArchiveKind> parseArchiveKind(std::string_view name);

/**
 * Length of the hex digest produced by algo (md5 32, sha256 64, sha512 128).
 */
[[nodiscard]] std::size_t hexDigestLength(HashAlgo algo) noexcept;

/**
 * Reject an expected checksum whose length or alphabet cannot match algo's digest.
 */
Expected<void> validateChecksum(const Checksum& checksum);

/**
 * Digest of the whole file, read in kHashBlockSize blocks.
 */
Expected<Checksum> hashFile(const std::filesystem::path& path, HashAlgo algo);

// ======================
// Factories
// ======================

std::unique_ptr<IRemoteAdapter> makeCurlRemoteAdapter(const DownloaderConfig& cfg);
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo);
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IArchiveExtractor> makeArchiveExtractor();

} // namespace fetchkit::downloader
