/*
 * fetchkit/src/downloader/integrity_verifier.cpp
 *
 * IntegrityVerifier (MD5 / SHA-256 / SHA-512 via OpenSSL EVP)
 *
 * Implements fetchkit::downloader::IIntegrityVerifier using OpenSSL's EVP interface.
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns a Checksum { algo, hex } and re-arms the context for reuse.
 * - hashFile() streams a file in fixed 1 MiB blocks, independent of the transfer chunk size.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <fetchkit/downloader/downloader.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fetchkit::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
    }
    return EVP_md5();
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit OpenSslIntegrityVerifier(HashAlgo algo) { reset(algo); }

    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        _algo = algo;
        _md = resolve_algo(_algo);
        _ctx = EvpMdCtx{};
        _finalized = false;
        if (!_ctx || !_md) {
            // Leave ctx null; finalize() reports the failure as an empty digest.
            return;
        }
        if (EVP_DigestInit_ex(_ctx.ctx, _md, nullptr) != 1) {
            _ctx = EvpMdCtx{};
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || _finalized || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            spdlog::debug("EVP_DigestUpdate failed; digest invalidated");
            _ctx = EvpMdCtx{};
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;

        if (!_ctx || _finalized) {
            out.hex.clear();
            return out;
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;

        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            out.hex.clear();
            _finalized = true;
            return out;
        }

        out.hex = to_hex_lower(md_buf.data(), md_len);
        _finalized = true;

        // Prepare for potential reuse: re-init with same algo
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Md5};
    const EVP_MD* _md{nullptr};
    EvpMdCtx _ctx{};
    bool _finalized{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<OpenSslIntegrityVerifier>(algo);
}

std::size_t hexDigestLength(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::Md5:
            return 32;
        case HashAlgo::Sha256:
            return 64;
        case HashAlgo::Sha512:
            return 128;
    }
    return 0;
}

Expected<void> validateChecksum(const Checksum& checksum) {
    const auto expected = hexDigestLength(checksum.algo);
    if (checksum.hex.size() != expected) {
        return Error{ErrorCode::InvalidArgument,
                     "Bad hash value given, should be a " + std::to_string(expected) +
                         "-character " + hashAlgoName(checksum.algo) + " string: " +
                         checksum.hex};
    }
    for (unsigned char c : checksum.hex) {
        if (!std::isxdigit(c)) {
            return Error{ErrorCode::InvalidArgument,
                         "Bad hash value given, non-hex character in: " + checksum.hex};
        }
    }
    return Expected<void>{};
}

Expected<Checksum> hashFile(const std::filesystem::path& path, HashAlgo algo) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open for hashing: " + path.string()};
    }

    OpenSslIntegrityVerifier verifier(algo);
    std::vector<char> buffer(kHashBlockSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto read = in.gcount();
        if (read > 0) {
            verifier.update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(read)));
        }
    }
    if (!in.eof()) {
        return Error{ErrorCode::IoError, "Read failed while hashing: " + path.string()};
    }

    auto digest = verifier.finalize();
    if (digest.hex.empty()) {
        return Error{ErrorCode::IoError, "Failed to finalize checksum for: " + path.string()};
    }
    return digest;
}

} // namespace fetchkit::downloader
