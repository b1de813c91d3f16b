/*
 * fetchkit/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - .part files live next to their destination so the final commit is a same-directory rename
 * - Atomic rename on commit; EXDEV fallback copies into a sibling temporary, fsyncs and renames it
 * - mergeInto() moves extracted archive entries into a destination directory all-or-nothing
 * - ScopedTempDir owns archive staging and removes it on every exit path
 */

#include <fetchkit/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace fetchkit::downloader {

namespace fs = std::filesystem;

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Expected<void>{};
}

static Expected<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return Expected<void>{};
}

static std::string random_suffix() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;
    return std::to_string(dist(gen));
}

static fs::path parent_or_cwd(const fs::path& p) {
    auto parent = p.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

// ---------- PartWriter ----------

class PartWriter final : public IPartWriter {
public:
    PartWriter(fs::path path, std::ofstream out) : path_(std::move(path)), out_(std::move(out)) {}

    Expected<void> append(std::span<const std::byte> data) override {
        out_.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!out_.good()) {
            return Error{ErrorCode::IoError, "write failed on: " + path_.string()};
        }
        return Expected<void>{};
    }

    Expected<void> close() override {
        if (!out_.is_open())
            return Expected<void>{};
        out_.flush();
        const bool good = out_.good();
        out_.close();
        if (!good) {
            return Error{ErrorCode::IoError, "flush failed on: " + path_.string()};
        }
        return fsync_file(path_);
    }

private:
    fs::path path_;
    std::ofstream out_;
};

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    Expected<std::optional<std::uint64_t>> partialSize(const fs::path& partFile) override {
        std::error_code ec;
        if (!fs::exists(partFile, ec)) {
            return std::optional<std::uint64_t>{};
        }
        auto sz = fs::file_size(partFile, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to stat partial file " + partFile.string() + ": " + ec.message()};
        }
        return std::optional<std::uint64_t>{static_cast<std::uint64_t>(sz)};
    }

    Expected<std::unique_ptr<IPartWriter>> openPart(const fs::path& partFile,
                                                    bool truncate) override {
        const auto mode = std::ios::binary | std::ios::out | (truncate ? std::ios::trunc
                                                                        : std::ios::app);
        std::ofstream os(partFile, mode);
        if (!os.good()) {
            return Error{ErrorCode::IoError, "Failed to open partial file: " + partFile.string()};
        }
        return std::unique_ptr<IPartWriter>(std::make_unique<PartWriter>(partFile, std::move(os)));
    }

    Expected<fs::path> commit(const fs::path& partFile, const fs::path& destination) override {
        // Attempt atomic rename
        std::error_code ren_ec;
        fs::rename(partFile, destination, ren_ec);
        if (ren_ec) {
            // Detect cross-device link (EXDEV) to perform fallback copy
            if (ren_ec == std::errc::cross_device_link) {
                spdlog::warn("Cross-device rename detected; performing copy+fsync+rename for {}",
                             destination.string());
                auto copy_ok = copy_file_fsync_replace(partFile, destination);
                if (!copy_ok.ok()) {
                    return copy_ok.error();
                }
                std::error_code del_ec;
                fs::remove(partFile, del_ec);
            } else {
                return Error{ErrorCode::IoError, "rename() failed (" + ren_ec.message() +
                                                     ") from " + partFile.string() + " to " +
                                                     destination.string()};
            }
        }

        // fsync the directory to persist the new entry
        auto rr = fsync_dir(parent_or_cwd(destination));
        if (!rr.ok()) {
            spdlog::debug("fsync on destination dir failed (continuing): {}",
                          parent_or_cwd(destination).string());
        }
        return destination;
    }

    Expected<void> mergeInto(const fs::path& sourceDir, const fs::path& destDir) override {
        std::error_code ec;
        const bool destExisted = fs::is_directory(destDir, ec);
        fs::create_directories(destDir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory " + destDir.string() + ": " + ec.message()};
        }

        // Entries displaced from destDir are parked inside it (same filesystem) until the merge
        // succeeds
        const fs::path parking = destDir / (".fetchkit-displaced-" + random_suffix());
        std::vector<fs::path> placed;                       // names moved into destDir
        std::vector<std::pair<fs::path, fs::path>> parked; // (parked path, original path)

        auto rollback = [&]() noexcept {
            std::error_code rec;
            for (auto it = placed.rbegin(); it != placed.rend(); ++it) {
                fs::remove_all(destDir / *it, rec);
            }
            bool restored = true;
            for (const auto& [from, to] : parked) {
                fs::rename(from, to, rec);
                if (rec) {
                    restored = false;
                    spdlog::error("Failed to restore {} after aborted merge (left at {}): {}",
                                  to.string(), from.string(), rec.message());
                }
            }
            if (restored) {
                fs::remove_all(parking, rec);
                // Only removes the folder if it is empty
                if (!destExisted)
                    fs::remove(destDir, rec);
            }
        };

        std::error_code iterEc;
        for (const auto& entry : fs::directory_iterator(sourceDir, iterEc)) {
            const auto name = entry.path().filename();
            const auto target = destDir / name;

            std::error_code statEc;
            if (fs::exists(fs::symlink_status(target, statEc))) {
                fs::create_directories(parking, ec);
                const auto aside = parking / name;
                fs::rename(target, aside, ec);
                if (ec) {
                    rollback();
                    return Error{ErrorCode::IoError, "Failed to displace existing " +
                                                         target.string() + ": " + ec.message()};
                }
                parked.emplace_back(aside, target);
            }

            fs::rename(entry.path(), target, ec);
            if (ec == std::errc::cross_device_link) {
                ec.clear();
                fs::copy(entry.path(), target, fs::copy_options::recursive, ec);
            }
            if (ec) {
                std::error_code rm;
                fs::remove_all(target, rm);
                rollback();
                return Error{ErrorCode::IoError,
                             "Failed to place " + target.string() + ": " + ec.message()};
            }
            placed.push_back(name);
        }
        if (iterEc) {
            rollback();
            return Error{ErrorCode::IoError,
                         "Failed to list " + sourceDir.string() + ": " + iterEc.message()};
        }

        fs::remove_all(parking, ec);
        return Expected<void>{};
    }

private:
    // Copy into a sibling temporary, fsync it, then rename over the destination.
    static Expected<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
        fs::path tmp = dst;
        tmp += ".tmp-" + random_suffix();

        {
            std::ifstream is(src, std::ios::binary);
            if (!is.good()) {
                return Error{ErrorCode::IoError, "copy: failed to open source: " + src.string()};
            }
            std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::IoError,
                             "copy: failed to open destination: " + tmp.string()};
            }
            std::vector<char> buffer(1 << 20); // 1 MiB buffer
            while (is.good()) {
                is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = is.gcount();
                if (got > 0) {
                    os.write(buffer.data(), got);
                    if (!os.good()) {
                        std::error_code ec;
                        fs::remove(tmp, ec);
                        return Error{ErrorCode::IoError,
                                     "copy: write failed for destination: " + tmp.string()};
                    }
                }
            }
            if (!is.eof()) {
                std::error_code ec;
                fs::remove(tmp, ec);
                return Error{ErrorCode::IoError, "copy: read failed for source: " + src.string()};
            }
        }

        auto rf = fsync_file(tmp);
        if (!rf.ok())
            return rf;

        std::error_code ec;
        fs::rename(tmp, dst, ec);
        if (ec) {
            std::error_code rm;
            fs::remove(tmp, rm);
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 tmp.string() + " to " + dst.string()};
        }
        return Expected<void>{};
    }
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

// ---------- ScopedTempDir ----------

Expected<ScopedTempDir> ScopedTempDir::create(std::string_view prefix) {
    std::error_code ec;
    auto base = fs::temp_directory_path(ec);
    if (ec) {
        return Error{ErrorCode::IoError, "No temporary directory available: " + ec.message()};
    }
    for (int attempt = 0; attempt < 5; ++attempt) {
        auto dir = base / (std::string(prefix) + random_suffix());
        if (fs::create_directory(dir, ec)) {
            fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
            return ScopedTempDir(std::move(dir));
        }
    }
    return Error{ErrorCode::IoError, "Failed to create temporary directory under " + base.string()};
}

ScopedTempDir::~ScopedTempDir() {
    release();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedTempDir::release() noexcept {
    if (path_.empty())
        return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::debug("Failed to remove temporary directory {}: {}", path_.string(),
                      ec.message());
    }
    path_.clear();
}

} // namespace fetchkit::downloader
