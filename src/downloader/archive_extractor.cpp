/*
 * fetchkit/src/downloader/archive_extractor.cpp
 *
 * libarchive-backed IArchiveExtractor for zip, tar and tar.gz. Any header, data or finish
 * failure aborts the extraction with ErrorCode::ArchiveError; callers extract into a staging
 * directory so a failure never touches the final destination.
 */

#include <fetchkit/downloader/downloader.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace fetchkit::downloader {

namespace fs = std::filesystem;

namespace {

struct ReadArchiveDeleter {
    void operator()(struct archive* a) const noexcept {
        if (a)
            archive_read_free(a);
    }
};

struct WriteArchiveDeleter {
    void operator()(struct archive* a) const noexcept {
        if (a)
            archive_write_free(a);
    }
};

using ReadArchive = std::unique_ptr<struct archive, ReadArchiveDeleter>;
using WriteArchive = std::unique_ptr<struct archive, WriteArchiveDeleter>;

Error archiveError(const std::string& what, struct archive* a) {
    const char* detail = a ? archive_error_string(a) : nullptr;
    return Error{ErrorCode::ArchiveError, what + (detail ? std::string(": ") + detail : "")};
}

Expected<void> copyData(struct archive* in, struct archive* out) {
    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true) {
        int r = archive_read_data_block(in, &buff, &size, &offset);
        if (r == ARCHIVE_EOF)
            return Expected<void>{};
        if (r < ARCHIVE_WARN)
            return archiveError("Failed to read archive data", in);
        if (archive_write_data_block(out, buff, size, offset) < ARCHIVE_WARN)
            return archiveError("Failed to write extracted data", out);
    }
}

bool isContained(const fs::path& member) {
    if (member.is_absolute() || member.has_root_name())
        return false;
    for (const auto& part : member) {
        if (part == "..")
            return false;
    }
    return true;
}

class LibArchiveExtractor final : public IArchiveExtractor {
public:
    Expected<void> extract(const fs::path& archiveFile, ArchiveKind kind,
                           const fs::path& destDir) override {
        ReadArchive a{archive_read_new()};
        WriteArchive ext{archive_write_disk_new()};
        if (!a || !ext) {
            return Error{ErrorCode::ArchiveError, "libarchive allocation failed"};
        }

        switch (kind) {
            case ArchiveKind::Zip:
                archive_read_support_format_zip(a.get());
                break;
            case ArchiveKind::Tar:
                archive_read_support_format_tar(a.get());
                break;
            case ArchiveKind::TarGz:
                archive_read_support_format_tar(a.get());
                archive_read_support_filter_gzip(a.get());
                break;
            case ArchiveKind::None:
                return Error{ErrorCode::InvalidArgument, "Not an archive kind: file"};
        }

        archive_write_disk_set_options(ext.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                      ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                      ARCHIVE_EXTRACT_SECURE_SYMLINKS);
        archive_write_disk_set_standard_lookup(ext.get());

        if (archive_read_open_filename(a.get(), archiveFile.string().c_str(), 10240) !=
            ARCHIVE_OK) {
            return archiveError("Failed to open archive " + archiveFile.string(), a.get());
        }

        std::error_code ec;
        fs::create_directories(destDir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create destination directory: " + ec.message()};
        }

        std::size_t entries = 0;
        struct archive_entry* entry = nullptr;
        while (true) {
            int r = archive_read_next_header(a.get(), &entry);
            if (r == ARCHIVE_EOF)
                break;
            if (r < ARCHIVE_WARN)
                return archiveError("Failed to read archive header", a.get());

            // Construct full path in destination; members may not escape it
            const char* name = archive_entry_pathname(entry);
            if (name == nullptr || !isContained(name))
                return Error{ErrorCode::ArchiveError,
                             std::string("Refusing unsafe archive member: ") +
                                 (name ? name : "<unnamed>")};
            fs::path entryPath = destDir / name;
            archive_entry_set_pathname(entry, entryPath.string().c_str());
            if (const char* link = archive_entry_hardlink(entry)) {
                if (!isContained(link))
                    return Error{ErrorCode::ArchiveError,
                                 std::string("Refusing unsafe hard link target: ") + link};
                archive_entry_set_hardlink(entry, (destDir / link).string().c_str());
            }

            if (archive_write_header(ext.get(), entry) < ARCHIVE_WARN)
                return archiveError("Failed to extract " + entryPath.string(), ext.get());
            if (archive_entry_size(entry) > 0) {
                if (auto cr = copyData(a.get(), ext.get()); !cr.ok())
                    return cr;
            }
            if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN)
                return archiveError("Failed to finish " + entryPath.string(), ext.get());
            ++entries;
        }

        if (archive_write_close(ext.get()) != ARCHIVE_OK)
            return archiveError("Failed to close extracted output", ext.get());

        spdlog::debug("Extracted {} entries from {} ({})", entries, archiveFile.string(),
                      archiveKindName(kind));
        return Expected<void>{};
    }
};

} // namespace

std::unique_ptr<IArchiveExtractor> makeArchiveExtractor() {
    return std::make_unique<LibArchiveExtractor>();
}

} // namespace fetchkit::downloader
