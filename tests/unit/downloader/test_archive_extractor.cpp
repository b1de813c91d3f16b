#include <gtest/gtest.h>
#include <fetchkit/downloader/downloader.hpp>

#include "../../common/downloader_fakes.h"

#include <archive.h>
#include <archive_entry.h>

#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace fetchkit::downloader;
using namespace fetchkit::test;

namespace {

using Members = std::vector<std::pair<std::string, std::string>>; // (name, content)

// Write a real archive with libarchive's writer API
void write_archive(const fs::path& out, ArchiveKind kind, const Members& members) {
    struct archive* a = archive_write_new();
    ASSERT_NE(a, nullptr);
    switch (kind) {
        case ArchiveKind::Zip:
            archive_write_set_format_zip(a);
            break;
        case ArchiveKind::Tar:
            archive_write_set_format_pax_restricted(a);
            break;
        case ArchiveKind::TarGz:
            archive_write_set_format_pax_restricted(a);
            archive_write_add_filter_gzip(a);
            break;
        case ArchiveKind::None:
            FAIL() << "not an archive kind";
    }
    archive_write_set_bytes_in_last_block(a, 1);
    ASSERT_EQ(archive_write_open_filename(a, out.string().c_str()), ARCHIVE_OK);
    for (const auto& [name, content] : members) {
        struct archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_size(e, static_cast<la_int64_t>(content.size()));
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        ASSERT_EQ(archive_write_header(a, e), ARCHIVE_OK);
        archive_write_data(a, content.data(), content.size());
        archive_entry_free(e);
    }
    archive_write_close(a);
    archive_write_free(a);
}

class ArchiveExtractorTest : public ::testing::Test {
protected:
    void SetUp() override { dir = make_temp_dir("fetchkit-archive-"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::unique_ptr<IArchiveExtractor> extractor = makeArchiveExtractor();
};

} // namespace

TEST_F(ArchiveExtractorTest, ExtractsZip) {
    const auto zip = dir / "tmp.zip";
    write_archive(zip, ArchiveKind::Zip, {{"readme.txt", "hello zip"}, {"sub/data.csv", "1,2,3"}});

    auto r = extractor->extract(zip, ArchiveKind::Zip, dir / "out");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(read_file(dir / "out" / "readme.txt"), "hello zip");
    EXPECT_EQ(read_file(dir / "out" / "sub" / "data.csv"), "1,2,3");
}

TEST_F(ArchiveExtractorTest, ExtractsTarAndTarGz) {
    write_archive(dir / "tmp.tar", ArchiveKind::Tar, {{"a.txt", "plain tar"}});
    write_archive(dir / "tmp.tar.gz", ArchiveKind::TarGz, {{"b.txt", "gzipped tar"}});

    auto tar = extractor->extract(dir / "tmp.tar", ArchiveKind::Tar, dir / "tar-out");
    ASSERT_TRUE(tar.ok()) << tar.error().message;
    EXPECT_EQ(read_file(dir / "tar-out" / "a.txt"), "plain tar");

    auto tgz = extractor->extract(dir / "tmp.tar.gz", ArchiveKind::TarGz, dir / "tgz-out");
    ASSERT_TRUE(tgz.ok()) << tgz.error().message;
    EXPECT_EQ(read_file(dir / "tgz-out" / "b.txt"), "gzipped tar");
}

TEST_F(ArchiveExtractorTest, CorruptArchiveIsArchiveError) {
    write_file(dir / "tmp.zip", "this is not a zip file at all");
    auto r = extractor->extract(dir / "tmp.zip", ArchiveKind::Zip, dir / "out");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ArchiveError);
}

TEST_F(ArchiveExtractorTest, KindMismatchIsArchiveError) {
    write_archive(dir / "tmp.zip", ArchiveKind::Zip, {{"x.txt", "x"}});
    auto r = extractor->extract(dir / "tmp.zip", ArchiveKind::TarGz, dir / "out");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ArchiveError);
}

TEST_F(ArchiveExtractorTest, MembersEscapingTheDestinationAreRejected) {
    write_archive(dir / "evil.tar", ArchiveKind::Tar, {{"../escaped.txt", "nope"}});
    auto r = extractor->extract(dir / "evil.tar", ArchiveKind::Tar, dir / "out");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ArchiveError);
    EXPECT_FALSE(fs::exists(dir / "escaped.txt"));
}
