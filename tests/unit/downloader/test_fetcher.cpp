#include <gtest/gtest.h>
#include <fetchkit/downloader/fetcher.hpp>
#include <fetchkit/downloader/transfer_engine.hpp>

#include "../../common/downloader_fakes.h"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace fetchkit::downloader;
using namespace fetchkit::test;

namespace {

constexpr const char* kTextUrl = "https://example.com/data/hello.txt";
constexpr const char* kZipUrl = "https://example.com/data/bundle.zip";

// Environment override restored on scope exit
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name))
            old_ = old;
        ::setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (old_)
            ::setenv(name_, old_->c_str(), 1);
        else
            ::unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

std::string zip_bytes(const std::string& member, const std::string& content) {
    std::vector<char> buffer(64 * 1024);
    size_t used = 0;
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    archive_write_set_bytes_in_last_block(a, 1);
    archive_write_open_memory(a, buffer.data(), buffer.size(), &used);
    struct archive_entry* e = archive_entry_new();
    archive_entry_set_pathname(e, member.c_str());
    archive_entry_set_size(e, static_cast<la_int64_t>(content.size()));
    archive_entry_set_filetype(e, AE_IFREG);
    archive_entry_set_perm(e, 0644);
    archive_write_header(a, e);
    archive_write_data(a, content.data(), content.size());
    archive_entry_free(e);
    archive_write_close(a);
    archive_write_free(a);
    return std::string(buffer.data(), used);
}

std::size_t count_entries(const fs::path& dir) {
    std::size_t n = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(dir))
        ++n;
    return n;
}

class FetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = make_temp_dir("fetchkit-fetcher-");
        // Staging directories land here so the test can see what is left behind
        fs::create_directories(root / "tmp");
        tmpEnv = std::make_unique<ScopedEnv>("TMPDIR", (root / "tmp").string());
        remote = std::make_shared<FakeRemoteAdapter>();
        DownloaderConfig cfg;
        cfg.initialChunkSize = 16;
        cfg.maxChunkSize = 256;
        fetcher = std::make_unique<Fetcher>(cfg, remote);
    }

    void TearDown() override {
        fetcher.reset();
        tmpEnv.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    DownloadRequest request(const std::string& url, const fs::path& dest) {
        auto req = fetcher->makeRequest(url, dest);
        req.verbose = false;
        return req;
    }

    fs::path root;
    std::unique_ptr<ScopedEnv> tmpEnv;
    std::shared_ptr<FakeRemoteAdapter> remote;
    std::unique_ptr<Fetcher> fetcher;
};

} // namespace

TEST_F(FetcherTest, DownloadsTextThenLeavesExistingFileAlone) {
    remote->serve(kTextUrl, "hello, world\n");
    const auto dest = root / "out" / "nested" / "hello.txt";

    auto first = fetcher->download(request(kTextUrl, dest));
    ASSERT_TRUE(first.ok()) << first.error().message;
    EXPECT_EQ(first.value(), dest);
    EXPECT_EQ(read_file(dest), "hello, world\n");
    EXPECT_FALSE(fs::exists(partPathFor(dest)));

    const int callsAfterFirst = remote->calls();
    auto second = fetcher->download(request(kTextUrl, dest));
    ASSERT_TRUE(second.ok()) << second.error().message;
    EXPECT_EQ(second.value(), dest);
    EXPECT_EQ(remote->calls(), callsAfterFirst);
}

TEST_F(FetcherTest, ExistingDestinationWithoutReplaceMakesNoNetworkCalls) {
    const auto dest = root / "present.bin";
    write_file(dest, "already here");

    auto r = fetcher->download(request(kTextUrl, dest));
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value(), dest);
    EXPECT_EQ(remote->calls(), 0);
    EXPECT_EQ(read_file(dest), "already here");
}

TEST_F(FetcherTest, ReplaceRedownloads) {
    remote->serve(kTextUrl, "new content");
    const auto dest = root / "present.txt";
    write_file(dest, "old content");

    auto req = request(kTextUrl, dest);
    req.replace = true;
    auto r = fetcher->download(req);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(read_file(dest), "new content");
}

TEST_F(FetcherTest, EmptyDestinationIsInvalidArgument) {
    auto r = fetcher->download(request(kTextUrl, ""));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(r.error().message, "You must specify a path. For current directory use .");
    EXPECT_EQ(remote->calls(), 0);
}

TEST_F(FetcherTest, WrongLengthHashMakesNoNetworkCalls) {
    remote->serve(kTextUrl, "payload");
    auto req = request(kTextUrl, root / "f.txt");
    req.checksum = Checksum{HashAlgo::Md5, "deadbeef"};

    auto r = fetcher->download(req);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(remote->calls(), 0);
    EXPECT_FALSE(fs::exists(root / "f.txt"));
}

TEST_F(FetcherTest, ZipArchiveIsExtractedWithoutStrayArtifacts) {
    remote->serve(kZipUrl, zip_bytes("inner.txt", "zipped payload"));
    const auto dest = root / "dataset";

    auto req = request(kZipUrl, dest);
    req.kind = ArchiveKind::Zip;
    std::vector<ProgressStage> stages;
    auto r = fetcher->download(req, [&](const ProgressEvent& ev) { stages.push_back(ev.stage); });
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value(), dest);

    EXPECT_EQ(read_file(dest / "inner.txt"), "zipped payload");
    EXPECT_EQ(count_entries(dest), 1u);
    EXPECT_EQ(count_entries(root / "tmp"), 0u);
    EXPECT_NE(std::find(stages.begin(), stages.end(), ProgressStage::Extracting), stages.end());
}

TEST_F(FetcherTest, ArchiveMergesIntoExistingFolderWhenReplacing) {
    remote->serve(kZipUrl, zip_bytes("inner.txt", "v2"));
    const auto dest = root / "dataset";
    fs::create_directories(dest);
    write_file(dest / "inner.txt", "v1");
    write_file(dest / "notes.md", "mine");

    auto req = request(kZipUrl, dest);
    req.kind = ArchiveKind::Zip;
    req.replace = true;
    auto r = fetcher->download(req);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(read_file(dest / "inner.txt"), "v2");
    EXPECT_EQ(read_file(dest / "notes.md"), "mine");
    EXPECT_EQ(count_entries(root / "tmp"), 0u);
}

TEST_F(FetcherTest, BrokenArchiveLeavesDestinationAsBefore) {
    remote->serve(kZipUrl, "definitely not a zip");
    const auto dest = root / "dataset";
    fs::create_directories(dest);
    write_file(dest / "inner.txt", "v1");

    auto req = request(kZipUrl, dest);
    req.kind = ArchiveKind::Zip;
    req.replace = true;
    auto r = fetcher->download(req);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ArchiveError);
    EXPECT_EQ(read_file(dest / "inner.txt"), "v1");
    EXPECT_EQ(count_entries(dest), 1u);
    EXPECT_EQ(count_entries(root / "tmp"), 0u);
}

TEST_F(FetcherTest, InterruptedArchiveFetchCanBeRetriedWithoutReplace) {
    remote->serve(kZipUrl, zip_bytes("inner.txt", "zipped payload")).failAfter = 40;
    const auto dest = root / "dataset";

    auto req = request(kZipUrl, dest);
    req.kind = ArchiveKind::Zip;
    auto first = fetcher->download(req);
    ASSERT_FALSE(first.ok());
    EXPECT_EQ(first.error().code, ErrorCode::NetworkError);
    EXPECT_FALSE(fs::exists(dest));
    EXPECT_EQ(count_entries(root / "tmp"), 0u);

    remote->resources[kZipUrl].failAfter.reset();
    const int callsBefore = remote->calls();
    auto retry = fetcher->download(req);
    ASSERT_TRUE(retry.ok()) << retry.error().message;
    EXPECT_GT(remote->calls(), callsBefore);
    EXPECT_EQ(read_file(dest / "inner.txt"), "zipped payload");
}

TEST_F(FetcherTest, ProviderLinksAreRewrittenBeforeFetching) {
    const std::string raw = "https://raw.githubusercontent.com/user/repo/main/data.txt";
    remote->serve(raw, "raw bytes");

    auto r = fetcher->download(
        request("https://github.com/user/repo/blob/main/data.txt", root / "data.txt"));
    ASSERT_TRUE(r.ok()) << r.error().message;
    ASSERT_FALSE(remote->probedUrls.empty());
    EXPECT_EQ(remote->probedUrls.front(), raw);
    EXPECT_EQ(read_file(root / "data.txt"), "raw bytes");
}

TEST_F(FetcherTest, TildeInDestinationIsExpanded) {
    ScopedEnv home("HOME", root.string());
    remote->serve(kTextUrl, "home sweet home");

    auto r = fetcher->download(request(kTextUrl, "~/docs/hello.txt"));
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value(), root / "docs" / "hello.txt");
    EXPECT_EQ(read_file(root / "docs" / "hello.txt"), "home sweet home");
}

TEST_F(FetcherTest, PhaseListenerSeesEngineTransitions) {
    remote->serve(kTextUrl, "abc");
    std::vector<TransferPhase> phases;
    fetcher->setPhaseListener([&](TransferPhase p) { phases.push_back(p); });

    ASSERT_TRUE(fetcher->download(request(kTextUrl, root / "abc.txt")).ok());
    ASSERT_FALSE(phases.empty());
    EXPECT_EQ(phases.front(), TransferPhase::Init);
    EXPECT_EQ(phases.back(), TransferPhase::Commit);
}

TEST(ArchiveKindParsing, AcceptsKnownKinds) {
    EXPECT_EQ(archiveKindFromString("file").value(), ArchiveKind::None);
    EXPECT_EQ(archiveKindFromString("none").value(), ArchiveKind::None);
    EXPECT_EQ(archiveKindFromString("zip").value(), ArchiveKind::Zip);
    EXPECT_EQ(archiveKindFromString("tar").value(), ArchiveKind::Tar);
    EXPECT_EQ(archiveKindFromString("tar.gz").value(), ArchiveKind::TarGz);

    auto bad = archiveKindFromString("rar");
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
}
