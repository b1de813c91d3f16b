#include <gtest/gtest.h>
#include <fetchkit/downloader/url_normalizer.hpp>

#include <string>

using namespace fetchkit::downloader;

TEST(UrlNormalizer, GoogleDriveShareLinkBecomesDirectDownload) {
    EXPECT_EQ(normalizeUrl("https://drive.google.com/file/d/1AbC_x-9/view?usp=sharing"),
              "https://drive.google.com/uc?export=download&id=1AbC_x-9");
}

TEST(UrlNormalizer, GoogleDriveIdAtEndOfUrl) {
    EXPECT_EQ(normalizeUrl("https://drive.google.com/file/d/XYZ"),
              "https://drive.google.com/uc?export=download&id=XYZ");
}

TEST(UrlNormalizer, GoogleDriveWithoutIdSegmentIsUnchanged) {
    const std::string url = "https://drive.google.com/drive/my-drive";
    EXPECT_EQ(normalizeUrl(url), url);
}

TEST(UrlNormalizer, DropboxSwitchesToDirectDownload) {
    EXPECT_EQ(normalizeUrl("https://www.dropbox.com/s/abc/data.csv?dl=0"),
              "https://www.dropbox.com/s/abc/data.csv?dl=1");
}

TEST(UrlNormalizer, DropboxImageGetsDlParameter) {
    EXPECT_EQ(normalizeUrl("https://www.dropbox.com/s/abc/figure.png"),
              "https://www.dropbox.com/s/abc/figure.png?dl=1");
    EXPECT_EQ(normalizeUrl("https://www.dropbox.com/s/abc/photo.jpg"),
              "https://www.dropbox.com/s/abc/photo.jpg?dl=1");
}

TEST(UrlNormalizer, GithubBlobBecomesRawContent) {
    EXPECT_EQ(normalizeUrl("https://github.com/user/repo/blob/master/data/file.txt"),
              "https://raw.githubusercontent.com/user/repo/master/data/file.txt");
}

TEST(UrlNormalizer, OnlyFirstBlobSegmentIsRemoved) {
    EXPECT_EQ(normalizeUrl("https://github.com/user/repo/blob/main/blob/x.txt"),
              "https://raw.githubusercontent.com/user/repo/main/blob/x.txt");
}

TEST(UrlNormalizer, OtherHostsPassThrough) {
    const std::string url = "https://example.com/files/archive.tar.gz?dl=0";
    EXPECT_EQ(normalizeUrl(url), url);
    EXPECT_EQ(normalizeUrl("ftp://ftp.example.org/pub/readme"), "ftp://ftp.example.org/pub/readme");
}

TEST(UrlNormalizer, RuleTableIsOrdered) {
    auto rules = providerRules();
    ASSERT_EQ(rules.size(), 3u);
    EXPECT_EQ(rules[0].name, "google-drive");
    EXPECT_EQ(rules[1].name, "dropbox");
    EXPECT_EQ(rules[2].name, "github");
    EXPECT_TRUE(rules[2].matches("https://github.com/a/b"));
    EXPECT_FALSE(rules[0].matches("https://github.com/a/b"));
}

TEST(UrlScheme, IsLowerCasedRegardlessOfInput) {
    EXPECT_EQ(urlScheme("Ftp://ftp.example.org/pub/a.bin"), "ftp");
    EXPECT_EQ(urlScheme("HTTPS://example.com/"), "https");
    EXPECT_EQ(urlScheme("example.com/no-scheme"), "");
}
