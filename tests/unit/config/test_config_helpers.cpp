#include <gtest/gtest.h>
#include <fetchkit/config/config_helpers.h>
#include <fetchkit/config/fetch_config.h>

#include "../../common/downloader_fakes.h"

#include <cstdlib>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace fetchkit::config;
using fetchkit::downloader::ErrorCode;
using fetchkit::downloader::HashAlgo;
using fetchkit::test::make_temp_dir;
using fetchkit::test::write_file;
using namespace std::chrono_literals;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name))
            old_ = old;
        if (value)
            ::setenv(name, value, 1);
        else
            ::unsetenv(name);
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

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { dir = make_temp_dir("fetchkit-config-"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

} // namespace

TEST_F(ConfigTest, ParsesSectionScopedValues) {
    const auto cfg = dir / "config.toml";
    write_file(cfg, "# fetchkit\n"
                    "timeout = 99\n"
                    "\n"
                    "[other]\n"
                    "timeout = 1\n"
                    "\n"
                    "[fetch]\n"
                    "timeout = 30   # seconds\n"
                    "user_agent = \"agent #7\"\n"
                    "hash_algo = 'sha256'\n");

    EXPECT_EQ(parse_config_value(cfg, "fetch", "timeout"), "30");
    EXPECT_EQ(parse_config_value(cfg, "other", "timeout"), "1");
    EXPECT_EQ(parse_config_value(cfg, "fetch", "user_agent"), "agent #7");
    EXPECT_EQ(parse_config_value(cfg, "fetch", "hash_algo"), "sha256");
    EXPECT_EQ(parse_config_value(cfg, "fetch", "missing"), "");
    EXPECT_EQ(parse_config_value(dir / "absent.toml", "fetch", "timeout"), "");
}

TEST_F(ConfigTest, DottedKeysAtTopLevel) {
    const auto cfg = dir / "config.toml";
    write_file(cfg, "fetch.resume = false\n");
    EXPECT_EQ(parse_config_value(cfg, "fetch", "resume"), "false");
}

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    auto r = load_downloader_config(dir / "absent.toml");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().defaultTimeout, 10000ms);
    EXPECT_EQ(r.value().initialChunkSize, 8192u);
    EXPECT_EQ(r.value().defaultChecksumAlgo, HashAlgo::Md5);
    EXPECT_TRUE(r.value().resume);
}

TEST_F(ConfigTest, LoadsFetchSection) {
    ScopedEnv home("HOME", dir.c_str());
    const auto cfg = dir / "config.toml";
    write_file(cfg, "[fetch]\n"
                    "timeout = 2.5\n"
                    "chunk_size = 4096\n"
                    "max_chunk_size = 1048576\n"
                    "hash_algo = sha512\n"
                    "resume = no\n"
                    "user_agent = \"my-agent/2\"\n"
                    "tls_insecure = true\n"
                    "ca_path = \"~/certs/ca.pem\"\n");

    auto r = load_downloader_config(cfg);
    ASSERT_TRUE(r.ok()) << r.error().message;
    const auto& c = r.value();
    EXPECT_EQ(c.defaultTimeout, 2500ms);
    EXPECT_EQ(c.initialChunkSize, 4096u);
    EXPECT_EQ(c.maxChunkSize, 1048576u);
    EXPECT_EQ(c.defaultChecksumAlgo, HashAlgo::Sha512);
    EXPECT_FALSE(c.resume);
    EXPECT_EQ(c.userAgent, "my-agent/2");
    EXPECT_TRUE(c.tlsInsecure);
    EXPECT_EQ(c.caPath, (dir / "certs" / "ca.pem").string());
}

TEST_F(ConfigTest, MalformedValuesAreInvalidArgument) {
    const auto cfg = dir / "config.toml";
    write_file(cfg, "[fetch]\nhash_algo = crc32\n");
    auto r = load_downloader_config(cfg);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(r.error().message.find("hash_algo"), std::string::npos);

    write_file(cfg, "[fetch]\ntimeout = soon\n");
    EXPECT_FALSE(load_downloader_config(cfg).ok());

    write_file(cfg, "[fetch]\nchunk_size = 0\n");
    EXPECT_FALSE(load_downloader_config(cfg).ok());

    write_file(cfg, "[fetch]\nchunk_size = 4096\nmax_chunk_size = 1024\n");
    EXPECT_FALSE(load_downloader_config(cfg).ok());
}

TEST(ConfigHelpers, ExpandTilde) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~"), fs::path("/home/tester"));
    EXPECT_EQ(expand_tilde("~/data/x"), fs::path("/home/tester/data/x"));
    EXPECT_EQ(expand_tilde("~other/x"), fs::path("~other/x"));
    EXPECT_EQ(expand_tilde("/abs/path"), fs::path("/abs/path"));
    EXPECT_EQ(expand_tilde(""), fs::path(""));
}

TEST(ConfigHelpers, ParsePrimitives) {
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
    EXPECT_EQ(parse_u64("8192"), 8192u);
    EXPECT_FALSE(parse_u64("12kb").has_value());
    EXPECT_FALSE(parse_u64("").has_value());
    EXPECT_EQ(unquote("  \"quoted\"  "), "quoted");
}

TEST(ConfigHelpers, ConfigPathResolution) {
    ScopedEnv xdg("XDG_CONFIG_HOME", "/xdg");
    {
        ScopedEnv env("FETCHKIT_CONFIG", nullptr);
        EXPECT_EQ(get_config_dir(), fs::path("/xdg/fetchkit"));
        EXPECT_EQ(resolve_config_path(), fs::path("/xdg/fetchkit/config.toml"));
        EXPECT_EQ(resolve_config_path("/explicit.toml"), fs::path("/explicit.toml"));
    }
    {
        ScopedEnv env("FETCHKIT_CONFIG", "/from/env.toml");
        EXPECT_EQ(resolve_config_path(), fs::path("/from/env.toml"));
        EXPECT_EQ(resolve_config_path("/explicit.toml"), fs::path("/explicit.toml"));
    }
}
