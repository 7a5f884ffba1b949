#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

TEST(Config, DefaultsApplyToMissingKeys) {
    auto r = Config::parse("address: http://tfe.test\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const ClientConfig& c = r.value.client();
    EXPECT_EQ(c.address, "http://tfe.test");
    EXPECT_EQ(c.base_path, "/api/v2/");
    EXPECT_EQ(c.poll.min_ms, LOG_POLL_MIN_MS);
    EXPECT_EQ(c.poll.max_ms, LOG_POLL_MAX_MS);
    EXPECT_EQ(c.chunk_size, LOG_CHUNK_SIZE);
    EXPECT_EQ(c.timeouts.connect_secs, HTTP_CONNECT_TIMEOUT_SECS);
    EXPECT_EQ(c.timeouts.request_secs, HTTP_REQUEST_TIMEOUT_SECS);
}

TEST(Config, ParsesAllKeys) {
    auto r = Config::parse(R"(
address: "http://10.0.0.5:8080///"
base_path: api/v3
poll:
  min_ms: 100
  max_ms: 400
chunk_size: 1024
timeouts:
  connect_secs: 3
  request_secs: 7
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const ClientConfig& c = r.value.client();
    EXPECT_EQ(c.address, "http://10.0.0.5:8080");
    EXPECT_EQ(c.base_path, "/api/v3/");
    EXPECT_EQ(c.poll.min_ms, 100);
    EXPECT_EQ(c.poll.max_ms, 400);
    EXPECT_EQ(c.chunk_size, 1024u);
    EXPECT_EQ(c.timeouts.connect_secs, 3);
    EXPECT_EQ(c.timeouts.request_secs, 7);
    EXPECT_EQ(r.value.api_url("plans/plan-1"), "http://10.0.0.5:8080/api/v3/plans/plan-1");
}

TEST(Config, RejectsInvalidValues) {
    EXPECT_EQ(Config::parse("").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("address: ftp://tfe.test\n").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("address: tfe.test\n").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("address: http://x\npoll:\n  min_ms: 0\n").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("address: http://x\npoll:\n  min_ms: 900\n  max_ms: 100\n").kind,
              ErrorKind::Config);
    EXPECT_EQ(Config::parse("address: http://x\nchunk_size: -5\n").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("address: http://x\ntimeouts:\n  request_secs: 0\n").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("- a\n- b\n").kind, ErrorKind::Config);
    EXPECT_EQ(Config::parse("address: [unclosed\n").kind, ErrorKind::Config);
}

TEST(Config, AcceptsHttpsAddress) {
    auto r = Config::parse("address: https://app.terraform.io\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.api_url("plans/plan-1"), "https://app.terraform.io/api/v2/plans/plan-1");
}

TEST(Config, WithAddress) {
    Config c = Config::with_address("http://localhost:9000/");
    EXPECT_EQ(c.api_url("plans/p"), "http://localhost:9000/api/v2/plans/p");
}

TEST(Config, LoadFileAndMissingFile) {
    auto path = platform::temp_file("planlog_config_test");
    ASSERT_FALSE(path.empty());
    {
        std::ofstream out(path);
        out << "address: http://tfe.test\nchunk_size: 10\n";
    }
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.client().chunk_size, 10u);

    fs::remove(path);
    auto missing = Config::load_file(path);
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.kind, ErrorKind::Config);
}

TEST(Config, LoadHonoursEnvironment) {
    auto path = platform::temp_file("planlog_config_env");
    ASSERT_FALSE(path.empty());
    {
        std::ofstream out(path);
        out << "address: http://from-file.test\npoll:\n  min_ms: 10\n  max_ms: 20\n";
    }
    setenv("PLANLOG_CONFIG", path.c_str(), 1);
    setenv("PLANLOG_ADDRESS", "http://from-env.test/", 1);

    auto r = Config::load();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.client().address, "http://from-env.test");
    EXPECT_EQ(r.value.client().poll.min_ms, 10);

    // Environment address alone is enough when the file is absent.
    fs::remove(path);
    r = Config::load();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.client().address, "http://from-env.test");

    unsetenv("PLANLOG_ADDRESS");
    r = Config::load();
    EXPECT_EQ(r.kind, ErrorKind::Config);
    unsetenv("PLANLOG_CONFIG");
}

TEST(Config, CreateDefaultIsLoadable) {
    auto dir = platform::temp_dir() / ("planlog_init_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    auto path = dir / "config.yaml";
    setenv("PLANLOG_CONFIG", path.c_str(), 1);

    ASSERT_TRUE(create_default_config().is_ok());
    EXPECT_TRUE(fs::exists(path));
    auto r = Config::load_file(path);
    EXPECT_TRUE(r.is_ok()) << r.error;

    // Existing file is left alone.
    {
        std::ofstream out(path);
        out << "address: http://kept.test\n";
    }
    ASSERT_TRUE(create_default_config().is_ok());
    EXPECT_EQ(Config::load_file(path).value.client().address, "http://kept.test");

    unsetenv("PLANLOG_CONFIG");
    fs::remove_all(dir);
}

TEST(Utils, ValidStringId) {
    EXPECT_TRUE(valid_string_id("plan-8F5JFydVYAmtTjET"));
    EXPECT_TRUE(valid_string_id("a.b_c-1"));
    EXPECT_FALSE(valid_string_id(""));
    EXPECT_FALSE(valid_string_id("a/b"));
    EXPECT_FALSE(valid_string_id("a b"));
    EXPECT_FALSE(valid_string_id("plan%2F"));
}

TEST(Utils, QueryEscape) {
    EXPECT_EQ(query_escape("plan-1"), "plan-1");
    EXPECT_EQ(query_escape("a b/c?"), "a+b%2Fc%3F");
    EXPECT_EQ(query_escape("~x.y_z"), "~x.y_z");
}
