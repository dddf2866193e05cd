#include <gtest/gtest.h>
#include "ghostpir/core/config.hpp"
#include "ghostpir/session/ghost_id.hpp"
#include "ghostpir/session/session_manager.hpp"
#include "test_support.hpp"
#include <cstdlib>

using namespace ghostpir;
using namespace ghostpir::session;
using namespace std::chrono_literals;

// ============================================================================
// Ghost Id Tests
// ============================================================================

TEST(GhostIdTest, KnownDigest) {
    EXPECT_EQ(derive_ghost_id("alice", "correct-horse"),
              "37bcc6600427683fb65a80338b751001cf94b6397dcfa1d9b8e1b9360475e59c");
    EXPECT_EQ(derive_ghost_id("", ""),
              "0d8c5a930238637ebba84d395bb05789e809681544879493a78cfe2983e4f2dd");
}

TEST(GhostIdTest, StableAndDistinct) {
    auto a = derive_ghost_id("alice", "pw");
    EXPECT_EQ(a, derive_ghost_id("alice", "pw"));
    EXPECT_NE(a, derive_ghost_id("alice", "pw2"));
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

// ============================================================================
// SessionManager Tests
// ============================================================================

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_shared<test_support::InMemoryPirServer>(16);
        now_ = TimePoint{} + 1000s;
    }

    SessionManager make(std::chrono::milliseconds ttl = 60s,
                        std::chrono::milliseconds margin = 45s) {
        return SessionManager(server_, ttl, margin, [this] { return now_; });
    }

    std::shared_ptr<test_support::InMemoryPirServer> server_;
    TimePoint now_;
};

TEST_F(SessionManagerTest, CreateStampsIssueTime) {
    auto mgr = make();
    auto token = mgr.create("ghost");

    EXPECT_EQ(token.value, "token-1");
    EXPECT_EQ(token.issued_at, now_);
    EXPECT_EQ(server_->sessions_created(), 1u);
}

TEST_F(SessionManagerTest, RefreshOnlyAfterMargin) {
    auto mgr = make();
    auto token = mgr.create("ghost");

    now_ += 45s;
    EXPECT_FALSE(mgr.needs_refresh(token, mgr.now()));
    EXPECT_EQ(mgr.refresh_if_needed(token, "ghost", mgr.now()).value, "token-1");

    now_ += 1s;
    EXPECT_TRUE(mgr.needs_refresh(token, mgr.now()));

    auto fresh = mgr.refresh_if_needed(token, "ghost", mgr.now());
    EXPECT_EQ(fresh.value, "token-2");
    EXPECT_EQ(fresh.issued_at, now_);
    EXPECT_EQ(server_->sessions_created(), 2u);
}

TEST_F(SessionManagerTest, EmptyTokenAlwaysRefreshes) {
    auto mgr = make();
    EXPECT_TRUE(mgr.needs_refresh(SessionToken{}, mgr.now()));
}

TEST_F(SessionManagerTest, RejectsBadMargins) {
    EXPECT_THROW(make(60s, 60s), ConfigError);
    EXPECT_THROW(make(60s, 0s), ConfigError);
    EXPECT_THROW(make(0s, 0s), ConfigError);
    EXPECT_THROW(SessionManager(nullptr, 60s, 45s), ConfigError);
}

TEST_F(SessionManagerTest, SessionFailurePropagates) {
    auto mgr = make();
    EXPECT_THROW(mgr.create(""), network::HttpError);
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(EndpointTest, ParsesBaseUrls) {
    auto a = Endpoint::parse("http://127.0.0.1:8000");
    EXPECT_EQ(a.host, "127.0.0.1");
    EXPECT_EQ(a.port, 8000);

    auto b = Endpoint::parse("http://example.org/");
    EXPECT_EQ(b.host, "example.org");
    EXPECT_EQ(b.port, 80);

    auto c = Endpoint::parse("localhost:9000/api");
    EXPECT_EQ(c.host, "localhost");
    EXPECT_EQ(c.port, 9000);
    EXPECT_EQ(c.to_string(), "localhost:9000");
}

TEST(EndpointTest, RejectsMalformed) {
    EXPECT_THROW(Endpoint::parse("https://example.org"), ConfigError);
    EXPECT_THROW(Endpoint::parse("http://"), ConfigError);
    EXPECT_THROW(Endpoint::parse("http://host:"), ConfigError);
    EXPECT_THROW(Endpoint::parse("http://host:80a"), ConfigError);
    EXPECT_THROW(Endpoint::parse("http://host:70000"), ConfigError);
    EXPECT_THROW(Endpoint::parse("http://host:0"), ConfigError);
}

TEST(ClientConfigTest, Defaults) {
    ClientConfig config;

    EXPECT_EQ(config.base_url, "http://127.0.0.1:8000");
    EXPECT_EQ(config.chunk_size, 4096u);
    EXPECT_EQ(config.session_ttl, 60s);
    EXPECT_EQ(config.refresh_margin, 45s);
    EXPECT_FALSE(config.verbose);
    EXPECT_NO_THROW(config.validate());
}

TEST(ClientConfigTest, ValidateRejects) {
    ClientConfig config;
    config.chunk_size = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    config = ClientConfig();
    config.refresh_margin = 60s;
    EXPECT_THROW(config.validate(), ConfigError);

    config = ClientConfig();
    config.base_url = "https://secure.example";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ClientConfigTest, EnvironmentOverrides) {
    ::setenv("GHOSTPIR_API_URL", "http://10.0.0.2:9001", 1);
    ::setenv("GHOSTPIR_CHUNK_SIZE", "1024", 1);
    ::setenv("GHOSTPIR_VERBOSE", "1", 1);

    auto config = ClientConfig::from_environment();
    EXPECT_EQ(config.base_url, "http://10.0.0.2:9001");
    EXPECT_EQ(config.chunk_size, 1024u);
    EXPECT_TRUE(config.verbose);

    ::setenv("GHOSTPIR_CHUNK_SIZE", "lots", 1);
    EXPECT_THROW(ClientConfig::from_environment(), ConfigError);

    ::unsetenv("GHOSTPIR_API_URL");
    ::unsetenv("GHOSTPIR_CHUNK_SIZE");
    ::unsetenv("GHOSTPIR_VERBOSE");

    auto defaults = ClientConfig::from_environment();
    EXPECT_EQ(defaults.base_url, "http://127.0.0.1:8000");
    EXPECT_FALSE(defaults.verbose);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
