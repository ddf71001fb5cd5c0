#include <gtest/gtest.h>
#include <managers/runtime.hpp>
#include "fake_transport.hpp"
#include "temp_dir.hpp"

static const char* RUNTIME_CONFIG = R"(
retry:
  monitor_interval: 20
sessions:
  kdf_iterations: 1000
hosts:
  - name: "gw"
    ip: "10.0.0.1"
    username: "ops"
    password: "pw"
    tunnels:
      - source_port: 8080
        endpoint_host: "db"
        endpoint_port: 5432
        max_retries: 0
  - name: "db"
    ip: "10.0.0.2"
    username: "ops"
    credential_id: "db-ops"
    user_id: "alice"
)";

class RuntimeTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeTransport* transport = nullptr;
    std::unique_ptr<TunneldRuntime> runtime;

    void SetUp() override {
        auto config = Config::parse(RUNTIME_CONFIG);
        ASSERT_TRUE(config.is_ok()) << config.error;

        RuntimePaths paths;
        paths.keys = dir.path() / "keys.yaml";
        paths.credentials = dir.path() / "credentials.yaml";

        auto fake = std::make_unique<FakeTransport>();
        transport = fake.get();
        runtime = std::make_unique<TunneldRuntime>(config.value, paths, std::move(fake));
    }

    void TearDown() override {
        runtime->shutdown();
    }

    TunnelState state(const std::string& name) {
        auto st = runtime->tunnels().get_status(name);
        return st ? st->state : TunnelState::Disconnected;
    }

    void store_db_credential() {
        ASSERT_TRUE(runtime->crypto().setup_user_encryption("alice", "pw").is_ok());
        ASSERT_TRUE(runtime->crypto().authenticate_user("alice", "pw"));
        PlainCredential p;
        p.id = "db-ops";
        p.owner_user_id = "alice";
        p.username = "dbadmin";
        p.password = "db-secret";
        ASSERT_TRUE(runtime->add_credential(p).is_ok());
    }
};

TEST_F(RuntimeTest, BuildsSpecsFromConfig) {
    ASSERT_EQ(runtime->specs().size(), 1u);
    EXPECT_EQ(runtime->specs()[0].name, "gw_8080_5432");
    EXPECT_TRUE(runtime->find_spec("gw_8080_5432").has_value());
    EXPECT_FALSE(runtime->find_spec("other_1_2").has_value());
    EXPECT_TRUE(runtime->connect("other_1_2").is_err());
}

TEST_F(RuntimeTest, LockedCredentialFailsTunnel) {
    ASSERT_TRUE(runtime->connect("gw_8080_5432").is_ok());
    ASSERT_TRUE(wait_until([&]() { return state("gw_8080_5432") == TunnelState::Failed; }));

    auto st = runtime->tunnels().get_status("gw_8080_5432");
    EXPECT_EQ(*st->error_type, ErrorType::CredentialUnavailable);
    // The source hop was opened, the endpoint never was
    EXPECT_EQ(transport->opens.load(), 1);
}

TEST_F(RuntimeTest, UnlockedCredentialConnects) {
    store_db_credential();

    ASSERT_TRUE(runtime->connect("gw_8080_5432").is_ok());
    ASSERT_TRUE(wait_until([&]() { return state("gw_8080_5432") == TunnelState::Connected; }));

    auto targets = transport->targets();
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[1].host, "10.0.0.2");
    EXPECT_EQ(targets[1].user, "dbadmin");
    EXPECT_EQ(targets[1].password, "db-secret");
}

TEST_F(RuntimeTest, AddCredentialRequiresUnlockedUser) {
    PlainCredential p;
    p.id = "db-ops";
    p.owner_user_id = "alice";
    p.password = "db-secret";
    auto r = runtime->add_credential(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorType::CredentialUnavailable);
    EXPECT_TRUE(runtime->credentials().list("alice").empty());
}

TEST_F(RuntimeTest, CredentialsPersistEncrypted) {
    store_db_credential();

    auto rec = runtime->credentials().find("db-ops");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->owner_user_id, "alice");
    EXPECT_FALSE(rec->password.empty());
    EXPECT_EQ(rec->password.data.find("db-secret"), std::string::npos);
}

TEST_F(RuntimeTest, ShutdownStopsTunnels) {
    store_db_credential();
    ASSERT_TRUE(runtime->connect("gw_8080_5432").is_ok());
    ASSERT_TRUE(wait_until([&]() { return state("gw_8080_5432") == TunnelState::Connected; }));

    runtime->shutdown();
    EXPECT_TRUE(runtime->tunnels().get_all_statuses().empty());
    EXPECT_GE(transport->log.index_of("close forward"), 0);
}
