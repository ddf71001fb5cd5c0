#include <gtest/gtest.h>
#include <ssh/libssh2_transport.hpp>
#include <platform/socket_util.hpp>
#include <chrono>
#include "fake_transport.hpp"

TEST(Libssh2Transport, RefusedPortIsNetworkUnreachable) {
    Libssh2Transport transport;
    SessionTarget t;
    t.host = "127.0.0.1";
    t.port = 1;
    t.user = "nobody";
    t.password = "x";
    t.timeout = 2;

    std::atomic<bool> cancelled{false};
    auto r = transport.open(t, cancelled);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorType::NetworkUnreachable);
}

TEST(Libssh2Transport, BindRejectsForeignLinks) {
    Libssh2Transport transport;
    EventLog log;
    FakeLink a("10.0.0.1", log);
    FakeLink b("10.0.0.2", log);

    ForwardRequest req;
    req.source_port = 8080;
    req.endpoint_port = 80;
    auto r = transport.bind(a, b, req);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorType::BindFailed);
}

TEST(SocketUtil, CancelledConnectReturnsPromptly) {
    std::atomic<bool> cancelled{true};
    auto start = std::chrono::steady_clock::now();
    auto r = platform::connect_tcp("192.0.2.1", 22, 10000, cancelled);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.is_err());
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(SessionTarget, WipeClearsSecrets) {
    SessionTarget t;
    t.password = "pw";
    t.private_key = "key";
    t.passphrase = "phrase";
    t.wipe();
    EXPECT_TRUE(t.password.empty());
    EXPECT_TRUE(t.private_key.empty());
    EXPECT_TRUE(t.passphrase.empty());
}
