#include <gtest/gtest.h>
#include <managers/tunnel_service.hpp>
#include "fake_transport.hpp"

class TunnelServiceTest : public ::testing::Test {
protected:
    FakeTransport transport;
    StaticHostDirectory hosts{{make_host("gw", "10.0.0.1"), make_host("db", "10.0.0.2")}};
    CredentialResolver resolver{nullptr, nullptr};
    StatusRecorder recorder;
    std::unique_ptr<TunnelService> service;

    void SetUp() override {
        SupervisorOptions o;
        o.monitor_interval_ms = 20;
        service = std::make_unique<TunnelService>(transport, resolver, &hosts, o);
        service->set_status_listener(recorder.listener());
    }

    void TearDown() override {
        service->shutdown();
    }

    TunnelSpec make_spec(int source_port, int max_retries = 2, int64_t interval_ms = 0) {
        TunnelSpec s;
        s.source = make_host("gw", "10.0.0.1");
        s.endpoint_host = "db";
        s.source_port = source_port;
        s.endpoint_port = 5432;
        s.name = tunnel_name(host_label(s.source), s.source_port, s.endpoint_port);
        s.max_retries = max_retries;
        s.retry_interval_ms = interval_ms;
        return s;
    }

    TunnelState state_of(const std::string& name) {
        auto st = service->get_status(name);
        return st ? st->state : TunnelState::Disconnected;
    }
};

TEST_F(TunnelServiceTest, ConnectRejectsInvalidSpec) {
    auto spec = make_spec(0);
    auto r = service->connect(spec);
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(service->get_status(spec.name).has_value());
    EXPECT_EQ(transport.opens.load(), 0);
}

TEST_F(TunnelServiceTest, ConnectReachesConnected) {
    auto spec = make_spec(8080);
    auto r = service->connect(spec);
    ASSERT_TRUE(r.is_ok());
    EXPECT_NE(r.value.state, TunnelState::Disconnected);

    ASSERT_TRUE(wait_until([&]() { return state_of(spec.name) == TunnelState::Connected; }));
    for (const auto& n : recorder.names()) EXPECT_EQ(n, "gw_8080_5432");
}

TEST_F(TunnelServiceTest, ConcurrentConnectsStartOneAttempt) {
    auto spec = make_spec(8080);
    std::vector<std::thread> callers;
    for (int i = 0; i < 8; i++) {
        callers.emplace_back([&]() {
            auto r = service->connect(spec);
            EXPECT_TRUE(r.is_ok());
        });
    }
    for (auto& t : callers) t.join();

    ASSERT_TRUE(wait_until([&]() { return state_of(spec.name) == TunnelState::Connected; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(transport.opens.load(), 2);
    EXPECT_EQ(transport.binds.load(), 1);
    EXPECT_EQ(service->get_all_statuses().size(), 1u);
}

TEST_F(TunnelServiceTest, ConnectWhileConnectedReturnsCurrentStatus) {
    auto spec = make_spec(8080);
    ASSERT_TRUE(service->connect(spec).is_ok());
    ASSERT_TRUE(wait_until([&]() { return state_of(spec.name) == TunnelState::Connected; }));

    auto again = service->connect(spec);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value.state, TunnelState::Connected);
    EXPECT_EQ(transport.opens.load(), 2);
}

TEST_F(TunnelServiceTest, DisconnectStopsAndForgetsTunnel) {
    auto spec = make_spec(8080);
    ASSERT_TRUE(service->connect(spec).is_ok());
    ASSERT_TRUE(wait_until([&]() { return state_of(spec.name) == TunnelState::Connected; }));

    auto r = service->disconnect(spec.name);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.state, TunnelState::Disconnected);
    EXPECT_TRUE(r.value.manual_disconnect);
    EXPECT_FALSE(service->get_status(spec.name).has_value());
    EXPECT_LT(transport.log.index_of("close forward"), transport.log.index_of("close 10.0.0.1"));

    // A fresh connect after disconnect starts a new cycle
    ASSERT_TRUE(service->connect(spec).is_ok());
    ASSERT_TRUE(wait_until([&]() { return state_of(spec.name) == TunnelState::Connected; }));
    EXPECT_EQ(transport.opens.load(), 4);
}

TEST_F(TunnelServiceTest, DisconnectUnknownTunnelIsNoOp) {
    auto r = service->disconnect("nope_1_2");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.state, TunnelState::Disconnected);
}

TEST_F(TunnelServiceTest, CancelDuringBackoffStopsRetrying) {
    transport.fail_host("10.0.0.2", "Connection refused", ErrorType::NetworkUnreachable);
    auto spec = make_spec(8080, 5, 60000);
    ASSERT_TRUE(service->connect(spec).is_ok());
    ASSERT_TRUE(wait_until([&]() { return state_of(spec.name) == TunnelState::Waiting; }));

    int opens = transport.opens.load();
    auto r = service->cancel(spec.name);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.state, TunnelState::Disconnected);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(transport.opens.load(), opens);
    EXPECT_FALSE(service->get_status(spec.name).has_value());
}

TEST_F(TunnelServiceTest, FailedStatusIsRetained) {
    transport.fail_host("10.0.0.2", "Connection refused", ErrorType::NetworkUnreachable);
    auto spec = make_spec(8080, 0);
    ASSERT_TRUE(service->connect(spec).is_ok());
    ASSERT_TRUE(wait_until([&]() { return state_of(spec.name) == TunnelState::Failed; }));

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    auto st = service->get_status(spec.name);
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->state, TunnelState::Failed);
    EXPECT_TRUE(st->retry_exhausted);
}

TEST_F(TunnelServiceTest, TunnelsAreIndependent) {
    auto a = make_spec(8080);
    auto b = make_spec(8081);
    ASSERT_TRUE(service->connect(a).is_ok());
    ASSERT_TRUE(service->connect(b).is_ok());
    ASSERT_TRUE(wait_until([&]() {
        return state_of(a.name) == TunnelState::Connected &&
               state_of(b.name) == TunnelState::Connected;
    }));

    ASSERT_TRUE(service->disconnect(a.name).is_ok());
    EXPECT_EQ(state_of(b.name), TunnelState::Connected);
    EXPECT_EQ(service->get_all_statuses().count(b.name), 1u);
}

TEST_F(TunnelServiceTest, AutostartConnectsFlaggedSpecsOnly) {
    auto a = make_spec(8080);
    a.auto_start = true;
    auto b = make_spec(8081);
    service->autostart({a, b}, 10);

    ASSERT_TRUE(wait_until([&]() { return state_of(a.name) == TunnelState::Connected; }));
    EXPECT_FALSE(service->get_status(b.name).has_value());
}

TEST_F(TunnelServiceTest, ShutdownStopsEverythingAndRefusesConnects) {
    ASSERT_TRUE(service->connect(make_spec(8080)).is_ok());
    ASSERT_TRUE(service->connect(make_spec(8081)).is_ok());
    ASSERT_TRUE(wait_until([&]() { return transport.binds.load() == 2; }));

    service->shutdown();
    EXPECT_TRUE(service->get_all_statuses().empty());
    EXPECT_TRUE(service->connect(make_spec(8082)).is_err());
}

TEST_F(TunnelServiceTest, ShutdownRacingConnectsLeavesNothingRunning) {
    for (int round = 0; round < 20; round++) {
        FakeTransport net;
        SupervisorOptions o;
        o.monitor_interval_ms = 20;
        TunnelService svc(net, resolver, &hosts, o);

        std::atomic<bool> go{false};
        std::thread connector([&]() {
            while (!go.load()) std::this_thread::yield();
            for (int port = 9000; port < 9040; port++) {
                if (svc.connect(make_spec(port)).is_err()) break;
            }
        });

        go = true;
        std::this_thread::sleep_for(std::chrono::microseconds(200 * (round % 5)));
        svc.shutdown();
        connector.join();

        EXPECT_TRUE(svc.get_all_statuses().empty()) << "round " << round;
        EXPECT_TRUE(svc.connect(make_spec(9100)).is_err());
    }
}
