#include <gtest/gtest.h>
#include <managers/supervisor.hpp>
#include "fake_transport.hpp"

class SupervisorTest : public ::testing::Test {
protected:
    FakeTransport transport;
    StaticHostDirectory hosts{{make_host("gw", "10.0.0.1"), make_host("db", "10.0.0.2")}};
    CredentialResolver resolver{nullptr, nullptr};
    StatusRecorder recorder;

    SupervisorOptions options() {
        SupervisorOptions o;
        o.monitor_interval_ms = 20;
        return o;
    }

    std::unique_ptr<Supervisor> make_supervisor() {
        return std::make_unique<Supervisor>("gw_8080_5432", transport, resolver, &hosts,
                                            options(), recorder.listener());
    }

    TunnelSpec make_spec(int max_retries, int64_t retry_interval_ms) {
        TunnelSpec s;
        s.name = "gw_8080_5432";
        s.source = make_host("gw", "10.0.0.1");
        s.endpoint_host = "db";
        s.source_port = 8080;
        s.endpoint_port = 5432;
        s.max_retries = max_retries;
        s.retry_interval_ms = retry_interval_ms;
        return s;
    }
};

TEST_F(SupervisorTest, UnreachableEndpointRetriesThenFails) {
    transport.fail_host("10.0.0.2", "Failed to connect to 10.0.0.2:22: No route to host",
                        ErrorType::NetworkUnreachable);
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(2, 50)));

    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Failed; }));

    std::vector<TunnelState> expected = {
        TunnelState::Connecting, TunnelState::Retrying, TunnelState::Waiting,
        TunnelState::Connecting, TunnelState::Retrying, TunnelState::Waiting,
        TunnelState::Connecting, TunnelState::Failed,
    };
    EXPECT_EQ(recorder.states(), expected);

    auto st = sup->status();
    EXPECT_TRUE(st.retry_exhausted);
    EXPECT_EQ(st.retry_count, 3);
    EXPECT_EQ(st.max_retries, 2);
    ASSERT_TRUE(st.error_type.has_value());
    EXPECT_EQ(*st.error_type, ErrorType::NetworkUnreachable);
    ASSERT_TRUE(st.reason.has_value());
    EXPECT_NE(st.reason->find("Endpoint host db"), std::string::npos);

    // Three attempts, each opening the source and then the endpoint
    EXPECT_EQ(transport.opens.load(), 6);
}

TEST_F(SupervisorTest, RetryCountsIncreaseByOne) {
    transport.fail_host("10.0.0.2", "Connection refused", ErrorType::NetworkUnreachable);
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(3, 0)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Failed; }));

    std::vector<int> retrying;
    for (const auto& st : recorder.statuses()) {
        if (st.state == TunnelState::Retrying) retrying.push_back(st.retry_count);
    }
    EXPECT_EQ(retrying, (std::vector<int>{1, 2, 3}));
}

TEST_F(SupervisorTest, ZeroMaxRetriesFailsOnFirstError) {
    transport.fail_host("10.0.0.1", "Authentication failed (username/password)",
                        ErrorType::AuthenticationFailed);
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(0, 1000)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Failed; }));

    std::vector<TunnelState> expected = {TunnelState::Connecting, TunnelState::Failed};
    EXPECT_EQ(recorder.states(), expected);
    EXPECT_EQ(*sup->status().error_type, ErrorType::AuthenticationFailed);
    EXPECT_EQ(transport.opens.load(), 1);
}

TEST_F(SupervisorTest, ConnectsAndResetsRetryCount) {
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(3, 0)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Connected; }));

    auto st = sup->status();
    EXPECT_EQ(st.retry_count, 0);
    EXPECT_FALSE(st.reason.has_value());
    EXPECT_EQ(transport.binds.load(), 1);

    auto targets = transport.targets();
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].host, "10.0.0.1");
    EXPECT_EQ(targets[1].host, "10.0.0.2");
    EXPECT_EQ(targets[0].password, "secret");
    sup->stop();
}

TEST_F(SupervisorTest, StartIsIgnoredWhileActive) {
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(3, 0)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Connected; }));

    EXPECT_FALSE(sup->start(make_spec(3, 0)));
    EXPECT_EQ(transport.opens.load(), 2);
    sup->stop();
}

TEST_F(SupervisorTest, StopDuringWaitingPreventsFurtherAttempts) {
    transport.fail_host("10.0.0.2", "Connection refused", ErrorType::NetworkUnreachable);
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(5, 60000)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Waiting; }));

    auto waiting = sup->status();
    ASSERT_TRUE(waiting.next_retry_in_seconds.has_value());
    EXPECT_GT(*waiting.next_retry_in_seconds, 0);
    EXPECT_LE(*waiting.next_retry_in_seconds, 60);

    int opens_before = transport.opens.load();
    auto done = sup->stop();
    EXPECT_EQ(done.state, TunnelState::Disconnected);
    EXPECT_TRUE(done.manual_disconnect);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(transport.opens.load(), opens_before);

    auto states = recorder.states();
    ASSERT_GE(states.size(), 2u);
    EXPECT_EQ(states[states.size() - 2], TunnelState::Disconnecting);
    EXPECT_EQ(states.back(), TunnelState::Disconnected);
}

TEST_F(SupervisorTest, StopInterruptsInFlightAttempt) {
    transport.block_open = true;
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(5, 0)));
    ASSERT_TRUE(wait_until([&]() { return transport.opens.load() == 1; }));

    auto done = sup->stop();
    EXPECT_EQ(done.state, TunnelState::Disconnected);
    EXPECT_EQ(transport.opens.load(), 1);

    // The worker never published the cancelled attempt as a failure
    for (const auto& st : recorder.statuses()) {
        EXPECT_NE(st.state, TunnelState::Retrying);
        EXPECT_NE(st.state, TunnelState::Failed);
    }
}

TEST_F(SupervisorTest, StopClosesListenerBeforeSessions) {
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(3, 0)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Connected; }));

    sup->stop();

    int fwd = transport.log.index_of("close forward");
    int src = transport.log.index_of("close 10.0.0.1");
    int dst = transport.log.index_of("close 10.0.0.2");
    ASSERT_GE(fwd, 0);
    ASSERT_GE(src, 0);
    ASSERT_GE(dst, 0);
    EXPECT_LT(fwd, src);
    EXPECT_LT(fwd, dst);
}

TEST_F(SupervisorTest, MissingEndpointHostIsClassified) {
    auto sup = make_supervisor();
    auto spec = make_spec(0, 0);
    spec.endpoint_host = "nowhere";
    ASSERT_TRUE(sup->start(spec));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Failed; }));

    auto st = sup->status();
    EXPECT_EQ(*st.error_type, ErrorType::EndpointHostNotFound);
    EXPECT_EQ(*st.reason, "Endpoint host 'nowhere' not found");
    EXPECT_EQ(transport.opens.load(), 0);
}

TEST_F(SupervisorTest, EndpointAddedDuringRetriesIsPickedUp) {
    auto sup = make_supervisor();
    auto spec = make_spec(5, 20);
    spec.endpoint_host = "late";
    ASSERT_TRUE(sup->start(spec));
    ASSERT_TRUE(wait_until([&]() { return sup->status().retry_count >= 1; }));

    hosts.set_hosts({make_host("gw", "10.0.0.1"), make_host("late", "10.0.0.9")});
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Connected; }));
    EXPECT_NE(transport.last_link("10.0.0.9"), nullptr);
    sup->stop();
}

TEST_F(SupervisorTest, BindFailureIsClassified) {
    transport.fail_bind = true;
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(0, 0)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Failed; }));

    EXPECT_EQ(*sup->status().error_type, ErrorType::BindFailed);
    // Both sessions from the failed attempt were released
    EXPECT_TRUE(transport.last_link("10.0.0.1")->closed());
    EXPECT_TRUE(transport.last_link("10.0.0.2")->closed());
}

TEST_F(SupervisorTest, DropWhileConnectedReconnects) {
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(2, 0)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Connected; }));

    auto first = transport.last_link("10.0.0.1");
    first->drop();

    ASSERT_TRUE(wait_until([&]() {
        return transport.opens.load() == 4 && sup->status().state == TunnelState::Connected;
    }));

    bool saw_retry = false;
    for (const auto& st : recorder.statuses()) {
        if (st.state == TunnelState::Retrying) {
            saw_retry = true;
            EXPECT_EQ(st.retry_count, 1);
            EXPECT_EQ(*st.error_type, ErrorType::NetworkUnreachable);
        }
    }
    EXPECT_TRUE(saw_retry);
    EXPECT_TRUE(first->closed());
    EXPECT_EQ(sup->status().retry_count, 0);
    sup->stop();
}

TEST_F(SupervisorTest, FailedTunnelCanBeRestarted) {
    transport.fail_host("10.0.0.2", "Connection refused", ErrorType::NetworkUnreachable);
    auto sup = make_supervisor();
    ASSERT_TRUE(sup->start(make_spec(0, 0)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Failed; }));

    transport.heal_host("10.0.0.2");
    ASSERT_TRUE(sup->start(make_spec(0, 0)));
    ASSERT_TRUE(wait_until([&]() { return sup->status().state == TunnelState::Connected; }));
    EXPECT_FALSE(sup->status().retry_exhausted);
    sup->stop();
}
