#include <gtest/gtest.h>
#include <managers/tunnel_types.hpp>

static TunnelSpec valid_spec() {
    TunnelSpec s;
    s.source.address = "203.0.113.10";
    s.source.username = "ops";
    s.endpoint_host = "db";
    s.source_port = 8080;
    s.endpoint_port = 80;
    s.name = tunnel_name(host_label(s.source), s.source_port, s.endpoint_port);
    return s;
}

TEST(TunnelTypes, HostLabelPrefersName) {
    HostRef h;
    h.name = "myhost";
    h.address = "203.0.113.10";
    h.username = "ops";
    EXPECT_EQ(host_label(h), "myhost");

    h.name.clear();
    EXPECT_EQ(host_label(h), "ops@203.0.113.10");
}

TEST(TunnelTypes, TunnelName) {
    EXPECT_EQ(tunnel_name("myhost", 8080, 80), "myhost_8080_80");
    EXPECT_EQ(tunnel_name("ops@203.0.113.10", 2222, 22), "ops@203.0.113.10_2222_22");
}

TEST(TunnelTypes, ValidSpecPasses) {
    EXPECT_TRUE(validate_spec(valid_spec()).is_ok());
}

TEST(TunnelTypes, PortRange) {
    auto s = valid_spec();
    s.source_port = 0;
    EXPECT_TRUE(validate_spec(s).is_err());

    s = valid_spec();
    s.endpoint_port = 65536;
    EXPECT_TRUE(validate_spec(s).is_err());

    s = valid_spec();
    s.endpoint_port = 65535;
    s.name = tunnel_name(host_label(s.source), s.source_port, s.endpoint_port);
    EXPECT_TRUE(validate_spec(s).is_ok());
}

TEST(TunnelTypes, MissingSourceDetails) {
    auto s = valid_spec();
    s.source.address.clear();
    auto r = validate_spec(s);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Missing required connection details");
}

TEST(TunnelTypes, NegativeRetries) {
    auto s = valid_spec();
    s.max_retries = -1;
    EXPECT_TRUE(validate_spec(s).is_err());
}

TEST(TunnelTypes, EndpointRequired) {
    auto s = valid_spec();
    s.endpoint_host.clear();
    EXPECT_TRUE(validate_spec(s).is_err());

    HostRef ep;
    ep.address = "10.0.0.5";
    ep.username = "ops";
    s.endpoint = ep;
    EXPECT_TRUE(validate_spec(s).is_ok());
}

TEST(TunnelTypes, NameMustMatchHostAndPorts) {
    auto s = valid_spec();
    s.name = "ops@203.0.113.10_8080_81";
    auto r = validate_spec(s);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("ops@203.0.113.10_8080_80"), std::string::npos);

    s.name = "";
    EXPECT_TRUE(validate_spec(s).is_err());

    s = valid_spec();
    s.source.name = "gateway";
    EXPECT_TRUE(validate_spec(s).is_err());
    s.name = "gateway_8080_80";
    EXPECT_TRUE(validate_spec(s).is_ok());
}

TEST(TunnelTypes, IdleStates) {
    EXPECT_TRUE(is_idle_state(TunnelState::Disconnected));
    EXPECT_TRUE(is_idle_state(TunnelState::Failed));
    EXPECT_FALSE(is_idle_state(TunnelState::Waiting));
    EXPECT_FALSE(is_idle_state(TunnelState::Connected));
    EXPECT_STREQ(tunnel_state_name(TunnelState::Waiting), "WAITING");
}
