#include <gtest/gtest.h>
#include <managers/tunnel_registry.hpp>
#include "fake_transport.hpp"

class TunnelRegistryTest : public ::testing::Test {
protected:
    FakeTransport transport;
    CredentialResolver resolver{nullptr, nullptr};
    TunnelRegistry registry;
    int created = 0;

    TunnelRegistry::Factory factory(const std::string& name) {
        return [this, name]() {
            created++;
            return std::make_shared<Supervisor>(name, transport, resolver, nullptr,
                                                SupervisorOptions{}, nullptr);
        };
    }
};

TEST_F(TunnelRegistryTest, GetOrCreateReusesExisting) {
    auto a = registry.get_or_create("a_1_2", factory("a_1_2"));
    auto b = registry.get_or_create("a_1_2", factory("a_1_2"));
    EXPECT_EQ(a, b);
    EXPECT_EQ(created, 1);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(TunnelRegistryTest, FindAndRemove) {
    registry.get_or_create("a_1_2", factory("a_1_2"));
    registry.get_or_create("b_1_2", factory("b_1_2"));
    ASSERT_NE(registry.find("a_1_2"), nullptr);

    registry.remove("a_1_2");
    EXPECT_EQ(registry.find("a_1_2"), nullptr);
    EXPECT_NE(registry.find("b_1_2"), nullptr);
    EXPECT_EQ(registry.snapshot().size(), 1u);
}

TEST_F(TunnelRegistryTest, RemoveUnknownIsHarmless) {
    registry.remove("missing");
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(TunnelRegistryTest, OpLockIsStablePerName) {
    auto l1 = registry.op_lock("a_1_2");
    auto l2 = registry.op_lock("a_1_2");
    auto other = registry.op_lock("b_1_2");
    EXPECT_EQ(l1, l2);
    EXPECT_NE(l1, other);

    // Kept after the supervisor is gone
    registry.get_or_create("a_1_2", factory("a_1_2"));
    registry.remove("a_1_2");
    EXPECT_EQ(registry.op_lock("a_1_2"), l1);
}

TEST_F(TunnelRegistryTest, SnapshotOutlivesRemoval) {
    registry.get_or_create("a_1_2", factory("a_1_2"));
    auto snap = registry.snapshot();
    registry.remove("a_1_2");
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0]->name(), "a_1_2");
}
