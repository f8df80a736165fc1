#include <gtest/gtest.h>
#include "controller/network_manager.hpp"
#include "fake_backend.hpp"
#include "test_support.hpp"

class NetworkManagerTest : public ::testing::Test {
protected:
    NetworkManagerTest() : network_(backend_, {"virbr0", "virtio"}, TimingConfig(), noWaitPoller(&slept_)) {
        backend_.addVm("web01", VmState::Running);
        backend_.addVm("db01", VmState::Stopped);

        NetworkInterface eth0;
        eth0.name = "eth0";
        eth0.mac = "52:54:00:AB:CD:EF";
        eth0.ip = "192.168.122.45";
        eth0.subnet = "24";
        NetworkInterface lo;
        lo.name = "lo";
        lo.ip = "127.0.0.1";
        backend_.interfaces["web01"] = {lo, eth0};
    }

    FakeBackend backend_;
    std::vector<std::chrono::milliseconds> slept_;
    NetworkManager network_;
};

TEST_F(NetworkManagerTest, ListingSourceFollowsPowerState) {
    ASSERT_TRUE(network_.listInterfaces("web01").isOk());
    ASSERT_TRUE(network_.listInterfaces("db01").isOk());
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"listInterfaces:web01:guest",
                                                        "listInterfaces:db01:definition"}));
}

TEST_F(NetworkManagerTest, AddToRunningVmWaitsForLink) {
    auto interfaces = network_.addInterface("web01");
    ASSERT_TRUE(interfaces.isOk());
    EXPECT_EQ(interfaces.unwrap().size(), 3u);
    EXPECT_EQ(backend_.calls.front(), "attachInterface:web01:virbr0:live");
    ASSERT_EQ(slept_.size(), 1u);
    EXPECT_EQ(slept_[0], std::chrono::seconds(5));
}

TEST_F(NetworkManagerTest, AddToStoppedVmChangesDefinitionOnly) {
    auto interfaces = network_.addInterface("db01");
    ASSERT_TRUE(interfaces.isOk());
    EXPECT_EQ(backend_.calls.front(), "attachInterface:db01:virbr0");
    EXPECT_TRUE(slept_.empty());
}

TEST_F(NetworkManagerTest, RemoveMatchesMacIgnoringCase) {
    auto interfaces = network_.removeInterface("web01", "52:54:00:ab:cd:ef");
    ASSERT_TRUE(interfaces.isOk());
    EXPECT_EQ(backend_.count("detachInterface:web01:52:54:00:ab:cd:ef:live"), 1u);
}

TEST_F(NetworkManagerTest, RemoveUnknownMac) {
    auto interfaces = network_.removeInterface("web01", "52:54:00:00:00:99");
    ASSERT_TRUE(interfaces.isErr());
    EXPECT_EQ(interfaces.kind(), ErrorKind::NotFound);
    EXPECT_EQ(backend_.count("detachInterface"), 0u);
}

TEST_F(NetworkManagerTest, EthInterfacesOnly) {
    auto eth = network_.listEthInterfaces("web01");
    ASSERT_TRUE(eth.isOk());
    ASSERT_EQ(eth.unwrap().size(), 1u);
    EXPECT_EQ(eth.unwrap()[0].name, "eth0");
}

TEST_F(NetworkManagerTest, InterfaceAddress) {
    auto ip = network_.interfaceAddress("web01", "eth0");
    ASSERT_TRUE(ip.isOk());
    EXPECT_EQ(ip.unwrap(), "192.168.122.45");

    auto missing = network_.interfaceAddress("web01", "eth1");
    ASSERT_TRUE(missing.isErr());
    EXPECT_EQ(missing.kind(), ErrorKind::NotFound);
}

TEST_F(NetworkManagerTest, GuestQueriesNeedRunningVm) {
    auto eth = network_.listEthInterfaces("db01");
    ASSERT_TRUE(eth.isErr());
    EXPECT_EQ(eth.kind(), ErrorKind::StateConflict);

    auto unknown = network_.interfaceAddress("ghost", "eth0");
    ASSERT_TRUE(unknown.isErr());
    EXPECT_EQ(unknown.kind(), ErrorKind::NotFound);
}
