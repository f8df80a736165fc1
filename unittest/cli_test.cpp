#include <gtest/gtest.h>
#include <sstream>
#include "fake_backend.hpp"
#include "fake_provisioner.hpp"
#include "main/cli.hpp"
#include "test_support.hpp"

namespace {

bool parse(std::vector<std::string> words, GlobalOptions& options, std::string& error) {
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(&word[0]);
    }
    return parseGlobalOptions(static_cast<int>(argv.size()), argv.data(), options, error);
}

}  // namespace

TEST(GlobalOptionsTest, SplitsOptionsFromCommand) {
    GlobalOptions options;
    std::string error;
    ASSERT_TRUE(parse({"vmsteward", "--config", "/tmp/c.json", "--backend", "gcp", "--debug",
                       "remove-disk", "web01", "sdb", "--force"},
                      options, error));
    EXPECT_EQ(options.configPath, "/tmp/c.json");
    EXPECT_EQ(options.backend, "gcp");
    EXPECT_TRUE(options.debug);
    EXPECT_EQ(options.command, "remove-disk");
    EXPECT_EQ(options.args, std::vector<std::string>({"web01", "sdb", "--force"}));
}

TEST(GlobalOptionsTest, RejectsBadOptions) {
    GlobalOptions options;
    std::string error;
    EXPECT_FALSE(parse({"vmsteward", "--config"}, options, error));
    EXPECT_FALSE(parse({"vmsteward", "--verbose", "list"}, options, error));
    EXPECT_NE(error.find("--verbose"), std::string::npos);
}

class ControllerCLITest : public ::testing::Test {
protected:
    ControllerCLITest() : cli_(backend_, provisioner_, config_, noWaitPoller(), ConfirmationPolicy::alwaysNo(), out_) {
        backend_.addVm("web01", VmState::Running, "192.168.122.45");
        backend_.addVm("db01", VmState::Stopped);
    }

    FakeBackend backend_;
    FakeProvisioner provisioner_;
    ControllerConfig config_;
    std::ostringstream out_;
    ControllerCLI cli_;
};

TEST_F(ControllerCLITest, ListPrintsSections) {
    ASSERT_EQ(cli_.run("list", {}), 0);
    EXPECT_EQ(out_.str(), "Running (1)\n  web01\nStopped (1)\n  db01\nPaused (0)\n");
}

TEST_F(ControllerCLITest, UsageErrors) {
    EXPECT_EQ(cli_.run("frobnicate", {"web01"}), 1);
    EXPECT_EQ(cli_.run("start", {}), 1);
    EXPECT_EQ(cli_.run("grow-disk", {"web01", "sdb"}), 1);
    EXPECT_EQ(cli_.run("stop", {"web01", "--bogus"}), 1);
    EXPECT_TRUE(backend_.calls.empty());
}

TEST_F(ControllerCLITest, FailuresExitNonZero) {
    EXPECT_EQ(cli_.run("start", {"ghost"}), 1);
    // declined by the confirmation policy
    EXPECT_EQ(cli_.run("delete", {"db01"}), 1);
    EXPECT_EQ(backend_.count("undefine"), 0u);
}

TEST_F(ControllerCLITest, ForceFlagSkipsConfirmation) {
    EXPECT_EQ(cli_.run("delete", {"db01", "--force"}), 0);
    EXPECT_EQ(backend_.count("undefine:db01"), 1u);
    EXPECT_EQ(provisioner_.removedClients, std::vector<std::string>({"db01"}));
}

TEST_F(ControllerCLITest, PrintsAddress) {
    ASSERT_EQ(cli_.run("ip", {"web01"}), 0);
    EXPECT_EQ(out_.str(), "192.168.122.45\n");
    EXPECT_EQ(cli_.run("ip", {"db01"}), 1);
}

TEST_F(ControllerCLITest, AddDiskWithOptions) {
    ASSERT_EQ(cli_.run("add-disk", {"db01", "2G", "--name", "scratch"}), 0);
    EXPECT_EQ(out_.str(), "sdb /k2g/vms/db01/scratch.qcow2\n");
    EXPECT_EQ(backend_.createdSizes, std::vector<uint64_t>({2ULL << 30}));
}

TEST_F(ControllerCLITest, DiskTable) {
    ASSERT_EQ(cli_.run("disks", {"web01"}), 0);
    EXPECT_NE(out_.str().find("TARGET"), std::string::npos);
    EXPECT_NE(out_.str().find("10 GiB"), std::string::npos);
    EXPECT_NE(out_.str().find("/k2g/vms/web01/boot.qcow2"), std::string::npos);
}

TEST_F(ControllerCLITest, EjectKeepsDriveOnRequest) {
    backend_.disks["db01"].push_back({"sdc", "/isos/ubuntu.iso", "db01-ubuntu", 0});
    ASSERT_EQ(cli_.run("eject", {"db01", "--keep-cdrom"}), 0);
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"ejectMedia:db01:sdc"}));
}
