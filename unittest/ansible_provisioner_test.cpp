#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "common/utils.hpp"
#include "fake_command_runner.hpp"
#include "provision/ansible_provisioner.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace {

class FakePortProbe : public PortProbe {
public:
    int openAfter = 1;  // number of probes until the port answers, 0 never
    int probes = 0;
    std::string lastHost;
    int lastPort = 0;

    bool isOpen(const std::string& host, int port, std::chrono::milliseconds) override {
        ++probes;
        lastHost = host;
        lastPort = port;
        return openAfter > 0 && probes >= openAfter;
    }
};

nlohmann::json readJson(const fs::path& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
}

}  // namespace

class AnsibleProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::path(::testing::TempDir()) / ("vmsteward-ansible-" + utils::randomHex(8));
        config_.clientDir = (root_ / "clients").string();
        config_.playbookDir = "/k2g/ansible/playbooks";
        config_.privateKey = "/root/.ssh/id_ed25519";
        config_.portWaitAttempts = 5;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    AnsibleProvisioner provisioner() {
        return AnsibleProvisioner(config_, runner_, probe_, noWaitPoller(&slept_));
    }

    fs::path root_;
    ProvisionConfig config_;
    FakeCommandRunner runner_;
    FakePortProbe probe_;
    std::vector<std::chrono::milliseconds> slept_;
};

TEST_F(AnsibleProvisionerTest, RunsPlaybookWithGeneratedFiles) {
    probe_.openAfter = 3;
    auto ansible = provisioner();

    Status status = ansible.run("192.168.122.45", "web01", "format_disk.yml",
                                {{"device_name", "web01-data"}, {"mount", "/mnt/data"}});
    ASSERT_TRUE(status.isOk()) << status.message();

    EXPECT_EQ(probe_.probes, 3);
    EXPECT_EQ(probe_.lastHost, "192.168.122.45");
    EXPECT_EQ(probe_.lastPort, 22);
    EXPECT_EQ(slept_.size(), 2u);

    fs::path dir = ansible.clientDirectory("web01");
    ASSERT_EQ(runner_.calls.size(), 1u);
    EXPECT_EQ(runner_.calls[0].command, "ansible-playbook");
    EXPECT_EQ(runner_.calls[0].args, std::vector<std::string>({
        "-i", (dir / "inventory.json").string(), "-u", "ansible",
        "--private-key", "/root/.ssh/id_ed25519",
        "-e", "@" + (dir / "extravars.json").string(),
        "/k2g/ansible/playbooks/format_disk.yml"}));

    auto inventory = readJson(dir / "inventory.json");
    EXPECT_EQ(inventory["all"]["hosts"]["web01"]["ansible_host"].get<std::string>(), "192.168.122.45");
    auto vars = readJson(dir / "extravars.json");
    EXPECT_EQ(vars["device_name"].get<std::string>(), "web01-data");
    EXPECT_EQ(vars["mount"].get<std::string>(), "/mnt/data");
}

TEST_F(AnsibleProvisionerTest, UnreachableHostRunsNothing) {
    probe_.openAfter = 0;
    Status status = provisioner().run("192.168.122.45", "web01", "mount_disk.yml", {});
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::TimeoutExceeded);
    EXPECT_EQ(probe_.probes, 5);
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(AnsibleProvisionerTest, MissingAddress) {
    Status status = provisioner().run("", "web01", "mount_disk.yml", {});
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::NotFound);
    EXPECT_EQ(probe_.probes, 0);
}

TEST_F(AnsibleProvisionerTest, PlaybookFailure) {
    runner_.respond("ansible-playbook", 2, "", "fatal: [web01]: FAILED!");
    Status status = provisioner().run("192.168.122.45", "web01", "resize_disk.yml", {});
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::TransportFailure);
}

TEST_F(AnsibleProvisionerTest, RemoveClient) {
    auto ansible = provisioner();
    ASSERT_TRUE(ansible.run("192.168.122.45", "web01", "mount_disk.yml", {}).isOk());
    ASSERT_TRUE(fs::exists(ansible.clientDirectory("web01")));

    ASSERT_TRUE(ansible.removeClient("web01").isOk());
    EXPECT_FALSE(fs::exists(ansible.clientDirectory("web01")));
    // removing again is harmless
    EXPECT_TRUE(ansible.removeClient("web01").isOk());
}
