#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "common/controller_config.hpp"
#include "common/utils.hpp"

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::path(::testing::TempDir()) / ("vmsteward-config-" + utils::randomHex(8) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    fs::path path_;
};

TEST_F(ConfigLoaderTest, EmptyDocumentGivesDefaults) {
    auto config = ConfigLoader::fromJson(nlohmann::json::object());
    ASSERT_TRUE(config.isOk());
    const auto& c = config.unwrap();
    EXPECT_EQ(c.backend, "kvm");
    EXPECT_EQ(c.kvm.vmDir, "/k2g/vms");
    EXPECT_EQ(c.kvm.inventorySource, "virsh");
    EXPECT_EQ(c.timing.shutdownWaitSec, 60);
    EXPECT_EQ(c.timing.startWaitSec, 120);
    EXPECT_EQ(c.gcp.operationTimeoutSec, 600);
    EXPECT_EQ(c.provision.sshPort, 22);
    EXPECT_EQ(c.provision.playbookDir, VMSTEWARD_PLAYBOOK_DIR);
    const std::string installed = "/vmsteward/ansible/playbooks";
    ASSERT_GE(c.provision.playbookDir.size(), installed.size());
    EXPECT_EQ(c.provision.playbookDir.substr(c.provision.playbookDir.size() - installed.size()), installed);
}

TEST_F(ConfigLoaderTest, FileOverridesDefaults) {
    write(R"({
        "backend": "gcp",
        "kvm": {"vm_dir": "/srv/vms", "bridge": "br0", "inventory_source": "libvirt"},
        "gcp": {"project_id": "demo", "zone": "europe-west1-b", "operation_timeout_sec": 0},
        "provision": {"private_key": "/root/.ssh/id_ed25519", "port_wait_attempts": 3},
        "timing": {"shutdown_wait_sec": 30},
        "logging": {"level": "debug"}
    })");

    auto config = ConfigLoader::loadFromFile(path_.string());
    ASSERT_TRUE(config.isOk()) << config.message();
    const auto& c = config.unwrap();
    EXPECT_EQ(c.backend, "gcp");
    EXPECT_EQ(c.kvm.vmDir, "/srv/vms");
    EXPECT_EQ(c.kvm.bridge, "br0");
    EXPECT_EQ(c.kvm.inventorySource, "libvirt");
    EXPECT_EQ(c.kvm.nicModel, "virtio");
    EXPECT_EQ(c.gcp.projectId, "demo");
    EXPECT_EQ(c.gcp.zone, "europe-west1-b");
    EXPECT_EQ(c.gcp.operationTimeoutSec, 0);
    EXPECT_EQ(c.provision.privateKey, "/root/.ssh/id_ed25519");
    EXPECT_EQ(c.provision.portWaitAttempts, 3);
    EXPECT_EQ(c.timing.shutdownWaitSec, 30);
    EXPECT_EQ(c.timing.forcedShutdownWaitSec, 10);
    EXPECT_EQ(c.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, MissingFileIsNotFound) {
    auto config = ConfigLoader::loadFromFile(path_.string());
    ASSERT_TRUE(config.isErr());
    EXPECT_EQ(config.kind(), ErrorKind::NotFound);
}

TEST_F(ConfigLoaderTest, MalformedJson) {
    write("{\"backend\": ");
    auto config = ConfigLoader::loadFromFile(path_.string());
    ASSERT_TRUE(config.isErr());
    EXPECT_EQ(config.kind(), ErrorKind::ParseError);
}

TEST_F(ConfigLoaderTest, WrongTypes) {
    auto field = ConfigLoader::fromJson(nlohmann::json::parse(R"({"timing": {"start_wait_sec": "soon"}})"));
    ASSERT_TRUE(field.isErr());
    EXPECT_EQ(field.kind(), ErrorKind::ParseError);

    auto section = ConfigLoader::fromJson(nlohmann::json::parse(R"({"kvm": "qemu:///system"})"));
    ASSERT_TRUE(section.isErr());
    EXPECT_EQ(section.kind(), ErrorKind::ParseError);

    EXPECT_TRUE(ConfigLoader::fromJson(nlohmann::json::array()).isErr());
}

TEST_F(ConfigLoaderTest, UnknownChoices) {
    auto backend = ConfigLoader::fromJson(nlohmann::json::parse(R"({"backend": "xen"})"));
    ASSERT_TRUE(backend.isErr());
    EXPECT_EQ(backend.kind(), ErrorKind::ParseError);

    auto source = ConfigLoader::fromJson(nlohmann::json::parse(R"({"kvm": {"inventory_source": "ssh"}})"));
    ASSERT_TRUE(source.isErr());
    EXPECT_EQ(source.kind(), ErrorKind::ParseError);
}
