#include <gtest/gtest.h>
#include "controller/lifecycle_manager.hpp"
#include "fake_backend.hpp"
#include "fake_provisioner.hpp"
#include "test_support.hpp"

class LifecycleManagerTest : public ::testing::Test {
protected:
    LifecycleManager manager(ConfirmationPolicy confirmation = ConfirmationPolicy::alwaysYes()) {
        return LifecycleManager(backend_, timing_, noWaitPoller(&slept_), confirmation, &provisioner_);
    }

    FakeBackend backend_;
    FakeProvisioner provisioner_;
    TimingConfig timing_;
    std::vector<std::chrono::milliseconds> slept_;
};

TEST_F(LifecycleManagerTest, UnknownVmIsNotFoundAndUntouched) {
    auto lifecycle = manager();
    for (Status status : {lifecycle.start("ghost"), lifecycle.shutdown("ghost"), lifecycle.reboot("ghost"),
                          lifecycle.hardReset("ghost"), lifecycle.deleteVm("ghost", true)}) {
        ASSERT_TRUE(status.isErr());
        EXPECT_EQ(status.kind(), ErrorKind::NotFound);
    }
    EXPECT_TRUE(backend_.calls.empty());
    EXPECT_TRUE(provisioner_.removedClients.empty());
}

TEST_F(LifecycleManagerTest, StartWaitsForAddress) {
    backend_.addVm("web01", VmState::Stopped);
    auto lifecycle = manager();

    ASSERT_TRUE(lifecycle.start("web01").isOk());
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"start:web01"}));
    EXPECT_EQ(backend_.vms["web01"], VmState::Running);
}

TEST_F(LifecycleManagerTest, StartingRunningVmDoesNothing) {
    backend_.addVm("web01", VmState::Running);
    ASSERT_TRUE(manager().start("web01").isOk());
    EXPECT_TRUE(backend_.calls.empty());
}

TEST_F(LifecycleManagerTest, StartFailsWithoutValidAddress) {
    backend_.addVm("web01", VmState::Stopped, "not-an-ip");
    Status status = manager().start("web01");
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::TimeoutExceeded);
    // 120 seconds polled every 5
    EXPECT_EQ(slept_.size(), 24u);
}

TEST_F(LifecycleManagerTest, StartPropagatesBackendFailure) {
    backend_.addVm("web01", VmState::Stopped);
    backend_.failures["start"] = makeError(ErrorKind::TransportFailure, "virsh start failed");
    Status status = manager().start("web01");
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::TransportFailure);
}

TEST_F(LifecycleManagerTest, GracefulShutdown) {
    backend_.addVm("web01", VmState::Running);
    ASSERT_TRUE(manager().shutdown("web01").isOk());
    EXPECT_EQ(backend_.count("forceStop"), 0u);
    EXPECT_TRUE(slept_.empty());
}

TEST_F(LifecycleManagerTest, ShutdownOfStoppedVmIsNoOp) {
    backend_.addVm("web01", VmState::Stopped);
    ASSERT_TRUE(manager().shutdown("web01").isOk());
    EXPECT_TRUE(backend_.calls.empty());
}

TEST_F(LifecycleManagerTest, ShutdownEscalatesToForceStopOnce) {
    backend_.addVm("web01", VmState::Running);
    backend_.gracefulShutdownWorks = false;

    ASSERT_TRUE(manager().shutdown("web01").isOk());
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"shutdown:web01", "forceStop:web01"}));
    EXPECT_EQ(slept_.size(), 60u);
    EXPECT_EQ(backend_.vms["web01"], VmState::Stopped);
}

TEST_F(LifecycleManagerTest, ShutdownGivesUpAfterForcedWait) {
    backend_.addVm("web01", VmState::Running);
    backend_.gracefulShutdownWorks = false;
    backend_.forceStopWorks = false;

    Status status = manager().shutdown("web01");
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::TimeoutExceeded);
    EXPECT_EQ(backend_.count("forceStop"), 1u);
    EXPECT_EQ(slept_.size(), 70u);
}

TEST_F(LifecycleManagerTest, ShutdownHonoursCustomWait) {
    backend_.addVm("web01", VmState::Running);
    backend_.gracefulShutdownWorks = false;
    ASSERT_TRUE(manager().shutdown("web01", std::chrono::seconds(5)).isOk());
    EXPECT_EQ(slept_.size(), 5u);
}

TEST_F(LifecycleManagerTest, RebootOfStoppedVmStartsIt) {
    backend_.addVm("web01", VmState::Stopped);
    ASSERT_TRUE(manager().reboot("web01").isOk());
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"start:web01"}));
}

TEST_F(LifecycleManagerTest, RebootAndResetOfRunningVm) {
    backend_.addVm("web01", VmState::Running);
    auto lifecycle = manager();
    ASSERT_TRUE(lifecycle.reboot("web01").isOk());
    ASSERT_TRUE(lifecycle.hardReset("web01").isOk());
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"reboot:web01", "reset:web01"}));
}

TEST_F(LifecycleManagerTest, SoftResetStopsThenStarts) {
    backend_.addVm("web01", VmState::Running);
    ASSERT_TRUE(manager().softReset("web01").isOk());
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"shutdown:web01", "start:web01"}));
}

TEST_F(LifecycleManagerTest, DeleteRunningVmInOrder) {
    backend_.addVm("web01", VmState::Running);
    ASSERT_TRUE(manager().deleteVm("web01", false).isOk());
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"shutdown:web01", "undefine:web01",
                                                        "removeInstanceFiles:web01"}));
    EXPECT_EQ(provisioner_.removedClients, std::vector<std::string>({"web01"}));
    EXPECT_EQ(backend_.vms.count("web01"), 0u);
}

TEST_F(LifecycleManagerTest, DeleteStoppedVmSkipsShutdown) {
    backend_.addVm("db01", VmState::Stopped);
    ASSERT_TRUE(manager().deleteVm("db01", false).isOk());
    EXPECT_EQ(backend_.count("shutdown"), 0u);
    EXPECT_EQ(backend_.count("undefine"), 1u);
}

TEST_F(LifecycleManagerTest, DeletePausedVmForcesItOffFirst) {
    backend_.addVm("cache", VmState::Paused);
    ASSERT_TRUE(manager().deleteVm("cache", true).isOk());
    EXPECT_EQ(backend_.calls, std::vector<std::string>({"forceStop:cache", "undefine:cache",
                                                        "removeInstanceFiles:cache"}));
}

TEST_F(LifecycleManagerTest, DeleteKeepsFilesWhileVmIsStillDefined) {
    backend_.addVm("db01", VmState::Stopped);
    backend_.undefineWorks = false;
    Status status = manager().deleteVm("db01", true);
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::StateConflict);
    EXPECT_EQ(backend_.count("removeInstanceFiles"), 0u);
    EXPECT_TRUE(provisioner_.removedClients.empty());
}

TEST_F(LifecycleManagerTest, DeclinedDeleteChangesNothing) {
    backend_.addVm("web01", VmState::Running);
    Status status = manager(ConfirmationPolicy::alwaysNo()).deleteVm("web01", false);
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::StateConflict);
    EXPECT_TRUE(backend_.calls.empty());
}

TEST_F(LifecycleManagerTest, ForceSkipsConfirmation) {
    backend_.addVm("web01", VmState::Stopped);
    ASSERT_TRUE(manager(ConfirmationPolicy::alwaysNo()).deleteVm("web01", true).isOk());
}

TEST_F(LifecycleManagerTest, DeleteStopsAtFirstFailure) {
    backend_.addVm("web01", VmState::Stopped);
    backend_.failures["undefine"] = makeError(ErrorKind::TransportFailure, "undefine failed");
    Status status = manager().deleteVm("web01", true);
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(backend_.count("removeInstanceFiles"), 0u);
    EXPECT_TRUE(provisioner_.removedClients.empty());
}

TEST_F(LifecycleManagerTest, PurgeDeletesEverythingNotRunning) {
    backend_.addVm("web01", VmState::Running);
    backend_.addVm("db01", VmState::Stopped);
    backend_.addVm("cache", VmState::Paused);

    int questions = 0;
    auto counting = ConfirmationPolicy::fromCallback([&questions](const std::string&) {
        ++questions;
        return true;
    });
    ASSERT_TRUE(manager(counting).purge(false).isOk());

    EXPECT_EQ(questions, 1);
    EXPECT_EQ(backend_.vms.size(), 1u);
    EXPECT_EQ(backend_.vms.count("web01"), 1u);
    EXPECT_EQ(provisioner_.removedClients, std::vector<std::string>({"db01", "cache"}));
    EXPECT_EQ(backend_.count("forceStop:cache"), 1u);
}

TEST_F(LifecycleManagerTest, DeclinedPurgeKeepsVms) {
    backend_.addVm("db01", VmState::Stopped);
    Status status = manager(ConfirmationPolicy::alwaysNo()).purge(false);
    ASSERT_TRUE(status.isErr());
    EXPECT_EQ(status.kind(), ErrorKind::StateConflict);
    EXPECT_EQ(backend_.vms.size(), 1u);
}

TEST_F(LifecycleManagerTest, ExistsCoversEveryState) {
    backend_.addVm("web01", VmState::Running);
    backend_.addVm("cache", VmState::Paused);
    auto lifecycle = manager();
    EXPECT_TRUE(lifecycle.tracker().exists("web01").unwrap());
    EXPECT_TRUE(lifecycle.tracker().exists("cache").unwrap());
    EXPECT_FALSE(lifecycle.tracker().exists("ghost").unwrap());

    backend_.failures["listInstances"] = makeError(ErrorKind::TransportFailure, "virsh missing");
    auto failed = lifecycle.tracker().exists("web01");
    ASSERT_TRUE(failed.isErr());
    EXPECT_EQ(failed.kind(), ErrorKind::TransportFailure);
}

TEST_F(LifecycleManagerTest, ListIsSorted) {
    backend_.addVm("zeta", VmState::Running);
    backend_.addVm("alpha", VmState::Running);
    auto inventory = manager().listInstances();
    ASSERT_TRUE(inventory.isOk());
    EXPECT_EQ(inventory.unwrap().running, std::vector<std::string>({"alpha", "zeta"}));
}

TEST_F(LifecycleManagerTest, ListFailureIsReported) {
    backend_.failures["listInstances"] = makeError(ErrorKind::TransportFailure, "no hypervisor");
    auto inventory = manager().listInstances();
    ASSERT_TRUE(inventory.isErr());
    EXPECT_EQ(inventory.kind(), ErrorKind::TransportFailure);
}
