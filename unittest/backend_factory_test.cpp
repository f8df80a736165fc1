#include <gtest/gtest.h>
#include "backend/backend_factory.hpp"
#include "fake_command_runner.hpp"
#include "test_support.hpp"

TEST(AccessTokenTest, ConfiguredTokenWins) {
    GcpConfig config;
    config.accessToken = "ya29.static";
    FakeCommandRunner runner;
    auto token = resolveAccessToken(config, runner);
    ASSERT_TRUE(token.isOk());
    EXPECT_EQ(token.unwrap(), "ya29.static");
    EXPECT_TRUE(runner.calls.empty());
}

TEST(AccessTokenTest, TokenFromCommand) {
    GcpConfig config;
    FakeCommandRunner runner;
    runner.respond("gcloud auth", 0, "  ya29.fresh  \n");
    auto token = resolveAccessToken(config, runner);
    ASSERT_TRUE(token.isOk());
    EXPECT_EQ(token.unwrap(), "ya29.fresh");
    EXPECT_EQ(runner.calls[0].line(), "gcloud auth print-access-token");
}

TEST(AccessTokenTest, CommandFailures) {
    GcpConfig config;
    FakeCommandRunner failing;
    failing.respond("gcloud", 1, "", "ERROR: no credentialed accounts");
    EXPECT_EQ(resolveAccessToken(config, failing).kind(), ErrorKind::TransportFailure);

    FakeCommandRunner silent;
    EXPECT_EQ(resolveAccessToken(config, silent).kind(), ErrorKind::ParseError);
}

TEST(BackendFactoryTest, BuildsKvmBackend) {
    ControllerConfig config;
    FakeCommandRunner runner;
    std::unique_ptr<HypervisorBackend> backend;
    ASSERT_TRUE(createBackend(config, runner, noWaitPoller(), backend).isOk());
    ASSERT_TRUE(backend != nullptr);
    EXPECT_EQ(backend->name(), "kvm");
}

TEST(BackendFactoryTest, RejectsIncompleteOrUnknownBackends) {
    ControllerConfig config;
    FakeCommandRunner runner;
    std::unique_ptr<HypervisorBackend> backend;

    config.backend = "gcp";
    Status noProject = createBackend(config, runner, noWaitPoller(), backend);
    ASSERT_TRUE(noProject.isErr());
    EXPECT_EQ(noProject.kind(), ErrorKind::NotFound);

    config.backend = "xen";
    Status unknown = createBackend(config, runner, noWaitPoller(), backend);
    ASSERT_TRUE(unknown.isErr());
    EXPECT_EQ(unknown.kind(), ErrorKind::ParseError);
    EXPECT_TRUE(backend == nullptr);
}
