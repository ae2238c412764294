#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include "../mocks/fake_topology.h"
#include "../mocks/mock_endpoint_factory.h"
#include "../mocks/mock_event_manager.h"
#include "common/env_flags.h"
#include "common/errors.h"
#include "launcher/fork_topology.h"
#include "launcher/launcher.h"
#include "launcher/reexec_topology.h"
#include "shmem/shmem_provider.h"

using namespace Flotilla;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::StrictMock;
using ::testing::Throw;

namespace {

std::vector<CoreId> MachineCores() {
    return {CoreId(0), CoreId(1), CoreId(2), CoreId(3)};
}

ClientLaunch FakeClientLaunch(std::optional<std::string> state = std::nullopt) {
    ClientLaunch launch;
    launch.state = std::move(state);
    launch.manager = std::make_unique<NiceMock<MockEventManager>>();
    return launch;
}

// Fails to re-attach its segments in the child of the given fork.
class FailingChildShMemProvider : public ShMemProvider {
public:
    explicit FailingChildShMemProvider(int failing_fork) : failing_fork_(failing_fork) {}

    std::shared_ptr<ShMem> NewShMem(size_t) override { throw std::logic_error("unused"); }
    std::shared_ptr<ShMem> ShMemByName(const std::string&, size_t, bool) override { throw std::logic_error("unused"); }
    void Unlink(const std::string&) override {}

    void PreFork() override { forks_++; }
    void PostFork(bool is_child) override {
        if (is_child && forks_ == failing_fork_) {
            throw ResourceError("Re-attaching shared memory", ENOMEM);
        }
    }

private:
    const int failing_fork_;
    int forks_ = 0;
};

class TwoCoreForkTopology : public ForkTopology {
public:
    using ForkTopology::ForkTopology;
    std::vector<CoreId> AvailableCores() const override { return {CoreId(0), CoreId(1)}; }
};

class LocalEndpoints : public EndpointFactory {
public:
    ClientLaunch LaunchClient(const ClientOptions&) override { return FakeClientLaunch(); }
    void RunBroker(const BrokerOptions&) override { throw std::logic_error("unused"); }
    void RunCentralizedBroker(const CentralizedBrokerOptions&) override { throw std::logic_error("unused"); }
    std::unique_ptr<EventManager> WrapCentralized(std::unique_ptr<EventManager> inner,
            const CentralizedClientOptions&) override {
        return inner;
    }
};

} // namespace

class LauncherTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(kDebugOutputEnv);
        config_.cores = Cores::FromCmdline("0-2");
        config_.broker_port = 4242;
        config_.launch_delay = 25ms;
        config_.configuration = "launcher_test";
    }

    ClientCallback CountingCallback(int result = 0) {
        return [this, result](std::optional<std::string> state, std::unique_ptr<EventManager> manager, CoreId core) {
            callback_calls_++;
            callback_core_ = core;
            callback_state_ = state;
            callback_had_manager_ = manager != nullptr;
            return result;
        };
    }

    LaunchConfig config_;
    FakeTopology topology_{MachineCores()};
    StrictMock<MockEndpointFactory> endpoints_;

    int callback_calls_ = 0;
    CoreId callback_core_;
    std::optional<std::string> callback_state_;
    bool callback_had_manager_ = false;
};

TEST_F(LauncherTest, SpawnsOneClientPerCoreAndOneBroker) {
    EXPECT_CALL(endpoints_, RunBroker(Field(&BrokerOptions::exit_cleanly_after, std::optional<size_t>(3))))
        .Times(1);

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    auto statuses = launcher.Launch();

    EXPECT_TRUE(statuses.empty());
    ASSERT_EQ(topology_.requests.size(), 3u);
    EXPECT_EQ(callback_calls_, 0);
    ASSERT_TRUE(launcher.role().has_value());
    EXPECT_TRUE(std::holds_alternative<BrokerRole>(*launcher.role()));
}

TEST_F(LauncherTest, BrokerGetsLaunchSettings) {
    config_.remote_broker_addr = "10.1.1.1:1337";
    config_.serialize_state = ShouldSaveState::Always;
    auto monitor = std::make_shared<LogMonitor>();

    BrokerOptions seen;
    EXPECT_CALL(endpoints_, RunBroker(_)).WillOnce([&seen](const BrokerOptions& options) {
        seen = options;
    });

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_, monitor);
    launcher.Launch();

    EXPECT_EQ(seen.port, 4242);
    EXPECT_EQ(seen.monitor, monitor);
    EXPECT_EQ(seen.remote_broker_addr, std::optional<std::string>("10.1.1.1:1337"));
    EXPECT_EQ(seen.configuration, "launcher_test");
    EXPECT_EQ(seen.serialize_state, ShouldSaveState::Always);
}

TEST_F(LauncherTest, BrokerCompletionSignalsEveryHandleOnce) {
    EXPECT_CALL(endpoints_, RunBroker(_)).WillOnce([this](const BrokerOptions&) {
        // Nothing is signaled while the broker still runs.
        EXPECT_EQ(topology_.shutdown_calls, 0u);
    });

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    launcher.Launch();

    EXPECT_EQ(topology_.shutdown_calls, 1u);
    EXPECT_THAT(topology_.signaled, ::testing::ElementsAre(1000, 1001, 1002));
    EXPECT_TRUE(topology_.awaited.empty());
}

TEST_F(LauncherTest, FailedBrokerStillStopsClients) {
    EXPECT_CALL(endpoints_, RunBroker(_)).WillOnce(Throw(ResourceError("Binding broker")));

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ResourceError);

    EXPECT_EQ(topology_.shutdown_calls, 1u);
    EXPECT_EQ(topology_.signaled.size(), 3u);
}

TEST_F(LauncherTest, FailedSpawnStopsClientsAlreadyStarted) {
    topology_.failing_spawn = 2;

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ResourceError);

    EXPECT_EQ(topology_.shutdown_calls, 1u);
    EXPECT_THAT(topology_.signaled, ::testing::ElementsAre(1000, 1001));
    EXPECT_FALSE(launcher.role().has_value());
}

TEST_F(LauncherTest, WithoutBrokerWaitsForEveryClient) {
    config_.spawn_broker = false;
    topology_.failing_pid = 1001;
    EXPECT_CALL(endpoints_, RunBroker(_)).Times(0);

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    auto statuses = launcher.Launch();

    EXPECT_EQ(topology_.await_calls, 1u);
    EXPECT_THAT(topology_.awaited, ::testing::ElementsAre(1000, 1001, 1002));
    EXPECT_EQ(topology_.shutdown_calls, 0u);
    ASSERT_EQ(statuses.size(), 3u);
    EXPECT_FALSE(statuses[1].success());
    EXPECT_EQ(statuses[1].core, CoreId(1));
    EXPECT_FALSE(launcher.role().has_value());
}

TEST_F(LauncherTest, FailOnClientErrorThrowsAfterWaitingForAll) {
    config_.spawn_broker = false;
    config_.fail_on_client_error = true;
    topology_.failing_pid = 1000;

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), LaunchError);
    EXPECT_EQ(topology_.awaited.size(), 3u);
}

TEST_F(LauncherTest, EmptyCoreSetSpawnsNothing) {
    config_.cores = Cores();

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ConfigError);
    EXPECT_TRUE(topology_.requests.empty());
}

TEST_F(LauncherTest, MissingCallbackSpawnsNothing) {
    Launcher launcher(config_, ClientCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ConfigError);
    EXPECT_TRUE(topology_.requests.empty());
}

TEST_F(LauncherTest, UnknownCoreSpawnsNothing) {
    config_.cores = Cores::FromCmdline("2,9");

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ConfigError);
    EXPECT_TRUE(topology_.requests.empty());
}

TEST_F(LauncherTest, StaggersClientsInIncreasingCoreOrder) {
    config_.cores = Cores(std::vector<CoreId>{CoreId(3), CoreId(0), CoreId(2)});
    EXPECT_CALL(endpoints_, RunBroker(_));

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    launcher.Launch();

    ASSERT_EQ(topology_.requests.size(), 3u);
    std::vector<CoreId> expected = {CoreId(0), CoreId(2), CoreId(3)};
    for (size_t k = 0; k < 3; k++) {
        EXPECT_EQ(topology_.requests[k].core, expected[k]);
        EXPECT_EQ(topology_.requests[k].stagger_index, k + 1);
        EXPECT_EQ(topology_.requests[k].launch_delay * topology_.requests[k].stagger_index, 25ms * (k + 1));
        EXPECT_NE(topology_.requests[k].output, nullptr);
    }
}

TEST_F(LauncherTest, ChildRunsCallbackAndExitsWithItsResult) {
    topology_.child_at = 1;
    EXPECT_CALL(endpoints_, LaunchClient(_)).WillOnce([](const ClientOptions& options) {
        EXPECT_EQ(options.core, CoreId(1));
        EXPECT_EQ(options.broker_port, 4242);
        EXPECT_EQ(options.configuration, "launcher_test");
        EXPECT_EQ(options.kind, ClientKind::Client);
        return FakeClientLaunch(std::string("saved"));
    });
    EXPECT_CALL(endpoints_, RunBroker(_)).Times(0);

    Launcher launcher(config_, CountingCallback(17), topology_, endpoints_);
    try {
        launcher.Launch();
        FAIL() << "worker returned into the launcher";
    } catch (const FakeExit& exit) {
        EXPECT_EQ(exit.code, 17);
    }

    EXPECT_EQ(callback_calls_, 1);
    EXPECT_EQ(callback_core_, CoreId(1));
    EXPECT_EQ(callback_state_, std::optional<std::string>("saved"));
    EXPECT_TRUE(callback_had_manager_);
    // The child stops spawning the moment it knows it is a worker.
    EXPECT_EQ(topology_.requests.size(), 2u);
    ASSERT_TRUE(launcher.role().has_value());
    ASSERT_TRUE(std::holds_alternative<ClientRole>(*launcher.role()));
    EXPECT_EQ(std::get<ClientRole>(*launcher.role()).core, CoreId(1));
}

TEST_F(LauncherTest, EndpointFailureSurfacesInTheWorker) {
    topology_.child_at = 0;
    EXPECT_CALL(endpoints_, LaunchClient(_)).WillOnce(Throw(ResourceError("Attaching to broker")));

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ResourceError);
    EXPECT_EQ(callback_calls_, 0);
}

TEST_F(LauncherTest, ReexecutedWorkerUsesInheritedCore) {
    topology_.inherited = CoreId(2);
    EXPECT_CALL(endpoints_, LaunchClient(Field(&ClientOptions::core, CoreId(2))))
        .WillOnce([](const ClientOptions&) { return FakeClientLaunch(); });

    Launcher launcher(config_, CountingCallback(5), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), FakeExit);
    EXPECT_TRUE(topology_.requests.empty());
    EXPECT_EQ(callback_core_, CoreId(2));
}

TEST_F(LauncherTest, InheritedCoreOutsideTheSetIsRejected) {
    topology_.inherited = CoreId(3);

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ConfigError);
    EXPECT_EQ(callback_calls_, 0);
}

TEST_F(LauncherTest, MalformedEnvironmentMarkerIsAConfigError) {
    std::vector<CoreId> available = GetCoreIds();
    config_.cores = Cores(std::vector<CoreId>{available.front()});
    ReexecTopology reexec("/bin/true", {"/bin/true"});

    for (const char* value : {"abc", "-1", "", "1x", "99999999999999999999999"}) {
        setenv(kLauncherClientEnv, value, 1);
        Launcher launcher(config_, CountingCallback(), reexec, endpoints_);
        EXPECT_THROW(launcher.Launch(), ConfigError) << "marker '" << value << "'";
    }
    unsetenv(kLauncherClientEnv);
    EXPECT_EQ(callback_calls_, 0);
}

TEST_F(LauncherTest, RedirectionTargetsAreOpenedByTheLauncher) {
    config_.stdout_file = ::testing::TempDir() + "/launcher_test_stdout";
    EXPECT_CALL(endpoints_, RunBroker(_));

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    launcher.Launch();

    FILE* f = std::fopen(config_.stdout_file->c_str(), "r");
    EXPECT_NE(f, nullptr);
    if (f) {
        std::fclose(f);
    }
}

TEST_F(LauncherTest, UncreatableRedirectionFileSpawnsNothing) {
    config_.stdout_file = "/nonexistent-dir/flotilla/out";

    Launcher launcher(config_, CountingCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ResourceError);
    EXPECT_TRUE(topology_.requests.empty());
}

TEST(LauncherForkTest, WorkerFailingAfterForkLeavesSiblingsRunning) {
    constexpr int kFailedWorkerCode = 42;
    unsetenv(kDebugOutputEnv);
    FailingChildShMemProvider provider(2);
    TwoCoreForkTopology topology(provider);
    LocalEndpoints endpoints;

    LaunchConfig config;
    config.cores = Cores::FromCmdline("0-1");
    config.spawn_broker = false;
    // Core 0 is still waiting out its stagger slot when the worker on core 1 fails.
    config.launch_delay = 300ms;

    const pid_t test_pid = getpid();
    Launcher launcher(config, [](std::optional<std::string>, std::unique_ptr<EventManager>, CoreId) { return 0; },
            topology, endpoints);
    std::vector<ExitStatus> statuses;
    try {
        statuses = launcher.Launch();
    } catch (const ResourceError&) {
        if (getpid() != test_pid) {
            _exit(kFailedWorkerCode);
        }
        throw;
    }

    ASSERT_EQ(getpid(), test_pid);
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0].core, CoreId(0));
    EXPECT_TRUE(statuses[0].exited);
    EXPECT_EQ(statuses[0].code, 0);
    EXPECT_EQ(statuses[0].signal, 0);
    EXPECT_EQ(statuses[1].core, CoreId(1));
    EXPECT_TRUE(statuses[1].exited);
    EXPECT_EQ(statuses[1].code, kFailedWorkerCode);
}
