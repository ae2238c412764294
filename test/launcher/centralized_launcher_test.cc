#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdlib>
#include "../mocks/fake_topology.h"
#include "../mocks/mock_endpoint_factory.h"
#include "../mocks/mock_event_manager.h"
#include "common/config.h"
#include "common/env_flags.h"
#include "common/errors.h"
#include "launcher/centralized_launcher.h"

using namespace Flotilla;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::StrictMock;

namespace {

ClientLaunch FakeClientLaunch() {
    ClientLaunch launch;
    launch.manager = std::make_unique<NiceMock<MockEventManager>>();
    return launch;
}

} // namespace

class CentralizedLauncherTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(kDebugOutputEnv);
        config_.cores = Cores::FromCmdline("1-3");
        config_.broker_port = 5000;
        config_.centralized_broker_port = 5001;
        config_.always_interesting = true;
    }

    ClientCallback Named(const std::string& name, int result) {
        return [this, name, result](std::optional<std::string>, std::unique_ptr<EventManager> manager, CoreId core) {
            ran_ = name;
            ran_on_ = core;
            wrapped_ = manager.get() == wrapped_manager_;
            return result;
        };
    }

    void ExpectWrap(bool is_main) {
        EXPECT_CALL(endpoints_, WrapCentralized(_, _))
            .WillOnce([this, is_main](std::unique_ptr<EventManager> inner, const CentralizedClientOptions& options) {
                EXPECT_NE(inner, nullptr);
                EXPECT_EQ(options.is_main, is_main);
                EXPECT_EQ(options.port, 5001);
                EXPECT_TRUE(options.always_interesting);
                auto wrapped = std::make_unique<NiceMock<MockEventManager>>();
                wrapped_manager_ = wrapped.get();
                return std::unique_ptr<EventManager>(std::move(wrapped));
            });
    }

    LaunchConfig config_;
    FakeTopology topology_{{CoreId(0), CoreId(1), CoreId(2), CoreId(3)}};
    StrictMock<MockEndpointFactory> endpoints_;

    std::string ran_;
    CoreId ran_on_;
    bool wrapped_ = false;
    EventManager* wrapped_manager_ = nullptr;
};

TEST_F(CentralizedLauncherTest, ParentSpawnsCentralizedBrokerWorkersAndBroker) {
    EXPECT_CALL(endpoints_, RunCentralizedBroker(_)).Times(0);
    EXPECT_CALL(endpoints_, RunBroker(::testing::Field(&BrokerOptions::exit_cleanly_after,
                    std::optional<size_t>(3)))).Times(1);

    CentralizedLauncher launcher(config_, Named("secondary", 0), Named("main", 0), topology_, endpoints_);
    launcher.Launch();

    EXPECT_EQ(topology_.duplications, 1u);
    ASSERT_EQ(topology_.requests.size(), 3u);
    EXPECT_EQ(topology_.requests[0].core, CoreId(1));
    EXPECT_EQ(topology_.requests[0].stagger_index, 1u);
    // The centralized broker is stopped along with the workers.
    EXPECT_EQ(topology_.shutdown_calls, 1u);
    EXPECT_THAT(topology_.signaled, ::testing::ElementsAre(999, 1000, 1001, 1002));
}

TEST_F(CentralizedLauncherTest, FailedSpawnStopsCentralizedBrokerAndWorkers) {
    topology_.failing_spawn = 1;

    CentralizedLauncher launcher(config_, Named("secondary", 0), Named("main", 0), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), ResourceError);

    EXPECT_EQ(topology_.shutdown_calls, 1u);
    EXPECT_THAT(topology_.signaled, ::testing::ElementsAre(999, 1000));
}

TEST_F(CentralizedLauncherTest, FirstCoreIsMain) {
    topology_.child_at = 0;
    EXPECT_CALL(endpoints_, LaunchClient(::testing::Field(&ClientOptions::kind, ClientKind::Main)))
        .WillOnce([](const ClientOptions&) { return FakeClientLaunch(); });
    ExpectWrap(true);

    CentralizedLauncher launcher(config_, Named("secondary", 0), Named("main", 4), topology_, endpoints_);
    try {
        launcher.Launch();
        FAIL() << "main worker returned into the launcher";
    } catch (const FakeExit& exit) {
        EXPECT_EQ(exit.code, 4);
    }

    EXPECT_EQ(ran_, "main");
    EXPECT_EQ(ran_on_, CoreId(1));
    EXPECT_TRUE(wrapped_);
    ASSERT_TRUE(launcher.role().has_value());
    ASSERT_TRUE(std::holds_alternative<MainClientRole>(*launcher.role()));
    EXPECT_EQ(std::get<MainClientRole>(*launcher.role()).core, CoreId(1));
}

TEST_F(CentralizedLauncherTest, OtherCoresAreSecondary) {
    for (size_t child : {1u, 2u}) {
        FakeTopology topology({CoreId(0), CoreId(1), CoreId(2), CoreId(3)});
        topology.child_at = child;
        EXPECT_CALL(endpoints_, LaunchClient(::testing::Field(&ClientOptions::kind, ClientKind::Secondary)))
            .WillOnce([](const ClientOptions&) { return FakeClientLaunch(); });
        ExpectWrap(false);

        CentralizedLauncher launcher(config_, Named("secondary", 0), Named("main", 0), topology, endpoints_);
        EXPECT_THROW(launcher.Launch(), FakeExit);

        EXPECT_EQ(ran_, "secondary");
        EXPECT_EQ(ran_on_, CoreId(child + 1));
        ASSERT_TRUE(launcher.role().has_value());
        EXPECT_TRUE(std::holds_alternative<SecondaryClientRole>(*launcher.role()));
        ::testing::Mock::VerifyAndClearExpectations(&endpoints_);
    }
}

TEST_F(CentralizedLauncherTest, MainFallsBackToSecondaryCallback) {
    topology_.child_at = 0;
    EXPECT_CALL(endpoints_, LaunchClient(_)).WillOnce([](const ClientOptions&) { return FakeClientLaunch(); });
    ExpectWrap(true);

    CentralizedLauncher launcher(config_, Named("secondary", 0), ClientCallback(), topology_, endpoints_);
    EXPECT_THROW(launcher.Launch(), FakeExit);
    EXPECT_EQ(ran_, "secondary");
}

TEST_F(CentralizedLauncherTest, DuplicateChildRunsCentralizedBroker) {
    topology_.duplicate_as_child = true;
    EXPECT_CALL(endpoints_, RunCentralizedBroker(_)).WillOnce([](const CentralizedBrokerOptions& options) {
        EXPECT_EQ(options.port, 5001);
        EXPECT_EQ(options.client_timeout, std::chrono::milliseconds(kCentralizedClientTimeoutMs));
        EXPECT_EQ(options.poll_interval, std::chrono::milliseconds(kCentralizedPollIntervalMs));
    });

    CentralizedLauncher launcher(config_, Named("secondary", 0), Named("main", 0), topology_, endpoints_);
    try {
        launcher.Launch();
        FAIL() << "centralized broker returned into the launcher";
    } catch (const FakeExit& exit) {
        EXPECT_EQ(exit.code, kShuttingDownExitCode);
    }
    EXPECT_TRUE(topology_.requests.empty());
    ASSERT_TRUE(launcher.role().has_value());
    EXPECT_TRUE(std::holds_alternative<CentralizedBrokerRole>(*launcher.role()));
}

TEST_F(CentralizedLauncherTest, CustomBuildersReplaceTheStandardEndpoint) {
    topology_.child_at = 1;
    ExpectWrap(false);
    int main_built = 0;
    int secondary_built = 0;

    CentralizedLauncher launcher(config_, Named("secondary", 0), Named("main", 0), topology_, endpoints_);
    EXPECT_THROW(launcher.LaunchGeneric(
                [&main_built](const ClientOptions&) { main_built++; return FakeClientLaunch(); },
                [&secondary_built](const ClientOptions&) { secondary_built++; return FakeClientLaunch(); }),
            FakeExit);

    EXPECT_EQ(main_built, 0);
    EXPECT_EQ(secondary_built, 1);
}

TEST_F(CentralizedLauncherTest, WithoutBrokerWaitsForWorkersAndCentralizedBroker) {
    config_.spawn_broker = false;

    CentralizedLauncher launcher(config_, Named("secondary", 0), Named("main", 0), topology_, endpoints_);
    auto statuses = launcher.Launch();

    EXPECT_EQ(statuses.size(), 4u);
    EXPECT_THAT(topology_.awaited, ::testing::ElementsAre(999, 1000, 1001, 1002));
}

TEST_F(CentralizedLauncherTest, RejectsUnusableSetups) {
    {
        CentralizedLauncher launcher(config_, ClientCallback(), Named("main", 0), topology_, endpoints_);
        EXPECT_THROW(launcher.Launch(), ConfigError);
    }
    {
        topology_.supports_duplication = false;
        CentralizedLauncher launcher(config_, Named("secondary", 0), Named("main", 0), topology_, endpoints_);
        EXPECT_THROW(launcher.Launch(), ConfigError);
        topology_.supports_duplication = true;
    }
    {
        LaunchConfig same_ports = config_;
        same_ports.centralized_broker_port = same_ports.broker_port;
        CentralizedLauncher launcher(same_ports, Named("secondary", 0), Named("main", 0), topology_, endpoints_);
        EXPECT_THROW(launcher.Launch(), ConfigError);
    }
    {
        LaunchConfig empty = config_;
        empty.cores = Cores();
        CentralizedLauncher launcher(empty, Named("secondary", 0), Named("main", 0), topology_, endpoints_);
        EXPECT_THROW(launcher.Launch(), ConfigError);
    }
    EXPECT_EQ(topology_.duplications, 0u);
    EXPECT_TRUE(topology_.requests.empty());
}
