#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include "agent/RestartSupervisor.hpp"

using namespace autopatch;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::MockFunction;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockLauncher : public IProcessLauncher {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(void, launch, (), (override));
};

}

class RestartSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto launcher = std::make_unique<NiceMock<MockLauncher>>();
        launcher_ = launcher.get();
        ON_CALL(*launcher_, name()).WillByDefault(Return("mock"));
        supervisor_ = std::make_unique<RestartSupervisor>(std::move(launcher));
    }

    NiceMock<MockLauncher>* launcher_ = nullptr;
    std::unique_ptr<RestartSupervisor> supervisor_;
};

TEST_F(RestartSupervisorTest, NullLauncherIsRejected) {
    EXPECT_THROW(RestartSupervisor(nullptr), std::invalid_argument);
}

TEST_F(RestartSupervisorTest, UnconfirmedRequestDoesNothing) {
    EXPECT_CALL(*launcher_, launch()).Times(0);
    auto outcome = supervisor_->request_restart(false);
    EXPECT_FALSE(outcome.accepted);
    EXPECT_FALSE(supervisor_->is_pending());
    EXPECT_THROW(supervisor_->perform(), std::runtime_error);
}

TEST_F(RestartSupervisorTest, SecondRequestIsRefusedWhilePending) {
    EXPECT_TRUE(supervisor_->request_restart(true).accepted);
    auto second = supervisor_->request_restart(true);
    EXPECT_FALSE(second.accepted);
    EXPECT_EQ(second.message, "A restart is already pending");
    EXPECT_TRUE(supervisor_->is_pending());
}

TEST_F(RestartSupervisorTest, DrainHooksRunInOrderBeforeLaunch) {
    MockFunction<void()> first;
    MockFunction<void()> second;
    {
        InSequence seq;
        EXPECT_CALL(first, Call());
        EXPECT_CALL(second, Call());
        EXPECT_CALL(*launcher_, launch());
    }
    supervisor_->add_drain_hook("first", first.AsStdFunction());
    supervisor_->add_drain_hook("second", second.AsStdFunction());

    ASSERT_TRUE(supervisor_->request_restart(true).accepted);
    supervisor_->perform();
    EXPECT_FALSE(supervisor_->is_pending());
}

TEST_F(RestartSupervisorTest, FailingHookDoesNotBlockTheHandOff) {
    supervisor_->add_drain_hook("broken", [] { throw std::runtime_error("hook exploded"); });
    EXPECT_CALL(*launcher_, launch()).Times(1);
    ASSERT_TRUE(supervisor_->request_restart(true).accepted);
    EXPECT_NO_THROW(supervisor_->perform());
}

TEST_F(RestartSupervisorTest, LauncherFailureIsReportedAndNotRetried) {
    EXPECT_CALL(*launcher_, launch()).WillOnce(Throw(std::runtime_error("execv failed")));
    ASSERT_TRUE(supervisor_->request_restart(true).accepted);

    EXPECT_THROW(supervisor_->perform(), std::runtime_error);
    EXPECT_FALSE(supervisor_->is_pending());
    // Nothing pending, so a second perform has nothing to retry.
    EXPECT_THROW(supervisor_->perform(), std::runtime_error);
    EXPECT_TRUE(supervisor_->request_restart(true).accepted);
}

TEST_F(RestartSupervisorTest, WaitForRequestWakesOnRequest) {
    auto waiter = std::async(std::launch::async, [this] {
        return supervisor_->wait_for_request(std::chrono::seconds(10));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    supervisor_->request_restart(true);
    EXPECT_TRUE(waiter.get());
}

TEST_F(RestartSupervisorTest, ShutdownReleasesWaiters) {
    auto waiter = std::async(std::launch::async, [this] {
        return supervisor_->wait_for_request(std::chrono::seconds(10));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    supervisor_->shutdown();
    EXPECT_FALSE(waiter.get());
}

TEST_F(RestartSupervisorTest, WaitTimesOutQuietly) {
    EXPECT_FALSE(supervisor_->wait_for_request(std::chrono::milliseconds(20)));
}

namespace {

// Stands in for a listen() loop: returns once stop() has been called.
struct FakeServer {
    std::atomic<bool> stopped{false};
    std::atomic<bool> returned{false};

    bool listen() {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!stopped.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        // In-flight responses are still being written at this point.
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        returned = true;
        return stopped.load();
    }
};

}

TEST_F(RestartSupervisorTest, HandOffWaitsForTheServerToReturn) {
    FakeServer server;
    MockFunction<void()> drain;
    supervisor_->add_drain_hook("orchestrator", drain.AsStdFunction());
    EXPECT_CALL(drain, Call()).WillOnce(Invoke([&] { EXPECT_TRUE(server.returned.load()); }));
    EXPECT_CALL(*launcher_, launch()).WillOnce(Invoke([&] { EXPECT_TRUE(server.returned.load()); }));

    int code = supervisor_->serve(
        [&] {
            EXPECT_TRUE(supervisor_->request_restart(true).accepted);
            return server.listen();
        },
        [&] { server.stopped = true; });

    EXPECT_EQ(code, 0);
    EXPECT_TRUE(server.stopped.load());
    EXPECT_FALSE(supervisor_->is_pending());
}

TEST_F(RestartSupervisorTest, InterruptSkipsThePendingHandOff) {
    FakeServer server;
    EXPECT_CALL(*launcher_, launch()).Times(0);

    int code = supervisor_->serve(
        [&] {
            supervisor_->interrupt();
            EXPECT_TRUE(supervisor_->request_restart(true).accepted);
            server.stopped = true;
            return server.listen();
        },
        [&] { server.stopped = true; });

    EXPECT_EQ(code, 0);
}

TEST_F(RestartSupervisorTest, ServeWithoutRequestReturnsQuietly) {
    EXPECT_CALL(*launcher_, launch()).Times(0);
    MockFunction<void()> stop;
    EXPECT_CALL(stop, Call()).Times(0);

    EXPECT_EQ(supervisor_->serve([] { return true; }, stop.AsStdFunction()), 0);
    EXPECT_EQ(supervisor_->serve([] { return false; }, stop.AsStdFunction()), 1);
}

TEST_F(RestartSupervisorTest, FailedHandOffFromServeIsExitCodeOne) {
    FakeServer server;
    EXPECT_CALL(*launcher_, launch()).WillOnce(Throw(std::runtime_error("execv failed")));

    int code = supervisor_->serve(
        [&] {
            supervisor_->request_restart(true);
            return server.listen();
        },
        [&] { server.stopped = true; });

    EXPECT_EQ(code, 1);
    EXPECT_FALSE(supervisor_->is_pending());
}
