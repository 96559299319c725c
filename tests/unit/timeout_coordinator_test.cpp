#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "core/gateway_error.h"
#include "core/timeout_coordinator.h"

using namespace planproxy;
using namespace std::chrono_literals;

namespace {

// Blocks until released or cancelled; mimics an upstream call that never answers.
struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open{false};

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        open = true;
        cv.notify_all();
    }

    void waitOpen(TimeoutState& state) {
        state.onCancel([this]() { release(); });
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this]() { return open; });
    }
};

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds limit) {
    const auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

}  // namespace

TEST(TimeoutCoordinatorTest, NonPositiveTimeoutFallsBackToDefault) {
    TimeoutCoordinator zero(0ms);
    EXPECT_EQ(zero.timeout(), TimeoutCoordinator::kDefaultTimeout);
    TimeoutCoordinator custom(250ms);
    EXPECT_EQ(custom.timeout(), 250ms);
}

TEST(TimeoutCoordinatorTest, OversizedTimeoutIsClampedAndDoesNotFireEarly) {
    TimeoutCoordinator coordinator(std::chrono::seconds(10000000000LL));
    EXPECT_EQ(coordinator.timeout(), TimeoutCoordinator::kMaxTimeout);

    auto state = coordinator.begin("huge");
    EXPECT_GT(state->deadline(), state->start());
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(state->responded());
    EXPECT_FALSE(state->cancelled());
}

TEST(TimeoutCoordinatorTest, BeginRecordsDeadline) {
    TimeoutCoordinator coordinator(5000ms);
    auto state = coordinator.begin("req-1");
    EXPECT_EQ(state->requestId(), "req-1");
    EXPECT_EQ(state->deadline() - state->start(), std::chrono::milliseconds(5000));
    EXPECT_GT(state->remaining().count(), 4000);
    EXPECT_LE(state->remaining().count(), 5000);
    EXPECT_EQ(coordinator.armedTimers(), 1u);
    EXPECT_FALSE(state->responded());

    UpstreamOutcome done;
    done.success = true;
    EXPECT_TRUE(coordinator.complete(state, done));
    EXPECT_EQ(coordinator.armedTimers(), 0u);
}

TEST(TimeoutCoordinatorTest, DeadlineCountsFromGivenStart) {
    TimeoutCoordinator coordinator(200ms);
    const auto accepted = std::chrono::steady_clock::now() - 150ms;
    auto state = coordinator.begin("accepted-earlier", accepted);
    EXPECT_EQ(state->start(), accepted);
    EXPECT_EQ(state->deadline(), accepted + 200ms);
    EXPECT_LE(state->remaining().count(), 50);

    const auto waiting = std::chrono::steady_clock::now();
    auto outcome = coordinator.await(state);
    EXPECT_EQ(outcome.error_kind, ErrorKind::kTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - waiting, 150ms);
}

TEST(TimeoutCoordinatorTest, UpstreamResultWinsBeforeDeadline) {
    TimeoutCoordinator coordinator(2000ms);
    auto state = coordinator.begin("fast");
    coordinator.runUpstream(state, [](TimeoutState&) {
        return UpstreamResponse{200, R"({"ok":true})"};
    });

    auto outcome = coordinator.await(state);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.response.status, 200);
    EXPECT_EQ(outcome.response.body, R"({"ok":true})");
    EXPECT_FALSE(state->cancelled());
    EXPECT_TRUE(waitFor([&]() { return coordinator.inflightTasks() == 0; }, 1000ms));
    EXPECT_EQ(coordinator.armedTimers(), 0u);
    // The worker dropped its reference before reporting itself finished.
    EXPECT_EQ(state.use_count(), 1);
}

TEST(TimeoutCoordinatorTest, DeadlineWinsAgainstHangingUpstream) {
    TimeoutCoordinator coordinator(100ms);
    auto state = coordinator.begin("slow");
    Gate gate;

    const auto started = std::chrono::steady_clock::now();
    coordinator.runUpstream(state, [&gate](TimeoutState& s) {
        gate.waitOpen(s);
        return UpstreamResponse{200, "late"};
    });

    auto outcome = coordinator.await(state);
    const auto waited = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::kTimeout);
    EXPECT_EQ(outcome.error_message, "Server response timeout reached");
    EXPECT_NE(outcome.error_details.find("Request took longer than 100 ms"), std::string::npos);
    EXPECT_GE(waited, 100ms);
    EXPECT_LT(waited, 1000ms);
    EXPECT_TRUE(state->cancelled());

    // The cancel hook released the task; its late result must not replace the timeout.
    EXPECT_TRUE(waitFor([&]() { return coordinator.inflightTasks() == 0; }, 2000ms));
    auto again = coordinator.await(state);
    EXPECT_EQ(again.error_kind, ErrorKind::kTimeout);
}

TEST(TimeoutCoordinatorTest, SecondDeliveryIsDiscarded) {
    TimeoutCoordinator coordinator(5000ms);
    auto state = coordinator.begin("dup");

    UpstreamOutcome first;
    first.success = true;
    first.response = {201, "first"};
    UpstreamOutcome second;
    second.success = true;
    second.response = {200, "second"};

    EXPECT_TRUE(coordinator.complete(state, first));
    EXPECT_FALSE(coordinator.complete(state, second));
    EXPECT_EQ(coordinator.await(state).response.body, "first");
}

TEST(TimeoutCoordinatorTest, TaskErrorsBecomeOutcomes) {
    TimeoutCoordinator coordinator(2000ms);

    auto proxy = coordinator.begin("proxy");
    coordinator.runUpstream(proxy, [](TimeoutState&) -> UpstreamResponse {
        throw GatewayError(ErrorKind::kProxy, "Failed to reach upstream", "Connection");
    });
    auto proxy_outcome = coordinator.await(proxy);
    EXPECT_FALSE(proxy_outcome.success);
    EXPECT_EQ(proxy_outcome.error_kind, ErrorKind::kProxy);
    EXPECT_EQ(proxy_outcome.error_details, "Connection");

    auto other = coordinator.begin("other");
    coordinator.runUpstream(other, [](TimeoutState&) -> UpstreamResponse {
        throw std::runtime_error("boom");
    });
    auto other_outcome = coordinator.await(other);
    EXPECT_EQ(other_outcome.error_kind, ErrorKind::kInternal);
    EXPECT_EQ(other_outcome.error_message, "boom");
}

TEST(TimeoutCoordinatorTest, CancelHookRunsImmediatelyWhenAlreadyCancelled) {
    TimeoutCoordinator coordinator(50ms);
    auto state = coordinator.begin("late-hook");
    auto outcome = coordinator.await(state);
    ASSERT_EQ(outcome.error_kind, ErrorKind::kTimeout);

    bool ran = false;
    state->onCancel([&ran]() { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(TimeoutCoordinatorTest, IndependentDeadlinesDoNotInterfere) {
    TimeoutCoordinator coordinator(150ms);
    auto slow = coordinator.begin("a");
    auto fast = coordinator.begin("b");
    Gate gate;

    coordinator.runUpstream(slow, [&gate](TimeoutState& s) {
        gate.waitOpen(s);
        return UpstreamResponse{200, "never"};
    });
    coordinator.runUpstream(fast, [](TimeoutState&) { return UpstreamResponse{200, "quick"}; });

    EXPECT_TRUE(coordinator.await(fast).success);
    EXPECT_EQ(coordinator.await(slow).error_kind, ErrorKind::kTimeout);
    EXPECT_TRUE(waitFor([&]() { return coordinator.inflightTasks() == 0; }, 2000ms));
}

TEST(TimeoutCoordinatorTest, DestructorReleasesPendingRequests) {
    std::shared_ptr<TimeoutState> state;
    {
        TimeoutCoordinator coordinator(60000ms);
        state = coordinator.begin("pending");
    }
    EXPECT_TRUE(state->responded());
    EXPECT_TRUE(state->cancelled());
}
