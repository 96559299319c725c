#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/upstream_types.h"
#include "utils/config.h"

namespace planproxy {

class TimeoutCoordinator;

// Per-request deadline bookkeeping. Only the TimeoutCoordinator delivers
// outcomes; upstream tasks observe it for cooperative cancellation.
class TimeoutState {
public:
    using Clock = std::chrono::steady_clock;

    TimeoutState(std::string request_id, Clock::time_point start, std::chrono::milliseconds timeout);

    TimeoutState(const TimeoutState&) = delete;
    TimeoutState& operator=(const TimeoutState&) = delete;

    const std::string& requestId() const { return request_id_; }
    Clock::time_point start() const { return start_; }
    Clock::time_point deadline() const { return deadline_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    std::chrono::milliseconds elapsed() const;
    // Time left until the deadline, never negative.
    std::chrono::milliseconds remaining() const;

    bool cancelled() const { return cancelled_.load(); }
    bool responded() const;

    // Registers a hook that aborts in-flight work. Runs immediately when the
    // state is already cancelled.
    void onCancel(std::function<void()> hook);

private:
    friend class TimeoutCoordinator;

    const std::string request_id_;
    const Clock::time_point start_;
    const std::chrono::milliseconds timeout_;
    const Clock::time_point deadline_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    bool responded_{false};
    std::optional<UpstreamOutcome> outcome_;
    std::vector<std::function<void()>> cancel_hooks_;
};

// The upstream call; throws GatewayError on failure.
using UpstreamTask = std::function<UpstreamResponse(TimeoutState&)>;

// Races the deadline of each request against its upstream call and lets exactly
// one of them deliver the outcome. Deadlines are served by a single timer thread;
// upstream tasks run on their own threads so an expired request can be answered
// while its call is still being torn down.
class TimeoutCoordinator {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{120000};
    static constexpr std::chrono::milliseconds kMaxTimeout{kMaxRequestTimeoutMs};

    // Non-positive timeouts fall back to kDefaultTimeout; longer ones are clamped to kMaxTimeout.
    explicit TimeoutCoordinator(std::chrono::milliseconds timeout = kDefaultTimeout);
    ~TimeoutCoordinator();

    TimeoutCoordinator(const TimeoutCoordinator&) = delete;
    TimeoutCoordinator& operator=(const TimeoutCoordinator&) = delete;

    std::chrono::milliseconds timeout() const { return timeout_; }

    // Records the deadline (start + timeout) for a new request and arms its timer.
    // Pass the time the request was accepted so the deadline covers the whole exchange.
    std::shared_ptr<TimeoutState> begin(const std::string& request_id,
                                        TimeoutState::Clock::time_point start = TimeoutState::Clock::now());

    // Runs the task on a worker thread; its result (or error) is offered to complete().
    void runUpstream(const std::shared_ptr<TimeoutState>& state, UpstreamTask task);

    // First caller wins and gets true; every later call is a no-op returning false.
    bool complete(const std::shared_ptr<TimeoutState>& state, UpstreamOutcome outcome);

    // Blocks until an outcome has been delivered for the state.
    UpstreamOutcome await(const std::shared_ptr<TimeoutState>& state);

    size_t armedTimers() const;
    size_t inflightTasks() const;

private:
    void timerLoop();
    void expire(const std::shared_ptr<TimeoutState>& state);
    bool deliver(const std::shared_ptr<TimeoutState>& state, UpstreamOutcome outcome, bool cancel);
    void disarm(TimeoutState& state);

    std::chrono::milliseconds timeout_;

    mutable std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    std::multimap<TimeoutState::Clock::time_point, std::weak_ptr<TimeoutState>> timers_;
    bool stop_{false};
    std::thread timer_thread_;

    mutable std::mutex tasks_mutex_;
    std::condition_variable tasks_cv_;
    size_t inflight_{0};
};

}  // namespace planproxy
