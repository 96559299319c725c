#include "core/timeout_coordinator.h"

#include <spdlog/spdlog.h>
#include <system_error>

namespace planproxy {

namespace {

std::string describeDeadline(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        return std::to_string(timeout.count() / 1000) + " seconds";
    }
    return std::to_string(timeout.count()) + " ms";
}

std::chrono::milliseconds effectiveTimeout(std::chrono::milliseconds requested) {
    if (requested.count() <= 0) {
        return TimeoutCoordinator::kDefaultTimeout;
    }
    if (requested > TimeoutCoordinator::kMaxTimeout) {
        spdlog::warn("Request timeout {} ms exceeds the {} ms limit, clamping", requested.count(),
                     TimeoutCoordinator::kMaxTimeout.count());
        return TimeoutCoordinator::kMaxTimeout;
    }
    return requested;
}

}  // namespace

TimeoutState::TimeoutState(std::string request_id, Clock::time_point start,
                           std::chrono::milliseconds timeout)
    : request_id_(std::move(request_id))
    , start_(start)
    , timeout_(timeout)
    , deadline_(start + timeout) {}

std::chrono::milliseconds TimeoutState::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_);
}

std::chrono::milliseconds TimeoutState::remaining() const {
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool TimeoutState::responded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responded_;
}

void TimeoutState::onCancel(std::function<void()> hook) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load()) {
            cancel_hooks_.push_back(std::move(hook));
            return;
        }
    }
    hook();
}

TimeoutCoordinator::TimeoutCoordinator(std::chrono::milliseconds timeout)
    : timeout_(effectiveTimeout(timeout)) {
    timer_thread_ = std::thread(&TimeoutCoordinator::timerLoop, this);
}

TimeoutCoordinator::~TimeoutCoordinator() {
    std::vector<std::shared_ptr<TimeoutState>> pending;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        stop_ = true;
        for (auto& entry : timers_) {
            if (auto state = entry.second.lock()) pending.push_back(std::move(state));
        }
        timers_.clear();
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    // Release handlers still waiting on a deadline, then let aborted calls unwind.
    for (auto& state : pending) {
        expire(state);
    }
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    tasks_cv_.wait(lock, [this]() { return inflight_ == 0; });
}

std::shared_ptr<TimeoutState> TimeoutCoordinator::begin(const std::string& request_id,
                                                        TimeoutState::Clock::time_point start) {
    auto state = std::make_shared<TimeoutState>(request_id, start, timeout_);
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (stop_) {
            throw GatewayError(ErrorKind::kInternal, "Gateway is shutting down");
        }
        timers_.emplace(state->deadline(), state);
    }
    timer_cv_.notify_one();
    return state;
}

void TimeoutCoordinator::runUpstream(const std::shared_ptr<TimeoutState>& state, UpstreamTask task) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        ++inflight_;
    }
    try {
        std::thread([this, state = state, task = std::move(task)]() mutable {
            UpstreamOutcome outcome;
            try {
                outcome.response = task(*state);
                outcome.success = true;
            } catch (const GatewayError& e) {
                outcome.error_kind = e.kind();
                outcome.error_message = e.what();
                outcome.error_details = e.details();
            } catch (const std::exception& e) {
                outcome.error_kind = ErrorKind::kInternal;
                outcome.error_message = e.what();
            }
            complete(state, std::move(outcome));

            task = nullptr;
            state.reset();
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            --inflight_;
            tasks_cv_.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            --inflight_;
        }
        tasks_cv_.notify_all();
        throw GatewayError(ErrorKind::kInternal, "Failed to start upstream call", e.what());
    }
}

bool TimeoutCoordinator::complete(const std::shared_ptr<TimeoutState>& state, UpstreamOutcome outcome) {
    return deliver(state, std::move(outcome), false);
}

UpstreamOutcome TimeoutCoordinator::await(const std::shared_ptr<TimeoutState>& state) {
    std::unique_lock<std::mutex> lock(state->mutex_);
    state->cv_.wait(lock, [&state]() { return state->responded_; });
    return *state->outcome_;
}

size_t TimeoutCoordinator::armedTimers() const {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    return timers_.size();
}

size_t TimeoutCoordinator::inflightTasks() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return inflight_;
}

void TimeoutCoordinator::timerLoop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (!stop_) {
        if (timers_.empty()) {
            timer_cv_.wait(lock, [this]() { return stop_ || !timers_.empty(); });
            continue;
        }
        const auto next = timers_.begin()->first;
        if (TimeoutState::Clock::now() < next) {
            timer_cv_.wait_until(lock, next);
            continue;
        }

        std::vector<std::shared_ptr<TimeoutState>> due;
        const auto now = TimeoutState::Clock::now();
        while (!timers_.empty() && timers_.begin()->first <= now) {
            if (auto state = timers_.begin()->second.lock()) {
                due.push_back(std::move(state));
            }
            timers_.erase(timers_.begin());
        }

        lock.unlock();
        for (auto& state : due) {
            expire(state);
        }
        due.clear();
        lock.lock();
    }
}

void TimeoutCoordinator::expire(const std::shared_ptr<TimeoutState>& state) {
    UpstreamOutcome outcome;
    outcome.error_kind = ErrorKind::kTimeout;
    outcome.error_message = "Server response timeout reached";
    outcome.error_details = "Request took longer than " + describeDeadline(state->timeout()) +
                            " to complete (elapsed " + std::to_string(state->elapsed().count()) +
                            "ms, deadline " + std::to_string(state->timeout().count()) + "ms)";
    deliver(state, std::move(outcome), true);
}

bool TimeoutCoordinator::deliver(const std::shared_ptr<TimeoutState>& state, UpstreamOutcome outcome,
                                 bool cancel) {
    std::vector<std::function<void()>> hooks;
    {
        std::lock_guard<std::mutex> lock(state->mutex_);
        if (state->responded_) {
            return false;
        }
        state->responded_ = true;
        state->outcome_ = std::move(outcome);
        if (cancel) {
            state->cancelled_.store(true);
            hooks.swap(state->cancel_hooks_);
        } else {
            state->cancel_hooks_.clear();
        }
    }
    state->cv_.notify_all();
    disarm(*state);

    for (auto& hook : hooks) {
        try {
            hook();
        } catch (const std::exception& e) {
            spdlog::warn("[{}] cancel hook failed: {}", state->requestId(), e.what());
        }
    }
    return true;
}

void TimeoutCoordinator::disarm(TimeoutState& state) {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    auto range = timers_.equal_range(state.deadline());
    for (auto it = range.first; it != range.second; ++it) {
        auto owner = it->second.lock();
        if (owner.get() == &state) {
            timers_.erase(it);
            return;
        }
    }
}

}  // namespace planproxy
