#include "app/DeadlineScope.hpp"

#include <exception>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {

DeadlineScope::DeadlineScope(const Config& config, std::shared_ptr<core::CancellationToken> parent)
    : config_(config),
      started_(Clock::now()),
      deadline_(started_ + config.deadline),
      parent_(std::move(parent)),
      token_(std::make_shared<core::CancellationToken>()),
      state_(std::make_shared<State>()) {
    auto state = state_;
    wakeOnCancel_ = std::make_unique<core::CancellationToken::Registration>(*token_, [state]() {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->cv.notify_all();
    });
    if (parent_) {
        std::weak_ptr<core::CancellationToken> child = token_;
        core::CancellationToken* source = parent_.get();
        parentLink_ = std::make_unique<core::CancellationToken::Registration>(*parent_, [child, source]() {
            if (auto token = child.lock()) {
                token->cancel(source->reason());
            }
        });
    }
}

DeadlineScope::~DeadlineScope() {
    if (!waited_) {
        token_->cancel("scope destroyed");
        wait();
    }
}

void DeadlineScope::spawn(Task task) {
    std::size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        index = state_->done.size();
        state_->done.push_back(false);
        ++state_->running;
    }

    auto state = state_;
    auto token = token_;
    const auto request = kfcp::log::currentRequest();
    threads_.emplace_back([state, token, index, request, task = std::move(task)]() {
        kfcp::log::RequestScope requestScope{request};
        bool failed = false;
        try {
            task(*token);
        } catch (const std::exception& ex) {
            failed = true;
            LOG_ERR("Fetch task " << index << " failed: " << ex.what());
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        state->done[index] = true;
        --state->running;
        if (failed) {
            ++state->failed;
        }
        state->cv.notify_all();
    });
}

DeadlineScope::Outcome DeadlineScope::wait() {
    Outcome outcome{};
    if (waited_) {
        outcome.completed = false;
        return outcome;
    }
    waited_ = true;

    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_until(lock, deadline_, [this]() { return state_->running == 0 || token_->cancelled(); });

    if (state_->running > 0) {
        const bool external = token_->cancelled();
        outcome.completed = false;
        outcome.cancelled = external;
        outcome.deadlineExceeded = !external;

        lock.unlock();
        if (!external) {
            kfcp::common::metrics::increment("deadline.expired");
            LOG_WARN("Deadline of " << config_.deadline.count() << " ms reached with running fetches, cancelling");
            token_->cancel("deadline exceeded");
        }
        lock.lock();

        state_->cv.wait_for(lock, config_.grace, [this]() { return state_->running == 0; });

        if (state_->running > 0) {
            const auto stuck = state_->running;
            lock.unlock();
            outcome.forceReleased = token_->force_release();
            LOG_WARN("Force released " << outcome.forceReleased << " resource(s) of " << stuck
                                       << " fetch task(s) still running after " << config_.grace.count()
                                       << " ms grace");
            lock.lock();
        }
    }

    for (std::size_t i = 0; i < threads_.size(); ++i) {
        if (!threads_[i].joinable()) {
            continue;
        }
        if (state_->done[i]) {
            lock.unlock();
            threads_[i].join();
            lock.lock();
        } else {
            threads_[i].detach();
            ++outcome.abandoned;
        }
    }
    outcome.failedTasks = state_->failed;
    lock.unlock();

    parentLink_.reset();
    wakeOnCancel_.reset();
    outcome.elapsed = Clock::now() - started_;
    return outcome;
}

}  // namespace app
