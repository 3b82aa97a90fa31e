#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/CancellationToken.hpp"

namespace app {

// Task group bound to a hard deadline. When the deadline passes (or the
// token is cancelled from outside) every task is signalled, gets `grace` to
// unwind, and tasks still running afterwards have their release hooks run
// and are abandoned. wait() therefore returns within deadline + grace.
//
// Tasks may outlive the scope once abandoned: anything they touch must be
// owned through shared pointers captured by the task.
//
// Tasks see a token owned by the scope. Cancelling `parent` cancels it, but
// the deadline and force release never reach back into `parent`.
class DeadlineScope {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void(core::CancellationToken&)>;

    struct Config {
        std::chrono::milliseconds deadline{std::chrono::minutes(5)};
        std::chrono::milliseconds grace{300};
    };

    struct Outcome {
        bool completed{true};
        bool deadlineExceeded{false};
        bool cancelled{false};
        std::size_t abandoned{0};
        std::size_t forceReleased{0};
        std::size_t failedTasks{0};
        Clock::duration elapsed{};
    };

    explicit DeadlineScope(const Config& config, std::shared_ptr<core::CancellationToken> parent = nullptr);
    ~DeadlineScope();

    DeadlineScope(const DeadlineScope&) = delete;
    DeadlineScope& operator=(const DeadlineScope&) = delete;

    void spawn(Task task);
    Outcome wait();

    core::CancellationToken& token() noexcept { return *token_; }
    const std::shared_ptr<core::CancellationToken>& sharedToken() const noexcept { return token_; }
    Clock::time_point deadline() const noexcept { return deadline_; }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::size_t running{0};
        std::size_t failed{0};
        std::vector<bool> done;
    };

    const Config config_;
    const Clock::time_point started_;
    const Clock::time_point deadline_;
    std::shared_ptr<core::CancellationToken> parent_;
    std::shared_ptr<core::CancellationToken> token_;
    std::shared_ptr<State> state_;
    std::vector<std::thread> threads_;
    std::unique_ptr<core::CancellationToken::Registration> wakeOnCancel_;
    std::unique_ptr<core::CancellationToken::Registration> parentLink_;
    bool waited_{false};
};

}  // namespace app
