#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace core {

// Shared cancellation signal for one request. Cancelling is cooperative:
// waiters wake up and cancel listeners run. Force release runs the release
// hooks of every operation that is still registered after the grace period.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    // Scoped hook registration. Unregistering blocks while a hook of this
    // token is executing, so the hook never outlives the resource it touches.
    class Registration {
    public:
        Registration() = default;
        Registration(CancellationToken& token, Callback onCancel, Callback onForceRelease = {});
        ~Registration();

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void release();

    private:
        CancellationToken* token_{nullptr};
        std::uint64_t id_{0};
    };

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel(const std::string& reason);
    std::size_t force_release();

    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
    bool force_released() const noexcept { return forceReleased_.load(std::memory_order_acquire); }
    std::string reason() const;

    // Both return false when the token was cancelled before the wait elapsed.
    bool sleep_for(std::chrono::milliseconds duration) const;
    bool sleep_until(Clock::time_point deadline) const;

    std::size_t registered() const;

private:
    struct Entry {
        Callback onCancel;
        Callback onForceRelease;
    };

    std::uint64_t add_(Callback onCancel, Callback onForceRelease);
    void remove_(std::uint64_t id);
    void invoke_(const Callback& callback, const char* phase) const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::mutex callbackMutex_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> forceReleased_{false};
    std::string reason_;
    std::map<std::uint64_t, Entry> entries_;
    std::uint64_t nextId_{1};
};

}  // namespace core
