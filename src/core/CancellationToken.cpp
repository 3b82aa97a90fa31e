#include "core/CancellationToken.hpp"

#include <exception>
#include <vector>

#include "common/Log.hpp"

namespace core {

CancellationToken::Registration::Registration(CancellationToken& token, Callback onCancel, Callback onForceRelease)
    : token_(&token), id_(token.add_(std::move(onCancel), std::move(onForceRelease))) {}

CancellationToken::Registration::~Registration() { release(); }

void CancellationToken::Registration::release() {
    if (token_ != nullptr) {
        token_->remove_(id_);
        token_ = nullptr;
        id_ = 0;
    }
}

void CancellationToken::cancel(const std::string& reason) {
    std::lock_guard<std::mutex> callbackLock(callbackMutex_);
    std::vector<std::uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed)) {
            return;
        }
        reason_ = reason;
        cancelled_.store(true, std::memory_order_release);
        for (const auto& entry : entries_) {
            ids.push_back(entry.first);
        }
    }
    cv_.notify_all();

    for (const auto id : ids) {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = entries_.find(id);
            if (it == entries_.end()) {
                continue;
            }
            callback = it->second.onCancel;
        }
        invoke_(callback, "cancel");
    }
}

std::size_t CancellationToken::force_release() {
    std::lock_guard<std::mutex> callbackLock(callbackMutex_);
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forceReleased_.store(true, std::memory_order_release);
        if (!cancelled_.load(std::memory_order_relaxed)) {
            reason_ = "force release";
            cancelled_.store(true, std::memory_order_release);
        }
        for (auto& entry : entries_) {
            if (entry.second.onForceRelease) {
                callbacks.push_back(std::move(entry.second.onForceRelease));
            }
        }
        entries_.clear();
    }
    cv_.notify_all();

    for (const auto& callback : callbacks) {
        invoke_(callback, "force release");
    }
    return callbacks.size();
}

std::string CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    return sleep_until(Clock::now() + duration);
}

bool CancellationToken::sleep_until(Clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this]() { return cancelled_.load(std::memory_order_acquire); });
    return !cancelled_.load(std::memory_order_acquire);
}

std::size_t CancellationToken::registered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::uint64_t CancellationToken::add_(Callback onCancel, Callback onForceRelease) {
    bool runCancel = false;
    bool runForce = false;
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runForce = forceReleased_.load(std::memory_order_relaxed);
        runCancel = cancelled_.load(std::memory_order_relaxed);
        if (!runForce) {
            id = nextId_++;
            entries_.emplace(id, Entry{onCancel, onForceRelease});
        }
    }
    // Late registrations observe the current state immediately.
    if (runForce) {
        invoke_(onCancel, "cancel");
        invoke_(onForceRelease, "force release");
    } else if (runCancel) {
        invoke_(onCancel, "cancel");
    }
    return id;
}

void CancellationToken::remove_(std::uint64_t id) {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> callbackLock(callbackMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(id);
}

void CancellationToken::invoke_(const Callback& callback, const char* phase) const {
    if (!callback) {
        return;
    }
    try {
        callback();
    } catch (const std::exception& ex) {
        LOG_WARN("Cancellation " << phase << " hook failed: " << ex.what());
    }
}

}  // namespace core
