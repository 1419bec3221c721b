#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"

#include "types.h"

namespace Subgate {

// Handles are unique across all registries in the process
inline SubscriptionHandle NextSubscriptionHandle() {
    static std::atomic<SubscriptionHandle> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

/**
 * Ordered observer registry. Listeners are invoked in registration order and
 * are identified by the handle returned from Add().
 *
 * Publish() copies the listener list before invoking anything, so a listener
 * may Add() or Remove() (itself included) while being called. A listener that
 * throws is logged and skipped; the remaining listeners still run.
 */
template<typename Event>
class ListenerRegistry {
public:
    using Callback = std::function<void(const Event&)>;

    explicit ListenerRegistry(const char* name) : name_(name) {}

    SubscriptionHandle Add(Callback callback) {
        SubscriptionHandle handle = NextSubscriptionHandle();
        absl::MutexLock lock(&mutex_);
        listeners_.emplace(handle, std::move(callback));
        return handle;
    }

    // Returns false for unknown or already removed handles
    bool Remove(SubscriptionHandle handle) {
        absl::MutexLock lock(&mutex_);
        return listeners_.erase(handle) > 0;
    }

    // Returns the number of listeners that threw
    size_t Publish(const Event& event) const {
        std::vector<std::pair<SubscriptionHandle, Callback>> snapshot;
        {
            absl::MutexLock lock(&mutex_);
            snapshot.assign(listeners_.begin(), listeners_.end());
        }
        size_t failures = 0;
        for (const auto& [handle, callback] : snapshot) {
            try {
                callback(event);
            } catch (const std::exception& e) {
                ++failures;
                LOG(ERROR) << "[" << name_ << "] Listener " << handle << " threw: " << e.what();
            } catch (...) {
                ++failures;
                LOG(ERROR) << "[" << name_ << "] Listener " << handle << " threw a non-standard exception";
            }
        }
        return failures;
    }

    size_t size() const {
        absl::MutexLock lock(&mutex_);
        return listeners_.size();
    }

    void Clear() {
        absl::MutexLock lock(&mutex_);
        listeners_.clear();
    }

private:
    const char* name_;
    mutable absl::Mutex mutex_;
    absl::btree_map<SubscriptionHandle, Callback> listeners_ ABSL_GUARDED_BY(mutex_);
};

/**
 * Scoped listener registration; runs the release action on destruction.
 */
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    explicit ScopedSubscription(std::function<void()> release) : release_(std::move(release)) {}
    ~ScopedSubscription() { Release(); }

    // Disable copy
    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    // Enable move
    ScopedSubscription(ScopedSubscription&& other) noexcept : release_(std::move(other.release_)) {
        other.release_ = nullptr;
    }
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            Release();
            release_ = std::move(other.release_);
            other.release_ = nullptr;
        }
        return *this;
    }

    void Release() {
        if (release_) {
            auto release = std::move(release_);
            release_ = nullptr;
            release();
        }
    }

    bool active() const { return static_cast<bool>(release_); }

private:
    std::function<void()> release_;
};

} // namespace Subgate
