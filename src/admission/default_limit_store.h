#ifndef SUBGATE_ADMISSION_DEFAULT_LIMIT_STORE_H_
#define SUBGATE_ADMISSION_DEFAULT_LIMIT_STORE_H_

#include <functional>

#include "absl/synchronization/mutex.h"

#include "listener_registry.h"
#include "types.h"

namespace Subgate {

/**
 * Holds the default base limit for rows that may stay subscribed while
 * off-screen. The admission controller never reads it; the invisible-row
 * quota owner does.
 */
class DefaultLimitStore {
public:
	using ChangeCallback = std::function<void(int64_t)>;

	explicit DefaultLimitStore(int64_t initial = kDefaultInactiveBaseLimit);

	int64_t Get() const;

	// Negative values clamp to 0. Listeners only hear about actual changes.
	void Set(int64_t value);

	SubscriptionHandle OnChange(ChangeCallback callback);
	bool Unsubscribe(SubscriptionHandle handle) { return listeners_.Remove(handle); }

private:
	mutable absl::Mutex mutex_;
	int64_t value_ ABSL_GUARDED_BY(mutex_);
	ListenerRegistry<int64_t> listeners_{"DefaultLimitStore"};
};

} // namespace Subgate

#endif // SUBGATE_ADMISSION_DEFAULT_LIMIT_STORE_H_
