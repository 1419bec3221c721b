#ifndef SUBGATE_ADMISSION_SUBSCRIPTION_CONTROLLER_H_
#define SUBGATE_ADMISSION_SUBSCRIPTION_CONTROLLER_H_

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "bounded_pool.h"
#include "capacity.h"
#include "listener_registry.h"
#include "lock_controller.h"
#include "metrics.h"
#include "pane_registry.h"
#include "types.h"

namespace Subgate {

/**
 * Decides which keys may hold a live-update channel on the fast and slow
 * tiers.
 *
 * Capacities follow the pane counts reported by the visibility tracker:
 *   fast = sum(visible) + kFastBufferMargin (allow-list size while locked)
 *   slow = sum(rendered)
 * Each pool is trimmed oldest-first whenever it overflows.
 *
 * Every mutating call (Register*, UpdatePane*Count, EngageSubscriptionLock,
 * ReleaseSubscriptionLock) publishes exactly one EvictionBatch, possibly
 * empty, to all eviction listeners before it returns. Batches reach
 * listeners in call order.
 *
 * Thread-safe. Listeners may read state (metrics, snapshot, lock queries)
 * and manage listener registrations from inside a callback, but must not
 * call mutating operations.
 */
class SubscriptionController {
public:
	using EvictionCallback = std::function<void(const EvictionBatch&)>;
	using LockChangeCallback = std::function<void(const LockState&)>;
	using MetricsChangeCallback = std::function<void(const SubscriptionSnapshot&)>;

	SubscriptionController();
	~SubscriptionController();

	/**
	 * Report how many rows of a pane are inside the viewport.
	 *
	 * @param pane_id Pane name; created on first use
	 * @param count Row count; non-finite or negative values count as 0
	 */
	void UpdatePaneVisibleCount(const std::string& pane_id, double count);

	/**
	 * Report how many rows of a pane are rendered (visible plus buffered).
	 *
	 * @param pane_id Pane name; created on first use
	 * @param count Row count; non-finite or negative values count as 0
	 */
	void UpdatePaneRenderedCount(const std::string& pane_id, double count);

	/**
	 * Admit a key to the fast tier. A key held by the slow tier is moved up
	 * without being reported as evicted (kUpgraded).
	 *
	 * While locked, a key outside the allow-list is refused even when the
	 * pool has room. Unless the slow tier still holds it, the key is reported
	 * in the batch's fast list although it was never a member, so the caller
	 * can tear down a channel it opened ahead of the call.
	 */
	AdmissionOutcome RegisterFastSubscription(const Key& key);

	// Admit a key to the slow tier; kIgnored for keys already on the fast tier
	AdmissionOutcome RegisterSlowSubscription(const Key& key);

	// Drop a key without reporting it as evicted. No batch is published.
	bool DeregisterFastSubscription(const Key& key);
	bool DeregisterSlowSubscription(const Key& key);

	void EngageSubscriptionLock(const LockRequest& request);
	void ReleaseSubscriptionLock();

	bool IsSubscriptionLockActive() const;
	// Sorted
	std::vector<Key> GetSubscriptionLockAllowedKeys() const;

	SubscriptionHandle OnSubscriptionEvictions(EvictionCallback callback);
	SubscriptionHandle OnSubscriptionLockChange(LockChangeCallback callback);
	// Fires immediately with the current snapshot, then on every change of
	// lock activity, pool sizes or limits. The first snapshot is delivered in
	// order with those of concurrent mutating calls.
	SubscriptionHandle OnSubscriptionMetricsChange(MetricsChangeCallback callback);

	// Remove a listener registered by any On* method
	bool Unsubscribe(SubscriptionHandle handle);

	SubscriptionMetrics GetSubscriptionMetrics() const;
	SubscriptionSnapshot GetSubscriptionSnapshot() const;

	/**
	 * Return to cold-start state: no panes, empty pools, unlocked.
	 * Listener registrations are kept.
	 */
	void Reset();

private:
	// Reapply computed capacities to both pools
	EvictionBatch ApplyCapacities() ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mutex_);

	SubscriptionMetrics MetricsLocked() const ABSL_SHARED_LOCKS_REQUIRED(state_mutex_);
	SubscriptionSnapshot SnapshotLocked() const ABSL_SHARED_LOCKS_REQUIRED(state_mutex_);

	// Fan out the results of one operation, in order: evictions, lock change, metrics
	void Deliver(const std::optional<EvictionBatch>& batch, const std::optional<LockState>& lock_event,
			bool force_metrics = false) ABSL_EXCLUSIVE_LOCKS_REQUIRED(op_mutex_);

	// Serializes mutating operations together with their notifications
	absl::Mutex op_mutex_ ABSL_ACQUIRED_BEFORE(state_mutex_);
	mutable absl::Mutex state_mutex_;

	PaneCountRegistry panes_ ABSL_GUARDED_BY(state_mutex_);
	BoundedOrderedPool fast_pool_ ABSL_GUARDED_BY(state_mutex_);
	BoundedOrderedPool slow_pool_ ABSL_GUARDED_BY(state_mutex_);
	LockController lock_ ABSL_GUARDED_BY(state_mutex_);

	// Last metrics delivered to metrics listeners
	std::optional<SubscriptionMetrics> last_metrics_ ABSL_GUARDED_BY(op_mutex_);
	bool last_lock_active_ ABSL_GUARDED_BY(op_mutex_) = false;

	ListenerRegistry<EvictionBatch> eviction_listeners_{"EvictionNotifier"};
	ListenerRegistry<LockState> lock_listeners_{"LockNotifier"};
	ListenerRegistry<SubscriptionSnapshot> metrics_listeners_{"MetricsNotifier"};

	SubscriptionController(const SubscriptionController&) = delete;
	SubscriptionController& operator=(const SubscriptionController&) = delete;
};

} // namespace Subgate

#endif // SUBGATE_ADMISSION_SUBSCRIPTION_CONTROLLER_H_
