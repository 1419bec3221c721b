#ifndef SUBGATE_ADMISSION_WIRE_BRIDGE_H_
#define SUBGATE_ADMISSION_WIRE_BRIDGE_H_

#include <atomic>
#include <memory>

#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "interfaces.h"
#include "listener_registry.h"
#include "subscription_controller.h"

namespace Subgate {

/**
 * Connects the admission controller to a wire sender.
 *
 * A key is registered first and subscribed on the wire only if the
 * controller still holds it afterwards, so every subscribe is matched by
 * exactly one unsubscribe:
 *   - evicted keys are unsubscribed on the tier they were evicted from
 *   - a fast upgrade unsubscribes the key's slow channel
 *   - refused, ignored and already-present registrations send nothing
 * Keys registered on the controller directly are not tracked and never
 * unsubscribed by the bridge. The eviction listener is removed when the
 * bridge is destroyed.
 */
class WireSubscriptionBridge {
public:
	WireSubscriptionBridge(SubscriptionController& controller,
			std::shared_ptr<IWireSubscriptionSender> sender);
	~WireSubscriptionBridge();

	/**
	 * Register a key on the given tier and subscribe it if admitted.
	 * @return true if the key holds a wire subscription on the tier afterwards
	 */
	bool Admit(const Key& key, Tier tier);
	bool AdmitFast(const Key& key) { return Admit(key, Tier::kFast); }
	bool AdmitSlow(const Key& key) { return Admit(key, Tier::kSlow); }

	// Deregister a key and unsubscribe it. Returns false if it was not held.
	bool Drop(const Key& key, Tier tier);

	bool IsSubscribed(const Key& key, Tier tier) const;

	size_t subscribes_sent() const { return subscribes_sent_.load(std::memory_order_relaxed); }
	size_t unsubscribes_sent() const { return unsubscribes_sent_.load(std::memory_order_relaxed); }

private:
	struct TierState {
		// Subscribed on the wire
		absl::flat_hash_set<Key> live;
		// Registration in flight; an eviction cancels it
		absl::flat_hash_set<Key> pending;
	};

	void OnEvictions(const EvictionBatch& batch);
	void HandleEvictionLocked(const Key& key, Tier tier) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
	void SendSubscribeLocked(const Key& key, Tier tier) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
	void SendUnsubscribeLocked(const Key& key, Tier tier) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

	TierState& state(Tier tier) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
		return tier == Tier::kFast ? fast_ : slow_;
	}

	SubscriptionController& controller_;
	std::shared_ptr<IWireSubscriptionSender> sender_;
	ScopedSubscription eviction_subscription_;

	// Also serializes calls into the sender
	mutable absl::Mutex mutex_;
	TierState fast_ ABSL_GUARDED_BY(mutex_);
	TierState slow_ ABSL_GUARDED_BY(mutex_);

	std::atomic<size_t> subscribes_sent_{0};
	std::atomic<size_t> unsubscribes_sent_{0};

	WireSubscriptionBridge(const WireSubscriptionBridge&) = delete;
	WireSubscriptionBridge& operator=(const WireSubscriptionBridge&) = delete;
};

} // namespace Subgate

#endif // SUBGATE_ADMISSION_WIRE_BRIDGE_H_
