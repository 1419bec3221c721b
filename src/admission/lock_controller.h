#ifndef SUBGATE_ADMISSION_LOCK_CONTROLLER_H_
#define SUBGATE_ADMISSION_LOCK_CONTROLLER_H_

#include <variant>
#include <vector>

#include "bounded_pool.h"
#include "types.h"

namespace Subgate {

/**
 * Argument of EngageSubscriptionLock: either block the whole fast tier or
 * admit only the listed keys.
 */
class LockRequest {
public:
	struct DenyAll {};
	struct Allow {
		std::vector<Key> keys;
	};

	static LockRequest DenyAllKeys() { return LockRequest(DenyAll{}); }
	static LockRequest AllowOnly(std::vector<Key> keys) { return LockRequest(Allow{std::move(keys)}); }

	bool deny_all() const { return std::holds_alternative<DenyAll>(request_); }

	// Deduplicated allow-list with empty keys dropped; empty for DenyAll
	absl::btree_set<Key> AllowedKeys() const;

private:
	explicit LockRequest(std::variant<DenyAll, Allow> request) : request_(std::move(request)) {}

	std::variant<DenyAll, Allow> request_;
};

/**
 * Unlocked/Locked state machine over the fast pool.
 *
 * Engaging filters the fast pool to the allow-list and pins its capacity to
 * the allow-list size; allowed keys that are not members are never added.
 * Releasing restores the normal capacity and adds nothing back.
 */
class LockController {
public:
	LockController() = default;

	/**
	 * Enter (or re-enter) Locked with the request's allow-list.
	 *
	 * @param request Allow-list or DenyAll
	 * @param fast_pool Pool to filter and repin
	 * @param notify_listeners Set to true when lock listeners should hear about it
	 * @return Fast keys evicted, oldest first
	 */
	std::vector<Key> Engage(const LockRequest& request, BoundedOrderedPool& fast_pool,
			bool& notify_listeners);

	/**
	 * Leave Locked. A no-op returning false when already unlocked.
	 *
	 * @param fast_pool Pool whose capacity is restored
	 * @param normal_capacity Unlocked fast capacity to restore
	 * @param evicted Receives keys evicted if normal_capacity is below the pool size
	 */
	bool Release(BoundedOrderedPool& fast_pool, size_t normal_capacity, std::vector<Key>& evicted);

	// True if key may enter the fast pool in the current state
	bool Admits(const Key& key) const { return !state_.active || state_.allowed.contains(key); }

	const LockState& state() const { return state_; }
	bool active() const { return state_.active; }

	void Reset() { state_ = LockState{}; }

private:
	LockState state_;
};

} // namespace Subgate

#endif // SUBGATE_ADMISSION_LOCK_CONTROLLER_H_
