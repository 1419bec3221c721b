#include "lock_controller.h"

#include <glog/logging.h>

namespace Subgate {

absl::btree_set<Key> LockRequest::AllowedKeys() const {
	absl::btree_set<Key> allowed;
	if (const auto* allow = std::get_if<Allow>(&request_)) {
		for (const auto& key : allow->keys) {
			if (!key.empty()) {
				allowed.insert(key);
			}
		}
	}
	return allowed;
}

std::vector<Key> LockController::Engage(const LockRequest& request, BoundedOrderedPool& fast_pool,
		bool& notify_listeners) {
	const bool was_active = state_.active;
	state_.active = true;
	state_.allowed = request.AllowedKeys();

	// Filter before repinning so that capacity trimming cannot pick allowed keys
	std::vector<Key> evicted = fast_pool.FilterTo(state_.allowed);
	std::vector<Key> trimmed = fast_pool.SetCapacity(state_.allowed.size());
	evicted.insert(evicted.end(), trimmed.begin(), trimmed.end());

	notify_listeners = !was_active || !state_.allowed.empty();

	VLOG(1) << "[LockController] " << (was_active ? "Re-engaged" : "Engaged") << " with "
		<< state_.allowed.size() << " allowed key(s), evicted " << evicted.size();
	return evicted;
}

bool LockController::Release(BoundedOrderedPool& fast_pool, size_t normal_capacity,
		std::vector<Key>& evicted) {
	if (!state_.active) {
		return false;
	}
	state_ = LockState{};
	evicted = fast_pool.SetCapacity(normal_capacity);
	if (!evicted.empty()) {
		LOG(WARNING) << "[LockController] Release shrank fast capacity to " << normal_capacity
			<< ", evicted " << evicted.size();
	}
	VLOG(1) << "[LockController] Released, fast capacity " << normal_capacity;
	return true;
}

} // namespace Subgate
