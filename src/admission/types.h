#ifndef SUBGATE_ADMISSION_TYPES_H_
#define SUBGATE_ADMISSION_TYPES_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/btree_set.h"

#include "common/config.h"

namespace Subgate {

// Opaque identifier of a streamable entity, usually "pair|token|chain"
using Key = std::string;

// Returned by every listener registration; 0 is never handed out
using SubscriptionHandle = uint64_t;
constexpr SubscriptionHandle kInvalidSubscriptionHandle = 0;

enum class Tier {
	kFast,
	kSlow,
};

inline const char* TierName(Tier tier) {
	return tier == Tier::kFast ? "fast" : "slow";
}

// What a Register*Subscription call did with its key
enum class AdmissionOutcome {
	kAdmitted,         // newly inserted; may be evicted again by the same call
	kUpgraded,         // moved from the slow pool to the fast pool
	kAlreadyPresent,   // already in the target pool, order unchanged
	kRefused,          // locked and outside the allow-list, reported in the batch
	kRefusedSilently,  // locked and outside the allow-list, still held by the slow pool
	kIgnored,          // empty key, or slow registration of a fast key
};

/**
 * Keys removed by one mutating call, oldest first within each tier.
 */
struct EvictionBatch {
	std::vector<Key> fast;
	std::vector<Key> slow;

	bool empty() const { return fast.empty() && slow.empty(); }
};

struct LockState {
	bool active = false;
	// Only meaningful while active
	absl::btree_set<Key> allowed;
};

struct CapacityLimits {
	size_t fast = kFastBufferMargin;
	size_t slow = 0;
	// Unlocked-equivalent fast capacity, kept current while locked
	size_t normal = kFastBufferMargin;

	bool operator==(const CapacityLimits& other) const {
		return fast == other.fast && slow == other.slow && normal == other.normal;
	}
	bool operator!=(const CapacityLimits& other) const { return !(*this == other); }
};

} // namespace Subgate

#endif // SUBGATE_ADMISSION_TYPES_H_
