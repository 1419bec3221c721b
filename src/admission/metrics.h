#ifndef SUBGATE_ADMISSION_METRICS_H_
#define SUBGATE_ADMISSION_METRICS_H_

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "pane_registry.h"
#include "types.h"

namespace Subgate {

struct SubscriptionMetrics {
	struct Counts {
		size_t fast = 0;
		size_t slow = 0;
	} counts;
	// limits.fast is the enforced value; limits.normal the unlocked-equivalent one
	CapacityLimits limits;
};

// Metrics plus the state behind them, for debug overlays and tooling
struct SubscriptionSnapshot {
	SubscriptionMetrics metrics;
	LockState lock;
	std::vector<Key> fast_keys;
	std::vector<Key> slow_keys;
	std::vector<std::pair<std::string, PaneRecord>> panes;
};

inline std::ostream& operator<<(std::ostream& os, const SubscriptionMetrics& m) {
	return os << "counts{fast=" << m.counts.fast << ", slow=" << m.counts.slow << "} limits{fast="
		<< m.limits.fast << ", slow=" << m.limits.slow << ", normal=" << m.limits.normal << "}";
}

} // namespace Subgate

#endif // SUBGATE_ADMISSION_METRICS_H_
