#include "capacity.h"

namespace Subgate {

CapacityLimits ComputeCapacityLimits(const PaneCountRegistry& panes, const LockState& lock) {
	CapacityLimits limits;
	limits.normal = panes.TotalVisible() + kFastBufferMargin;
	limits.fast = lock.active ? lock.allowed.size() : limits.normal;
	limits.slow = panes.TotalRendered();
	return limits;
}

} // namespace Subgate
