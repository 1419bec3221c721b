#ifndef SUBGATE_ADMISSION_CAPACITY_H_
#define SUBGATE_ADMISSION_CAPACITY_H_

#include "pane_registry.h"
#include "types.h"

namespace Subgate {

/**
 * Derive tier capacities from pane counts and lock state.
 *
 *   normal = sum(visible) + kFastBufferMargin
 *   fast   = lock.active ? lock.allowed.size() : normal
 *   slow   = sum(rendered)
 */
CapacityLimits ComputeCapacityLimits(const PaneCountRegistry& panes, const LockState& lock);

} // namespace Subgate

#endif // SUBGATE_ADMISSION_CAPACITY_H_
