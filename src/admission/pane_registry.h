#ifndef SUBGATE_ADMISSION_PANE_REGISTRY_H_
#define SUBGATE_ADMISSION_PANE_REGISTRY_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"

namespace Subgate {

struct PaneRecord {
	size_t visible_count = 0;
	// Visible plus buffered rows
	size_t rendered_count = 0;
};

/**
 * Per-pane row counts reported by the visibility tracker. Records are
 * upserted on first write and only dropped by Clear().
 */
class PaneCountRegistry {
public:
	PaneCountRegistry() = default;

	/**
	 * Normalize a raw count: non-finite or negative input becomes 0,
	 * fractions are floored and very large values saturate.
	 */
	static size_t ClampCount(double count);

	void SetVisibleCount(const std::string& pane_id, size_t count);
	void SetRenderedCount(const std::string& pane_id, size_t count);

	size_t TotalVisible() const;
	size_t TotalRendered() const;

	// Records ordered by pane id
	std::vector<std::pair<std::string, PaneRecord>> Panes() const;

	size_t size() const { return panes_.size(); }
	void Clear() { panes_.clear(); }

private:
	absl::btree_map<std::string, PaneRecord> panes_;
};

} // namespace Subgate

#endif // SUBGATE_ADMISSION_PANE_REGISTRY_H_
