#include "pane_registry.h"

#include <cmath>

#include "common/config.h"

namespace Subgate {

size_t PaneCountRegistry::ClampCount(double count) {
	if (!std::isfinite(count) || count <= 0) {
		return 0;
	}
	if (count >= static_cast<double>(kMaxPaneRowCount)) {
		return kMaxPaneRowCount;
	}
	return static_cast<size_t>(std::floor(count));
}

void PaneCountRegistry::SetVisibleCount(const std::string& pane_id, size_t count) {
	panes_[pane_id].visible_count = count;
}

void PaneCountRegistry::SetRenderedCount(const std::string& pane_id, size_t count) {
	panes_[pane_id].rendered_count = count;
}

size_t PaneCountRegistry::TotalVisible() const {
	size_t total = 0;
	for (const auto& [pane_id, record] : panes_) {
		total += record.visible_count;
	}
	return total;
}

size_t PaneCountRegistry::TotalRendered() const {
	size_t total = 0;
	for (const auto& [pane_id, record] : panes_) {
		total += record.rendered_count;
	}
	return total;
}

std::vector<std::pair<std::string, PaneRecord>> PaneCountRegistry::Panes() const {
	return std::vector<std::pair<std::string, PaneRecord>>(panes_.begin(), panes_.end());
}

} // namespace Subgate
