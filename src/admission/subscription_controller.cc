#include "subscription_controller.h"

#include <iterator>

#include <glog/logging.h>

namespace Subgate {

namespace {

void AppendKeys(std::vector<Key>& dst, std::vector<Key>&& src) {
	dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
}

} // namespace

SubscriptionController::SubscriptionController()
	: fast_pool_(TierName(Tier::kFast), kFastBufferMargin),
	  slow_pool_(TierName(Tier::kSlow), 0) {
	last_metrics_ = MetricsLocked();
	VLOG(3) << "\t[SubscriptionController]\tConstructed";
}

SubscriptionController::~SubscriptionController() {
	VLOG(3) << "\t[SubscriptionController]\tDestructed";
}

void SubscriptionController::UpdatePaneVisibleCount(const std::string& pane_id, double count) {
	absl::MutexLock op_lock(&op_mutex_);
	EvictionBatch batch;
	{
		absl::MutexLock lock(&state_mutex_);
		panes_.SetVisibleCount(pane_id, PaneCountRegistry::ClampCount(count));
		batch = ApplyCapacities();
	}
	Deliver(batch, std::nullopt);
}

void SubscriptionController::UpdatePaneRenderedCount(const std::string& pane_id, double count) {
	absl::MutexLock op_lock(&op_mutex_);
	EvictionBatch batch;
	{
		absl::MutexLock lock(&state_mutex_);
		panes_.SetRenderedCount(pane_id, PaneCountRegistry::ClampCount(count));
		batch = ApplyCapacities();
	}
	Deliver(batch, std::nullopt);
}

AdmissionOutcome SubscriptionController::RegisterFastSubscription(const Key& key) {
	absl::MutexLock op_lock(&op_mutex_);
	EvictionBatch batch;
	AdmissionOutcome outcome;
	{
		absl::MutexLock lock(&state_mutex_);
		if (key.empty()) {
			outcome = AdmissionOutcome::kIgnored;
		} else if (fast_pool_.Contains(key)) {
			outcome = AdmissionOutcome::kAlreadyPresent;
		} else if (!lock_.Admits(key)) {
			if (slow_pool_.Contains(key)) {
				outcome = AdmissionOutcome::kRefusedSilently;
			} else {
				VLOG(2) << "[SubscriptionController] Refused " << key << " while locked";
				batch.fast.push_back(key);
				outcome = AdmissionOutcome::kRefused;
			}
		} else {
			// Upgrade: the key stays subscribed, only its tier changes
			outcome = slow_pool_.Remove(key) ? AdmissionOutcome::kUpgraded : AdmissionOutcome::kAdmitted;
			batch.fast = fast_pool_.Register(key);
		}
	}
	Deliver(batch, std::nullopt);
	return outcome;
}

AdmissionOutcome SubscriptionController::RegisterSlowSubscription(const Key& key) {
	absl::MutexLock op_lock(&op_mutex_);
	EvictionBatch batch;
	AdmissionOutcome outcome;
	{
		absl::MutexLock lock(&state_mutex_);
		// No implicit downgrade of fast keys
		if (key.empty() || fast_pool_.Contains(key)) {
			outcome = AdmissionOutcome::kIgnored;
		} else if (slow_pool_.Contains(key)) {
			outcome = AdmissionOutcome::kAlreadyPresent;
		} else {
			outcome = AdmissionOutcome::kAdmitted;
			batch.slow = slow_pool_.Register(key);
		}
	}
	Deliver(batch, std::nullopt);
	return outcome;
}

bool SubscriptionController::DeregisterFastSubscription(const Key& key) {
	absl::MutexLock op_lock(&op_mutex_);
	bool removed;
	{
		absl::MutexLock lock(&state_mutex_);
		removed = fast_pool_.Remove(key);
	}
	if (removed) {
		Deliver(std::nullopt, std::nullopt);
	}
	return removed;
}

bool SubscriptionController::DeregisterSlowSubscription(const Key& key) {
	absl::MutexLock op_lock(&op_mutex_);
	bool removed;
	{
		absl::MutexLock lock(&state_mutex_);
		removed = slow_pool_.Remove(key);
	}
	if (removed) {
		Deliver(std::nullopt, std::nullopt);
	}
	return removed;
}

void SubscriptionController::EngageSubscriptionLock(const LockRequest& request) {
	absl::MutexLock op_lock(&op_mutex_);
	EvictionBatch batch;
	std::optional<LockState> lock_event;
	{
		absl::MutexLock lock(&state_mutex_);
		bool notify = false;
		batch.fast = lock_.Engage(request, fast_pool_, notify);
		if (notify) {
			lock_event = lock_.state();
		}
	}
	Deliver(batch, lock_event);
}

void SubscriptionController::ReleaseSubscriptionLock() {
	absl::MutexLock op_lock(&op_mutex_);
	EvictionBatch batch;
	std::optional<LockState> lock_event;
	{
		absl::MutexLock lock(&state_mutex_);
		const size_t normal = ComputeCapacityLimits(panes_, lock_.state()).normal;
		if (lock_.Release(fast_pool_, normal, batch.fast)) {
			lock_event = lock_.state();
		}
	}
	Deliver(batch, lock_event);
}

bool SubscriptionController::IsSubscriptionLockActive() const {
	absl::ReaderMutexLock lock(&state_mutex_);
	return lock_.active();
}

std::vector<Key> SubscriptionController::GetSubscriptionLockAllowedKeys() const {
	absl::ReaderMutexLock lock(&state_mutex_);
	const auto& allowed = lock_.state().allowed;
	return std::vector<Key>(allowed.begin(), allowed.end());
}

SubscriptionHandle SubscriptionController::OnSubscriptionEvictions(EvictionCallback callback) {
	return eviction_listeners_.Add(std::move(callback));
}

SubscriptionHandle SubscriptionController::OnSubscriptionLockChange(LockChangeCallback callback) {
	return lock_listeners_.Add(std::move(callback));
}

SubscriptionHandle SubscriptionController::OnSubscriptionMetricsChange(MetricsChangeCallback callback) {
	// Held so the first snapshot cannot overtake a concurrent Deliver()
	absl::MutexLock op_lock(&op_mutex_);
	SubscriptionSnapshot snapshot = GetSubscriptionSnapshot();
	try {
		callback(snapshot);
	} catch (const std::exception& e) {
		LOG(ERROR) << "[SubscriptionController] Metrics listener threw on first delivery: " << e.what();
	} catch (...) {
		LOG(ERROR) << "[SubscriptionController] Metrics listener threw a non-standard exception on first delivery";
	}
	return metrics_listeners_.Add(std::move(callback));
}

bool SubscriptionController::Unsubscribe(SubscriptionHandle handle) {
	if (handle == kInvalidSubscriptionHandle) {
		return false;
	}
	return eviction_listeners_.Remove(handle) ||
		lock_listeners_.Remove(handle) ||
		metrics_listeners_.Remove(handle);
}

SubscriptionMetrics SubscriptionController::GetSubscriptionMetrics() const {
	absl::ReaderMutexLock lock(&state_mutex_);
	return MetricsLocked();
}

SubscriptionSnapshot SubscriptionController::GetSubscriptionSnapshot() const {
	absl::ReaderMutexLock lock(&state_mutex_);
	return SnapshotLocked();
}

void SubscriptionController::Reset() {
	absl::MutexLock op_lock(&op_mutex_);
	{
		absl::MutexLock lock(&state_mutex_);
		panes_.Clear();
		fast_pool_.Clear();
		slow_pool_.Clear();
		lock_.Reset();
		ApplyCapacities();
	}
	VLOG(1) << "[SubscriptionController] Reset";
	Deliver(std::nullopt, std::nullopt, true);
}

EvictionBatch SubscriptionController::ApplyCapacities() {
	const CapacityLimits limits = ComputeCapacityLimits(panes_, lock_.state());
	EvictionBatch batch;
	AppendKeys(batch.fast, fast_pool_.SetCapacity(limits.fast));
	AppendKeys(batch.slow, slow_pool_.SetCapacity(limits.slow));
	return batch;
}

SubscriptionMetrics SubscriptionController::MetricsLocked() const {
	SubscriptionMetrics metrics;
	metrics.counts.fast = fast_pool_.Size();
	metrics.counts.slow = slow_pool_.Size();
	metrics.limits = ComputeCapacityLimits(panes_, lock_.state());
	return metrics;
}

SubscriptionSnapshot SubscriptionController::SnapshotLocked() const {
	SubscriptionSnapshot snapshot;
	snapshot.metrics = MetricsLocked();
	snapshot.lock = lock_.state();
	snapshot.fast_keys = fast_pool_.Keys();
	snapshot.slow_keys = slow_pool_.Keys();
	snapshot.panes = panes_.Panes();
	return snapshot;
}

void SubscriptionController::Deliver(const std::optional<EvictionBatch>& batch,
		const std::optional<LockState>& lock_event, bool force_metrics) {
	if (batch.has_value()) {
		if (!batch->empty()) {
			VLOG(2) << "[SubscriptionController] Evicted fast=" << batch->fast.size()
				<< " slow=" << batch->slow.size();
		}
		eviction_listeners_.Publish(*batch);
	}
	if (lock_event.has_value()) {
		lock_listeners_.Publish(*lock_event);
	}

	SubscriptionMetrics metrics;
	bool lock_active;
	{
		absl::ReaderMutexLock lock(&state_mutex_);
		metrics = MetricsLocked();
		lock_active = lock_.active();
	}
	const bool changed = force_metrics ||
		!last_metrics_.has_value() ||
		last_lock_active_ != lock_active ||
		last_metrics_->counts.fast != metrics.counts.fast ||
		last_metrics_->counts.slow != metrics.counts.slow ||
		last_metrics_->limits != metrics.limits;
	if (!changed) {
		return;
	}
	last_metrics_ = metrics;
	last_lock_active_ = lock_active;
	if (metrics_listeners_.size() > 0) {
		metrics_listeners_.Publish(GetSubscriptionSnapshot());
	}
}

} // namespace Subgate
