#include "wire_bridge.h"

#include <stdexcept>

#include <glog/logging.h>

namespace Subgate {

WireSubscriptionBridge::WireSubscriptionBridge(SubscriptionController& controller,
		std::shared_ptr<IWireSubscriptionSender> sender)
	: controller_(controller),
	  sender_(std::move(sender)) {
	if (!sender_) {
		throw std::invalid_argument("WireSubscriptionBridge requires a sender");
	}
	SubscriptionHandle handle = controller_.OnSubscriptionEvictions(
			[this](const EvictionBatch& batch) { OnEvictions(batch); });
	eviction_subscription_ = ScopedSubscription([&controller, handle]() {
		controller.Unsubscribe(handle);
	});
	VLOG(3) << "\t[WireSubscriptionBridge]\tConstructed";
}

WireSubscriptionBridge::~WireSubscriptionBridge() {
	eviction_subscription_.Release();
	VLOG(3) << "\t[WireSubscriptionBridge]\tDestructed, sent " << subscribes_sent()
		<< " subscribe(s) and " << unsubscribes_sent() << " unsubscribe(s)";
}

bool WireSubscriptionBridge::Admit(const Key& key, Tier tier) {
	if (!ParseSubscriptionKey(key).has_value()) {
		LOG(WARNING) << "[WireSubscriptionBridge] Ignoring malformed key '" << key << "'";
		return false;
	}
	{
		absl::MutexLock lock(&mutex_);
		state(tier).pending.insert(key);
	}

	const AdmissionOutcome outcome = tier == Tier::kFast
		? controller_.RegisterFastSubscription(key)
		: controller_.RegisterSlowSubscription(key);

	absl::MutexLock lock(&mutex_);
	TierState& target = state(tier);
	// Gone if an eviction already claimed the key
	const bool still_pending = target.pending.erase(key) > 0;

	switch (outcome) {
		case AdmissionOutcome::kAdmitted:
			if (still_pending) {
				SendSubscribeLocked(key, tier);
			}
			break;
		case AdmissionOutcome::kUpgraded:
			if (still_pending) {
				SendSubscribeLocked(key, tier);
			}
			if (slow_.live.contains(key)) {
				SendUnsubscribeLocked(key, Tier::kSlow);
			}
			break;
		case AdmissionOutcome::kAlreadyPresent:
		case AdmissionOutcome::kRefused:
		case AdmissionOutcome::kRefusedSilently:
		case AdmissionOutcome::kIgnored:
			VLOG(2) << "[WireSubscriptionBridge] No subscribe for " << TierName(tier) << " key " << key;
			break;
	}
	return target.live.contains(key);
}

bool WireSubscriptionBridge::Drop(const Key& key, Tier tier) {
	const bool removed = tier == Tier::kFast
		? controller_.DeregisterFastSubscription(key)
		: controller_.DeregisterSlowSubscription(key);
	absl::MutexLock lock(&mutex_);
	if (state(tier).live.contains(key)) {
		SendUnsubscribeLocked(key, tier);
	}
	return removed;
}

bool WireSubscriptionBridge::IsSubscribed(const Key& key, Tier tier) const {
	absl::MutexLock lock(&mutex_);
	return (tier == Tier::kFast ? fast_ : slow_).live.contains(key);
}

void WireSubscriptionBridge::OnEvictions(const EvictionBatch& batch) {
	absl::MutexLock lock(&mutex_);
	for (const auto& key : batch.fast) {
		HandleEvictionLocked(key, Tier::kFast);
	}
	for (const auto& key : batch.slow) {
		HandleEvictionLocked(key, Tier::kSlow);
	}
}

void WireSubscriptionBridge::HandleEvictionLocked(const Key& key, Tier tier) {
	TierState& target = state(tier);
	// Cancels an in-flight admission; Admit() then sends nothing
	target.pending.erase(key);
	if (target.live.contains(key)) {
		SendUnsubscribeLocked(key, tier);
	}
}

void WireSubscriptionBridge::SendSubscribeLocked(const Key& key, Tier tier) {
	auto parsed = ParseSubscriptionKey(key);
	if (!parsed.has_value()) {
		return;
	}
	sender_->SendSubscribe(*parsed, tier);
	state(tier).live.insert(key);
	subscribes_sent_.fetch_add(1, std::memory_order_relaxed);
}

void WireSubscriptionBridge::SendUnsubscribeLocked(const Key& key, Tier tier) {
	auto parsed = ParseSubscriptionKey(key);
	if (!parsed.has_value()) {
		LOG(WARNING) << "[WireSubscriptionBridge] Cannot unsubscribe malformed " << TierName(tier)
			<< " key '" << key << "'";
		return;
	}
	sender_->SendUnsubscribe(*parsed, tier);
	state(tier).live.erase(key);
	unsubscribes_sent_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace Subgate
