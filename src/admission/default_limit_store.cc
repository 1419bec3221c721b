#include "default_limit_store.h"

#include <algorithm>

#include <glog/logging.h>

namespace Subgate {

DefaultLimitStore::DefaultLimitStore(int64_t initial)
	: value_(std::max<int64_t>(0, initial)) {}

int64_t DefaultLimitStore::Get() const {
	absl::MutexLock lock(&mutex_);
	return value_;
}

void DefaultLimitStore::Set(int64_t value) {
	const int64_t safe = std::max<int64_t>(0, value);
	{
		absl::MutexLock lock(&mutex_);
		if (safe == value_) {
			return;
		}
		value_ = safe;
	}
	VLOG(1) << "[DefaultLimitStore] Base limit set to " << safe;
	listeners_.Publish(safe);
}

SubscriptionHandle DefaultLimitStore::OnChange(ChangeCallback callback) {
	return listeners_.Add(std::move(callback));
}

} // namespace Subgate
