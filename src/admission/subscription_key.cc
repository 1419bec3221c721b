#include "subscription_key.h"

#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

#include "common/config.h"

namespace Subgate {

Key SubscriptionKey::ToString() const {
	const char sep[] = {kKeySeparator, '\0'};
	return absl::StrCat(pair, sep, token, sep, chain);
}

std::optional<SubscriptionKey> ParseSubscriptionKey(const Key& key) {
	std::vector<std::string> parts = absl::StrSplit(key, kKeySeparator);
	if (parts.size() != 3) {
		return std::nullopt;
	}
	for (const auto& part : parts) {
		if (part.empty()) {
			return std::nullopt;
		}
	}
	return SubscriptionKey{std::move(parts[0]), std::move(parts[1]), std::move(parts[2])};
}

} // namespace Subgate
