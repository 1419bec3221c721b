#ifndef SUBGATE_ADMISSION_SUBSCRIPTION_KEY_H_
#define SUBGATE_ADMISSION_SUBSCRIPTION_KEY_H_

#include <optional>
#include <string>

#include "types.h"

namespace Subgate {

// Wire-level identity of a streamable entity
struct SubscriptionKey {
	std::string pair;
	std::string token;
	std::string chain;

	// "pair|token|chain"
	Key ToString() const;

	bool operator==(const SubscriptionKey& other) const {
		return pair == other.pair && token == other.token && chain == other.chain;
	}
};

/**
 * Split a "pair|token|chain" key. Returns nullopt unless there are exactly
 * three non-empty fields.
 */
std::optional<SubscriptionKey> ParseSubscriptionKey(const Key& key);

} // namespace Subgate

#endif // SUBGATE_ADMISSION_SUBSCRIPTION_KEY_H_
