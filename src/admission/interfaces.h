#pragma once

#include "subscription_key.h"
#include "types.h"

namespace Subgate {

/**
 * Interface for the transport that carries subscribe/unsubscribe messages
 */
class IWireSubscriptionSender {
public:
    virtual ~IWireSubscriptionSender() = default;

    virtual void SendSubscribe(const SubscriptionKey& key, Tier tier) = 0;
    virtual void SendUnsubscribe(const SubscriptionKey& key, Tier tier) = 0;
};

} // namespace Subgate
