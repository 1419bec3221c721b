#ifndef SUBGATE_REPLAY_TRACE_RUNNER_H_
#define SUBGATE_REPLAY_TRACE_RUNNER_H_

#include <memory>
#include <string>

#include "admission/interfaces.h"
#include "admission/subscription_controller.h"
#include "admission/wire_bridge.h"

namespace YAML {
class Node;
}

namespace Subgate {

struct ReplayStats {
	size_t operations = 0;
	size_t batches = 0;
	size_t fast_evicted = 0;
	size_t slow_evicted = 0;
};

/**
 * Wire sender that only logs what it would put on the wire.
 */
class LoggingWireSender : public IWireSubscriptionSender {
public:
	void SendSubscribe(const SubscriptionKey& key, Tier tier) override;
	void SendUnsubscribe(const SubscriptionKey& key, Tier tier) override;
};

/**
 * Replays a YAML trace of visibility, admission and lock events against a
 * controller. The trace holds an "ops" sequence, e.g.
 *
 *   ops:
 *     - {op: visible, pane: trending, count: 5}
 *     - {op: fast, key: "0xpair|0xtoken|ETH"}
 *     - {op: lock, allow: ["0xpair|0xtoken|ETH"]}
 *     - {op: release}
 */
class TraceRunner {
public:
	TraceRunner(SubscriptionController& controller, std::shared_ptr<IWireSubscriptionSender> sender,
			bool print_metrics);
	~TraceRunner();

	bool RunFile(const std::string& path);
	bool RunString(const std::string& yaml_content);

	const ReplayStats& stats() const { return stats_; }

private:
	bool Run(const YAML::Node& trace);
	bool Apply(const YAML::Node& op, size_t index);

	SubscriptionController& controller_;
	WireSubscriptionBridge bridge_;
	ScopedSubscription stats_subscription_;
	const bool print_metrics_;
	ReplayStats stats_;
};

} // namespace Subgate

#endif // SUBGATE_REPLAY_TRACE_RUNNER_H_
