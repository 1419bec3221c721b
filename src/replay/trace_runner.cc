#include "trace_runner.h"

#include <vector>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Subgate {

void LoggingWireSender::SendSubscribe(const SubscriptionKey& key, Tier tier) {
	LOG(INFO) << "SUBSCRIBE   [" << TierName(tier) << "] pair=" << key.pair << " token=" << key.token
		<< " chain=" << key.chain;
}

void LoggingWireSender::SendUnsubscribe(const SubscriptionKey& key, Tier tier) {
	LOG(INFO) << "UNSUBSCRIBE [" << TierName(tier) << "] pair=" << key.pair << " token=" << key.token
		<< " chain=" << key.chain;
}

TraceRunner::TraceRunner(SubscriptionController& controller,
		std::shared_ptr<IWireSubscriptionSender> sender, bool print_metrics)
	: controller_(controller),
	  bridge_(controller, std::move(sender)),
	  print_metrics_(print_metrics) {
	SubscriptionHandle handle = controller_.OnSubscriptionEvictions([this](const EvictionBatch& batch) {
		stats_.batches++;
		stats_.fast_evicted += batch.fast.size();
		stats_.slow_evicted += batch.slow.size();
	});
	stats_subscription_ = ScopedSubscription([&controller, handle]() {
		controller.Unsubscribe(handle);
	});
}

TraceRunner::~TraceRunner() {
	stats_subscription_.Release();
}

bool TraceRunner::RunFile(const std::string& path) {
	try {
		return Run(YAML::LoadFile(path));
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to load trace " << path << ": " << e.what();
		return false;
	}
}

bool TraceRunner::RunString(const std::string& yaml_content) {
	try {
		return Run(YAML::Load(yaml_content));
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse trace: " << e.what();
		return false;
	}
}

bool TraceRunner::Run(const YAML::Node& trace) {
	const YAML::Node ops = trace["ops"];
	if (!ops || !ops.IsSequence()) {
		LOG(ERROR) << "Trace has no 'ops' sequence";
		return false;
	}
	for (size_t i = 0; i < ops.size(); ++i) {
		try {
			if (!Apply(ops[i], i)) {
				return false;
			}
		} catch (const YAML::Exception& e) {
			LOG(ERROR) << "Trace op #" << i << " is malformed: " << e.what();
			return false;
		}
		stats_.operations++;
		if (print_metrics_) {
			LOG(INFO) << "#" << i << " " << controller_.GetSubscriptionMetrics();
		}
	}
	LOG(INFO) << "Replayed " << stats_.operations << " op(s): " << stats_.fast_evicted
		<< " fast and " << stats_.slow_evicted << " slow eviction(s)";
	return true;
}

bool TraceRunner::Apply(const YAML::Node& op, size_t index) {
	const std::string name = op["op"].as<std::string>();
	VLOG(2) << "Trace op #" << index << ": " << name;

	if (name == "visible") {
		controller_.UpdatePaneVisibleCount(op["pane"].as<std::string>(), op["count"].as<double>());
	} else if (name == "rendered") {
		controller_.UpdatePaneRenderedCount(op["pane"].as<std::string>(), op["count"].as<double>());
	} else if (name == "fast") {
		bridge_.AdmitFast(op["key"].as<std::string>());
	} else if (name == "slow") {
		bridge_.AdmitSlow(op["key"].as<std::string>());
	} else if (name == "drop_fast") {
		bridge_.Drop(op["key"].as<std::string>(), Tier::kFast);
	} else if (name == "drop_slow") {
		bridge_.Drop(op["key"].as<std::string>(), Tier::kSlow);
	} else if (name == "lock") {
		if (op["allow"]) {
			controller_.EngageSubscriptionLock(
					LockRequest::AllowOnly(op["allow"].as<std::vector<std::string>>()));
		} else {
			controller_.EngageSubscriptionLock(LockRequest::DenyAllKeys());
		}
	} else if (name == "lock_all") {
		controller_.EngageSubscriptionLock(LockRequest::DenyAllKeys());
	} else if (name == "release") {
		controller_.ReleaseSubscriptionLock();
	} else if (name == "reset") {
		controller_.Reset();
	} else if (name == "metrics") {
		LOG(INFO) << "#" << index << " " << controller_.GetSubscriptionMetrics();
	} else {
		LOG(ERROR) << "Unknown trace op '" << name << "' at #" << index;
		return false;
	}
	return true;
}

} // namespace Subgate
