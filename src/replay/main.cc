#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "admission/default_limit_store.h"
#include "admission/subscription_controller.h"
#include "common/configuration.h"
#include "trace_runner.h"

using namespace Subgate;

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	std::string trace_path;
	bool quiet = false;

	// Setup command line options
	cxxopts::Options options("subgate_replay", "Replay a subscription admission trace");

	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("trace", "YAML trace to replay", cxxopts::value<std::string>())
		("v,verbosity", "Log verbosity (overrides configuration)", cxxopts::value<int>())
		("b,default-base-limit", "Default inactive base limit", cxxopts::value<int64_t>())
		("quiet", "Do not log metrics after every operation")
		("h,help", "Print usage");

	Configuration& config = Configuration::getInstance();
	try {
		auto result = options.parse(argc, argv);
		if (result.count("help") || !result.count("trace")) {
			std::cout << options.help() << std::endl;
			return result.count("help") ? 0 : 1;
		}
		trace_path = result["trace"].as<std::string>();
		quiet = result.count("quiet") > 0;
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		return 1;
	}

	// --config, --verbosity and --default-base-limit
	if (!config.overrideFromCommandLine(argc, argv)) {
		LOG(ERROR) << "Invalid configuration";
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Validation error: " << error;
		}
		return 1;
	}
	if (quiet) {
		config.config().replay.print_metrics.set(false);
	}

	if (!config.validate()) {
		LOG(ERROR) << "Configuration validation failed";
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Validation error: " << error;
		}
		return 1;
	}

	FLAGS_logtostderr = config.getLogToStderr();
	FLAGS_v = config.getLogVerbosity();

	DefaultLimitStore base_limit(config.getDefaultInactiveBaseLimit());
	LOG(INFO) << "Default inactive base limit: " << base_limit.Get();

	SubscriptionController controller;
	TraceRunner runner(controller, std::make_shared<LoggingWireSender>(),
			config.config().replay.print_metrics.get());

	if (!runner.RunFile(trace_path)) {
		return 1;
	}
	LOG(INFO) << "Final " << controller.GetSubscriptionMetrics();
	return 0;
}
