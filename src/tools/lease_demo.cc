// Runs several coordinators against one shared in-memory lease store, each
// standing in for a separate consumer process, and shows how consumption
// moves between them when the current owner dies without unregistering.

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "lease/clock.h"
#include "lease/in_memory_lease_store.h"
#include "lease/lease_coordinator.h"
#include "lease/retry_strategy.h"

using namespace Leasehold;

namespace {

class LoggingListener : public CompetingConsumerListener {
public:
	void OnConsumeGranted(const std::string& subscription_id, const std::string& subscriber_id) override {
		LOG(INFO) << "[" << subscriber_id << "] may now consume " << subscription_id;
	}

	void OnConsumeProhibited(const std::string& subscription_id, const std::string& subscriber_id) override {
		LOG(INFO) << "[" << subscriber_id << "] must stop consuming " << subscription_id;
	}
};

struct Process {
	std::string subscriber_id;
	std::unique_ptr<LeaseCoordinator> coordinator;
	bool alive = true;
};

} // namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1;

	cxxopts::Options options("lease_demo", "Competing consumers sharing one subscription");
	options.allow_unrecognised_options();
	options.add_options()
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("s,subscription", "Subscription id", cxxopts::value<std::string>()->default_value("orders"))
		("p,processes", "Number of competing processes", cxxopts::value<int>()->default_value("3"))
		("lease_time_ms", "Lease time, overrides the configuration", cxxopts::value<int64_t>()->default_value("0"))
		("kill_after_ms", "Crash the current owner after this long (0 = never)", cxxopts::value<int64_t>()->default_value("3000"))
		("d,duration_ms", "How long to run", cxxopts::value<int64_t>()->default_value("10000"))
		("h,help", "Print usage");

	auto result = options.parse(argc, argv);
	if (result.count("help")) {
		std::cout << options.help() << std::endl;
		return 0;
	}
	FLAGS_v = result["log_level"].as<int>();

	// --config, --lease-time, --retry-strategy, ... are picked up here
	Configuration& config = Configuration::getInstance();
	config.overrideFromCommandLine(argc, argv);
	int64_t lease_time_ms = result["lease_time_ms"].as<int64_t>();
	if (lease_time_ms > 0) {
		config.config().coordinator.lease_time_ms.set(lease_time_ms);
		config.config().coordinator.refresh_interval_ms.set(0);
	}
	if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Config validation error: " << error;
		}
		return 1;
	}

	const std::string subscription_id = result["subscription"].as<std::string>();
	const int num_processes = result["processes"].as<int>();
	if (num_processes < 1) {
		LOG(ERROR) << "Need at least one process";
		return 1;
	}

	LOG(INFO) << "Lease time " << config.getLeaseTimeMs() << "ms, refresh every "
		<< config.getRefreshIntervalMs() << "ms, collection " << config.getLeaseCollection();

	auto store = std::make_shared<InMemoryLeaseStore>(config.getLeaseCollection());
	auto clock = std::make_shared<SystemClock>();
	auto listener = std::make_shared<LoggingListener>();
	RetryStrategy retry;
	LeaseCoordinatorOptions coordinator_options;
	try {
		retry = RetryStrategy::FromConfig(config.config().retry);
		coordinator_options = LeaseCoordinatorOptions::FromConfig(config);
	} catch (const std::invalid_argument& e) {
		LOG(ERROR) << "Invalid configuration: " << e.what();
		return 1;
	}

	std::vector<Process> processes;
	for (int i = 0; i < num_processes; ++i) {
		Process process;
		process.subscriber_id = "subscriber-" + std::to_string(i);
		process.coordinator = std::make_unique<LeaseCoordinator>(store, clock, retry, coordinator_options);
		process.coordinator->AddListener(listener);
		process.coordinator->ScheduleRefresh();
		bool acquired = process.coordinator->RegisterCompetingConsumer(subscription_id, process.subscriber_id);
		LOG(INFO) << process.subscriber_id << " registered, lock " << (acquired ? "acquired" : "not acquired");
		processes.push_back(std::move(process));
	}

	const auto start = std::chrono::steady_clock::now();
	const auto duration = std::chrono::milliseconds(result["duration_ms"].as<int64_t>());
	const auto kill_after = std::chrono::milliseconds(result["kill_after_ms"].as<int64_t>());
	bool killed = kill_after.count() <= 0;

	while (std::chrono::steady_clock::now() - start < duration) {
		if (!killed && std::chrono::steady_clock::now() - start >= kill_after) {
			for (auto& process : processes) {
				if (process.alive && process.coordinator->HasLock(subscription_id, process.subscriber_id)) {
					// Crash: stop renewing without releasing the lease.
					LOG(INFO) << "Crashing " << process.subscriber_id;
					process.coordinator->Shutdown();
					process.alive = false;
					break;
				}
			}
			killed = true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(500));
	}

	for (auto& process : processes) {
		if (process.alive) {
			process.coordinator->UnregisterCompetingConsumer(subscription_id, process.subscriber_id);
		}
		process.coordinator->Shutdown();
	}
	LOG(INFO) << "Done";
	return 0;
}
