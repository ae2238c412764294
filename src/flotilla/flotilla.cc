#include <cstdlib>
#include <iostream>
#include <memory>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "absl/container/flat_hash_set.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "demo_fuzzer.h"
#include "launcher/centralized_launcher.h"
#include "launcher/fork_topology.h"
#include "launcher/launcher.h"
#include "shmem/shmem_provider.h"
#include "transport/centralized_event_manager.h"
#include "transport/endpoint_builder.h"

namespace {

Flotilla::ClientCallback MakeWorker(size_t iterations) {
	return [iterations](std::optional<std::string> state, std::unique_ptr<Flotilla::EventManager> manager,
			Flotilla::CoreId core) {
		Flotilla::DemoFuzzer fuzzer(std::move(manager), core, iterations);
		if (state) {
			fuzzer.RestoreState(*state);
		}
		return fuzzer.Run();
	};
}

// The main worker only keeps forwarded testcases that hit a bucket it has
// not been offered before.
Flotilla::ClientCallback MakeMainWorker(size_t iterations) {
	return [iterations](std::optional<std::string> state, std::unique_ptr<Flotilla::EventManager> manager,
			Flotilla::CoreId core) {
		if (auto* centralized = dynamic_cast<Flotilla::CentralizedEventManager*>(manager.get())) {
			auto offered = std::make_shared<absl::flat_hash_set<uint32_t>>();
			centralized->set_evaluator([offered](const Flotilla::ReceivedEvent& event) {
					return offered->insert(Flotilla::DemoFuzzer::Bucket(event.payload)).second;
					});
		}
		Flotilla::DemoFuzzer fuzzer(std::move(manager), core, iterations);
		if (state) {
			fuzzer.RestoreState(*state);
		}
		return fuzzer.Run();
	};
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	// Parse command line arguments
	cxxopts::Options options = Flotilla::Configuration::buildOptions();
	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	Flotilla::Configuration& configuration = Flotilla::Configuration::getInstance();
	if (!configuration.overrideFromCommandLine(arguments)) {
		return EXIT_FAILURE;
	}
	if (!configuration.validate()) {
		for (const auto& err : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << err;
		}
		return EXIT_FAILURE;
	}
	const Flotilla::FlotillaConfig& config = configuration.config();

	try {
		Flotilla::LaunchConfig launch = Flotilla::LaunchConfig::FromConfiguration(config);
		size_t iterations = config.demo.iterations.get();

		// *************** Initialize collaborators **********************
		Flotilla::PosixShMemProvider shmem;
		Flotilla::EndpointBuilder endpoints(shmem, config.state.slot_size.get());
		auto monitor = std::make_shared<Flotilla::LogMonitor>();

		std::vector<Flotilla::ExitStatus> statuses;
		if (config.launcher.centralized.get()) {
			Flotilla::ForkTopology topology(shmem);
			Flotilla::CentralizedLauncher launcher(std::move(launch), MakeWorker(iterations),
					MakeMainWorker(iterations), topology, endpoints, monitor);
			statuses = launcher.Launch();
		} else {
			std::unique_ptr<Flotilla::Topology> topology = Flotilla::MakeDefaultTopology(shmem);
			Flotilla::Launcher launcher(std::move(launch), MakeWorker(iterations), *topology, endpoints, monitor);
			statuses = launcher.Launch();
		}

		for (const auto& status : statuses) {
			VLOG(1) << "Worker " << status;
		}
	} catch (const Flotilla::LaunchError& e) {
		LOG(ERROR) << "Launch failed: " << e.what();
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Flotilla Terminating";
	return EXIT_SUCCESS;
}
