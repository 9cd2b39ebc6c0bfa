#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/config.h"
#include "common/configuration.h"
#include "common/env_flags.h"
#include "kernel/sweep_controller.h"
#include "session/sim_session.h"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void HandleStopSignal(int) {
	g_stop_requested = 1;
}

IsingSim::SweepConfig SweepConfigFromSettings(const IsingSim::IsingSimConfig& config, bool anneal) {
	const auto& sweep = config.sweep;
	if (anneal) {
		return IsingSim::MakeAnnealConfig(
				static_cast<float>(sweep.t_initial.get()),
				static_cast<float>(sweep.t_final.get()),
				static_cast<float>(sweep.t_step.get()),
				std::chrono::milliseconds(sweep.equilibration_wait_ms.get()),
				std::chrono::milliseconds(sweep.step_wait_ms.get()),
				sweep.reinitialize_first.get(),
				sweep.save_snapshots.get());
	}
	IsingSim::SweepConfig sweep_config;
	sweep_config.t_initial = static_cast<float>(sweep.t_initial.get());
	sweep_config.t_final = static_cast<float>(sweep.t_final.get());
	sweep_config.t_step = static_cast<float>(sweep.t_step.get());
	sweep_config.sample_points = sweep.sample_points.get();
	sweep_config.sample_wait = std::chrono::milliseconds(sweep.sample_wait_ms.get());
	sweep_config.step_wait = std::chrono::milliseconds(sweep.step_wait_ms.get());
	sweep_config.equilibration_wait = std::chrono::milliseconds(sweep.equilibration_wait_ms.get());
	sweep_config.save_snapshots = sweep.save_snapshots.get();
	sweep_config.reinitialize_first = sweep.reinitialize_first.get();
	return sweep_config;
}

// One CSV line per sample: T,point,M,c(1),c(2),...
void PrintReport(const IsingSim::SweepReport& report) {
	std::cout << "temperature,point,magnetization,correlation..." << std::endl;
	for (const auto& sample : report.samples) {
		std::cout << sample.temperature << "," << sample.point << "," << sample.magnetization;
		for (double c : sample.correlation) {
			std::cout << "," << c;
		}
		std::cout << std::endl;
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	// Parse command line arguments
	cxxopts::Options options("isingsim", "Live Metropolis Monte Carlo Ising simulation");

	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("graph_size", "Lattice side length", cxxopts::value<int>())
		("continuous", "Use continuous spins in [-1, 1]")
		("unweighted", "Nearest-neighbour couplings only")
		("temperature", "Initial temperature", cxxopts::value<double>())
		("duration", "Seconds to run, 0 runs until interrupted", cxxopts::value<int>())
		("sweep", "Run a temperature sweep with sampling")
		("anneal", "Run an annealing schedule with snapshots")
		("defects", "Fraction of sites turned into defects at start", cxxopts::value<double>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	IsingSim::Configuration& configuration = IsingSim::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string path = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			for (const auto& e : configuration.getValidationErrors()) {
				LOG(ERROR) << "Config: " << e;
			}
			LOG(ERROR) << "Failed to load configuration from " << path;
			return EXIT_FAILURE;
		}
		LOG(INFO) << "Loaded configuration from " << path;
	}

	IsingSim::IsingSimConfig& config = configuration.config();
	if (arguments.count("graph_size")) config.simulation.graph_size.set(arguments["graph_size"].as<int>());
	if (arguments.count("continuous")) config.simulation.continuous.set(true);
	if (arguments.count("unweighted")) config.simulation.weighted.set(false);
	if (arguments.count("temperature")) config.simulation.initial_temperature.set(arguments["temperature"].as<double>());
	if (arguments.count("duration")) config.driver.duration_s.set(arguments["duration"].as<int>());

	if (!configuration.validate()) {
		for (const auto& e : configuration.getValidationErrors()) {
			LOG(ERROR) << "Config: " << e;
		}
		return EXIT_FAILURE;
	}

	// *************** Session **********************
	IsingSim::SessionOptions session_options = IsingSim::SessionOptions::FromConfig(config);
	session_options.inline_tasks = IsingSim::ReadEnvBoolStrict("ISINGSIM_INLINE_TASKS", false);

	std::signal(SIGINT, HandleStopSignal);
	std::signal(SIGTERM, HandleStopSignal);

	IsingSim::SimSession session(session_options);
	if (arguments.count("defects")) {
		session.AddRandomDefects(arguments["defects"].as<double>());
	}
	session.Start();

	const bool sweep = arguments.count("sweep") > 0;
	const bool anneal = arguments.count("anneal") > 0;
	if (sweep || anneal) {
		if (!session.StartSweep(SweepConfigFromSettings(config, anneal))) {
			LOG(ERROR) << "Sweep could not be started";
			session.Shutdown();
			return EXIT_FAILURE;
		}
	}

	// *************** Frame driver **********************
	const auto frame_period = std::chrono::microseconds(1000000 / config.driver.frame_rate.get());
	const int duration_s = config.driver.duration_s.get();
	const auto start = std::chrono::steady_clock::now();
	auto next_frame = start;
	auto next_log = start + std::chrono::milliseconds(IsingSim::kStatsLogPeriodMs);
	int exit_code = EXIT_SUCCESS;

	LOG(INFO) << "Driving frames at " << config.driver.frame_rate.get() << " Hz"
		<< (sweep || anneal ? " until the sweep ends"
			: duration_s > 0 ? " for " + std::to_string(duration_s) + " s" : " until interrupted");

	while (!g_stop_requested) {
		const auto now = std::chrono::steady_clock::now();
		// A sweep owns the schedule and replaces the fixed duration
		if (sweep || anneal) {
			if (session.LastSweepStatus().has_value()) {
				break;
			}
		} else if (duration_s > 0 && now - start >= std::chrono::seconds(duration_s)) {
			break;
		}
		if (!session.Healthy()) {
			try {
				session.CheckHealth();
			} catch (const std::exception& e) {
				LOG(ERROR) << "Hot loop failed: " << e.what();
			}
			exit_code = EXIT_FAILURE;
			break;
		}

		session.TimedFunctions();

		if (now >= next_log) {
			IsingSim::SharedSimState& state = session.State();
			LOG(INFO) << "T=" << state.Temperature()
				<< " upf=" << state.UpdatesPerFrame()
				<< " M=" << state.Magnetization()
				<< " phase=" << IsingSim::HotLoopPhaseName(state.Phase())
				<< (state.AnalysisRunning() ? " sweep" : "");
			next_log += std::chrono::milliseconds(IsingSim::kStatsLogPeriodMs);
		}

		next_frame += frame_period;
		std::this_thread::sleep_until(next_frame);
	}

	if (g_stop_requested) {
		LOG(INFO) << "Interrupted, shutting down";
	}
	session.Shutdown();

	if (sweep || anneal) {
		const auto status = session.LastSweepStatus();
		if (status.has_value()) {
			LOG(INFO) << "Sweep " << IsingSim::SweepStatusName(*status);
			PrintReport(session.LastSweepReport());
			if (*status == IsingSim::SweepStatus::kFailed) {
				exit_code = EXIT_FAILURE;
			}
		}
	}
	return exit_code;
}
