#include "sweep_controller.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <glog/logging.h>
#include "absl/time/time.h"

#include "../common/config.h"
#include "../common/task_executor.h"

namespace IsingSim {

SweepConfig MakeAnnealConfig(float t_initial, float t_final, float t_step,
                             std::chrono::milliseconds initial_wait, std::chrono::milliseconds step_wait,
                             bool reinitialize, bool save_snapshots) {
	SweepConfig config;
	config.t_initial = t_initial;
	config.t_final = t_final;
	config.t_step = t_step;
	config.equilibration_wait = initial_wait;
	config.step_wait = step_wait;
	config.sample_points = 0;
	config.sample_wait = std::chrono::milliseconds(0);
	config.reinitialize_first = reinitialize;
	config.save_snapshots = save_snapshots;
	return config;
}

const char* SweepStatusName(SweepStatus status) {
	switch (status) {
		case SweepStatus::kCompleted: return "completed";
		case SweepStatus::kCancelled: return "cancelled";
		case SweepStatus::kRejectedBusy: return "rejected_busy";
		case SweepStatus::kFailed: return "failed";
	}
	return "unknown";
}

std::vector<std::string> ValidateSweepConfig(const SweepConfig& config) {
	std::vector<std::string> errors;
	if (config.set_points.empty()) {
		if (!std::isfinite(config.t_initial) || !std::isfinite(config.t_final) || !std::isfinite(config.t_step)) {
			errors.push_back("Sweep bounds must be finite");
		} else if (config.t_step <= 0.0f) {
			errors.push_back("Sweep temperature step must be positive");
		} else if (config.t_initial > config.t_final) {
			errors.push_back("Sweep start temperature exceeds end temperature");
		}
	} else if (std::any_of(config.set_points.begin(), config.set_points.end(),
			[](float t) { return !std::isfinite(t); })) {
		errors.push_back("Sweep set-points must be finite");
	}
	if (config.sample_points < 0) {
		errors.push_back("Sweep sample points cannot be negative");
	}
	if (config.equilibration_wait.count() < 0 || config.step_wait.count() < 0 ||
			config.sample_wait.count() < 0) {
		errors.push_back("Sweep waits cannot be negative");
	}
	return errors;
}

std::vector<float> SweepTemperatures(const SweepConfig& config) {
	if (!config.set_points.empty()) {
		return config.set_points;
	}
	std::vector<float> temperatures;
	// Count steps up front so accumulated float error never drops the end point
	const double span = static_cast<double>(config.t_final) - static_cast<double>(config.t_initial);
	const long steps = static_cast<long>(std::floor(span / static_cast<double>(config.t_step) + 1e-6));
	for (long k = 0; k <= steps; ++k) {
		temperatures.push_back(static_cast<float>(config.t_initial + static_cast<double>(k) * config.t_step));
	}
	return temperatures;
}

SweepController::SweepController(SharedSimState& state, SweepCollaborators collaborators)
	: state_(state), collaborators_(std::move(collaborators)) {}

void SweepController::Cancel() {
	absl::MutexLock lock(&mu_);
	cancel_requested_ = true;
	cancel_cv_.SignalAll();
}

bool SweepController::CancelledLocked() const {
	return cancel_requested_ || !state_.AnalysisRunning() ||
		(cancel_token_ != nullptr && cancel_token_->load(std::memory_order_acquire));
}

bool SweepController::InterruptibleWait(std::chrono::milliseconds duration) {
	const absl::Time deadline = absl::Now() + absl::FromChrono(duration);
	absl::MutexLock lock(&mu_);
	while (!CancelledLocked()) {
		const absl::Time now = absl::Now();
		if (now >= deadline) {
			return true;
		}
		// Sliced so an external clear of analysisRunning is noticed promptly
		cancel_cv_.WaitWithDeadline(&mu_, std::min(deadline, now + absl::Milliseconds(kSweepWaitSliceMs)));
	}
	return false;
}

SweepStatus SweepController::RunSweep(const SweepConfig& config, SweepReport* report,
                                      const std::atomic<bool>* cancel_token) {
	const std::vector<std::string> errors = ValidateSweepConfig(config);
	if (!errors.empty()) {
		std::ostringstream msg;
		msg << "Invalid sweep configuration:";
		for (const auto& e : errors) {
			msg << " " << e << ";";
		}
		throw std::invalid_argument(msg.str());
	}
	const std::vector<float> temperatures = SweepTemperatures(config);

	{
		absl::MutexLock lock(&mu_);
		if (active_) {
			LOG(WARNING) << "Sweep rejected: another sweep is already running";
			return SweepStatus::kRejectedBusy;
		}
		active_ = true;
		cancel_requested_ = false;
		cancel_token_ = cancel_token;
		state_.SetAnalysisRunning(true);
	}
	ScopeGuard end_analysis([this]() {
		absl::MutexLock lock(&mu_);
		state_.SetAnalysisRunning(false);
		cancel_token_ = nullptr;
		active_ = false;
	});

	SweepReport local_report;
	SweepReport& out = report != nullptr ? *report : local_report;
	out = SweepReport{};

	LOG(INFO) << "Sweep started over " << temperatures.size() << " temperatures, "
		<< config.sample_points << " samples each";

	if (config.reinitialize_first && collaborators_.reinitialize) {
		collaborators_.reinitialize();
	}

	if (!temperatures.empty()) {
		state_.SetTemperature(temperatures.front());
	}
	if (!InterruptibleWait(config.equilibration_wait)) {
		LOG(INFO) << "Sweep cancelled during equilibration";
		return SweepStatus::kCancelled;
	}

	for (float temperature : temperatures) {
		state_.SetTemperature(temperature);
		out.temperatures.push_back(temperature);
		VLOG(1) << "Sweep at T=" << temperature;

		if (!InterruptibleWait(config.step_wait)) {
			LOG(INFO) << "Sweep cancelled at T=" << temperature;
			return SweepStatus::kCancelled;
		}

		for (int point = 0; point < config.sample_points; ++point) {
			if (!InterruptibleWait(config.sample_wait)) {
				LOG(INFO) << "Sweep cancelled at T=" << temperature << " sample " << point;
				return SweepStatus::kCancelled;
			}
			SweepSample sample;
			sample.temperature = temperature;
			sample.point = point;
			if (collaborators_.magnetization) {
				sample.magnetization = collaborators_.magnetization();
			}
			if (collaborators_.correlation) {
				sample.correlation = collaborators_.correlation();
			}
			out.samples.push_back(std::move(sample));
		}

		if (config.save_snapshots && collaborators_.save_snapshot) {
			if (collaborators_.save_snapshot(temperature)) {
				++out.snapshots_saved;
			} else {
				LOG(WARNING) << "Snapshot at T=" << temperature << " was not saved";
			}
		}
	}

	LOG(INFO) << "Sweep completed: " << out.samples.size() << " samples, "
		<< out.snapshots_saved << " snapshots";
	return SweepStatus::kCompleted;
}

} // namespace IsingSim
