#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "shared_sim_state.h"

namespace IsingSim {

struct SweepConfig {
	float t_initial = 1.0f;
	float t_final = 13.0f;
	float t_step = 0.5f;
	// When non-empty, visited in order instead of the t_initial..t_final range
	std::vector<float> set_points;

	std::chrono::milliseconds equilibration_wait{0};  // once, at the first set-point
	std::chrono::milliseconds step_wait{0};           // after every temperature change
	int sample_points = 12;
	std::chrono::milliseconds sample_wait{5000};      // before every sample

	bool save_snapshots = false;
	bool reinitialize_first = false;
};

// Annealing: walk the schedule and snapshot each temperature, no sampling
SweepConfig MakeAnnealConfig(float t_initial, float t_final, float t_step,
                             std::chrono::milliseconds initial_wait, std::chrono::milliseconds step_wait,
                             bool reinitialize, bool save_snapshots);

struct SweepSample {
	float temperature = 0.0f;
	int point = 0;
	double magnetization = 0.0;
	std::vector<double> correlation;
};

struct SweepReport {
	std::vector<float> temperatures;
	std::vector<SweepSample> samples;
	size_t snapshots_saved = 0;
};

enum class SweepStatus {
	kCompleted,
	kCancelled,
	kRejectedBusy,  // another sweep is in flight
	kFailed         // a collaborator threw; recorded by owners that run sweeps in the background
};

const char* SweepStatusName(SweepStatus status);

// Empty when the config is usable
std::vector<std::string> ValidateSweepConfig(const SweepConfig& config);

// Inclusive of t_initial, stepping up to and including t_final
std::vector<float> SweepTemperatures(const SweepConfig& config);

/**
 * External collaborators of a sweep. Any of them may be empty, in which case
 * that part of the protocol is skipped.
 */
struct SweepCollaborators {
	std::function<double()> magnetization;
	// Bound to the lattice; picks the estimator from the current defect state
	std::function<std::vector<double>()> correlation;
	// Render + persist tagged with the temperature; false on failure
	std::function<bool(float)> save_snapshot;
	// Runs through the hot loop's reconfiguration protocol
	std::function<void()> reinitialize;
};

/**
 * Serializes a temperature scan against the live hot loop. The hot loop keeps
 * running; the sweep only writes the shared temperature and waits.
 *
 * At most one sweep runs at a time: a second RunSweep while one is active is
 * rejected. analysisRunning is set for the duration and always cleared on
 * return, including when a collaborator throws.
 * Cancellation (Cancel(), the caller's cancel token, or an external clear of
 * analysisRunning) is checked on every wait boundary.
 */
class SweepController {
public:
	SweepController(SharedSimState& state, SweepCollaborators collaborators);

	SweepController(const SweepController&) = delete;
	SweepController& operator=(const SweepController&) = delete;

	// Throws std::invalid_argument before any side effect if config is invalid.
	// cancel_token, when given, is polled with the other cancellation sources;
	// it lets an owner cancel a sweep that has not claimed the controller yet.
	SweepStatus RunSweep(const SweepConfig& config, SweepReport* report,
	                     const std::atomic<bool>* cancel_token = nullptr);

	void Cancel();

private:
	// False if the sweep was cancelled before the wait elapsed
	bool InterruptibleWait(std::chrono::milliseconds duration);
	bool CancelledLocked() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

	SharedSimState& state_;
	SweepCollaborators collaborators_;

	absl::Mutex mu_;
	absl::CondVar cancel_cv_;
	bool active_ ABSL_GUARDED_BY(mu_) = false;
	bool cancel_requested_ ABSL_GUARDED_BY(mu_) = false;
	const std::atomic<bool>* cancel_token_ ABSL_GUARDED_BY(mu_) = nullptr;
};

} // namespace IsingSim
