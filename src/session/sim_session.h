#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "../analysis/correlation.h"
#include "../common/config.h"
#include "../common/configuration.h"
#include "../common/task_executor.h"
#include "../kernel/hot_loop_controller.h"
#include "../kernel/shared_sim_state.h"
#include "../kernel/sweep_controller.h"
#include "../kernel/task_gate.h"
#include "../lattice/ising_graph.h"
#include "../render/snapshot_sink.h"

namespace IsingSim {

struct SessionOptions {
	int graph_size = 512;
	bool continuous = false;
	bool weighted = true;
	double initial_temperature = 1.0;
	uint64_t seed = 0;            // 0 draws from std::random_device
	size_t stats_window = kDefaultStatsWindow;
	int worker_threads = 3;
	bool inline_tasks = false;    // run gated tasks on the driver thread
	std::string snapshot_dir = "Images";
	int max_distance = 32;
	size_t pairs_per_distance = 4096;

	static SessionOptions FromConfig(const IsingSimConfig& config);
};

// "Ising T1.5"
std::string SnapshotLabel(float temperature);

/**
 * Owns the lattice and the SharedSimState for the lifetime of a simulation,
 * and wires the kernel pieces together: the hot loop, one TaskGate per
 * periodic task, the statistics windows and the sweep controller.
 */
class SimSession {
public:
	explicit SimSession(const SessionOptions& options, std::unique_ptr<ISnapshotSink> sink = nullptr);
	~SimSession();

	SimSession(const SimSession&) = delete;
	SimSession& operator=(const SimSession&) = delete;

	void Start();
	void Shutdown();

	// Frame tick: image snapshot, updates-per-frame and magnetization, each
	// behind its own gate
	void TimedFunctions();

	// Gated task bodies
	void UpdateImage();
	void UpdatesPerFrame();
	void UpdateMagnetization();

	// Structural changes, all routed through the reconfiguration protocol
	void Reinitialize();
	size_t AddRandomDefects(double fraction);
	void SetWeighted(bool weighted);

	void SetTemperature(float temperature) { state_->SetTemperature(temperature); }
	void SetBrushRadius(int radius);
	void SetBrushValue(float value) { state_->SetBrushValue(value); }
	// Paints the current brush centred at (i, j)
	size_t PaintAt(int i, int j, bool clamp = false);
	// Renders the lattice now and persists it under label
	bool SaveSnapshot(const std::string& label);

	// Synchronous sweep on the caller's thread
	SweepStatus RunSweep(const SweepConfig& config, SweepReport* report);
	// Sweep on a dedicated thread; false if one is still in flight
	bool StartSweep(const SweepConfig& config);
	void CancelSweep();
	void JoinSweep();
	// Empty while a background sweep is in flight or before the first one;
	// kFailed when a collaborator threw
	std::optional<SweepStatus> LastSweepStatus() const;
	SweepReport LastSweepReport() const;

	// Rethrows a hot-loop failure, if any
	void CheckHealth() const;
	bool Healthy() const { return hot_loop_->Failure() == nullptr; }

	bool CopyLatestImage(ImageBuffer* out) const;

	SharedSimState& State() { return *state_; }
	const AnyGraph& Graph() const { return graph_; }
	HotLoopController& HotLoop() { return *hot_loop_; }
	TaskGate& ImageGate() { return *image_gate_; }
	TaskGate& UpfGate() { return *upf_gate_; }
	TaskGate& MagnetizationGate() { return *magnetization_gate_; }
	const SessionOptions& Options() const { return options_; }

private:
	StepFunction DeriveStep();
	double Magnetization() const;

	const SessionOptions options_;
	std::mt19937_64 control_rng_;   // used only inside reconfiguration mutators
	std::mt19937_64 step_seeder_;   // used only by the hot loop thread

	AnyGraph graph_;
	std::unique_ptr<SharedSimState> state_;
	std::unique_ptr<TaskExecutor> executor_;
	std::unique_ptr<TaskGate> image_gate_;
	std::unique_ptr<TaskGate> upf_gate_;
	std::unique_ptr<TaskGate> magnetization_gate_;
	std::unique_ptr<ISnapshotSink> sink_;
	CorrelationSampler correlation_sampler_;
	const std::vector<int> distances_;
	std::unique_ptr<HotLoopController> hot_loop_;
	std::unique_ptr<SweepController> sweep_;

	// Held by the brush path and by every structural mutator
	absl::Mutex structure_mu_;

	mutable absl::Mutex image_mu_;
	ImageBuffer latest_image_ ABSL_GUARDED_BY(image_mu_);

	mutable absl::Mutex sweep_mu_;
	std::thread sweep_thread_;
	std::atomic<bool> sweep_in_progress_{false};
	std::atomic<bool> sweep_cancel_{false};
	std::optional<SweepStatus> last_sweep_status_ ABSL_GUARDED_BY(sweep_mu_);
	SweepReport last_sweep_report_ ABSL_GUARDED_BY(sweep_mu_);

	std::atomic<bool> shut_down_{false};
};

} // namespace IsingSim
