#pragma once

#include <atomic>
#include <cstdint>

#include "absl/synchronization/mutex.h"
#include "../common/config.h"
#include "../lattice/ising_graph.h"
#include "windowed_aggregator.h"

namespace IsingSim {

class HotLoopController;

enum class HotLoopPhase {
	kStopped,        // not started, shut down, or failed
	kRunning,        // shouldRun=true,  isRunning=true
	kDraining,       // shouldRun=false, isRunning=true
	kReconfiguring   // shouldRun=false, isRunning=false, loop parked
};

const char* HotLoopPhaseName(HotLoopPhase phase);

struct ImageSize {
	int width = 0;
	int height = 0;
};

struct SharedSimStateOptions {
	double initial_temperature = 1.0;
	int brush_radius = 0;
	ImageSize image_size;
	size_t stats_window = kDefaultStatsWindow;
};

/**
 * The single mutable state shared by the hot loop, the gated maintenance
 * tasks, the sweep and the UI-facing setters.
 *
 * Scalars are atomics. The run flags follow a strict ownership rule:
 * shouldRun may be written by anyone through RequestStop()/RequestRun(),
 * isRunning is written only by HotLoopController (the setters are private and
 * HotLoopController is the only friend). Transitions of either flag happen
 * under run_mu_ so blocking waiters never miss a wakeup.
 */
class SharedSimState {
public:
	explicit SharedSimState(const SharedSimStateOptions& options);

	SharedSimState(const SharedSimState&) = delete;
	SharedSimState& operator=(const SharedSimState&) = delete;

	// Temperature, re-read by the step function every iteration
	float Temperature() const { return temperature_.load(std::memory_order_relaxed); }
	void SetTemperature(float temperature) { temperature_.store(temperature, std::memory_order_relaxed); }

	// Brush
	int BrushRadius() const { return brush_radius_.load(std::memory_order_relaxed); }
	float BrushValue() const { return brush_value_.load(std::memory_order_relaxed); }
	void SetBrushValue(float value) { brush_value_.store(value, std::memory_order_relaxed); }
	void SetBrush(int radius, BrushMask mask);
	BrushMask CopyBrushMask() const;

	// Raw update counter, bumped by the hot loop every step
	void CountUpdate() { updates_.fetch_add(1, std::memory_order_relaxed); }
	int64_t PendingUpdates() const { return updates_.load(std::memory_order_relaxed); }
	int64_t TakeUpdates() { return updates_.exchange(0, std::memory_order_relaxed); }

	// Published statistics
	float Magnetization() const { return magnetization_.load(std::memory_order_acquire); }
	void PublishMagnetization(float value) { magnetization_.store(value, std::memory_order_release); }
	int64_t UpdatesPerFrame() const { return updates_per_frame_.load(std::memory_order_acquire); }
	void PublishUpdatesPerFrame(int64_t value) { updates_per_frame_.store(value, std::memory_order_release); }

	WindowedAggregator& UpdatesWindow() { return updates_window_; }
	WindowedAggregator& MagnetizationWindow() { return magnetization_window_; }
	const WindowedAggregator& MagnetizationWindow() const { return magnetization_window_; }

	ImageSize GetImageSize() const;
	void SetImageSize(ImageSize size);

	// Run flags
	bool ShouldRun() const { return should_run_.load(std::memory_order_acquire); }
	bool IsRunning() const { return is_running_.load(std::memory_order_acquire); }
	HotLoopPhase Phase() const;

	// Reconfiguration handshake used by HotLoopController::RequestReconfigure
	void RequestStop();
	void RequestRun();
	// Blocks until the hot loop has acknowledged a stop (isRunning=false)
	void WaitUntilParked() const;

	// Sweep flag, set by SweepController. External callers may clear it to
	// cancel a sweep in flight.
	bool AnalysisRunning() const { return analysis_running_.load(std::memory_order_acquire); }
	void SetAnalysisRunning(bool running) { analysis_running_.store(running, std::memory_order_release); }

private:
	friend class HotLoopController;

	// Hot-loop side of the handshake
	bool WaitForRunOrShutdown();
	void MarkParked();
	void MarkStopped();
	void RequestShutdown();
	bool ShutdownRequested() const;

	std::atomic<float> temperature_;

	std::atomic<int> brush_radius_;
	std::atomic<float> brush_value_{0.0f};
	mutable absl::Mutex brush_mu_;
	BrushMask brush_mask_ ABSL_GUARDED_BY(brush_mu_);

	std::atomic<int64_t> updates_{0};
	std::atomic<int64_t> updates_per_frame_{0};
	std::atomic<float> magnetization_{0.0f};
	WindowedAggregator updates_window_;
	WindowedAggregator magnetization_window_;

	std::atomic<int> image_width_;
	std::atomic<int> image_height_;

	mutable absl::Mutex run_mu_;
	mutable absl::CondVar run_cv_;
	std::atomic<bool> should_run_{true};
	std::atomic<bool> is_running_{false};
	HotLoopPhase phase_ ABSL_GUARDED_BY(run_mu_) = HotLoopPhase::kStopped;
	bool shutdown_ ABSL_GUARDED_BY(run_mu_) = false;

	std::atomic<bool> analysis_running_{false};
};

} // namespace IsingSim
