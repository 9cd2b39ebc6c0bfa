#include "shared_sim_state.h"

#include <glog/logging.h>

namespace IsingSim {

const char* HotLoopPhaseName(HotLoopPhase phase) {
	switch (phase) {
		case HotLoopPhase::kStopped: return "Stopped";
		case HotLoopPhase::kRunning: return "Running";
		case HotLoopPhase::kDraining: return "Draining";
		case HotLoopPhase::kReconfiguring: return "Reconfiguring";
	}
	return "Unknown";
}

SharedSimState::SharedSimState(const SharedSimStateOptions& options)
	: temperature_(static_cast<float>(options.initial_temperature)),
	  brush_radius_(options.brush_radius),
	  brush_mask_(DiscreteGraph::OrderedCircle(options.brush_radius)),
	  updates_window_("upf", options.stats_window, WindowedAggregator::Reduction::kMean),
	  magnetization_window_("magnetization", options.stats_window, WindowedAggregator::Reduction::kMean),
	  image_width_(options.image_size.width),
	  image_height_(options.image_size.height) {}

void SharedSimState::SetBrush(int radius, BrushMask mask) {
	absl::MutexLock lock(&brush_mu_);
	brush_radius_.store(radius, std::memory_order_relaxed);
	brush_mask_ = std::move(mask);
}

BrushMask SharedSimState::CopyBrushMask() const {
	absl::MutexLock lock(&brush_mu_);
	return brush_mask_;
}

ImageSize SharedSimState::GetImageSize() const {
	return ImageSize{image_width_.load(std::memory_order_relaxed),
		image_height_.load(std::memory_order_relaxed)};
}

void SharedSimState::SetImageSize(ImageSize size) {
	image_width_.store(size.width, std::memory_order_relaxed);
	image_height_.store(size.height, std::memory_order_relaxed);
}

HotLoopPhase SharedSimState::Phase() const {
	absl::MutexLock lock(&run_mu_);
	return phase_;
}

void SharedSimState::RequestStop() {
	absl::MutexLock lock(&run_mu_);
	should_run_.store(false, std::memory_order_release);
	if (phase_ == HotLoopPhase::kRunning) {
		phase_ = HotLoopPhase::kDraining;
	}
}

void SharedSimState::RequestRun() {
	absl::MutexLock lock(&run_mu_);
	should_run_.store(true, std::memory_order_release);
	run_cv_.SignalAll();
}

void SharedSimState::WaitUntilParked() const {
	absl::MutexLock lock(&run_mu_);
	while (is_running_.load(std::memory_order_acquire)) {
		run_cv_.Wait(&run_mu_);
	}
}

bool SharedSimState::WaitForRunOrShutdown() {
	absl::MutexLock lock(&run_mu_);
	while (!shutdown_ && !should_run_.load(std::memory_order_acquire)) {
		run_cv_.Wait(&run_mu_);
	}
	if (shutdown_) {
		return false;
	}
	// Set under run_mu_: a requester that stops us after this point waits for the next park
	is_running_.store(true, std::memory_order_release);
	phase_ = HotLoopPhase::kRunning;
	return true;
}

void SharedSimState::MarkParked() {
	absl::MutexLock lock(&run_mu_);
	is_running_.store(false, std::memory_order_release);
	phase_ = shutdown_ ? HotLoopPhase::kStopped : HotLoopPhase::kReconfiguring;
	run_cv_.SignalAll();
}

void SharedSimState::MarkStopped() {
	absl::MutexLock lock(&run_mu_);
	is_running_.store(false, std::memory_order_release);
	phase_ = HotLoopPhase::kStopped;
	run_cv_.SignalAll();
}

void SharedSimState::RequestShutdown() {
	absl::MutexLock lock(&run_mu_);
	shutdown_ = true;
	should_run_.store(false, std::memory_order_release);
	run_cv_.SignalAll();
}

bool SharedSimState::ShutdownRequested() const {
	absl::MutexLock lock(&run_mu_);
	return shutdown_;
}

} // namespace IsingSim
