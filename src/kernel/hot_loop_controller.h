#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "metropolis.h"
#include "shared_sim_state.h"

namespace IsingSim {

/**
 * Owns the single long-lived Monte Carlo worker.
 *
 * The step behaviour is an owned StepFunction that is only ever replaced
 * while the loop is parked: every time the loop resumes it asks the
 * StepSource for a fresh function (a "branch"), so a new energy function or
 * lattice structure takes effect exactly at that handoff and a step closure
 * is never mutated while in use.
 *
 * A throwing step (or step source) is fatal: the loop stops, isRunning is
 * cleared and the exception is kept for the owner to collect via Failure().
 */
class HotLoopController {
public:
	using StepSource = std::function<StepFunction()>;

	HotLoopController(SharedSimState& state, StepSource source);
	~HotLoopController();

	HotLoopController(const HotLoopController&) = delete;
	HotLoopController& operator=(const HotLoopController&) = delete;

	// Runs Run() on a dedicated thread
	void Start();

	// The loop itself. Returns only after Shutdown() or a step failure.
	void Run();

	// Requests shutdown and joins the worker thread if Start() created one
	void Shutdown();

	// Stop, wait for the loop to park, apply mutator, resume. Concurrent
	// requests are serialized. The loop is resumed even if mutator throws;
	// the exception then propagates to the caller.
	void RequestReconfigure(const std::function<void()>& mutator);

	std::exception_ptr Failure() const;
	std::string FailureMessage() const;
	uint64_t Branches() const { return branches_.load(std::memory_order_relaxed); }

private:
	SharedSimState& state_;
	StepSource source_;
	std::thread thread_;
	std::atomic<uint64_t> branches_{0};

	absl::Mutex reconfigure_mu_;
	mutable absl::Mutex failure_mu_;
	std::exception_ptr failure_ ABSL_GUARDED_BY(failure_mu_);
};

} // namespace IsingSim
