#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "../common/task_executor.h"

namespace IsingSim {

/**
 * Exclusive admission for one periodic task identity.
 *
 * TryRun admits the task only if no earlier invocation is still in flight;
 * otherwise the invocation is dropped (never queued). With an executor the
 * task runs on a pool thread and TryRun returns immediately; without one it
 * runs inline. Exceptions thrown by the task are logged and counted, and the
 * gate is released on every exit path.
 */
class TaskGate {
public:
	explicit TaskGate(std::string name, TaskExecutor* executor = nullptr);

	TaskGate(const TaskGate&) = delete;
	TaskGate& operator=(const TaskGate&) = delete;

	template <typename Fn, typename... Args>
	bool TryRun(Fn&& fn, Args&&... args) {
		return Dispatch(std::function<void()>(
			std::bind(std::forward<Fn>(fn), std::forward<Args>(args)...)));
	}

	bool InFlight() const { return in_flight_.load(std::memory_order_acquire); }

	// Blocks until no invocation is in flight; false on timeout
	bool WaitIdle(absl::Duration timeout) const;

	const std::string& Name() const { return name_; }
	uint64_t Completed() const { return completed_.load(std::memory_order_relaxed); }
	uint64_t Dropped() const { return dropped_.load(std::memory_order_relaxed); }
	uint64_t Failures() const { return failures_.load(std::memory_order_relaxed); }
	std::string LastError() const;

private:
	bool Dispatch(std::function<void()> task);
	void RunAndRelease(const std::function<void()>& task);
	void Release();
	void RecordFailure(const std::string& what);

	const std::string name_;
	TaskExecutor* executor_;

	std::atomic<bool> in_flight_{false};
	std::atomic<uint64_t> completed_{0};
	std::atomic<uint64_t> dropped_{0};
	std::atomic<uint64_t> failures_{0};

	mutable absl::Mutex mu_;
	mutable absl::CondVar idle_cv_;
	std::string last_error_ ABSL_GUARDED_BY(mu_);
};

} // namespace IsingSim
