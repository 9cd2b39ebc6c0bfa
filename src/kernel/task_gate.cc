#include "task_gate.h"

#include <exception>

#include <glog/logging.h>

namespace IsingSim {

TaskGate::TaskGate(std::string name, TaskExecutor* executor)
	: name_(std::move(name)), executor_(executor) {}

bool TaskGate::Dispatch(std::function<void()> task) {
	bool expected = false;
	if (!in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
		dropped_.fetch_add(1, std::memory_order_relaxed);
		VLOG(3) << "TaskGate " << name_ << ": previous run still in flight, dropping";
		return false;
	}

	if (executor_ == nullptr) {
		RunAndRelease(task);
		return true;
	}

	auto body = [this, task = std::move(task)]() { RunAndRelease(task); };
	if (!executor_->Submit(std::move(body))) {
		LOG(WARNING) << "TaskGate " << name_ << ": executor stopped, task not dispatched";
		Release();
		return false;
	}
	return true;
}

void TaskGate::RunAndRelease(const std::function<void()>& task) {
	ScopeGuard release([this] { Release(); });
	try {
		task();
		completed_.fetch_add(1, std::memory_order_relaxed);
	} catch (const std::exception& e) {
		RecordFailure(e.what());
	} catch (...) {
		RecordFailure("non-standard exception");
	}
}

void TaskGate::RecordFailure(const std::string& what) {
	failures_.fetch_add(1, std::memory_order_relaxed);
	LOG(ERROR) << "TaskGate " << name_ << ": task failed: " << what;
	absl::MutexLock lock(&mu_);
	last_error_ = what;
}

void TaskGate::Release() {
	absl::MutexLock lock(&mu_);
	in_flight_.store(false, std::memory_order_release);
	idle_cv_.SignalAll();
}

bool TaskGate::WaitIdle(absl::Duration timeout) const {
	const absl::Time deadline = absl::Now() + timeout;
	absl::MutexLock lock(&mu_);
	while (in_flight_.load(std::memory_order_acquire)) {
		if (idle_cv_.WaitWithDeadline(&mu_, deadline)) {
			return !in_flight_.load(std::memory_order_acquire);
		}
	}
	return true;
}

std::string TaskGate::LastError() const {
	absl::MutexLock lock(&mu_);
	return last_error_;
}

} // namespace IsingSim
