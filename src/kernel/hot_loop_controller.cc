#include "hot_loop_controller.h"

#include <glog/logging.h>

#include "../common/task_executor.h"

namespace IsingSim {

namespace {

std::string DescribeException(const std::exception_ptr& eptr) {
	if (!eptr) {
		return "";
	}
	try {
		std::rethrow_exception(eptr);
	} catch (const std::exception& e) {
		return e.what();
	} catch (...) {
		return "non-standard exception";
	}
}

} // namespace

HotLoopController::HotLoopController(SharedSimState& state, StepSource source)
	: state_(state), source_(std::move(source)) {}

HotLoopController::~HotLoopController() {
	Shutdown();
}

void HotLoopController::Start() {
	if (thread_.joinable()) {
		LOG(WARNING) << "Hot loop already started";
		return;
	}
	thread_ = std::thread([this]() { Run(); });
}

void HotLoopController::Run() {
	LOG(INFO) << "Hot loop started";
	try {
		while (state_.WaitForRunOrShutdown()) {
			// Branch: the only place a new step function takes effect
			StepFunction step = source_();
			const uint64_t branch = branches_.fetch_add(1, std::memory_order_relaxed) + 1;
			VLOG(1) << "Hot loop entering branch " << branch;

			while (state_.ShouldRun()) {
				step();
				state_.CountUpdate();
				std::this_thread::yield();
			}

			state_.MarkParked();
			VLOG(1) << "Hot loop parked after branch " << branch;
		}
	} catch (...) {
		absl::MutexLock lock(&failure_mu_);
		failure_ = std::current_exception();
		LOG(ERROR) << "Hot loop step failed, stopping: " << DescribeException(failure_);
	}
	state_.MarkStopped();
	LOG(INFO) << "Hot loop stopped after " << Branches() << " branches";
}

void HotLoopController::Shutdown() {
	state_.RequestShutdown();
	if (thread_.joinable()) {
		thread_.join();
	}
}

void HotLoopController::RequestReconfigure(const std::function<void()>& mutator) {
	absl::MutexLock serialize(&reconfigure_mu_);
	state_.RequestStop();
	state_.WaitUntilParked();
	ScopeGuard resume([this]() { state_.RequestRun(); });
	VLOG(2) << "Reconfiguring with hot loop " << HotLoopPhaseName(state_.Phase());
	mutator();
}

std::exception_ptr HotLoopController::Failure() const {
	absl::MutexLock lock(&failure_mu_);
	return failure_;
}

std::string HotLoopController::FailureMessage() const {
	return DescribeException(Failure());
}

} // namespace IsingSim
