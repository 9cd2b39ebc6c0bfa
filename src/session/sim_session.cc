#include "sim_session.h"

#include <cmath>
#include <sstream>

#include <glog/logging.h>

#include "../common/config.h"
#include "../kernel/metropolis.h"

namespace IsingSim {

namespace {

uint64_t ResolveSeed(uint64_t seed) {
	if (seed != 0) {
		return seed;
	}
	std::random_device rd;
	return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

SessionOptions SessionOptions::FromConfig(const IsingSimConfig& config) {
	SessionOptions options;
	options.graph_size = config.simulation.graph_size.get();
	options.continuous = config.simulation.continuous.get();
	options.weighted = config.simulation.weighted.get();
	options.initial_temperature = config.simulation.initial_temperature.get();
	options.seed = config.simulation.seed.get();
	options.stats_window = static_cast<size_t>(config.stats.window.get());
	options.worker_threads = config.driver.worker_threads.get();
	options.snapshot_dir = config.output.snapshot_dir.get();
	options.max_distance = config.analysis.max_distance.get();
	options.pairs_per_distance = static_cast<size_t>(config.analysis.pairs_per_distance.get());
	return options;
}

std::string SnapshotLabel(float temperature) {
	std::ostringstream label;
	label << "Ising T" << temperature;
	return label.str();
}

SimSession::SimSession(const SessionOptions& options, std::unique_ptr<ISnapshotSink> sink)
	: options_(options),
	  control_rng_(ResolveSeed(options.seed)),
	  step_seeder_(control_rng_()),
	  graph_(MakeGraph(options.continuous, options.graph_size, options.weighted, control_rng_)),
	  sink_(std::move(sink)),
	  correlation_sampler_(options.pairs_per_distance, control_rng_()),
	  distances_(DistanceDomain(options.max_distance)) {
	const int brush_radius = static_cast<int>(std::lround(options.graph_size * kBrushRadiusFraction));

	SharedSimStateOptions state_options;
	state_options.initial_temperature = options.initial_temperature;
	state_options.brush_radius = brush_radius;
	state_options.image_size = ImageSize{options.graph_size, options.graph_size};
	state_options.stats_window = options.stats_window;
	state_ = std::make_unique<SharedSimState>(state_options);

	if (!options.inline_tasks) {
		executor_ = std::make_unique<TaskExecutor>(static_cast<size_t>(options.worker_threads));
	}
	image_gate_ = std::make_unique<TaskGate>("image", executor_.get());
	upf_gate_ = std::make_unique<TaskGate>("upf", executor_.get());
	magnetization_gate_ = std::make_unique<TaskGate>("magnetization", executor_.get());

	if (!sink_) {
		sink_ = std::make_unique<PgmSnapshotSink>(options.snapshot_dir);
	}

	hot_loop_ = std::make_unique<HotLoopController>(*state_, [this]() { return DeriveStep(); });

	SweepCollaborators collaborators;
	collaborators.magnetization = [this]() { return Magnetization(); };
	collaborators.correlation = [this]() { return correlation_sampler_(graph_, distances_); };
	collaborators.save_snapshot = [this](float temperature) {
		return SaveSnapshot(SnapshotLabel(temperature));
	};
	collaborators.reinitialize = [this]() { Reinitialize(); };
	sweep_ = std::make_unique<SweepController>(*state_, std::move(collaborators));

	LOG(INFO) << "SimSession created: " << (options.continuous ? "continuous" : "discrete")
		<< " lattice " << options.graph_size << "x" << options.graph_size
		<< (options.weighted ? " weighted" : " unweighted")
		<< " T=" << options.initial_temperature
		<< (options.inline_tasks ? " inline tasks" : "");
}

SimSession::~SimSession() {
	Shutdown();
}

void SimSession::Start() {
	hot_loop_->Start();
}

void SimSession::Shutdown() {
	if (shut_down_.exchange(true)) {
		return;
	}
	CancelSweep();
	JoinSweep();
	hot_loop_->Shutdown();
	if (executor_) {
		executor_->Stop();
	}
	LOG(INFO) << "SimSession shut down";
}

StepFunction SimSession::DeriveStep() {
	return MakeStepFunction(graph_, *state_, step_seeder_());
}

double SimSession::Magnetization() const {
	return std::visit([](const auto& g) { return g->TotalMagnetization(); }, graph_);
}

void SimSession::TimedFunctions() {
	image_gate_->TryRun(&SimSession::UpdateImage, this);
	upf_gate_->TryRun(&SimSession::UpdatesPerFrame, this);
	magnetization_gate_->TryRun(&SimSession::UpdateMagnetization, this);
}

void SimSession::UpdateImage() {
	ImageBuffer buffer = sink_->Render(graph_);
	state_->SetImageSize(ImageSize{buffer.width, buffer.height});
	absl::MutexLock lock(&image_mu_);
	latest_image_ = std::move(buffer);
}

void SimSession::UpdatesPerFrame() {
	WindowedAggregator& window = state_->UpdatesWindow();
	if (window.RecordAndMaybeFlush(static_cast<double>(state_->TakeUpdates()))) {
		state_->PublishUpdatesPerFrame(std::llround(window.Output()));
		VLOG(2) << "Updates per frame: " << state_->UpdatesPerFrame();
	}
}

void SimSession::UpdateMagnetization() {
	WindowedAggregator& window = state_->MagnetizationWindow();
	if (window.RecordAndMaybeFlush(Magnetization())) {
		state_->PublishMagnetization(static_cast<float>(window.Output()));
		VLOG(2) << "Magnetization: " << state_->Magnetization();
	}
}

void SimSession::Reinitialize() {
	hot_loop_->RequestReconfigure([this]() {
		absl::MutexLock lock(&structure_mu_);
		std::visit([this](auto& g) { g->Reinitialize(control_rng_); }, graph_);
		state_->PublishMagnetization(0.0f);
		state_->TakeUpdates();
	});
	LOG(INFO) << "Lattice reinitialized";
}

size_t SimSession::AddRandomDefects(double fraction) {
	size_t added = 0;
	hot_loop_->RequestReconfigure([this, fraction, &added]() {
		absl::MutexLock lock(&structure_mu_);
		added = std::visit([this, fraction](auto& g) { return g->AddRandomDefects(fraction, control_rng_); },
			graph_);
	});
	LOG(INFO) << "Added " << added << " random defects";
	return added;
}

void SimSession::SetWeighted(bool weighted) {
	hot_loop_->RequestReconfigure([this, weighted]() {
		absl::MutexLock lock(&structure_mu_);
		std::visit([weighted](auto& g) { g->SetWeighted(weighted); }, graph_);
	});
	LOG(INFO) << "Lattice weighting " << (weighted ? "enabled" : "disabled");
}

void SimSession::SetBrushRadius(int radius) {
	state_->SetBrush(radius, DiscreteGraph::OrderedCircle(radius));
}

size_t SimSession::PaintAt(int i, int j, bool clamp) {
	const BrushMask mask = state_->CopyBrushMask();
	const float value = state_->BrushValue();
	absl::MutexLock lock(&structure_mu_);
	return std::visit([&](auto& g) { return g->PaintCircle(mask, i, j, value, clamp); }, graph_);
}

bool SimSession::SaveSnapshot(const std::string& label) {
	return sink_->Persist(sink_->Render(graph_), label);
}

SweepStatus SimSession::RunSweep(const SweepConfig& config, SweepReport* report) {
	return sweep_->RunSweep(config, report);
}

bool SimSession::StartSweep(const SweepConfig& config) {
	const std::vector<std::string> errors = ValidateSweepConfig(config);
	if (!errors.empty()) {
		for (const auto& e : errors) {
			LOG(ERROR) << "Sweep not started: " << e;
		}
		return false;
	}

	absl::MutexLock lock(&sweep_mu_);
	if (sweep_in_progress_.load(std::memory_order_acquire)) {
		LOG(WARNING) << "Sweep not started: previous sweep still in flight";
		return false;
	}
	if (sweep_thread_.joinable()) {
		sweep_thread_.join();
	}
	sweep_cancel_.store(false, std::memory_order_release);
	sweep_in_progress_.store(true, std::memory_order_release);
	last_sweep_status_.reset();
	last_sweep_report_ = SweepReport{};
	sweep_thread_ = std::thread([this, config]() {
		SweepReport report;
		SweepStatus status = SweepStatus::kFailed;
		try {
			status = sweep_->RunSweep(config, &report, &sweep_cancel_);
		} catch (const std::exception& e) {
			LOG(ERROR) << "Sweep failed: " << e.what();
		}
		{
			absl::MutexLock result_lock(&sweep_mu_);
			last_sweep_status_ = status;
			last_sweep_report_ = std::move(report);
		}
		sweep_in_progress_.store(false, std::memory_order_release);
	});
	return true;
}

void SimSession::CancelSweep() {
	sweep_cancel_.store(true, std::memory_order_release);
	sweep_->Cancel();
}

void SimSession::JoinSweep() {
	std::thread sweep_thread;
	{
		absl::MutexLock lock(&sweep_mu_);
		sweep_thread = std::move(sweep_thread_);
	}
	if (sweep_thread.joinable()) {
		sweep_thread.join();
	}
}

std::optional<SweepStatus> SimSession::LastSweepStatus() const {
	absl::MutexLock lock(&sweep_mu_);
	return last_sweep_status_;
}

SweepReport SimSession::LastSweepReport() const {
	absl::MutexLock lock(&sweep_mu_);
	return last_sweep_report_;
}

void SimSession::CheckHealth() const {
	if (std::exception_ptr failure = hot_loop_->Failure()) {
		std::rethrow_exception(failure);
	}
}

bool SimSession::CopyLatestImage(ImageBuffer* out) const {
	absl::MutexLock lock(&image_mu_);
	if (latest_image_.pixels.empty()) {
		return false;
	}
	*out = latest_image_;
	return true;
}

} // namespace IsingSim
