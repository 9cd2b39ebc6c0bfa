#include "metropolis.h"

#include <cmath>

namespace IsingSim {

bool AcceptDiscreteFlip(float e_state, float temperature, double uniform01) {
	if (e_state >= 0.0f) {
		return true;
	}
	if (temperature <= 0.0f) {
		return false;
	}
	// exp(-beta * dE) with dE = -2 * e_state
	return uniform01 < std::exp(2.0 * static_cast<double>(e_state) / static_cast<double>(temperature));
}

bool AcceptContinuousMove(float delta_e, float temperature, double uniform01) {
	if (delta_e < 0.0f) {
		return true;
	}
	if (temperature <= 0.0f) {
		return false;
	}
	return uniform01 < std::exp(-static_cast<double>(delta_e) / static_cast<double>(temperature));
}

namespace {

template <typename Graph>
std::uniform_int_distribution<size_t> ActiveSiteDistribution(const Graph& graph) {
	const size_t n = graph.ActiveSites().size();
	return std::uniform_int_distribution<size_t>(0, n == 0 ? 0 : n - 1);
}

} // namespace

DiscreteStep::DiscreteStep(DiscreteGraph* graph, const SharedSimState* state, uint64_t seed)
	: graph_(graph),
	  state_(state),
	  energy_(graph->EnergyFunction()),
	  active_(&graph->ActiveSites()),
	  pick_(ActiveSiteDistribution(*graph)),
	  rng_(seed) {}

void DiscreteStep::operator()() {
	if (active_->empty()) {
		return;
	}
	const size_t idx = (*active_)[pick_(rng_)];
	const int8_t spin = graph_->Get(idx);
	const float e_state = static_cast<float>(spin) * energy_(*graph_, idx);
	if (e_state >= 0.0f || AcceptDiscreteFlip(e_state, state_->Temperature(), uniform_(rng_))) {
		graph_->Set(idx, static_cast<int8_t>(-spin));
	}
}

ContinuousStep::ContinuousStep(ContinuousGraph* graph, const SharedSimState* state, uint64_t seed)
	: graph_(graph),
	  state_(state),
	  energy_(graph->EnergyFunction()),
	  active_(&graph->ActiveSites()),
	  pick_(ActiveSiteDistribution(*graph)),
	  rng_(seed) {}

void ContinuousStep::operator()() {
	if (active_->empty()) {
		return;
	}
	const size_t idx = (*active_)[pick_(rng_)];
	const float old_state = graph_->Get(idx);
	const float efactor = energy_(*graph_, idx);
	const float new_state = ContinuousGraph::RandomState(rng_);
	const float delta_e = efactor * (new_state - old_state);
	if (delta_e < 0.0f || AcceptContinuousMove(delta_e, state_->Temperature(), uniform_(rng_))) {
		graph_->Set(idx, new_state);
	}
}

StepKernel MakeStepKernel(AnyGraph& graph, const SharedSimState& state, uint64_t seed) {
	if (auto* discrete = std::get_if<std::unique_ptr<DiscreteGraph>>(&graph)) {
		return DiscreteStep(discrete->get(), &state, seed);
	}
	return ContinuousStep(std::get<std::unique_ptr<ContinuousGraph>>(graph).get(), &state, seed);
}

StepFunction MakeStepFunction(AnyGraph& graph, const SharedSimState& state, uint64_t seed) {
	return std::visit([](auto&& kernel) -> StepFunction { return std::move(kernel); },
		MakeStepKernel(graph, state, seed));
}

} // namespace IsingSim
