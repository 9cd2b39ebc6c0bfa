#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <variant>
#include <vector>

#include "../lattice/ising_graph.h"
#include "shared_sim_state.h"

namespace IsingSim {

// Metropolis acceptance for a spin flip with local energy e_state = s * LocalEnergyFactor.
// e_state >= 0 is always accepted; temperature <= 0 is the zero-temperature
// limit and rejects every uphill move.
bool AcceptDiscreteFlip(float e_state, float temperature, double uniform01);

// Metropolis acceptance for a continuous move with energy change delta_e
bool AcceptContinuousMove(float delta_e, float temperature, double uniform01);

/**
 * One single-site update on a discrete lattice. Captures the energy function
 * and the active-site list at construction; both stay fixed until the next
 * branch. Temperature is re-read from the shared state on every call.
 */
class DiscreteStep {
public:
	DiscreteStep(DiscreteGraph* graph, const SharedSimState* state, uint64_t seed);
	void operator()();

private:
	DiscreteGraph* graph_;
	const SharedSimState* state_;
	DiscreteGraph::EnergyFn energy_;
	const std::vector<uint32_t>* active_;
	std::uniform_int_distribution<size_t> pick_;
	std::uniform_real_distribution<double> uniform_{0.0, 1.0};
	std::mt19937_64 rng_;
};

// Same contract for the continuous representation: the candidate value is drawn
// from [-1, 1] and overwrites the site on acceptance.
class ContinuousStep {
public:
	ContinuousStep(ContinuousGraph* graph, const SharedSimState* state, uint64_t seed);
	void operator()();

private:
	ContinuousGraph* graph_;
	const SharedSimState* state_;
	ContinuousGraph::EnergyFn energy_;
	const std::vector<uint32_t>* active_;
	std::uniform_int_distribution<size_t> pick_;
	std::uniform_real_distribution<double> uniform_{0.0, 1.0};
	std::mt19937_64 rng_;
};

using StepKernel = std::variant<DiscreteStep, ContinuousStep>;
using StepFunction = std::function<void()>;

// Visits the lattice variant once and binds the matching kernel
StepKernel MakeStepKernel(AnyGraph& graph, const SharedSimState& state, uint64_t seed);
StepFunction MakeStepFunction(AnyGraph& graph, const SharedSimState& state, uint64_t seed);

} // namespace IsingSim
