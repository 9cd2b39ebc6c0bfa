#pragma once

#include <cstddef>
#include <functional>
#include <random>
#include <vector>

#include "../lattice/ising_graph.h"

namespace IsingSim {

// (lattice, distance domain) -> one connected correlation value per distance
using CorrelationFn = std::function<std::vector<double>(const AnyGraph&, const std::vector<int>&)>;

// 1, 2, ..., max_distance
std::vector<int> DistanceDomain(int max_distance);

// Estimates <s_i s_j> - <s_i><s_j> over random pairs displaced by d along x or y,
// with periodic wrap.
std::vector<double> SampleCorrelationPeriodic(const AnyGraph& graph, const std::vector<int>& distances,
                                              size_t pairs_per_distance, std::mt19937_64& rng);

// As above, but only pairs whose endpoints are both active sites contribute
std::vector<double> SampleCorrelationPeriodicDefects(const AnyGraph& graph, const std::vector<int>& distances,
                                                     size_t pairs_per_distance, std::mt19937_64& rng);

bool GraphHasDefects(const AnyGraph& graph);

/**
 * Holds the sampling parameters and its own RNG, and picks the periodic or the
 * defect-aware estimator from the lattice's current defect state on each call.
 */
class CorrelationSampler {
public:
	CorrelationSampler(size_t pairs_per_distance, uint64_t seed);

	std::vector<double> operator()(const AnyGraph& graph, const std::vector<int>& distances);

	// Adapts this sampler to the CorrelationFn signature; the sampler must outlive it
	CorrelationFn AsFunction();

private:
	size_t pairs_per_distance_;
	std::mt19937_64 rng_;
};

} // namespace IsingSim
