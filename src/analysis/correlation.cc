#include "correlation.h"

#include <glog/logging.h>

namespace IsingSim {

namespace {

template <typename Graph>
std::vector<double> SampleCorrelation(const Graph& graph, const std::vector<int>& distances,
                                      size_t pairs, bool skip_defects, std::mt19937_64& rng) {
	std::vector<double> result;
	result.reserve(distances.size());
	std::uniform_int_distribution<int> coord(0, graph.Side() - 1);

	for (int d : distances) {
		double sum_prod = 0.0;
		double sum_a = 0.0;
		double sum_b = 0.0;
		size_t count = 0;
		for (size_t p = 0; p < pairs; ++p) {
			const int i = coord(rng);
			const int j = coord(rng);
			const bool along_x = (rng() & 1ULL) != 0;
			const size_t a = graph.Index(i, j);
			const size_t b = along_x ? graph.Index(i + d, j) : graph.Index(i, j + d);
			if (skip_defects && (graph.IsDefect(a) || graph.IsDefect(b))) {
				continue;
			}
			const double sa = static_cast<double>(graph.Get(a));
			const double sb = static_cast<double>(graph.Get(b));
			sum_prod += sa * sb;
			sum_a += sa;
			sum_b += sb;
			++count;
		}
		if (count == 0) {
			result.push_back(0.0);
			continue;
		}
		const double n = static_cast<double>(count);
		result.push_back(sum_prod / n - (sum_a / n) * (sum_b / n));
	}
	return result;
}

std::vector<double> Sample(const AnyGraph& graph, const std::vector<int>& distances,
                           size_t pairs, bool skip_defects, std::mt19937_64& rng) {
	return std::visit([&](const auto& g) {
		return SampleCorrelation(*g, distances, pairs, skip_defects, rng);
	}, graph);
}

} // namespace

std::vector<int> DistanceDomain(int max_distance) {
	std::vector<int> distances;
	for (int d = 1; d <= max_distance; ++d) {
		distances.push_back(d);
	}
	return distances;
}

std::vector<double> SampleCorrelationPeriodic(const AnyGraph& graph, const std::vector<int>& distances,
                                              size_t pairs_per_distance, std::mt19937_64& rng) {
	return Sample(graph, distances, pairs_per_distance, false, rng);
}

std::vector<double> SampleCorrelationPeriodicDefects(const AnyGraph& graph, const std::vector<int>& distances,
                                                     size_t pairs_per_distance, std::mt19937_64& rng) {
	return Sample(graph, distances, pairs_per_distance, true, rng);
}

bool GraphHasDefects(const AnyGraph& graph) {
	return std::visit([](const auto& g) { return g->HasDefects(); }, graph);
}

CorrelationSampler::CorrelationSampler(size_t pairs_per_distance, uint64_t seed)
	: pairs_per_distance_(pairs_per_distance), rng_(seed) {}

std::vector<double> CorrelationSampler::operator()(const AnyGraph& graph, const std::vector<int>& distances) {
	if (GraphHasDefects(graph)) {
		VLOG(3) << "Sampling correlation with defect-aware estimator";
		return SampleCorrelationPeriodicDefects(graph, distances, pairs_per_distance_, rng_);
	}
	return SampleCorrelationPeriodic(graph, distances, pairs_per_distance_, rng_);
}

CorrelationFn CorrelationSampler::AsFunction() {
	return [this](const AnyGraph& graph, const std::vector<int>& distances) {
		return (*this)(graph, distances);
	};
}

} // namespace IsingSim
