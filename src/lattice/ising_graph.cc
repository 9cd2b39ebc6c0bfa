#include "ising_graph.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <glog/logging.h>

#include "../common/config.h"

namespace IsingSim {

namespace {

inline int Wrap(int x, int side) {
	x %= side;
	return x < 0 ? x + side : x;
}

} // namespace

template <typename StateT>
IsingGraph<StateT>::IsingGraph(int side, bool weighted, std::mt19937_64& rng)
	: side_(side),
	  site_count_(static_cast<size_t>(side) * static_cast<size_t>(side)),
	  weighted_(weighted),
	  hamiltonian_(weighted ? Hamiltonian::kWeighted : Hamiltonian::kPlain) {
	if (side < 2) {
		throw std::invalid_argument("IsingGraph side must be at least 2, got " + std::to_string(side));
	}
	state_ = std::make_unique<std::atomic<State>[]>(site_count_);
	defect_ = std::make_unique<std::atomic<bool>[]>(site_count_);

	nearest_.resize(site_count_ * 4);
	diagonal_.resize(site_count_ * 4);
	for (int i = 0; i < side_; ++i) {
		for (int j = 0; j < side_; ++j) {
			const size_t site = Index(i, j);
			nearest_[site * 4 + 0] = static_cast<uint32_t>(Index(i - 1, j));
			nearest_[site * 4 + 1] = static_cast<uint32_t>(Index(i + 1, j));
			nearest_[site * 4 + 2] = static_cast<uint32_t>(Index(i, j - 1));
			nearest_[site * 4 + 3] = static_cast<uint32_t>(Index(i, j + 1));
			diagonal_[site * 4 + 0] = static_cast<uint32_t>(Index(i - 1, j - 1));
			diagonal_[site * 4 + 1] = static_cast<uint32_t>(Index(i - 1, j + 1));
			diagonal_[site * 4 + 2] = static_cast<uint32_t>(Index(i + 1, j - 1));
			diagonal_[site * 4 + 3] = static_cast<uint32_t>(Index(i + 1, j + 1));
		}
	}

	Reinitialize(rng);
	VLOG(1) << "IsingGraph created: side=" << side_ << " sites=" << site_count_
		<< " weighted=" << weighted_;
}

template <typename StateT>
size_t IsingGraph<StateT>::Index(int i, int j) const {
	return static_cast<size_t>(Wrap(i, side_)) * static_cast<size_t>(side_) +
		static_cast<size_t>(Wrap(j, side_));
}

template <typename StateT>
typename IsingGraph<StateT>::EnergyFn IsingGraph<StateT>::EnergyFunction() const {
	return GetHamiltonian() == Hamiltonian::kWeighted ? &IsingGraph::WeightedLocalEnergy
		: &IsingGraph::PlainLocalEnergy;
}

template <typename StateT>
float IsingGraph<StateT>::PlainLocalEnergy(const IsingGraph& graph, size_t site) {
	const uint32_t* nn = &graph.nearest_[site * 4];
	float field = 0.0f;
	for (int k = 0; k < 4; ++k) {
		field += static_cast<float>(graph.Get(nn[k]));
	}
	return -field;
}

template <typename StateT>
float IsingGraph<StateT>::WeightedLocalEnergy(const IsingGraph& graph, size_t site) {
	const uint32_t* nn = &graph.nearest_[site * 4];
	const uint32_t* diag = &graph.diagonal_[site * 4];
	float field = 0.0f;
	float diag_field = 0.0f;
	for (int k = 0; k < 4; ++k) {
		field += static_cast<float>(graph.Get(nn[k]));
		diag_field += static_cast<float>(graph.Get(diag[k]));
	}
	return -(field + kDiagonalCouplingWeight * diag_field);
}

template <typename StateT>
double IsingGraph<StateT>::TotalMagnetization() const {
	double sum = 0.0;
	for (size_t site = 0; site < site_count_; ++site) {
		sum += static_cast<double>(Get(site));
	}
	return sum;
}

template <>
int8_t IsingGraph<int8_t>::RandomState(std::mt19937_64& rng) {
	return (rng() & 1ULL) ? int8_t{1} : int8_t{-1};
}

template <>
float IsingGraph<float>::RandomState(std::mt19937_64& rng) {
	std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
	return dist(rng);
}

template <>
int8_t IsingGraph<int8_t>::BrushState(float value) {
	return value < 0.0f ? int8_t{-1} : int8_t{1};
}

template <>
float IsingGraph<float>::BrushState(float value) {
	return std::clamp(value, -1.0f, 1.0f);
}

template <typename StateT>
void IsingGraph<StateT>::Reinitialize(std::mt19937_64& rng) {
	active_sites_.clear();
	active_sites_.reserve(site_count_);
	for (size_t site = 0; site < site_count_; ++site) {
		Set(site, RandomState(rng));
		defect_[site].store(false, std::memory_order_relaxed);
		active_sites_.push_back(static_cast<uint32_t>(site));
	}
	has_defects_.store(false, std::memory_order_release);
	hamiltonian_.store(weighted_ ? Hamiltonian::kWeighted : Hamiltonian::kPlain,
		std::memory_order_release);
}

template <typename StateT>
size_t IsingGraph<StateT>::AddRandomDefects(double fraction, std::mt19937_64& rng) {
	if (fraction <= 0.0 || active_sites_.empty()) {
		return 0;
	}
	fraction = std::min(fraction, 1.0);
	const size_t target = static_cast<size_t>(std::llround(fraction * static_cast<double>(active_sites_.size())));

	// Partial Fisher-Yates: the chosen sites end up at the tail
	size_t added = 0;
	while (added < target) {
		const size_t remaining = active_sites_.size() - added;
		std::uniform_int_distribution<size_t> pick(0, remaining - 1);
		std::swap(active_sites_[pick(rng)], active_sites_[remaining - 1]);
		const uint32_t site = active_sites_[remaining - 1];
		defect_[site].store(true, std::memory_order_relaxed);
		Set(site, State{0});
		++added;
	}
	active_sites_.resize(active_sites_.size() - added);
	std::sort(active_sites_.begin(), active_sites_.end());
	if (added > 0) {
		has_defects_.store(true, std::memory_order_release);
	}
	VLOG(1) << "Added " << added << " defects, " << active_sites_.size() << " active sites left";
	return added;
}

template <typename StateT>
void IsingGraph<StateT>::SetWeighted(bool weighted) {
	weighted_ = weighted;
	hamiltonian_.store(weighted ? Hamiltonian::kWeighted : Hamiltonian::kPlain,
		std::memory_order_release);
}

template <typename StateT>
BrushMask IsingGraph<StateT>::OrderedCircle(int radius) {
	BrushMask mask;
	if (radius < 0) {
		return mask;
	}
	const int r2 = radius * radius;
	for (int dx = -radius; dx <= radius; ++dx) {
		for (int dy = -radius; dy <= radius; ++dy) {
			if (dx * dx + dy * dy <= r2) {
				mask.emplace_back(dx, dy);
			}
		}
	}
	std::stable_sort(mask.begin(), mask.end(), [](const auto& a, const auto& b) {
		return a.first * a.first + a.second * a.second < b.first * b.first + b.second * b.second;
	});
	return mask;
}

template <typename StateT>
size_t IsingGraph<StateT>::PaintCircle(const BrushMask& mask, int i, int j, float value, bool clamp) {
	const State state = BrushState(value);
	size_t painted = 0;
	for (const auto& [dx, dy] : mask) {
		const int x = i + dx;
		const int y = j + dy;
		if (clamp && (x < 0 || x >= side_ || y < 0 || y >= side_)) {
			continue;
		}
		const size_t site = Index(x, y);
		if (IsDefect(site)) {
			continue;
		}
		Set(site, state);
		++painted;
	}
	return painted;
}

template class IsingGraph<int8_t>;
template class IsingGraph<float>;

AnyGraph MakeGraph(bool continuous, int side, bool weighted, std::mt19937_64& rng) {
	if (continuous) {
		return std::make_unique<ContinuousGraph>(side, weighted, rng);
	}
	return std::make_unique<DiscreteGraph>(side, weighted, rng);
}

} // namespace IsingSim
