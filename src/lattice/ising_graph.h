#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <random>
#include <utility>
#include <variant>
#include <vector>

namespace IsingSim {

// Energy-function selector. Changing it is a structural change and only
// happens while the hot loop is parked.
enum class Hamiltonian {
	kPlain,     // nearest neighbours, unit couplings
	kWeighted   // nearest plus diagonal neighbours
};

using BrushMask = std::vector<std::pair<int, int>>;

/**
 * Periodic square lattice with per-site atomic state.
 *
 * Single-site reads and writes are relaxed atomics: the hot loop, the brush
 * path and the maintenance readers touch one slot at a time, so a reader may
 * observe an interleaved lattice but never a torn site. Structural fields
 * (active list, Hamiltonian selector) are mutated only through
 * HotLoopController::RequestReconfigure.
 */
template <typename StateT>
class IsingGraph {
public:
	using State = StateT;
	// Immutable energy query captured by a step function at branch time
	using EnergyFn = float (*)(const IsingGraph&, size_t);

	IsingGraph(int side, bool weighted, std::mt19937_64& rng);

	IsingGraph(const IsingGraph&) = delete;
	IsingGraph& operator=(const IsingGraph&) = delete;

	int Side() const { return side_; }
	size_t SiteCount() const { return site_count_; }
	bool Weighted() const { return weighted_; }

	State Get(size_t site) const { return state_[site].load(std::memory_order_relaxed); }
	void Set(size_t site, State value) { state_[site].store(value, std::memory_order_relaxed); }
	size_t Index(int i, int j) const;

	// Returns -sum_j w_ij s_j for the current selector
	float LocalEnergyFactor(size_t site) const { return EnergyFunction()(*this, site); }
	EnergyFn EnergyFunction() const;
	Hamiltonian GetHamiltonian() const { return hamiltonian_.load(std::memory_order_acquire); }

	// Active (non-defect) sites, sampled uniformly by the step function
	const std::vector<uint32_t>& ActiveSites() const { return active_sites_; }
	bool IsDefect(size_t site) const { return defect_[site].load(std::memory_order_relaxed); }
	bool HasDefects() const { return has_defects_.load(std::memory_order_acquire); }

	double TotalMagnetization() const;

	// Structural mutators, callers must hold the hot loop parked
	void Reinitialize(std::mt19937_64& rng);
	size_t AddRandomDefects(double fraction, std::mt19937_64& rng);
	void SetWeighted(bool weighted);

	// Brush edit path. Runs beside the hot loop; callers serialize it against
	// the structural mutators so a site turned into a defect keeps state 0
	static BrushMask OrderedCircle(int radius);
	size_t PaintCircle(const BrushMask& mask, int i, int j, float value, bool clamp);

	// Draws a uniform state from the representation's domain
	static State RandomState(std::mt19937_64& rng);

private:
	static float PlainLocalEnergy(const IsingGraph& graph, size_t site);
	static float WeightedLocalEnergy(const IsingGraph& graph, size_t site);
	static State BrushState(float value);

	const int side_;
	const size_t site_count_;
	bool weighted_;

	std::unique_ptr<std::atomic<State>[]> state_;
	std::unique_ptr<std::atomic<bool>[]> defect_;
	std::atomic<bool> has_defects_{false};
	std::vector<uint32_t> active_sites_;
	std::atomic<Hamiltonian> hamiltonian_;

	// [site * 4 + k], filled once at construction
	std::vector<uint32_t> nearest_;
	std::vector<uint32_t> diagonal_;
};

template <> int8_t IsingGraph<int8_t>::RandomState(std::mt19937_64& rng);
template <> float IsingGraph<float>::RandomState(std::mt19937_64& rng);
template <> int8_t IsingGraph<int8_t>::BrushState(float value);
template <> float IsingGraph<float>::BrushState(float value);

extern template class IsingGraph<int8_t>;
extern template class IsingGraph<float>;

using DiscreteGraph = IsingGraph<int8_t>;
using ContinuousGraph = IsingGraph<float>;

// The two incompatible state representations, selected once per session
using AnyGraph = std::variant<std::unique_ptr<DiscreteGraph>, std::unique_ptr<ContinuousGraph>>;

AnyGraph MakeGraph(bool continuous, int side, bool weighted, std::mt19937_64& rng);

} // namespace IsingSim
