#pragma once

#include <cstddef>
#include <cstdint>

namespace IsingSim {

/// Moving-average window length shared by the frame statistics (frames)
constexpr size_t kDefaultStatsWindow = 60;
/// Brush radius as a fraction of the lattice side
constexpr double kBrushRadiusFraction = 0.1;
/// Weight applied to the diagonal couplings of a weighted lattice
constexpr float kDiagonalCouplingWeight = 0.5f;
/// Upper bound on a single wait slice while a sweep sleeps, keeps cancellation responsive
constexpr int64_t kSweepWaitSliceMs = 50;
/// Interval between the driver's statistics log lines
constexpr int64_t kStatsLogPeriodMs = 1000;

} // namespace IsingSim
