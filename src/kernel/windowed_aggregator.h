#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

namespace IsingSim {

/**
 * Fixed-length moving window over a low-frequency sample stream.
 *
 * Every recording evicts the oldest sample. Every `window` recordings the
 * reduction of the whole window is published to Output(); readers in between
 * observe the previous window's value. Recording is expected to happen from
 * one gated task at a time; the internal mutex only protects snapshot readers.
 */
class WindowedAggregator {
public:
	enum class Reduction {
		kMean,  // sum(window) / window
		kSum    // sum(window)
	};

	WindowedAggregator(std::string name, size_t window, Reduction reduction = Reduction::kMean);

	WindowedAggregator(const WindowedAggregator&) = delete;
	WindowedAggregator& operator=(const WindowedAggregator&) = delete;

	// Returns true when this recording crossed a flush boundary
	bool RecordAndMaybeFlush(double sample);

	double Output() const { return output_.load(std::memory_order_acquire); }
	uint64_t Flushes() const { return flushes_.load(std::memory_order_relaxed); }

	// Oldest sample first
	std::vector<double> Snapshot() const;
	size_t FrameCount() const;
	size_t Window() const { return window_; }
	const std::string& Name() const { return name_; }

	// Zeroes the window, the frame counter and the published output
	void Reset();

private:
	const std::string name_;
	const size_t window_;
	const Reduction reduction_;

	mutable absl::Mutex mu_;
	std::vector<double> ring_ ABSL_GUARDED_BY(mu_);
	size_t head_ ABSL_GUARDED_BY(mu_) = 0;   // slot of the oldest sample
	size_t frames_ ABSL_GUARDED_BY(mu_) = 0;

	std::atomic<double> output_{0.0};
	std::atomic<uint64_t> flushes_{0};
};

} // namespace IsingSim
