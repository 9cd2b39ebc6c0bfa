#include "windowed_aggregator.h"

#include <numeric>
#include <stdexcept>

#include <glog/logging.h>

namespace IsingSim {

WindowedAggregator::WindowedAggregator(std::string name, size_t window, Reduction reduction)
	: name_(std::move(name)), window_(window), reduction_(reduction) {
	if (window_ == 0) {
		throw std::invalid_argument("WindowedAggregator " + name_ + ": window must be positive");
	}
	ring_.assign(window_, 0.0);
}

bool WindowedAggregator::RecordAndMaybeFlush(double sample) {
	absl::MutexLock lock(&mu_);
	// Overwriting the oldest slot and advancing head is the ring form of shift-left + append
	ring_[head_] = sample;
	head_ = (head_ + 1) % window_;

	if (++frames_ < window_) {
		return false;
	}
	const double sum = std::accumulate(ring_.begin(), ring_.end(), 0.0);
	const double value = reduction_ == Reduction::kMean ? sum / static_cast<double>(window_) : sum;
	output_.store(value, std::memory_order_release);
	flushes_.fetch_add(1, std::memory_order_relaxed);
	frames_ = 0;
	VLOG(3) << "Aggregator " << name_ << " flushed " << value;
	return true;
}

std::vector<double> WindowedAggregator::Snapshot() const {
	absl::MutexLock lock(&mu_);
	std::vector<double> out;
	out.reserve(window_);
	for (size_t i = 0; i < window_; ++i) {
		out.push_back(ring_[(head_ + i) % window_]);
	}
	return out;
}

size_t WindowedAggregator::FrameCount() const {
	absl::MutexLock lock(&mu_);
	return frames_;
}

void WindowedAggregator::Reset() {
	absl::MutexLock lock(&mu_);
	ring_.assign(window_, 0.0);
	head_ = 0;
	frames_ = 0;
	output_.store(0.0, std::memory_order_release);
}

} // namespace IsingSim
