#pragma once

#include <cstdint>

#include "common/config.h"

namespace Estuary {

/**
 * Last punctuation time an operator has emitted downstream.
 * Never decreases; a punctuation at or below it is redundant.
 */
class WatermarkTracker {
public:
	WatermarkTracker() = default;

	int64_t Current() const { return current_; }

	bool IsRedundant(int64_t punctuation_time) const { return punctuation_time <= current_; }

	// Raises the watermark; returns false and leaves it unchanged when t is redundant.
	bool Advance(int64_t t) {
		if (t <= current_) return false;
		current_ = t;
		return true;
	}

	// Checkpoint restore only
	void Restore(int64_t t) { current_ = t; }

private:
	int64_t current_ = kMinSyncTime;
};

} // namespace Estuary
