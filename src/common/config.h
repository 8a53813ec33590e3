#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

#include "configuration.h"

namespace Estuary {

/// Reserved other-time marking a row as a punctuation.
constexpr int64_t kPunctuationOtherTime = std::numeric_limits<int64_t>::min();
/// Sync-time of a punctuation that closes a stream.
constexpr int64_t kInfinitySyncTime = std::numeric_limits<int64_t>::max();
/// Initial value of next-time cursors and of the output watermark.
constexpr int64_t kMinSyncTime = std::numeric_limits<int64_t>::min();
/// Other-time written into a redundant punctuation when it is turned into a deleted row.
constexpr int64_t kDeletedPlaceholderOtherTime = 0;

/// Rows per bitvector word.
constexpr size_t kBitvectorWordBits = 64;

/// Output batch capacity.
inline size_t DataBatchSize() {
	return Configuration::getInstance().getDataBatchSize();
}

/// Read on every fast-path decision so a change takes effect on the next batch.
inline bool DeterministicWithinTimestamp() {
	return Configuration::getInstance().getDeterministicWithinTimestamp();
}

}  // namespace Estuary
