#ifndef ESTUARY_STREAM_STREAM_BATCH_H_
#define ESTUARY_STREAM_STREAM_BATCH_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <glog/logging.h>

#include "common/config.h"

namespace Estuary {

/**
 * Key type of streams that are not grouped
 */
struct Empty {
	bool operator==(const Empty&) const { return true; }
	bool operator!=(const Empty&) const { return false; }
};

inline bool IsPunctuation(int64_t other_time) {
	return other_time == kPunctuationOtherTime;
}

// Start edges, end edges and intervals all carry a non-negative other-time.
inline bool IsDataEvent(int64_t other_time) {
	return other_time >= 0;
}

/**
 * Fixed-capacity columnar batch of events.
 *
 * Row i is (vsync[i], vother[i], key[i], payload[i], hash[i]) plus bit i of the
 * deletion bitvector. Rows [0, Count()) are valid; iter is the consumption cursor
 * of whoever currently reads the batch. Once sealed the batch is immutable until
 * the pool hands it out again through Allocate().
 */
template <typename TKey, typename TPayload>
class StreamBatch {
public:
	using Ptr = std::unique_ptr<StreamBatch>;
	using KeyType = TKey;
	using PayloadType = TPayload;

	explicit StreamBatch(size_t capacity)
		: vsync(capacity),
		  vother(capacity),
		  key(capacity),
		  payload(capacity),
		  hash(capacity),
		  bitvector((capacity + kBitvectorWordBits - 1) / kBitvectorWordBits, 0),
		  capacity_(capacity) {}

	StreamBatch(const StreamBatch&) = delete;
	StreamBatch& operator=(const StreamBatch&) = delete;

	// Prepare for reuse: empty, unsealed, cursor at the start, no deleted rows.
	void Allocate() {
		count_ = 0;
		iter = 0;
		sealed_ = false;
		std::fill(bitvector.begin(), bitvector.end(), 0);
	}

	size_t Count() const { return count_; }
	size_t Capacity() const { return capacity_; }
	bool IsFull() const { return count_ == capacity_; }
	bool IsSealed() const { return sealed_; }

	void Seal() { sealed_ = true; }

	bool IsDeleted(size_t i) const {
		return (bitvector[i >> 6] & (1ULL << (i & 0x3f))) != 0;
	}

	// Permitted on a sealed batch by whoever holds its Ptr exclusively.
	void SetDeleted(size_t i) {
		bitvector[i >> 6] |= (1ULL << (i & 0x3f));
	}

	// Punctuations are visible whatever their deletion bit says.
	bool IsVisible(size_t i) const {
		return !(IsDeleted(i) && IsDataEvent(vother[i]));
	}

	// Claim the next free row; the caller fills every column.
	size_t AppendSlot() {
		DCHECK(!sealed_) << "Append to sealed batch";
		DCHECK_LT(count_, capacity_);
		return count_++;
	}

	size_t Add(int64_t sync_time, int64_t other_time, const TKey& k, const TPayload& p, int32_t h) {
		size_t i = AppendSlot();
		vsync[i] = sync_time;
		vother[i] = other_time;
		key[i] = k;
		payload[i] = p;
		hash[i] = h;
		return i;
	}

	size_t AddPunctuation(int64_t sync_time) {
		size_t i = AppendSlot();
		vsync[i] = sync_time;
		vother[i] = kPunctuationOtherTime;
		key[i] = TKey();
		payload[i] = TPayload();
		hash[i] = 0;
		return i;
	}

	// Used by checkpoint restore, which writes the columns directly.
	void SetCount(size_t count) {
		DCHECK_LE(count, capacity_);
		count_ = count;
	}

	std::vector<int64_t> vsync;
	std::vector<int64_t> vother;
	std::vector<TKey> key;
	std::vector<TPayload> payload;
	std::vector<int32_t> hash;
	std::vector<uint64_t> bitvector;

	size_t iter = 0;

private:
	size_t capacity_;
	size_t count_ = 0;
	bool sealed_ = false;
};

} // namespace Estuary

#endif // ESTUARY_STREAM_STREAM_BATCH_H_
