#pragma once

#include <algorithm>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <glog/logging.h>

#include "common/config.h"
#include "diagnostics/plan_node.h"
#include "stream/column_codec.h"
#include "stream/memory_manager.h"
#include "binary_pipe.h"
#include "watermark_tracker.h"

namespace Estuary {

struct UnionPipeStats {
	uint64_t left_batches_forwarded = 0;   // Whole left batches moved downstream without copying
	uint64_t right_batches_forwarded = 0;
	uint64_t rows_copied = 0;              // Rows transplanted into the output batch
	uint64_t punctuations_suppressed = 0;  // Redundant punctuations dropped or rewritten as deleted rows
	uint64_t output_batches_flushed = 0;
};

/**
 * Temporal union of two sync-time-ordered streams with the same key and payload types.
 *
 * Output is ordered by sync-time; on equal sync-times the left event comes first
 * (at batch boundaries only when deterministic_within_timestamp is set). A whole
 * input batch that precedes everything pending on the other side is moved downstream
 * as is; otherwise rows are merged one by one into an output batch taken from the pool.
 * Punctuations at or below the last emitted one are never passed on.
 *
 * Inputs are assumed to be ordered; this is not checked.
 */
template <typename TKey, typename TPayload>
class UnionPipe : public BinaryPipe<TKey, TPayload> {
	public:
		using Base = BinaryPipe<TKey, TPayload>;
		using typename Base::Batch;
		using typename Base::BatchPtr;
		using typename Base::Observer;
		using typename Base::Pool;

		/**
		 * Binds to the process-wide pool for the stream's storage mode
		 */
		UnionPipe(const StreamProperties& properties, std::shared_ptr<Observer> observer)
			: UnionPipe(properties, std::move(observer),
					MemoryManager::GetMemoryPool<TKey, TPayload>(properties.is_columnar)) {}

		UnionPipe(const StreamProperties& properties, std::shared_ptr<Observer> observer,
				std::shared_ptr<Pool> pool)
			: Base(std::move(observer), std::move(pool)),
			  error_messages_(properties.error_messages) {
			output_ = this->pool().Get();
		}

		~UnionPipe() override {
			if (output_) this->pool().Return(std::move(output_));
		}

		void ProcessBothBatches(BatchPtr& left_batch, BatchPtr& right_batch,
				bool& left_batch_done, bool& right_batch_done,
				bool& left_batch_free, bool& right_batch_free) override;

		void ProcessLeftBatch(BatchPtr& batch, bool& is_batch_done, bool& is_batch_free) override;
		void ProcessRightBatch(BatchPtr& batch, bool& is_batch_done, bool& is_batch_free) override;

		void FlushContents() override;

		size_t CurrentlyBufferedOutputCount() const override {
			return output_ ? output_->Count() : 0;
		}

		// Serialize next-time cursors, watermark and buffered output
		bool Checkpoint(std::ostream& os) const;

		// Replace state with a checkpoint; on failure the state is left untouched
		bool Restore(std::istream& is);

		int64_t next_left_time() const { return next_left_time_; }
		int64_t next_right_time() const { return next_right_time_; }
		int64_t watermark() const { return watermark_.Current(); }
		const UnionPipeStats& stats() const { return stats_; }

		/**
		 * Advance batch.iter past deleted data events.
		 * @return true if batch.iter now points at a visible row
		 */
		static bool GoToVisibleRow(Batch& batch);

		/**
		 * Upper bound on the sync-times of a batch's visible rows.
		 * Punctuations may trail the last data event with larger times, so the
		 * bound covers the last visible row and every punctuation right before it.
		 * @return std::nullopt when no row is visible
		 */
		static std::optional<int64_t> MaxBatchSyncTime(const Batch& batch);

	protected:
		void DisposeState() override;

		void OnLeftDrained() override {
			left_drained_ = true;
			next_left_time_ = kInfinitySyncTime;
		}

		void OnRightDrained() override {
			right_drained_ = true;
			next_right_time_ = kInfinitySyncTime;
		}

		void ProduceBinaryQueryPlan(PlanNode::Ptr left, PlanNode::Ptr right) override;

	private:
		void OutputCurrentTuple(const Batch& batch);
		void OutputBatch(BatchPtr& batch);

		std::string error_messages_;
		BatchPtr output_;

		int64_t next_left_time_ = kMinSyncTime;
		int64_t next_right_time_ = kMinSyncTime;
		WatermarkTracker watermark_;

		bool left_drained_ = false;
		bool right_drained_ = false;

		UnionPipeStats stats_;
};

template <typename TKey, typename TPayload>
void UnionPipe<TKey, TPayload>::ProcessBothBatches(BatchPtr& left_batch, BatchPtr& right_batch,
		bool& left_batch_done, bool& right_batch_done,
		bool& left_batch_free, bool& right_batch_free) {
	left_batch_free = right_batch_free = true;

	std::optional<int64_t> last_left_time;
	std::optional<int64_t> last_right_time;

	bool first = (left_batch->iter == 0);
	if (!GoToVisibleRow(*left_batch)) {
		left_batch_done = true;
		right_batch_done = false;
		return;
	}

	next_left_time_ = left_batch->vsync[left_batch->iter];
	if (first) last_left_time = MaxBatchSyncTime(*left_batch);

	first = (right_batch->iter == 0);
	if (!GoToVisibleRow(*right_batch)) {
		left_batch_done = false;
		right_batch_done = true;
		return;
	}

	next_right_time_ = right_batch->vsync[right_batch->iter];
	if (first) last_right_time = MaxBatchSyncTime(*right_batch);

	if (last_left_time && last_right_time) {
		left_batch_done = right_batch_done = false;
		if (*last_left_time <= next_right_time_) {
			OutputBatch(left_batch);
			++stats_.left_batches_forwarded;
			left_batch_done = true;
			left_batch_free = false;
		}

		if (DeterministicWithinTimestamp() ? (*last_right_time < next_left_time_)
				: (*last_right_time <= next_left_time_)) {
			OutputBatch(right_batch);
			++stats_.right_batches_forwarded;
			right_batch_done = true;
			right_batch_free = false;
		}

		if (left_batch_done || right_batch_done) return;
	}

	while (true) {
		if (next_left_time_ <= next_right_time_) {
			OutputCurrentTuple(*left_batch);

			left_batch->iter++;

			if (!GoToVisibleRow(*left_batch)) {
				left_batch_done = true;
				right_batch_done = false;
				return;
			}

			next_left_time_ = left_batch->vsync[left_batch->iter];
		} else {
			OutputCurrentTuple(*right_batch);

			right_batch->iter++;

			if (!GoToVisibleRow(*right_batch)) {
				left_batch_done = false;
				right_batch_done = true;
				return;
			}

			next_right_time_ = right_batch->vsync[right_batch->iter];
		}
	}
}

template <typename TKey, typename TPayload>
void UnionPipe<TKey, TPayload>::ProcessLeftBatch(BatchPtr& batch, bool& is_batch_done, bool& is_batch_free) {
	is_batch_free = true;
	if (batch->iter == 0) {
		std::optional<int64_t> max_left_time = MaxBatchSyncTime(*batch);
		if (max_left_time && *max_left_time <= next_right_time_) {
			OutputBatch(batch);
			++stats_.left_batches_forwarded;
			is_batch_done = true;
			is_batch_free = false;
			return;
		}
	}

	while (true) {
		if (!GoToVisibleRow(*batch)) {
			is_batch_done = true;
			return;
		}

		next_left_time_ = batch->vsync[batch->iter];

		if (!right_drained_ && next_left_time_ > next_right_time_) {
			is_batch_done = false;
			return;
		}

		OutputCurrentTuple(*batch);

		batch->iter++;
	}
}

template <typename TKey, typename TPayload>
void UnionPipe<TKey, TPayload>::ProcessRightBatch(BatchPtr& batch, bool& is_batch_done, bool& is_batch_free) {
	is_batch_free = true;
	if (batch->iter == 0) {
		std::optional<int64_t> max_right_time = MaxBatchSyncTime(*batch);
		if (max_right_time && (DeterministicWithinTimestamp() ? (*max_right_time < next_left_time_)
				: (*max_right_time <= next_left_time_))) {
			OutputBatch(batch);
			++stats_.right_batches_forwarded;
			is_batch_done = true;
			is_batch_free = false;
			return;
		}
	}

	while (true) {
		if (!GoToVisibleRow(*batch)) {
			is_batch_done = true;
			return;
		}

		next_right_time_ = batch->vsync[batch->iter];

		// Stop at equal times too: a left event with this sync-time may still arrive.
		if (!left_drained_ && next_right_time_ >= next_left_time_) {
			is_batch_done = false;
			return;
		}

		OutputCurrentTuple(*batch);

		batch->iter++;
	}
}

template <typename TKey, typename TPayload>
bool UnionPipe<TKey, TPayload>::GoToVisibleRow(Batch& batch) {
	while (batch.iter < batch.Count() && !batch.IsVisible(batch.iter))
		batch.iter++;

	return batch.iter != batch.Count();
}

template <typename TKey, typename TPayload>
std::optional<int64_t> UnionPipe<TKey, TPayload>::MaxBatchSyncTime(const Batch& batch) {
	std::optional<int64_t> max;
	for (size_t i = batch.Count(); i-- > 0;) {
		// Skip deleted data events
		if (!batch.IsVisible(i)) continue;

		max = max ? std::max(*max, batch.vsync[i]) : batch.vsync[i];
		if (!IsPunctuation(batch.vother[i])) break;
	}

	return max;
}

template <typename TKey, typename TPayload>
void UnionPipe<TKey, TPayload>::OutputCurrentTuple(const Batch& batch) {
	const size_t src = batch.iter;
	if (IsPunctuation(batch.vother[src])) {
		if (!watermark_.Advance(batch.vsync[src])) {
			++stats_.punctuations_suppressed;
			return;
		}
	}

	size_t index = output_->AppendSlot();
	output_->vsync[index] = batch.vsync[src];
	output_->vother[index] = batch.vother[src];
	output_->key[index] = batch.key[src];
	output_->payload[index] = batch.payload[src];
	output_->hash[index] = batch.hash[src];
	if (batch.IsDeleted(src)) output_->SetDeleted(index);
	++stats_.rows_copied;

	if (output_->IsFull()) FlushContents();
}

template <typename TKey, typename TPayload>
void UnionPipe<TKey, TPayload>::OutputBatch(BatchPtr& batch) {
	int64_t updated_watermark = watermark_.Current();
	for (size_t i = 0; i < batch->Count(); i++) {
		if (!IsPunctuation(batch->vother[i])) continue;

		if (batch->vsync[i] <= updated_watermark) {
			// Downstream must never see a redundant punctuation; turn it into a deleted data event.
			batch->vother[i] = kDeletedPlaceholderOtherTime;
			batch->SetDeleted(i);
			++stats_.punctuations_suppressed;
		} else {
			updated_watermark = batch->vsync[i];
		}
	}
	watermark_.Advance(updated_watermark);

	// Buffered rows precede everything in this batch.
	FlushContents();

	VLOG(2) << "UnionPipe: forwarding whole batch of " << batch->Count() << " rows";
	batch->Seal();
	this->observer().OnNext(std::move(batch));
}

template <typename TKey, typename TPayload>
void UnionPipe<TKey, TPayload>::FlushContents() {
	if (!output_ || output_->Count() == 0) return;

	VLOG(3) << "UnionPipe: flushing " << output_->Count() << " buffered rows";
	output_->Seal();
	++stats_.output_batches_flushed;
	this->observer().OnNext(std::move(output_));
	output_ = this->pool().Get();
}

template <typename TKey, typename TPayload>
void UnionPipe<TKey, TPayload>::DisposeState() {
	if (output_) this->pool().Return(std::move(output_));
	VLOG(1) << "UnionPipe disposed: forwarded " << stats_.left_batches_forwarded << " left and "
		<< stats_.right_batches_forwarded << " right batches, copied " << stats_.rows_copied
		<< " rows, suppressed " << stats_.punctuations_suppressed << " punctuations, flushed "
		<< stats_.output_batches_flushed << " output batches";
}

template <typename TKey, typename TPayload>
void UnionPipe<TKey, TPayload>::ProduceBinaryQueryPlan(PlanNode::Ptr left, PlanNode::Ptr right) {
	auto node = std::make_shared<UnionPlanNode>(std::move(left), std::move(right), this,
			TypeName<TKey>(), TypeName<TPayload>(), false, false, error_messages_);
	this->observer().ProduceQueryPlan(std::move(node));
}

template <typename TKey, typename TPayload>
bool UnionPipe<TKey, TPayload>::Checkpoint(std::ostream& os) const {
	const size_t count = output_ ? output_->Count() : 0;

	checkpoint::StateHeader header{};
	header.magic = checkpoint::kStateMagic;
	header.version = checkpoint::kStateFormatVersion;
	header.flags = 0;
	header.next_left_time = next_left_time_;
	header.next_right_time = next_right_time_;
	header.watermark = watermark_.Current();
	header.output_count = count;
	header.output_capacity = output_ ? output_->Capacity() : this->pool().batch_capacity();
	os.write(reinterpret_cast<const char*>(&header), sizeof(header));

	if (count > 0) {
		checkpoint::ColumnCodec<int64_t>::Write(os, output_->vsync, count);
		checkpoint::ColumnCodec<int64_t>::Write(os, output_->vother, count);
		checkpoint::ColumnCodec<TKey>::Write(os, output_->key, count);
		checkpoint::ColumnCodec<TPayload>::Write(os, output_->payload, count);
		checkpoint::ColumnCodec<int32_t>::Write(os, output_->hash, count);
		checkpoint::ColumnCodec<uint64_t>::Write(os, output_->bitvector,
				(count + kBitvectorWordBits - 1) / kBitvectorWordBits);
	}

	if (!os) {
		LOG(ERROR) << "UnionPipe::Checkpoint: failed to write state";
		return false;
	}
	return true;
}

template <typename TKey, typename TPayload>
bool UnionPipe<TKey, TPayload>::Restore(std::istream& is) {
	checkpoint::StateHeader header{};
	if (!is.read(reinterpret_cast<char*>(&header), sizeof(header))) {
		LOG(ERROR) << "UnionPipe::Restore: truncated state header";
		return false;
	}
	if (header.magic != checkpoint::kStateMagic) {
		LOG(ERROR) << "UnionPipe::Restore: bad magic 0x" << std::hex << header.magic << std::dec;
		return false;
	}
	if (header.version != checkpoint::kStateFormatVersion) {
		LOG(ERROR) << "UnionPipe::Restore: unsupported format version " << header.version;
		return false;
	}
	if (!output_) {
		LOG(ERROR) << "UnionPipe::Restore: operator already disposed";
		return false;
	}
	if (header.output_count > output_->Capacity()) {
		LOG(ERROR) << "UnionPipe::Restore: checkpoint holds " << header.output_count
			<< " buffered rows but output capacity is " << output_->Capacity();
		return false;
	}

	const size_t count = static_cast<size_t>(header.output_count);
	BatchPtr restored = this->pool().Get();
	if (count > 0) {
		bool ok = checkpoint::ColumnCodec<int64_t>::Read(is, restored->vsync, count) &&
			checkpoint::ColumnCodec<int64_t>::Read(is, restored->vother, count) &&
			checkpoint::ColumnCodec<TKey>::Read(is, restored->key, count) &&
			checkpoint::ColumnCodec<TPayload>::Read(is, restored->payload, count) &&
			checkpoint::ColumnCodec<int32_t>::Read(is, restored->hash, count) &&
			checkpoint::ColumnCodec<uint64_t>::Read(is, restored->bitvector,
					(count + kBitvectorWordBits - 1) / kBitvectorWordBits);
		if (!ok) {
			LOG(ERROR) << "UnionPipe::Restore: truncated output batch (" << count << " rows expected)";
			this->pool().Return(std::move(restored));
			return false;
		}
		restored->SetCount(count);
	}

	this->pool().Return(std::move(output_));
	output_ = std::move(restored);
	next_left_time_ = header.next_left_time;
	next_right_time_ = header.next_right_time;
	watermark_.Restore(header.watermark);
	return true;
}

} // namespace Estuary
