#ifndef ESTUARY_STREAM_BATCH_POOL_H_
#define ESTUARY_STREAM_BATCH_POOL_H_

#include <atomic>
#include <cstddef>
#include <memory>

#include <glog/logging.h>
#include "folly/MPMCQueue.h"

#include "stream_batch.h"

namespace Estuary {

/**
 * BatchPool recycles fixed-capacity StreamBatches so operators do not allocate per event.
 *
 * Design:
 * - Returned batches are reset and cached in a lock-free folly::MPMCQueue
 * - Get() never fails: an empty cache falls back to a fresh allocation
 * - Returns beyond max_cached_batches are destroyed instead of cached
 * - Thread-safe; one pool is shared by every operator of the same key/payload/storage mode
 */
template <typename TKey, typename TPayload>
class BatchPool {
public:
	using Batch = StreamBatch<TKey, TPayload>;
	using Ptr = typename Batch::Ptr;

	/**
	 * Constructor
	 * @param batch_capacity Rows per batch handed out by this pool
	 * @param max_cached_batches Capacity of the free list
	 * @param is_columnar Storage mode this pool serves
	 */
	BatchPool(size_t batch_capacity, size_t max_cached_batches, bool is_columnar)
		: batch_capacity_(batch_capacity),
		  max_cached_batches_(max_cached_batches),
		  is_columnar_(is_columnar),
		  free_batches_(std::make_unique<folly::MPMCQueue<Batch*>>(max_cached_batches)) {
		if (batch_capacity_ == 0 || max_cached_batches_ == 0) {
			LOG(FATAL) << "BatchPool: Invalid parameters (batch_capacity=" << batch_capacity_
				<< ", max_cached_batches=" << max_cached_batches_ << ")";
		}
		VLOG(1) << "BatchPool initialized: capacity=" << batch_capacity_
			<< " rows, cache=" << max_cached_batches_
			<< (is_columnar_ ? " (columnar)" : " (row-oriented)");
	}

	~BatchPool() {
		size_t outstanding = outstanding_count_.load(std::memory_order_relaxed);
		if (outstanding > 0) {
			VLOG(1) << "BatchPool destructor: " << outstanding
				<< " batches still held by operators or consumers";
		}
		Batch* batch = nullptr;
		while (free_batches_->read(batch)) {
			delete batch;
		}
	}

	/**
	 * Acquire an empty, unsealed batch with the pool's capacity.
	 * Thread-safe. Non-blocking.
	 */
	Ptr Get() {
		Batch* batch = nullptr;
		if (!free_batches_->read(batch)) {
			batch = new Batch(batch_capacity_);
			created_count_.fetch_add(1, std::memory_order_relaxed);
			VLOG(3) << "BatchPool::Get: cache empty, allocated batch " << batch;
		}
		batch->Allocate();
		outstanding_count_.fetch_add(1, std::memory_order_relaxed);
		return Ptr(batch);
	}

	/**
	 * Return a batch for reuse. The caller must not touch it afterwards.
	 * Thread-safe. Non-blocking.
	 */
	void Return(Ptr batch) {
		if (!batch) {
			LOG(WARNING) << "BatchPool::Return: Attempted to return nullptr";
			return;
		}

		size_t prev = outstanding_count_.fetch_sub(1, std::memory_order_relaxed);
		if (prev == 0) {
			// Batch was built outside this pool; keep the counter at zero.
			outstanding_count_.fetch_add(1, std::memory_order_relaxed);
		}

		if (batch->Capacity() != batch_capacity_) {
			LOG(ERROR) << "BatchPool::Return: batch capacity " << batch->Capacity()
				<< " does not match pool capacity " << batch_capacity_ << "; dropping it";
			return;
		}

		batch->Allocate();
		Batch* raw = batch.release();
		if (!free_batches_->write(raw)) {
			// Cache full
			delete raw;
		}
	}

	size_t batch_capacity() const { return batch_capacity_; }
	bool is_columnar() const { return is_columnar_; }

	// Batches currently handed out and not yet returned
	size_t GetOutstandingCount() const { return outstanding_count_.load(std::memory_order_relaxed); }

	// Batches ever constructed by this pool
	size_t GetCreatedCount() const { return created_count_.load(std::memory_order_relaxed); }

	size_t GetCachedCount() const {
		auto guess = free_batches_->sizeGuess();
		return guess > 0 ? static_cast<size_t>(guess) : 0;
	}

private:
	const size_t batch_capacity_;
	const size_t max_cached_batches_;
	const bool is_columnar_;

	// Lock-free queue of reusable batches (owned)
	std::unique_ptr<folly::MPMCQueue<Batch*>> free_batches_;

	std::atomic<size_t> outstanding_count_{0};
	std::atomic<size_t> created_count_{0};

	BatchPool(const BatchPool&) = delete;
	BatchPool& operator=(const BatchPool&) = delete;
};

} // namespace Estuary

#endif // ESTUARY_STREAM_BATCH_POOL_H_
