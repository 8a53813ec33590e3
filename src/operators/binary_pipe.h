#pragma once

#include <cstddef>
#include <deque>
#include <memory>

#include <glog/logging.h>

#include "diagnostics/plan_node.h"
#include "stream/batch_pool.h"
#include "stream/interfaces.h"

namespace Estuary {

/**
 * Pull driver shared by binary operators.
 *
 * Incoming batches are queued per side. Whenever a batch arrives the driver hands
 * the operator one batch from each side, or a single batch when the other side has
 * nothing pending, and inspects the done/free flags the operator reports:
 *   done && free   - the operator is finished with the batch; it goes back to the pool
 *   done && !free  - the operator moved the batch downstream; the queue slot is empty
 *   !done          - the batch stays at the head of its queue with its cursor where
 *                    the operator left it
 */
template <typename TKey, typename TPayload>
class BinaryPipe {
	public:
		using Batch = StreamBatch<TKey, TPayload>;
		using BatchPtr = typename Batch::Ptr;
		using Observer = IStreamObserver<TKey, TPayload>;
		using Pool = BatchPool<TKey, TPayload>;

		BinaryPipe(std::shared_ptr<Observer> observer, std::shared_ptr<Pool> pool)
			: observer_(std::move(observer)), pool_(std::move(pool)) {
			CHECK(observer_) << "BinaryPipe requires an observer";
			CHECK(pool_) << "BinaryPipe requires a batch pool";
		}

		virtual ~BinaryPipe() = default;

		BinaryPipe(const BinaryPipe&) = delete;
		BinaryPipe& operator=(const BinaryPipe&) = delete;

		void OnNextLeft(BatchPtr batch) { Enqueue(left_queue_, left_completed_, std::move(batch), "left"); }
		void OnNextRight(BatchPtr batch) { Enqueue(right_queue_, right_completed_, std::move(batch), "right"); }

		void OnCompletedLeft() {
			left_completed_ = true;
			Process();
		}

		void OnCompletedRight() {
			right_completed_ = true;
			Process();
		}

		void OnFlush() {
			FlushContents();
			observer_->OnFlush();
		}

		void ProduceQueryPlan(PlanNode::Ptr left, PlanNode::Ptr right) {
			ProduceBinaryQueryPlan(std::move(left), std::move(right));
		}

		// Releases queued input and the operator's own state back to the pool.
		void Dispose() {
			for (auto* queue : {&left_queue_, &right_queue_}) {
				for (auto& batch : *queue) {
					if (batch) pool_->Return(std::move(batch));
				}
				queue->clear();
			}
			DisposeState();
		}

		/**
		 * Merge one batch from each side.
		 * Flags report, per side, whether the batch is finished and whether the
		 * caller still owns it (free) or it was moved downstream (not free).
		 */
		virtual void ProcessBothBatches(BatchPtr& left_batch, BatchPtr& right_batch,
				bool& left_batch_done, bool& right_batch_done,
				bool& left_batch_free, bool& right_batch_free) = 0;

		// Consume a left batch while the right side has nothing pending
		virtual void ProcessLeftBatch(BatchPtr& batch, bool& is_batch_done, bool& is_batch_free) = 0;

		// Consume a right batch while the left side has nothing pending
		virtual void ProcessRightBatch(BatchPtr& batch, bool& is_batch_done, bool& is_batch_free) = 0;

		// Seal and emit whatever output is buffered
		virtual void FlushContents() = 0;

		virtual size_t CurrentlyBufferedOutputCount() const = 0;

		size_t LeftQueueSize() const { return left_queue_.size(); }
		size_t RightQueueSize() const { return right_queue_.size(); }
		bool IsCompleted() const { return completed_; }

	protected:
		virtual void DisposeState() {}

		// A completed side whose queue is empty will never produce again
		virtual void OnLeftDrained() {}
		virtual void OnRightDrained() {}

		virtual void ProduceBinaryQueryPlan(PlanNode::Ptr left, PlanNode::Ptr right) = 0;

		Observer& observer() const { return *observer_; }
		Pool& pool() const { return *pool_; }

	private:
		void Enqueue(std::deque<BatchPtr>& queue, bool completed, BatchPtr batch, const char* side) {
			if (!batch) {
				LOG(WARNING) << "BinaryPipe: ignoring null " << side << " batch";
				return;
			}
			if (completed) {
				LOG(ERROR) << "BinaryPipe: " << side << " batch arrived after completion; dropping it";
				pool_->Return(std::move(batch));
				return;
			}
			queue.push_back(std::move(batch));
			Process();
		}

		void Process() {
			while (true) {
				SignalDrained();

				if (!left_queue_.empty() && !right_queue_.empty()) {
					bool left_done = false, right_done = false;
					bool left_free = true, right_free = true;
					ProcessBothBatches(left_queue_.front(), right_queue_.front(),
							left_done, right_done, left_free, right_free);
					CHECK(left_done || right_done) << "ProcessBothBatches finished neither batch";
					if (left_done) ReleaseFront(left_queue_, left_free, "left");
					if (right_done) ReleaseFront(right_queue_, right_free, "right");
				} else if (!left_queue_.empty()) {
					bool done = false, free = true;
					ProcessLeftBatch(left_queue_.front(), done, free);
					if (!done) break;
					ReleaseFront(left_queue_, free, "left");
				} else if (!right_queue_.empty()) {
					bool done = false, free = true;
					ProcessRightBatch(right_queue_.front(), done, free);
					if (!done) break;
					ReleaseFront(right_queue_, free, "right");
				} else {
					break;
				}
			}

			if (left_drained_ && right_drained_ && !completed_) {
				completed_ = true;
				FlushContents();
				observer_->OnCompleted();
			}
		}

		void SignalDrained() {
			if (left_completed_ && !left_drained_ && left_queue_.empty()) {
				left_drained_ = true;
				OnLeftDrained();
			}
			if (right_completed_ && !right_drained_ && right_queue_.empty()) {
				right_drained_ = true;
				OnRightDrained();
			}
		}

		void ReleaseFront(std::deque<BatchPtr>& queue, bool free, const char* side) {
			BatchPtr& front = queue.front();
			if (free) {
				CHECK(front) << side << " batch reported free after it was moved downstream";
				pool_->Return(std::move(front));
			} else {
				CHECK(!front) << side << " batch reported forwarded but is still owned by the driver";
			}
			queue.pop_front();
		}

		std::shared_ptr<Observer> observer_;
		std::shared_ptr<Pool> pool_;

		std::deque<BatchPtr> left_queue_;
		std::deque<BatchPtr> right_queue_;

		bool left_completed_ = false;
		bool right_completed_ = false;
		bool left_drained_ = false;
		bool right_drained_ = false;
		bool completed_ = false;
};

} // namespace Estuary
