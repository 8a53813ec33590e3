#pragma once

#include <string>

#include "diagnostics/plan_node.h"
#include "stream_batch.h"

namespace Estuary {

/**
 * Downstream consumer of an operator's output.
 *
 * OnNext receives ownership of a sealed batch; batches arrive in sync-time order.
 */
template <typename TKey, typename TPayload>
class IStreamObserver {
public:
	virtual ~IStreamObserver() = default;

	virtual void OnNext(typename StreamBatch<TKey, TPayload>::Ptr batch) = 0;
	virtual void OnCompleted() = 0;
	virtual void OnFlush() = 0;

	// Receives the plan node of the operator feeding this observer
	virtual void ProduceQueryPlan(PlanNode::Ptr node) = 0;
};

/**
 * Construction-time properties of the stream an operator runs on
 */
struct StreamProperties {
	bool is_columnar = true;
	// Recorded for plan reporting
	std::string error_messages;
};

} // namespace Estuary
