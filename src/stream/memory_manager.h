#ifndef ESTUARY_STREAM_MEMORY_MANAGER_H_
#define ESTUARY_STREAM_MEMORY_MANAGER_H_

#include <functional>
#include <memory>
#include <typeindex>

#include "common/config.h"
#include "batch_pool.h"

namespace Estuary {

/**
 * Process-wide registry of batch pools, one per (key type, payload type, storage mode)
 */
class MemoryManager {
public:
	template <typename TKey, typename TPayload>
	static std::shared_ptr<BatchPool<TKey, TPayload>> GetMemoryPool(bool is_columnar) {
		const Configuration& config = Configuration::getInstance();
		if (config.config().pool.force_row_oriented.get()) {
			is_columnar = false;
		}
		std::shared_ptr<void> pool = GetOrCreate(
			std::type_index(typeid(TKey)), std::type_index(typeid(TPayload)), is_columnar,
			[&config, is_columnar]() -> std::shared_ptr<void> {
				return std::make_shared<BatchPool<TKey, TPayload>>(
					config.getDataBatchSize(), config.getMaxCachedBatches(), is_columnar);
			});
		return std::static_pointer_cast<BatchPool<TKey, TPayload>>(pool);
	}

	// Drop every registered pool. Operators keep the pools they already hold.
	static void Clear();

	static size_t GetPoolCount();

private:
	static std::shared_ptr<void> GetOrCreate(std::type_index key_type,
	                                         std::type_index payload_type,
	                                         bool is_columnar,
	                                         const std::function<std::shared_ptr<void>()>& factory);
};

} // namespace Estuary

#endif // ESTUARY_STREAM_MEMORY_MANAGER_H_
