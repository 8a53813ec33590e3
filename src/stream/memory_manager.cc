#include "memory_manager.h"

#include <glog/logging.h>
#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"
#include "absl/synchronization/mutex.h"

namespace Estuary {

namespace {

struct PoolKey {
	std::type_index key_type;
	std::type_index payload_type;
	bool is_columnar;

	bool operator==(const PoolKey& o) const {
		return key_type == o.key_type && payload_type == o.payload_type && is_columnar == o.is_columnar;
	}

	template <typename H>
	friend H AbslHashValue(H h, const PoolKey& k) {
		return H::combine(std::move(h), k.key_type.hash_code(), k.payload_type.hash_code(), k.is_columnar);
	}
};

struct Registry {
	absl::Mutex mu;
	absl::flat_hash_map<PoolKey, std::shared_ptr<void>> pools ABSL_GUARDED_BY(mu);
};

Registry& GetRegistry() {
	static Registry* registry = new Registry();
	return *registry;
}

} // namespace

std::shared_ptr<void> MemoryManager::GetOrCreate(std::type_index key_type,
                                                 std::type_index payload_type,
                                                 bool is_columnar,
                                                 const std::function<std::shared_ptr<void>()>& factory) {
	Registry& registry = GetRegistry();
	absl::MutexLock lock(&registry.mu);
	PoolKey key{key_type, payload_type, is_columnar};
	auto it = registry.pools.find(key);
	if (it != registry.pools.end()) {
		return it->second;
	}
	std::shared_ptr<void> pool = factory();
	registry.pools.emplace(key, pool);
	LOG(INFO) << "MemoryManager: created " << (is_columnar ? "columnar" : "row-oriented")
		<< " pool for <" << key_type.name() << ", " << payload_type.name() << ">";
	return pool;
}

void MemoryManager::Clear() {
	Registry& registry = GetRegistry();
	absl::MutexLock lock(&registry.mu);
	registry.pools.clear();
}

size_t MemoryManager::GetPoolCount() {
	Registry& registry = GetRegistry();
	absl::MutexLock lock(&registry.mu);
	return registry.pools.size();
}

} // namespace Estuary
