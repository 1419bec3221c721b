#ifndef SUBGATE_ADMISSION_BOUNDED_POOL_H_
#define SUBGATE_ADMISSION_BOUNDED_POOL_H_

#include <list>
#include <string>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"

#include "types.h"

namespace Subgate {

/**
 * BoundedOrderedPool keeps an insertion-ordered set of keys under a mutable
 * capacity. After every mutation the pool holds at most Capacity() keys;
 * overflow is resolved by evicting from the oldest end.
 *
 * Every mutator returns the keys it evicted, oldest first. Explicit removal
 * through Remove() is not an eviction and is not reported.
 *
 * Not thread-safe; the owning controller serializes access.
 */
class BoundedOrderedPool {
public:
	/**
	 * @param name Tier name used in log lines
	 * @param capacity Initial capacity
	 */
	explicit BoundedOrderedPool(std::string name, size_t capacity = 0);

	/**
	 * Append a key at the newest end and trim to capacity.
	 * Registering a present key is a no-op and does not refresh its age.
	 * With a capacity of 0 the key is admitted and evicted by the same call.
	 */
	std::vector<Key> Register(const Key& key);

	/**
	 * Change the capacity. Shrinking evicts oldest-first; growing never inserts.
	 */
	std::vector<Key> SetCapacity(size_t capacity);

	/**
	 * Drop every member missing from allow, in pool order. Allowed keys that
	 * are not members are not inserted.
	 */
	std::vector<Key> FilterTo(const absl::btree_set<Key>& allow);

	// Remove a key without reporting it. Returns false if absent.
	bool Remove(const Key& key);

	bool Contains(const Key& key) const { return index_.contains(key); }
	size_t Size() const { return order_.size(); }
	size_t Capacity() const { return capacity_; }
	const std::string& name() const { return name_; }

	// Members, oldest first
	std::vector<Key> Keys() const;

	// Drop all members without reporting them; capacity is kept
	void Clear();

private:
	std::vector<Key> TrimToCapacity();

	const std::string name_;
	size_t capacity_;

	// Oldest at front
	std::list<Key> order_;
	absl::flat_hash_map<Key, std::list<Key>::iterator> index_;

	BoundedOrderedPool(const BoundedOrderedPool&) = delete;
	BoundedOrderedPool& operator=(const BoundedOrderedPool&) = delete;
};

} // namespace Subgate

#endif // SUBGATE_ADMISSION_BOUNDED_POOL_H_
