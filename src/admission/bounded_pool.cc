#include "bounded_pool.h"

#include <iterator>

#include <glog/logging.h>

namespace Subgate {

BoundedOrderedPool::BoundedOrderedPool(std::string name, size_t capacity)
	: name_(std::move(name)),
	  capacity_(capacity) {
	VLOG(3) << "\t[BoundedOrderedPool:" << name_ << "]\tConstructed, capacity=" << capacity_;
}

std::vector<Key> BoundedOrderedPool::Register(const Key& key) {
	if (index_.contains(key)) {
		return {};
	}
	order_.push_back(key);
	index_.emplace(key, std::prev(order_.end()));
	VLOG(3) << "[BoundedOrderedPool:" << name_ << "] Registered " << key
		<< " (" << order_.size() << "/" << capacity_ << ")";
	return TrimToCapacity();
}

std::vector<Key> BoundedOrderedPool::SetCapacity(size_t capacity) {
	if (capacity != capacity_) {
		VLOG(1) << "[BoundedOrderedPool:" << name_ << "] Capacity " << capacity_ << " -> " << capacity;
	}
	capacity_ = capacity;
	return TrimToCapacity();
}

std::vector<Key> BoundedOrderedPool::FilterTo(const absl::btree_set<Key>& allow) {
	std::vector<Key> evicted;
	for (auto it = order_.begin(); it != order_.end();) {
		if (allow.contains(*it)) {
			++it;
			continue;
		}
		index_.erase(*it);
		evicted.push_back(std::move(*it));
		it = order_.erase(it);
	}
	return evicted;
}

bool BoundedOrderedPool::Remove(const Key& key) {
	auto it = index_.find(key);
	if (it == index_.end()) {
		return false;
	}
	order_.erase(it->second);
	index_.erase(it);
	return true;
}

std::vector<Key> BoundedOrderedPool::Keys() const {
	return std::vector<Key>(order_.begin(), order_.end());
}

void BoundedOrderedPool::Clear() {
	order_.clear();
	index_.clear();
}

std::vector<Key> BoundedOrderedPool::TrimToCapacity() {
	std::vector<Key> evicted;
	while (order_.size() > capacity_) {
		index_.erase(order_.front());
		evicted.push_back(std::move(order_.front()));
		order_.pop_front();
	}
	return evicted;
}

} // namespace Subgate
