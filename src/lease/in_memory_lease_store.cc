#include "in_memory_lease_store.h"

#include <glog/logging.h>

namespace Leasehold {

InMemoryLeaseStore::InMemoryLeaseStore(std::string collection)
	: collection_(std::move(collection)) {
	VLOG(3) << "\t[InMemoryLeaseStore]\tConstructed collection=" << collection_;
}

InMemoryLeaseStore::~InMemoryLeaseStore() {
	VLOG(3) << "\t[InMemoryLeaseStore]\tDestructed collection=" << collection_;
}

bool InMemoryLeaseStore::AcquireOrRefresh(const std::string& subscription_id,
		const std::string& subscriber_id,
		Clock::time_point now,
		std::chrono::milliseconds lease_time) {
	absl::MutexLock lock(&mutex_);
	auto it = leases_.find(subscription_id);
	if (it != leases_.end() &&
			it->second.subscriber_id != subscriber_id &&
			it->second.expires_at > now) {
		VLOG(2) << "[InMemoryLeaseStore] " << subscription_id << " held by " << it->second.subscriber_id
			<< ", refusing " << subscriber_id;
		return false;
	}
	leases_[subscription_id] = LeaseRecord{subscriber_id, now + lease_time};
	return true;
}

bool InMemoryLeaseStore::Renew(const std::string& subscription_id,
		const std::string& subscriber_id,
		Clock::time_point now,
		std::chrono::milliseconds lease_time) {
	absl::MutexLock lock(&mutex_);
	auto it = leases_.find(subscription_id);
	if (it == leases_.end() || it->second.subscriber_id != subscriber_id) {
		return false;
	}
	it->second.expires_at = now + lease_time;
	return true;
}

void InMemoryLeaseStore::Remove(const std::string& subscription_id) {
	absl::MutexLock lock(&mutex_);
	leases_.erase(subscription_id);
}

bool InMemoryLeaseStore::Release(const std::string& subscription_id, const std::string& subscriber_id) {
	absl::MutexLock lock(&mutex_);
	auto it = leases_.find(subscription_id);
	if (it == leases_.end() || it->second.subscriber_id != subscriber_id) {
		return false;
	}
	leases_.erase(it);
	return true;
}

std::optional<LeaseRecord> InMemoryLeaseStore::Find(const std::string& subscription_id) const {
	absl::MutexLock lock(&mutex_);
	auto it = leases_.find(subscription_id);
	if (it == leases_.end()) {
		return std::nullopt;
	}
	return it->second;
}

} // namespace Leasehold
