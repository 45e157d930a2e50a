#ifndef LEASEHOLD_LEASE_IN_MEMORY_LEASE_STORE_H_
#define LEASEHOLD_LEASE_IN_MEMORY_LEASE_STORE_H_

#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "common/config.h"
#include "lease_store.h"

namespace Leasehold {

struct LeaseRecord {
	std::string subscriber_id;
	Clock::time_point expires_at;
};

/**
 * Lease store kept in process memory. Every coordinator sharing one instance
 * competes exactly as separate processes sharing a remote store would.
 */
class InMemoryLeaseStore final : public LeaseStore {
	public:
		explicit InMemoryLeaseStore(std::string collection = kDefaultLeaseCollection);
		~InMemoryLeaseStore() override;

		bool AcquireOrRefresh(const std::string& subscription_id,
				const std::string& subscriber_id,
				Clock::time_point now,
				std::chrono::milliseconds lease_time) override;

		bool Renew(const std::string& subscription_id,
				const std::string& subscriber_id,
				Clock::time_point now,
				std::chrono::milliseconds lease_time) override;

		void Remove(const std::string& subscription_id) override;

		bool Release(const std::string& subscription_id, const std::string& subscriber_id) override;

		// Current record for the subscription, expired or not.
		std::optional<LeaseRecord> Find(const std::string& subscription_id) const;

		const std::string& collection() const { return collection_; }

	private:
		const std::string collection_;
		mutable absl::Mutex mutex_;
		absl::flat_hash_map<std::string, LeaseRecord> leases_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Leasehold

#endif // LEASEHOLD_LEASE_IN_MEMORY_LEASE_STORE_H_
