#ifndef LEASEHOLD_LEASE_LEASE_COORDINATOR_H_
#define LEASEHOLD_LEASE_LEASE_COORDINATOR_H_

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "common/config.h"
#include "common/configuration.h"
#include "common/fine_grained_lock.h"
#include "clock.h"
#include "competing_consumer.h"
#include "lease_store.h"
#include "listener_registry.h"
#include "retry_strategy.h"
#include "scheduled_refresh.h"

namespace Leasehold {

struct LeaseCoordinatorOptions {
	std::chrono::milliseconds lease_time{kDefaultLeaseTimeMs};
	// 0 = half of lease_time
	std::chrono::milliseconds refresh_interval{kDefaultRefreshIntervalMs};

	static LeaseCoordinatorOptions FromConfig(const Configuration& config);
};

/**
 * Lease-based competing consumer coordinator.
 *
 * Decides, from this process' point of view, which registered subscribers
 * currently own the right to consume their subscription. Ownership is
 * arbitrated by the LeaseStore; this class caches the outcome per
 * (subscription, subscriber), renews held leases in the background, retries
 * unheld ones, and tells listeners whenever a subscriber gains or loses the
 * right to consume.
 *
 * Transitions for one (subscription, subscriber) are serialized, including
 * the store calls and retry backoff behind them; different tuples never wait
 * on each other. Notifications are delivered in the order the transitions
 * happen. Listeners run on the thread that observed the transition (a caller
 * of RegisterCompetingConsumer / UnregisterCompetingConsumer, or the
 * refresher) while that tuple stays locked. They may call back into the
 * coordinator, but must not block waiting for another thread's transition,
 * since that thread may in turn be waiting for the listener's tuple.
 */
class LeaseCoordinator {
	public:
		using RefreshOperation = std::function<void()>;
		// Receives the sweep and returns the operation to run on every tick.
		using RefreshOperationFactory = std::function<RefreshOperation(RefreshOperation)>;

		/**
		 * @param store Shared lease backend
		 * @param clock Source of "now" for lease expiry
		 * @param retry_strategy Applied to every store call; retries stop once Shutdown() is called
		 * @param options Lease time and refresh interval
		 *
		 * Throws std::invalid_argument for a null store or clock, a non-positive
		 * lease time, or a refresh interval not strictly below the lease time.
		 */
		LeaseCoordinator(std::shared_ptr<LeaseStore> store,
				std::shared_ptr<Clock> clock,
				RetryStrategy retry_strategy,
				LeaseCoordinatorOptions options = LeaseCoordinatorOptions());

		~LeaseCoordinator();

		LeaseCoordinator(const LeaseCoordinator&) = delete;
		LeaseCoordinator& operator=(const LeaseCoordinator&) = delete;

		/**
		 * Renew and acquire leases in the background every refresh interval.
		 * Calling it again replaces the previous schedule.
		 */
		LeaseCoordinator& ScheduleRefresh();
		LeaseCoordinator& ScheduleRefresh(RefreshOperationFactory factory);

		/**
		 * Try to acquire (or refresh) the subscription's lease for the subscriber.
		 *
		 * @return true if the subscriber now holds the lease
		 */
		bool RegisterCompetingConsumer(const std::string& subscription_id, const std::string& subscriber_id);

		// Forget the subscriber and release its lease if the store still names it owner.
		// No-op if not registered.
		void UnregisterCompetingConsumer(const std::string& subscription_id, const std::string& subscriber_id);

		// Cached answer as of the latest register call or refresh cycle; never touches the store.
		bool HasLock(const std::string& subscription_id, const std::string& subscriber_id) const;

		void AddListener(std::shared_ptr<CompetingConsumerListener> listener);
		void RemoveListener(const std::shared_ptr<CompetingConsumerListener>& listener);

		// One refresh cycle over every registered subscriber, on the calling thread.
		void RefreshOrAcquireLeases();

		// Stop the refresher and cancel retries in progress. Idempotent.
		void Shutdown();

		bool IsRunning() const { return running_.load(); }
		std::optional<LockStatus> GetStatus(const std::string& subscription_id, const std::string& subscriber_id) const;
		size_t NumCompetingConsumers() const;
		std::chrono::milliseconds lease_time() const { return lease_time_; }
		std::chrono::milliseconds refresh_interval() const { return refresh_interval_; }

	private:
		// Callers hold cc's lock in consumer_locks_.
		bool AcquireLocked(const CompetingConsumer& cc);
		void RenewLocked(const CompetingConsumer& cc);

		// Run op through the retry strategy; a failure that survives it reads as false.
		bool CallStore(const char* action, const CompetingConsumer& cc, const std::function<bool()>& op);

		std::optional<LockStatus> Lookup(const CompetingConsumer& cc) const;
		void SetStatus(const CompetingConsumer& cc, LockStatus status);

		static void ValidateIds(const std::string& subscription_id, const std::string& subscriber_id);

		std::shared_ptr<LeaseStore> store_;
		std::shared_ptr<Clock> clock_;
		const std::chrono::milliseconds lease_time_;
		const std::chrono::milliseconds refresh_interval_;

		std::atomic<bool> running_{true};
		const RetryStrategy retry_strategy_;

		mutable absl::Mutex mutex_;
		absl::flat_hash_map<CompetingConsumer, LockStatus> competing_consumers_ ABSL_GUARDED_BY(mutex_);
		KeyedLock<CompetingConsumer> consumer_locks_;

		ListenerRegistry listeners_;
		// Last member, destroyed first: waits for a tick still using the members above.
		ScheduledRefresh scheduled_refresh_;
};

} // namespace Leasehold

#endif // LEASEHOLD_LEASE_LEASE_COORDINATOR_H_
