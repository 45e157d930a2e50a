#ifndef LEASEHOLD_LEASE_LISTENER_REGISTRY_H_
#define LEASEHOLD_LEASE_LISTENER_REGISTRY_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

namespace Leasehold {

/**
 * Observer of consumption rights. Both callbacks run synchronously on the
 * thread that detected the transition.
 */
class CompetingConsumerListener {
public:
	virtual ~CompetingConsumerListener() = default;

	virtual void OnConsumeGranted(const std::string& subscription_id, const std::string& subscriber_id) {}
	virtual void OnConsumeProhibited(const std::string& subscription_id, const std::string& subscriber_id) {}
};

/**
 * Set of listeners, notified in registration order. A listener that throws
 * is logged and skipped; the remaining listeners are still notified.
 */
class ListenerRegistry {
	public:
		ListenerRegistry() = default;

		ListenerRegistry(const ListenerRegistry&) = delete;
		ListenerRegistry& operator=(const ListenerRegistry&) = delete;

		// Throws std::invalid_argument for a null listener. Adding twice is a no-op.
		void Add(std::shared_ptr<CompetingConsumerListener> listener);
		void Remove(const std::shared_ptr<CompetingConsumerListener>& listener);

		void NotifyConsumeGranted(const std::string& subscription_id, const std::string& subscriber_id) const;
		void NotifyConsumeProhibited(const std::string& subscription_id, const std::string& subscriber_id) const;

		size_t size() const;

	private:
		std::vector<std::shared_ptr<CompetingConsumerListener>> Snapshot() const;

		mutable absl::Mutex mutex_;
		std::vector<std::shared_ptr<CompetingConsumerListener>> listeners_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Leasehold

#endif // LEASEHOLD_LEASE_LISTENER_REGISTRY_H_
