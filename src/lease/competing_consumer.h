#ifndef LEASEHOLD_LEASE_COMPETING_CONSUMER_H_
#define LEASEHOLD_LEASE_COMPETING_CONSUMER_H_

#include <ostream>
#include <string>
#include <utility>

namespace Leasehold {

/**
 * One registration entry: a subscriber instance competing for a subscription.
 * Compared and hashed by value.
 */
struct CompetingConsumer {
	std::string subscription_id;
	std::string subscriber_id;

	bool operator==(const CompetingConsumer& other) const {
		return subscription_id == other.subscription_id && subscriber_id == other.subscriber_id;
	}
	bool operator!=(const CompetingConsumer& other) const { return !(*this == other); }

	template <typename H>
	friend H AbslHashValue(H h, const CompetingConsumer& cc) {
		return H::combine(std::move(h), cc.subscription_id, cc.subscriber_id);
	}
};

// Absence of an entry is the implicit "unregistered" state.
enum class LockStatus {
	kLockAcquired,
	kLockNotAcquired
};

inline const char* LockStatusName(LockStatus status) {
	switch (status) {
		case LockStatus::kLockAcquired:
			return "LOCK_ACQUIRED";
		case LockStatus::kLockNotAcquired:
			return "LOCK_NOT_ACQUIRED";
	}
	return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, LockStatus status) {
	return os << LockStatusName(status);
}

inline std::ostream& operator<<(std::ostream& os, const CompetingConsumer& cc) {
	return os << "(subscriberId=" << cc.subscriber_id << ", subscriptionId=" << cc.subscription_id << ")";
}

} // namespace Leasehold

#endif // LEASEHOLD_LEASE_COMPETING_CONSUMER_H_
