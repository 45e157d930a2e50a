#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include "clock.h"

namespace Leasehold {

/**
 * Raised by lease store implementations when the backend could not be
 * reached or did not answer. Considered transient and retried.
 */
class LeaseStoreError : public std::runtime_error {
public:
	explicit LeaseStoreError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Interface for the shared lease backend. Every operation is atomic with
 * respect to other processes using the same backend; at most one subscriber
 * owns a subscription's lease at any instant the store considers "now".
 */
class LeaseStore {
public:
	virtual ~LeaseStore() = default;

	/**
	 * Grant the lease to subscriber_id if there is no lease, the lease has
	 * expired, or subscriber_id already owns it. On success expiry becomes
	 * now + lease_time.
	 *
	 * @return false if a different subscriber holds a live lease
	 */
	virtual bool AcquireOrRefresh(const std::string& subscription_id,
			const std::string& subscriber_id,
			Clock::time_point now,
			std::chrono::milliseconds lease_time) = 0;

	/**
	 * Extend expiry to now + lease_time only if subscriber_id is the current owner.
	 *
	 * @return false if the lease was lost or never held
	 */
	virtual bool Renew(const std::string& subscription_id,
			const std::string& subscriber_id,
			Clock::time_point now,
			std::chrono::milliseconds lease_time) = 0;

	// Unconditionally delete the subscription's lease record.
	virtual void Remove(const std::string& subscription_id) = 0;

	/**
	 * Delete the lease record only if subscriber_id is its current owner,
	 * expired or not.
	 *
	 * @return false if there was no record or another subscriber owns it
	 */
	virtual bool Release(const std::string& subscription_id, const std::string& subscriber_id) = 0;
};

} // namespace Leasehold
