#include "lease_coordinator.h"

#include <stdexcept>
#include <vector>

#include <glog/logging.h>

namespace Leasehold {

namespace {

std::chrono::milliseconds ValidLeaseTime(const LeaseCoordinatorOptions& options) {
	if (options.lease_time.count() <= 0) {
		throw std::invalid_argument("Lease time must be positive");
	}
	return options.lease_time;
}

std::chrono::milliseconds ResolveRefreshInterval(const LeaseCoordinatorOptions& options) {
	std::chrono::milliseconds interval = options.refresh_interval;
	if (interval.count() == 0) {
		interval = options.lease_time / 2;
	}
	if (interval.count() <= 0 || interval >= options.lease_time) {
		throw std::invalid_argument("Refresh interval must be positive and smaller than the lease time");
	}
	return interval;
}

} // namespace

LeaseCoordinatorOptions LeaseCoordinatorOptions::FromConfig(const Configuration& config) {
	LeaseCoordinatorOptions options;
	options.lease_time = std::chrono::milliseconds(config.getLeaseTimeMs());
	options.refresh_interval = std::chrono::milliseconds(config.getRefreshIntervalMs());
	return options;
}

LeaseCoordinator::LeaseCoordinator(std::shared_ptr<LeaseStore> store,
		std::shared_ptr<Clock> clock,
		RetryStrategy retry_strategy,
		LeaseCoordinatorOptions options)
	: store_(std::move(store)),
	clock_(std::move(clock)),
	lease_time_(ValidLeaseTime(options)),
	refresh_interval_(ResolveRefreshInterval(options)),
	retry_strategy_(retry_strategy.WithLivenessCheck([this]() { return running_.load(); })) {
	if (!store_) {
		throw std::invalid_argument("Lease store cannot be null");
	}
	if (!clock_) {
		throw std::invalid_argument("Clock cannot be null");
	}
	VLOG(3) << "\t[LeaseCoordinator]\tConstructed lease_time=" << lease_time_.count()
		<< "ms refresh_interval=" << refresh_interval_.count() << "ms";
}

LeaseCoordinator::~LeaseCoordinator() {
	Shutdown();
	VLOG(3) << "\t[LeaseCoordinator]\tDestructed";
}

LeaseCoordinator& LeaseCoordinator::ScheduleRefresh() {
	return ScheduleRefresh([](RefreshOperation sweep) { return sweep; });
}

LeaseCoordinator& LeaseCoordinator::ScheduleRefresh(RefreshOperationFactory factory) {
	if (!factory) {
		throw std::invalid_argument("Refresh operation factory cannot be null");
	}
	if (!running_.load()) {
		LOG(WARNING) << "[LeaseCoordinator] Shut down, not scheduling refresh";
		return *this;
	}
	RefreshOperation tick = factory([this]() { RefreshOrAcquireLeases(); });
	if (!tick) {
		throw std::invalid_argument("Refresh operation factory returned an empty operation");
	}
	RetryStrategy retry = retry_strategy_;
	scheduled_refresh_.ScheduleInBackground([retry, tick]() { retry.Execute(tick); }, refresh_interval_);
	return *this;
}

bool LeaseCoordinator::RegisterCompetingConsumer(const std::string& subscription_id,
		const std::string& subscriber_id) {
	ValidateIds(subscription_id, subscriber_id);
	CompetingConsumer cc{subscription_id, subscriber_id};
	KeyedLock<CompetingConsumer>::Guard guard(consumer_locks_, cc);
	return AcquireLocked(cc);
}

void LeaseCoordinator::UnregisterCompetingConsumer(const std::string& subscription_id,
		const std::string& subscriber_id) {
	ValidateIds(subscription_id, subscriber_id);
	CompetingConsumer cc{subscription_id, subscriber_id};
	KeyedLock<CompetingConsumer>::Guard guard(consumer_locks_, cc);

	std::optional<LockStatus> status;
	{
		absl::MutexLock lock(&mutex_);
		auto it = competing_consumers_.find(cc);
		if (it == competing_consumers_.end()) {
			VLOG(2) << "Unregistering unknown consumer " << cc << ", nothing to do";
			return;
		}
		status = it->second;
		competing_consumers_.erase(it);
	}
	VLOG(1) << "Unregistered consumer " << cc << " status=" << *status;

	// The store may still name us owner while the cache says otherwise (a lost
	// acquire reply, a transient renew error), so release whatever we own.
	bool released = CallStore("release", cc, [&]() {
			return store_->Release(cc.subscription_id, cc.subscriber_id);
			});
	if (released) {
		VLOG(1) << "Released lease of " << cc;
	} else if (*status == LockStatus::kLockAcquired) {
		LOG(WARNING) << "Lease of " << cc << " not released, it stays until it expires unless already taken over";
	}

	if (*status == LockStatus::kLockAcquired) {
		listeners_.NotifyConsumeProhibited(cc.subscription_id, cc.subscriber_id);
	}
}

bool LeaseCoordinator::HasLock(const std::string& subscription_id, const std::string& subscriber_id) const {
	ValidateIds(subscription_id, subscriber_id);
	std::optional<LockStatus> status = Lookup(CompetingConsumer{subscription_id, subscriber_id});
	bool has_lock = status == LockStatus::kLockAcquired;
	VLOG(2) << "hasLock=" << has_lock << " (subscriberId=" << subscriber_id
		<< ", subscriptionId=" << subscription_id << ")";
	return has_lock;
}

void LeaseCoordinator::AddListener(std::shared_ptr<CompetingConsumerListener> listener) {
	listeners_.Add(std::move(listener));
}

void LeaseCoordinator::RemoveListener(const std::shared_ptr<CompetingConsumerListener>& listener) {
	listeners_.Remove(listener);
}

void LeaseCoordinator::RefreshOrAcquireLeases() {
	std::vector<CompetingConsumer> snapshot;
	{
		absl::ReaderMutexLock lock(&mutex_);
		snapshot.reserve(competing_consumers_.size());
		for (const auto& entry : competing_consumers_) {
			snapshot.push_back(entry.first);
		}
	}
	VLOG(2) << "In RefreshOrAcquireLeases with " << snapshot.size() << " competing consumers";

	for (const auto& cc : snapshot) {
		if (!running_.load()) {
			VLOG(1) << "Shutdown signalled, abandoning refresh cycle";
			return;
		}
		KeyedLock<CompetingConsumer>::Guard guard(consumer_locks_, cc);
		// Re-read under the consumer lock: it may have changed since the snapshot.
		std::optional<LockStatus> status = Lookup(cc);
		if (!status) {
			VLOG(2) << "Consumer " << cc << " unregistered during refresh, skipping";
			continue;
		}
		VLOG(2) << "Status " << *status << " " << cc;
		if (*status == LockStatus::kLockAcquired) {
			RenewLocked(cc);
		} else {
			AcquireLocked(cc);
		}
	}
}

void LeaseCoordinator::Shutdown() {
	if (running_.exchange(false)) {
		VLOG(1) << "[LeaseCoordinator] Shutting down";
	}
	scheduled_refresh_.Close();
}

std::optional<LockStatus> LeaseCoordinator::GetStatus(const std::string& subscription_id,
		const std::string& subscriber_id) const {
	ValidateIds(subscription_id, subscriber_id);
	return Lookup(CompetingConsumer{subscription_id, subscriber_id});
}

size_t LeaseCoordinator::NumCompetingConsumers() const {
	absl::ReaderMutexLock lock(&mutex_);
	return competing_consumers_.size();
}

bool LeaseCoordinator::AcquireLocked(const CompetingConsumer& cc) {
	std::optional<LockStatus> old_status = Lookup(cc);
	bool acquired = CallStore("acquire", cc, [&]() {
			return store_->AcquireOrRefresh(cc.subscription_id, cc.subscriber_id, clock_->now(), lease_time_);
			});
	VLOG(2) << "oldStatus=" << (old_status ? LockStatusName(*old_status) : "UNREGISTERED")
		<< " acquired lock=" << acquired << " " << cc;
	SetStatus(cc, acquired ? LockStatus::kLockAcquired : LockStatus::kLockNotAcquired);

	bool was_acquired = old_status == LockStatus::kLockAcquired;
	if (!was_acquired && acquired) {
		VLOG(1) << "Consumption granted " << cc;
		listeners_.NotifyConsumeGranted(cc.subscription_id, cc.subscriber_id);
	} else if (was_acquired && !acquired) {
		VLOG(1) << "Consumption prohibited " << cc;
		listeners_.NotifyConsumeProhibited(cc.subscription_id, cc.subscriber_id);
	}
	return acquired;
}

void LeaseCoordinator::RenewLocked(const CompetingConsumer& cc) {
	bool still_has_lock = CallStore("renew", cc, [&]() {
			return store_->Renew(cc.subscription_id, cc.subscriber_id, clock_->now(), lease_time_);
			});
	if (still_has_lock) {
		return;
	}
	VLOG(1) << "Lost lock! " << cc;
	SetStatus(cc, LockStatus::kLockNotAcquired);
	listeners_.NotifyConsumeProhibited(cc.subscription_id, cc.subscriber_id);
}

bool LeaseCoordinator::CallStore(const char* action, const CompetingConsumer& cc,
		const std::function<bool()>& op) {
	try {
		return retry_strategy_.Execute(op);
	} catch (const std::exception& e) {
		LOG(WARNING) << "Lease store " << action << " failed for " << cc << ": " << e.what();
		return false;
	}
}

std::optional<LockStatus> LeaseCoordinator::Lookup(const CompetingConsumer& cc) const {
	absl::ReaderMutexLock lock(&mutex_);
	auto it = competing_consumers_.find(cc);
	if (it == competing_consumers_.end()) {
		return std::nullopt;
	}
	return it->second;
}

void LeaseCoordinator::SetStatus(const CompetingConsumer& cc, LockStatus status) {
	absl::MutexLock lock(&mutex_);
	competing_consumers_[cc] = status;
}

void LeaseCoordinator::ValidateIds(const std::string& subscription_id, const std::string& subscriber_id) {
	if (subscription_id.empty()) {
		throw std::invalid_argument("Subscription id cannot be empty");
	}
	if (subscriber_id.empty()) {
		throw std::invalid_argument("Subscriber id cannot be empty");
	}
}

} // namespace Leasehold
