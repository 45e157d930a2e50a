#include "listener_registry.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include <glog/logging.h>

namespace Leasehold {

void ListenerRegistry::Add(std::shared_ptr<CompetingConsumerListener> listener) {
	if (!listener) {
		throw std::invalid_argument("CompetingConsumerListener cannot be null");
	}
	absl::MutexLock lock(&mutex_);
	if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
		listeners_.push_back(std::move(listener));
	}
}

void ListenerRegistry::Remove(const std::shared_ptr<CompetingConsumerListener>& listener) {
	if (!listener) {
		throw std::invalid_argument("CompetingConsumerListener cannot be null");
	}
	absl::MutexLock lock(&mutex_);
	listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

size_t ListenerRegistry::size() const {
	absl::MutexLock lock(&mutex_);
	return listeners_.size();
}

// Delivery runs outside mutex_ so listeners may add or remove listeners.
std::vector<std::shared_ptr<CompetingConsumerListener>> ListenerRegistry::Snapshot() const {
	absl::MutexLock lock(&mutex_);
	return listeners_;
}

void ListenerRegistry::NotifyConsumeGranted(const std::string& subscription_id,
		const std::string& subscriber_id) const {
	for (const auto& listener : Snapshot()) {
		try {
			listener->OnConsumeGranted(subscription_id, subscriber_id);
		} catch (const std::exception& e) {
			LOG(ERROR) << "Listener failed in OnConsumeGranted (subscriberId=" << subscriber_id
				<< ", subscriptionId=" << subscription_id << "): " << e.what();
		} catch (...) {
			LOG(ERROR) << "Listener failed in OnConsumeGranted (subscriberId=" << subscriber_id
				<< ", subscriptionId=" << subscription_id << ") with a non-standard exception";
		}
	}
}

void ListenerRegistry::NotifyConsumeProhibited(const std::string& subscription_id,
		const std::string& subscriber_id) const {
	for (const auto& listener : Snapshot()) {
		try {
			listener->OnConsumeProhibited(subscription_id, subscriber_id);
		} catch (const std::exception& e) {
			LOG(ERROR) << "Listener failed in OnConsumeProhibited (subscriberId=" << subscriber_id
				<< ", subscriptionId=" << subscription_id << "): " << e.what();
		} catch (...) {
			LOG(ERROR) << "Listener failed in OnConsumeProhibited (subscriberId=" << subscriber_id
				<< ", subscriptionId=" << subscription_id << ") with a non-standard exception";
		}
	}
}

} // namespace Leasehold
