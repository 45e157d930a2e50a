#include "retry_strategy.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace Leasehold {

RetryStrategy::RetryStrategy() = default;

RetryStrategy RetryStrategy::None() {
	return RetryStrategy();
}

RetryStrategy RetryStrategy::Fixed(std::chrono::milliseconds delay) {
	if (delay.count() < 0) {
		throw std::invalid_argument("Retry delay cannot be negative");
	}
	RetryStrategy strategy;
	strategy.backoff_ = Backoff::kFixed;
	strategy.initial_ = delay;
	strategy.max_ = delay;
	strategy.max_attempts_ = 0;
	return strategy;
}

RetryStrategy RetryStrategy::ExponentialBackoff(std::chrono::milliseconds initial,
		std::chrono::milliseconds max,
		double multiplier) {
	if (initial.count() <= 0 || max < initial) {
		throw std::invalid_argument("Exponential backoff requires 0 < initial <= max");
	}
	if (multiplier < 1.0) {
		throw std::invalid_argument("Exponential backoff multiplier must be at least 1.0");
	}
	RetryStrategy strategy;
	strategy.backoff_ = Backoff::kExponential;
	strategy.initial_ = initial;
	strategy.max_ = max;
	strategy.multiplier_ = multiplier;
	strategy.max_attempts_ = 0;
	return strategy;
}

RetryStrategy RetryStrategy::FromConfig(const LeaseholdConfig::Retry& config) {
	std::string name = config.strategy.get();
	RetryStrategy strategy;
	if (name == "none") {
		return strategy;
	} else if (name == "fixed") {
		strategy = Fixed(std::chrono::milliseconds(config.initial_backoff_ms.get()));
	} else if (name == "exponential") {
		strategy = ExponentialBackoff(std::chrono::milliseconds(config.initial_backoff_ms.get()),
				std::chrono::milliseconds(config.max_backoff_ms.get()),
				config.multiplier.get());
	} else {
		throw std::invalid_argument("Unknown retry strategy: " + name);
	}
	return strategy.MaxAttempts(config.max_attempts.get());
}

RetryStrategy RetryStrategy::MaxAttempts(int max_attempts) const {
	RetryStrategy copy = *this;
	copy.max_attempts_ = max_attempts;
	return copy;
}

RetryStrategy RetryStrategy::RetryIf(RetryPredicate predicate) const {
	RetryStrategy copy = *this;
	copy.retry_if_ = std::move(predicate);
	return copy;
}

RetryStrategy RetryStrategy::WithLivenessCheck(LivenessCheck is_live) const {
	RetryStrategy copy = *this;
	if (!is_live) {
		return copy;
	}
	if (copy.is_live_) {
		LivenessCheck previous = copy.is_live_;
		copy.is_live_ = [previous, is_live]() { return previous() && is_live(); };
	} else {
		copy.is_live_ = std::move(is_live);
	}
	return copy;
}

std::chrono::milliseconds RetryStrategy::BackoffFor(int failed_attempts) const {
	switch (backoff_) {
		case Backoff::kNone:
			return std::chrono::milliseconds(0);
		case Backoff::kFixed:
			return initial_;
		case Backoff::kExponential: {
			double factor = std::pow(multiplier_, std::max(0, failed_attempts - 1));
			double delay_ms = static_cast<double>(initial_.count()) * factor;
			if (delay_ms >= static_cast<double>(max_.count())) {
				return max_;
			}
			return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
		}
	}
	return std::chrono::milliseconds(0);
}

bool RetryStrategy::IsLive() const {
	return !is_live_ || is_live_();
}

bool RetryStrategy::ShouldRetry(const std::exception& e, int failed_attempts) const {
	if (backoff_ == Backoff::kNone) {
		return false;
	}
	if (max_attempts_ > 0 && failed_attempts >= max_attempts_) {
		VLOG(1) << "Giving up after " << failed_attempts << " attempts: " << e.what();
		return false;
	}
	if (retry_if_ && !retry_if_(e)) {
		return false;
	}
	return IsLive();
}

bool RetryStrategy::WaitBeforeRetry(std::chrono::milliseconds delay) const {
	const auto poll = std::chrono::milliseconds(kRetryCancellationPollMs);
	const auto deadline = std::chrono::steady_clock::now() + delay;
	while (true) {
		if (!IsLive()) {
			return false;
		}
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			break;
		}
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
		std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1), poll));
	}
	return IsLive();
}

} // namespace Leasehold
