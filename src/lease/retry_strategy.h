#ifndef LEASEHOLD_LEASE_RETRY_STRATEGY_H_
#define LEASEHOLD_LEASE_RETRY_STRATEGY_H_

#include <chrono>
#include <exception>
#include <functional>
#include <memory>

#include <glog/logging.h>

#include "common/configuration.h"

namespace Leasehold {

/**
 * Runs an operation, retrying it with a backoff schedule while it throws.
 *
 * The first attempt always runs. Before every further attempt, and while
 * waiting out a backoff delay, the liveness check is evaluated; once it is
 * false the last error is rethrown without waiting for the rest of the
 * schedule. Errors not derived from std::exception are never caught.
 *
 * RetryStrategy is an immutable value; the modifiers return a copy.
 */
class RetryStrategy {
	public:
		using RetryPredicate = std::function<bool(const std::exception&)>;
		using LivenessCheck = std::function<bool()>;

		// Single attempt, no retries
		RetryStrategy();

		static RetryStrategy None();
		static RetryStrategy Fixed(std::chrono::milliseconds delay);
		static RetryStrategy ExponentialBackoff(std::chrono::milliseconds initial,
				std::chrono::milliseconds max,
				double multiplier);

		/**
		 * Build the strategy described by the retry section of the configuration.
		 * Throws std::invalid_argument for an unknown strategy name.
		 */
		static RetryStrategy FromConfig(const LeaseholdConfig::Retry& config);

		// Total attempts including the first; <= 0 means unlimited.
		RetryStrategy MaxAttempts(int max_attempts) const;

		// Only errors accepted by the predicate are retried.
		RetryStrategy RetryIf(RetryPredicate predicate) const;

		// ANDed with any liveness check already present.
		RetryStrategy WithLivenessCheck(LivenessCheck is_live) const;

		/**
		 * Delay before the next attempt.
		 *
		 * @param failed_attempts Number of attempts that have failed so far (>= 1)
		 */
		std::chrono::milliseconds BackoffFor(int failed_attempts) const;

		bool IsLive() const;
		int max_attempts() const { return max_attempts_; }

		template <typename Operation>
		auto Execute(Operation&& operation) const -> decltype(operation()) {
			for (int attempt = 1;; ++attempt) {
				try {
					return operation();
				} catch (const std::exception& e) {
					if (!ShouldRetry(e, attempt)) {
						throw;
					}
					std::chrono::milliseconds delay = BackoffFor(attempt);
					LOG(WARNING) << "Attempt " << attempt << " failed: " << e.what()
						<< ", retrying in " << delay.count() << "ms";
					if (!WaitBeforeRetry(delay)) {
						VLOG(1) << "Retry cancelled after attempt " << attempt;
						throw;
					}
				}
			}
		}

	private:
		enum class Backoff {
			kNone,
			kFixed,
			kExponential
		};

		bool ShouldRetry(const std::exception& e, int failed_attempts) const;

		// Returns false if the liveness check failed while waiting.
		bool WaitBeforeRetry(std::chrono::milliseconds delay) const;

		Backoff backoff_ = Backoff::kNone;
		std::chrono::milliseconds initial_{0};
		std::chrono::milliseconds max_{0};
		double multiplier_ = 1.0;
		int max_attempts_ = 1;
		RetryPredicate retry_if_;
		LivenessCheck is_live_;
};

} // namespace Leasehold

#endif // LEASEHOLD_LEASE_RETRY_STRATEGY_H_
