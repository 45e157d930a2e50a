#ifndef LEASEHOLD_LEASE_SCHEDULED_REFRESH_H_
#define LEASEHOLD_LEASE_SCHEDULED_REFRESH_H_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace Leasehold {

/**
 * Runs a task on a background thread at a fixed period. One tick finishes
 * before the next one starts. Exceptions escaping a tick are logged and the
 * schedule continues.
 */
class ScheduledRefresh {
	public:
		using Task = std::function<void()>;

		ScheduledRefresh() = default;
		// Closes, then waits for every worker still finishing a tick, including
		// one detached by a Close() issued from inside its own tick.
		~ScheduledRefresh();

		ScheduledRefresh(const ScheduledRefresh&) = delete;
		ScheduledRefresh& operator=(const ScheduledRefresh&) = delete;

		/**
		 * Start running task every period, the first run one period from now.
		 * Replaces a previous schedule.
		 *
		 * @return false if the refresher was already closed
		 */
		bool ScheduleInBackground(Task task, std::chrono::milliseconds period);

		/**
		 * Stop scheduling. Waits for a tick in progress unless called from the
		 * refresher thread itself. Idempotent.
		 */
		void Close();

		bool IsScheduled() const;
		uint64_t ticks() const;

	private:
		// Shared with the worker so a worker detached mid-tick outlives us safely.
		struct State {
			std::mutex mutex;
			std::condition_variable cv;
			uint64_t generation = 0;  // bumped to stop the current worker
			uint64_t ticks = 0;
			size_t live_workers = 0;  // attached or detached, until Run returns
			bool closed = false;
		};

		static void Run(std::shared_ptr<State> state, Task task,
				std::chrono::milliseconds period, uint64_t generation);
		void StopWorker(std::unique_lock<std::mutex>& lock);

		std::shared_ptr<State> state_ = std::make_shared<State>();
		std::thread worker_;  // guarded by state_->mutex
};

} // namespace Leasehold

#endif // LEASEHOLD_LEASE_SCHEDULED_REFRESH_H_
