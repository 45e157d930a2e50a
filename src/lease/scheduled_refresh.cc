#include "scheduled_refresh.h"

#include <exception>

#include <glog/logging.h>

namespace Leasehold {

namespace {

// State of the refresher whose worker is the current thread, if any.
thread_local const void* current_refresh_state = nullptr;

} // namespace

ScheduledRefresh::~ScheduledRefresh() {
	Close();
	std::unique_lock<std::mutex> lock(state_->mutex);
	// Destroyed from inside a tick: that worker cannot be waited for.
	size_t own_worker = current_refresh_state == state_.get() ? 1 : 0;
	state_->cv.wait(lock, [&]() { return state_->live_workers <= own_worker; });
}

bool ScheduledRefresh::ScheduleInBackground(Task task, std::chrono::milliseconds period) {
	std::unique_lock<std::mutex> lock(state_->mutex);
	if (state_->closed) {
		LOG(WARNING) << "[ScheduledRefresh] Closed, ignoring schedule request";
		return false;
	}
	StopWorker(lock);
	if (state_->closed) {
		return false;
	}
	uint64_t generation = ++state_->generation;
	++state_->live_workers;
	worker_ = std::thread(&ScheduledRefresh::Run, state_, std::move(task), period, generation);
	VLOG(3) << "[ScheduledRefresh] Scheduled every " << period.count() << "ms";
	return true;
}

void ScheduledRefresh::Close() {
	std::unique_lock<std::mutex> lock(state_->mutex);
	if (state_->closed) {
		return;
	}
	state_->closed = true;
	StopWorker(lock);
	VLOG(3) << "[ScheduledRefresh] Closed";
}

bool ScheduledRefresh::IsScheduled() const {
	std::lock_guard<std::mutex> lock(state_->mutex);
	return worker_.joinable() && !state_->closed;
}

uint64_t ScheduledRefresh::ticks() const {
	std::lock_guard<std::mutex> lock(state_->mutex);
	return state_->ticks;
}

// Called with state_->mutex held through lock; releases it while joining.
void ScheduledRefresh::StopWorker(std::unique_lock<std::mutex>& lock) {
	while (worker_.joinable()) {
		++state_->generation;
		state_->cv.notify_all();
		if (worker_.get_id() == std::this_thread::get_id()) {
			// Stopping from inside a tick; the worker exits once the tick returns.
			worker_.detach();
			return;
		}
		std::thread worker = std::move(worker_);
		lock.unlock();
		worker.join();
		lock.lock();
	}
}

void ScheduledRefresh::Run(std::shared_ptr<State> state, Task task,
		std::chrono::milliseconds period, uint64_t generation) {
	current_refresh_state = state.get();
	std::unique_lock<std::mutex> lock(state->mutex);
	while (true) {
		bool stopped = state->cv.wait_for(lock, period,
				[&]() { return state->generation != generation; });
		if (stopped) {
			break;
		}
		lock.unlock();
		try {
			task();
		} catch (const std::exception& e) {
			LOG(ERROR) << "[ScheduledRefresh] Tick failed: " << e.what();
		}
		lock.lock();
		++state->ticks;
	}
	--state->live_workers;
	state->cv.notify_all();
}

} // namespace Leasehold
