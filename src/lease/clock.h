#ifndef LEASEHOLD_LEASE_CLOCK_H_
#define LEASEHOLD_LEASE_CLOCK_H_

#include <atomic>
#include <chrono>

namespace Leasehold {

/**
 * Time source for lease expiry. Lease records are shared between processes,
 * so instants are wall-clock based.
 */
class Clock {
public:
	using time_point = std::chrono::system_clock::time_point;

	virtual ~Clock() = default;

	virtual time_point now() const = 0;
};

class SystemClock final : public Clock {
public:
	time_point now() const override {
		return std::chrono::system_clock::now();
	}
};

/**
 * Clock that only moves when told to. Safe to read from the refresher thread
 * while a test thread advances it.
 */
class ManualClock final : public Clock {
public:
	ManualClock() : now_(time_point{}) {}
	explicit ManualClock(time_point start) : now_(start) {}

	time_point now() const override {
		return now_.load();
	}

	void advance(std::chrono::milliseconds delta) {
		time_point current = now_.load();
		while (!now_.compare_exchange_weak(current, current + delta)) {
		}
	}

	void set(time_point tp) {
		now_.store(tp);
	}

private:
	std::atomic<time_point> now_;
};

} // namespace Leasehold

#endif // LEASEHOLD_LEASE_CLOCK_H_
