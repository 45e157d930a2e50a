#ifndef LEASEHOLD_COMMON_CONFIG_H_
#define LEASEHOLD_COMMON_CONFIG_H_

#include <cstdint>

namespace Leasehold {

/// Lease configs
/// How long an unrenewed lease stays valid.
const int64_t kDefaultLeaseTimeMs = 20000;
/// 0 means "renew once half of the lease time has elapsed".
const int64_t kDefaultRefreshIntervalMs = 0;
/// Storage location the leases are kept under.
const char kDefaultLeaseCollection[] = "competing-consumer-locks";

/// Retry configs for lease store calls
const int64_t kDefaultInitialBackoffMs = 100;
const int64_t kDefaultMaxBackoffMs = 2000;
const double kDefaultBackoffMultiplier = 2.0;
/// Attempts per store call, including the first one.
const int kDefaultMaxAttempts = 5;
/// Granularity at which a backoff wait re-checks whether it should abort.
const int64_t kRetryCancellationPollMs = 10;

} // namespace Leasehold

#endif // LEASEHOLD_COMMON_CONFIG_H_
