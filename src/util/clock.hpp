/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Clock - Injectable wall clock used for entry timestamps and expiry
 */

#ifndef QCACHE_UTIL_CLOCK_HPP
#define QCACHE_UTIL_CLOCK_HPP

#include <chrono>
#include <cstdint>
#include <functional>

namespace qcache::util {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * Clock source - returns the current wall-clock time
 *
 * Components that stamp or expire entries take a Clock so that tests
 * can advance time deterministically.
 */
using Clock = std::function<TimePoint()>;

inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

/**
 * Milliseconds since the Unix epoch
 */
inline std::int64_t epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace qcache::util

#endif // QCACHE_UTIL_CLOCK_HPP
