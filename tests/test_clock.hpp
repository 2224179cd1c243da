/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Test helpers - manually advanced clock
 */

#ifndef QCACHE_TESTS_TEST_CLOCK_HPP
#define QCACHE_TESTS_TEST_CLOCK_HPP

#include "util/clock.hpp"

#include <chrono>

namespace qcache::test {

class ManualClock {
public:
    ManualClock()
        : now_(std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000))) {}

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> by) {
        now_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(by);
    }

    util::TimePoint now() const { return now_; }

    // The clock must outlive whatever holds the returned function
    util::Clock clock() {
        return [this] { return now_; };
    }

private:
    util::TimePoint now_;
};

} // namespace qcache::test

#endif // QCACHE_TESTS_TEST_CLOCK_HPP
