/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Future helpers - already-resolved futures for synchronous implementations
 */

#ifndef QCACHE_UTIL_FUTURE_HPP
#define QCACHE_UTIL_FUTURE_HPP

#include <exception>
#include <future>
#include <utility>

namespace qcache::util {

template<typename T>
std::future<T> make_ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

inline std::future<void> make_ready_future() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

template<typename T>
std::future<T> make_failed_future(std::exception_ptr error) {
    std::promise<T> promise;
    promise.set_exception(std::move(error));
    return promise.get_future();
}

} // namespace qcache::util

#endif // QCACHE_UTIL_FUTURE_HPP
