/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Async Store - Runs store operations on a Boost.Asio thread pool
 */

#ifndef QCACHE_CACHE_ASYNC_STORE_HPP
#define QCACHE_CACHE_ASYNC_STORE_HPP

#include "cache/key_value_store.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>

namespace qcache::cache {

namespace asio = boost::asio;

/**
 * Store decorator that completes get/set off the calling thread
 *
 * Each operation is posted to an internal asio::thread_pool and the caller
 * receives a future for its result. shutdown() lets queued operations
 * finish; operations submitted after it fail with std::runtime_error.
 */
class AsyncStore : public KeyValueStore {
public:
    AsyncStore(std::shared_ptr<KeyValueStore> inner, std::size_t threads);
    ~AsyncStore() override;

    AsyncStore(const AsyncStore&) = delete;
    AsyncStore& operator=(const AsyncStore&) = delete;

    std::future<std::optional<std::string>> get(const std::string& key) override;
    std::future<void> set(const std::string& key, std::string value, std::chrono::seconds ttl) override;

    /**
     * Stop accepting work and wait for queued operations to complete
     */
    void shutdown();

private:
    template <typename T>
    std::future<T> submit(std::function<T()> operation);

    std::shared_ptr<KeyValueStore> inner_;
    asio::thread_pool pool_;
    std::atomic<bool> accepting_{true};
};

} // namespace qcache::cache

#endif // QCACHE_CACHE_ASYNC_STORE_HPP
