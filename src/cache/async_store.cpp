/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Async Store Implementation
 */

#include "cache/async_store.hpp"
#include "util/logger.hpp"

#include <boost/asio/post.hpp>

#include <stdexcept>

namespace qcache::cache {

using util::log_component::Store;

AsyncStore::AsyncStore(std::shared_ptr<KeyValueStore> inner, std::size_t threads)
    : inner_(std::move(inner))
    , pool_(threads > 0 ? threads : 1)
{
    QCACHE_LOG_DEBUG(Store, "Async store started with {} threads", threads > 0 ? threads : 1);
}

AsyncStore::~AsyncStore() {
    shutdown();
}

template <typename T>
std::future<T> AsyncStore::submit(std::function<T()> operation) {
    auto task = std::make_shared<std::packaged_task<T()>>(std::move(operation));
    auto result = task->get_future();

    if (!accepting_.load()) {
        std::promise<T> rejected;
        rejected.set_exception(std::make_exception_ptr(std::runtime_error("async store is shut down")));
        return rejected.get_future();
    }

    asio::post(pool_, [task] { (*task)(); });
    return result;
}

std::future<std::optional<std::string>> AsyncStore::get(const std::string& key) {
    return submit<std::optional<std::string>>([inner = inner_, key] {
        return inner->get(key).get();
    });
}

std::future<void> AsyncStore::set(const std::string& key, std::string value, std::chrono::seconds ttl) {
    auto shared_value = std::make_shared<std::string>(std::move(value));
    return submit<void>([inner = inner_, key, shared_value, ttl] {
        inner->set(key, std::move(*shared_value), ttl).get();
    });
}

void AsyncStore::shutdown() {
    if (!accepting_.exchange(false)) {
        return;
    }
    // Without stop(), join() returns once the queue has drained
    pool_.join();
    QCACHE_LOG_DEBUG(Store, "Async store shut down");
}

} // namespace qcache::cache
