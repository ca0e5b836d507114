#pragma once

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include "cachet/core/cache/expiring/ExpiringSizedCache.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief ExpiringSizedCache под std::shared_mutex.
 * @details Чтения идут параллельно под разделяемой блокировкой, запись и
 *          вытеснение под эксклюзивной. Значение возвращается копией, так как
 *          ссылка не может пережить снятие блокировки.
 */
template<typename Key, typename Value,
         typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
class SharedExpiringCache {
public:
    using Store = ExpiringSizedCache<Key, Value, Hash, KeyEqual>;

    explicit SharedExpiringCache(Duration ttl) : store_(ttl) {}
    SharedExpiringCache(Duration ttl, size_t capacity) : store_(ttl, capacity) {}

    SharedExpiringCache(const SharedExpiringCache&) = delete;
    SharedExpiringCache& operator=(const SharedExpiringCache&) = delete;

    std::optional<Value> get(const Key& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (const Value* value = store_.get(key)) {
            return *value;
        }
        return std::nullopt;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return store_.size();
    }

    std::optional<Value> insert(Key key, Value value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return store_.insert(std::move(key), std::move(value));
    }

    std::optional<Value> insertEvict(Key key, Value value, bool evict) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return store_.insertEvict(std::move(key), std::move(value), evict);
    }

    std::optional<Value> remove(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return store_.remove(key);
    }

    size_t evict() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return store_.evict();
    }

    size_t retainLatest(size_t count, bool evict) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return store_.retainLatest(count, evict);
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        store_.clear();
    }

    std::optional<size_t> setSizeLimit(size_t size) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return store_.setSizeLimit(size);
    }

    std::optional<size_t> sizeLimit() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return store_.sizeLimit();
    }

    Duration setTtl(Duration ttl) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return store_.setTtl(ttl);
    }

    Duration ttl() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return store_.ttl();
    }

    void setMaxTombstoneLimit(size_t limit) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        store_.setMaxTombstoneLimit(limit);
    }

    size_t maxTombstoneLimit() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return store_.maxTombstoneLimit();
    }

    void reserve(size_t more) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        store_.reserve(more);
    }

    /// Выполнить f(const Store&) под разделяемой блокировкой, без копирования значений.
    template<typename F>
    auto withRead(F&& f) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return f(static_cast<const Store&>(store_));
    }

private:
    Store store_;
    mutable std::shared_mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace cachet
