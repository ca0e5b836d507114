#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>
#include "cachet/core/cache/base/BaseCache.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Кэш с ограничением по времени жизни записей.
 * @details Каждая запись помечается моментом вставки. Просроченная запись
 *          удаляется при обращении к ней (фоновой очистки нет). Смена срока жизни
 *          применяется к уже сохранённым записям при следующем обращении.
 *          В режиме refresh попадание продлевает жизнь записи.
 */
template<typename Key, typename Value>
class TimedCache : public BaseCache<Key, Value> {
public:
    using Factory = typename BaseCache<Key, Value>::Factory;

    struct Stamped {
        TimePoint stamp;
        Value value;
    };

    explicit TimedCache(Duration lifespan)
        : lifespan_(lifespan) {}

    TimedCache(Duration lifespan, size_t initialCapacity)
        : lifespan_(lifespan), initialCapacity_(initialCapacity) {
        store_.reserve(initialCapacity);
    }

    static TimedCache withLifespanAndRefresh(Duration lifespan, bool refresh) {
        TimedCache cache(lifespan);
        cache.refresh_ = refresh;
        return cache;
    }

    std::optional<Value> get(const Key& key) override {
        if (Value* value = getMut(key)) {
            return *value;
        }
        return std::nullopt;
    }

    Value* getMut(const Key& key) override {
        auto it = store_.find(key);
        if (it == store_.end()) {
            ++misses_;
            return nullptr;
        }
        const TimePoint now = Clock::now();
        if (!detail::isFresh(it->second.stamp, now, lifespan_)) {
            ++misses_;
            store_.erase(it);
            return nullptr;
        }
        if (refresh_) {
            it->second.stamp = now;
        }
        ++hits_;
        return &it->second.value;
    }

    Value& getOrSetWith(const Key& key, const Factory& factory) override {
        auto it = store_.find(key);
        const TimePoint now = Clock::now();
        if (it != store_.end()) {
            if (detail::isFresh(it->second.stamp, now, lifespan_)) {
                if (refresh_) {
                    it->second.stamp = now;
                }
                ++hits_;
            } else {
                ++misses_;
                it->second.value = factory();
                it->second.stamp = Clock::now();
            }
            return it->second.value;
        }
        ++misses_;
        Value value = factory();
        return store_.emplace(key, Stamped{Clock::now(), std::move(value)}).first->second.value;
    }

    std::optional<Value> put(const Key& key, Value value) override {
        Stamped stamped{Clock::now(), std::move(value)};
        auto it = store_.find(key);
        if (it == store_.end()) {
            store_.emplace(key, std::move(stamped));
            return std::nullopt;
        }
        std::optional<Value> previous(std::move(it->second.value));
        it->second = std::move(stamped);
        return previous;
    }

    std::optional<Value> remove(const Key& key) override {
        auto it = store_.find(key);
        if (it == store_.end()) {
            return std::nullopt;
        }
        std::optional<Value> removed(std::move(it->second.value));
        store_.erase(it);
        return removed;
    }

    /**
     * @brief Как get(), но просроченное значение возвращается вместе с флагом expired.
     * @details Просроченная запись удаляется из кэша и отдаётся вызывающему.
     * @return {значение, expired}
     */
    std::pair<std::optional<Value>, bool> getExpired(const Key& key) {
        auto it = store_.find(key);
        if (it == store_.end()) {
            ++misses_;
            return {std::nullopt, false};
        }
        const TimePoint now = Clock::now();
        if (detail::isFresh(it->second.stamp, now, lifespan_)) {
            if (refresh_) {
                it->second.stamp = now;
            }
            ++hits_;
            return {it->second.value, false};
        }
        ++misses_;
        std::optional<Value> expired(std::move(it->second.value));
        store_.erase(it);
        return {std::move(expired), true};
    }

    /// Удалить все просроченные записи. Возвращает число удалённых.
    size_t flush() {
        const TimePoint now = Clock::now();
        size_t removed = 0;
        for (auto it = store_.begin(); it != store_.end();) {
            if (detail::isFresh(it->second.stamp, now, lifespan_)) {
                ++it;
            } else {
                it = store_.erase(it);
                ++removed;
            }
        }
        spdlog::debug("TimedCache: удалено просроченных записей: {}", removed);
        return removed;
    }

    void clear() override {
        store_.clear();
    }

    void reset() override {
        store_ = std::unordered_map<Key, Stamped>();
        if (initialCapacity_) {
            store_.reserve(*initialCapacity_);
        }
    }

    void resetMetrics() override {
        hits_ = 0;
        misses_ = 0;
    }

    size_t size() const override { return store_.size(); }
    std::optional<uint64_t> hits() const override { return hits_; }
    std::optional<uint64_t> misses() const override { return misses_; }
    std::optional<Duration> lifespan() const override { return lifespan_; }

    std::optional<Duration> setLifespan(Duration lifespan) override {
        const Duration old = lifespan_;
        lifespan_ = lifespan;
        return old;
    }

    std::string policyName() const override { return "timed"; }

    bool refresh() const { return refresh_; }
    void setRefresh(bool refresh) { refresh_ = refresh; }

    const std::unordered_map<Key, Stamped>& store() const { return store_; }

private:
    std::unordered_map<Key, Stamped> store_;
    Duration lifespan_;
    bool refresh_ = false;
    std::optional<size_t> initialCapacity_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace cache
} // namespace core
} // namespace cachet
