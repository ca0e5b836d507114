#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include "cachet/core/cache/base/BaseCache.hpp"
#include "cachet/core/cache/concurrent/SharedExpiringCache.hpp"
#include "cachet/core/cache/disk/DiskCache.hpp"
#include "cachet/core/cache/expiring/ExpiringValueCache.hpp"
#include "cachet/core/cache/metrics/CacheConfig.hpp"
#include "cachet/core/cache/sized/SizedCache.hpp"
#include "cachet/core/cache/timed/TimedCache.hpp"
#include "cachet/core/cache/timed/TimedSizedCache.hpp"
#include "cachet/core/cache/unbound/UnboundCache.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Создать in-memory кэш по конфигурации.
 * @details Поддерживаются политики unbound, lru, timed и timed_sized.
 *          Для остальных политик есть makeExpiringValueCache,
 *          makeSharedExpiringCache и makeDiskCache.
 * @throws std::invalid_argument при неверной конфигурации или неподдерживаемой политике
 */
template<typename Key, typename Value>
std::unique_ptr<BaseCache<Key, Value>> makeCache(const CacheConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("makeCache: неверная конфигурация для политики " + toString(config.policy));
    }
    std::unique_ptr<BaseCache<Key, Value>> cache;
    switch (config.policy) {
        case EvictionPolicy::Unbound:
            cache = std::make_unique<UnboundCache<Key, Value>>(config.initialCapacity);
            break;
        case EvictionPolicy::Lru:
            cache = std::make_unique<SizedCache<Key, Value>>(config.capacity, config.writePolicy);
            break;
        case EvictionPolicy::Timed: {
            auto timed = std::make_unique<TimedCache<Key, Value>>(config.lifespan, config.initialCapacity);
            timed->setRefresh(config.refresh);
            cache = std::move(timed);
            break;
        }
        case EvictionPolicy::TimedSized:
            cache = std::make_unique<TimedSizedCache<Key, Value>>(config.capacity, config.lifespan, config.refresh);
            break;
        default:
            throw std::invalid_argument("makeCache: политика " + toString(config.policy) +
                                        " не реализует BaseCache");
    }
    spdlog::debug("makeCache: создан кэш {} (ёмкость: {}, срок жизни: {} мс)",
                  cache->policyName(), config.capacity, config.lifespan.count());
    return cache;
}

namespace detail {

inline void requirePolicy(const CacheConfig& config, EvictionPolicy expected, const char* factory) {
    if (config.policy != expected) {
        throw std::invalid_argument(std::string(factory) + ": ожидается политика " + toString(expected) +
                                    ", получена " + toString(config.policy));
    }
    if (!config.validate()) {
        throw std::invalid_argument(std::string(factory) + ": неверная конфигурация для политики " +
                                    toString(config.policy));
    }
}

} // namespace detail

/// LRU со значениями, истекающими сами (ExpiryTraits<Value>). Использует capacity.
template<typename Key, typename Value, typename Traits = ExpiryTraits<Value>>
std::unique_ptr<ExpiringValueCache<Key, Value, Traits>> makeExpiringValueCache(const CacheConfig& config) {
    detail::requirePolicy(config, EvictionPolicy::ExpiringValue, "makeExpiringValueCache");
    return std::make_unique<ExpiringValueCache<Key, Value, Traits>>(config.capacity);
}

/**
 * @brief Хранилище с tombstone под shared_mutex.
 * @details Применяются lifespan (TTL), sizeLimit, maxTombstones и
 *          initialCapacity (предвыделение таблицы).
 */
template<typename Key, typename Value>
std::unique_ptr<SharedExpiringCache<Key, Value>> makeSharedExpiringCache(const CacheConfig& config) {
    detail::requirePolicy(config, EvictionPolicy::ExpiringSized, "makeSharedExpiringCache");
    auto cache = std::make_unique<SharedExpiringCache<Key, Value>>(config.lifespan, config.initialCapacity);
    if (config.sizeLimit) {
        cache->setSizeLimit(*config.sizeLimit);
    }
    cache->setMaxTombstoneLimit(config.maxTombstones);
    spdlog::debug("makeSharedExpiringCache: TTL {} мс, лимит размера {}, порог tombstone {}",
                  config.lifespan.count(), config.sizeLimit ? std::to_string(*config.sizeLimit) : "нет",
                  config.maxTombstones);
    return cache;
}

/**
 * @brief Дисковый кэш по конфигурации.
 * @details Используются cacheName, diskDirectory (пусто = каталог по умолчанию),
 *          compress и refresh. Нулевой lifespan означает бессрочные записи.
 * @throws std::invalid_argument при неверной конфигурации
 * @throws DiskCacheError (Kind::Build) если каталог не удалось создать
 */
template<typename Key, typename Value>
DiskCache<Key, Value> makeDiskCache(const CacheConfig& config) {
    detail::requirePolicy(config, EvictionPolicy::Disk, "makeDiskCache");
    DiskCacheBuilder<Key, Value> builder(config.cacheName);
    builder.setRefresh(config.refresh).setCompression(config.compress);
    if (!config.diskDirectory.empty()) {
        builder.setDiskDirectory(config.diskDirectory);
    }
    if (config.lifespan.count() > 0) {
        builder.setLifespan(config.lifespan);
    }
    return builder.build();
}

} // namespace cache
} // namespace core
} // namespace cachet
