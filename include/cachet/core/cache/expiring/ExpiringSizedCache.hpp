#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>
#include "cachet/core/cache/base/ExpiryClock.hpp"
#include "cachet/core/cache/expiring/SharedKey.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Кэш со сроком жизни и необязательным лимитом размера, рассчитанный на
 *        большое число параллельных читателей.
 * @details Чтение (get) константно и не трогает очередь истечения, поэтому может
 *          выполняться под разделяемой блокировкой. Удаление и вытеснение только
 *          помечают ключ в очереди (tombstone); физическое уплотнение очереди
 *          выполняется одним проходом, когда число пометок превышает лимит.
 *
 *          Компромиссы:
 *           - при превышении лимита размера вытесняется запись, истекающая раньше
 *             всех, а не LRU;
 *           - size() точен только сразу после evict() или retainLatest();
 *           - вытеснение выполняется только по явному запросу (или при вставке).
 */
template<typename Key, typename Value,
         typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
class ExpiringSizedCache {
public:
    static constexpr size_t kDefaultMaxTombstones = 50;

    explicit ExpiringSizedCache(Duration ttl) : ttl_(ttl) {}

    ExpiringSizedCache(Duration ttl, size_t capacity) : ttl_(ttl) {
        map_.reserve(capacity);
    }

    /// Установить лимит размера. Возвращает прежний.
    std::optional<size_t> setSizeLimit(size_t size) {
        if (size == 0) {
            throw std::invalid_argument("ExpiringSizedCache: лимит размера должен быть больше нуля");
        }
        std::optional<size_t> previous = sizeLimit_;
        sizeLimit_ = size;
        return previous;
    }

    std::optional<size_t> sizeLimit() const { return sizeLimit_; }

    /// Зарезервировать место ещё под more записей.
    void reserve(size_t more) { map_.reserve(map_.size() + more); }

    /// Установить срок жизни, вернуть прежний.
    Duration setTtl(Duration ttl) {
        const Duration previous = ttl_;
        ttl_ = ttl;
        return previous;
    }

    Duration ttl() const { return ttl_; }

    void setMaxTombstoneLimit(size_t limit) { maxTombstones_ = limit; }
    size_t maxTombstoneLimit() const { return maxTombstones_; }
    size_t tombstoneCount() const { return tombstoneCount_; }
    // Длина очереди истечения вместе с помеченными ключами
    size_t stampCount() const { return keys_.size(); }

    /**
     * @brief Вытеснить просроченные записи.
     * @return Количество записей, удалённых из карты.
     */
    size_t evict() {
        return dropOldest(expiredBoundary(Clock::now()), 0);
    }

    /**
     * @brief Оставить только count самых поздних записей; при evict также
     *        вытеснить все просроченные.
     * @return Количество удалённых записей.
     */
    size_t retainLatest(size_t count, bool evict) {
        const size_t liveToDrop = map_.size() > count ? map_.size() - count : 0;
        const size_t expiredEnd = evict ? expiredBoundary(Clock::now()) : 0;
        return dropOldest(expiredEnd, liveToDrop);
    }

    /// Удалить запись. Значение возвращается без проверки срока; вызовите evict() заранее, если это важно.
    std::optional<Value> remove(const Key& key) {
        auto it = map_.find(SharedKey<Key>::borrowed(key));
        if (it == map_.end()) {
            return std::nullopt;
        }
        markTombstone(it->second.stampIndex);
        std::optional<Value> removed(std::move(it->second.value));
        map_.erase(it);
        checkClearTombstones();
        return removed;
    }

    /// Вставить пару без вытеснения просроченных. См. insertEvict.
    std::optional<Value> insert(Key key, Value value) {
        return insertEvict(std::move(key), std::move(value), false);
    }

    /**
     * @brief Вставить пару, при необходимости освободив место.
     * @details При заданном лимите размера и новом ключе вытесняется запись,
     *          истекающая раньше всех. При evict также удаляются просроченные.
     * @return Прежнее значение, если оно ещё не истекло.
     * @throws TimeBoundsError если now + ttl не представимо; кэш не изменяется.
     */
    std::optional<Value> insertEvict(Key key, Value value, bool evict) {
        const TimePoint now = Clock::now();
        const TimePoint expiry = detail::checkedExpiry(now, ttl_);

        const bool isNew = map_.find(SharedKey<Key>::borrowed(key)) == map_.end();
        if (sizeLimit_ && isNew && map_.size() >= *sizeLimit_) {
            retainLatest(*sizeLimit_ - 1, evict);
        } else if (evict) {
            this->evict();
        }

        // очередь должна оставаться отсортированной и после уменьшения ttl
        TimePoint orderExpiry = expiry;
        if (!keys_.empty() && keys_.back().expiry > orderExpiry) {
            orderExpiry = keys_.back().expiry;
        }

        std::optional<Value> previous;
        auto it = map_.find(SharedKey<Key>::borrowed(key));
        if (it != map_.end()) {
            Entry& entry = it->second;
            markTombstone(entry.stampIndex);
            keys_.push_back(Stamp{false, orderExpiry, it->first});
            if (!(entry.expiry < now)) {
                previous = std::move(entry.value);
            }
            entry.stampIndex = keys_.size() - 1;
            entry.expiry = expiry;
            entry.value = std::move(value);
        } else {
            SharedKey<Key> shared = SharedKey<Key>::make(std::move(key));
            keys_.push_back(Stamp{false, orderExpiry, shared});
            map_.emplace(std::move(shared), Entry{keys_.size() - 1, expiry, std::move(value)});
        }
        checkClearTombstones();
        return previous;
    }

    /// Очистить кэш. Память контейнеров не освобождается.
    void clear() {
        map_.clear();
        keys_.clear();
        tombstoneCount_ = 0;
    }

    /// Размер вместе с логически истёкшими записями до ближайшего evict().
    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    /// Получить неистёкшее значение. Ничего не изменяет.
    const Value* get(const Key& key) const {
        auto it = map_.find(SharedKey<Key>::borrowed(key));
        if (it == map_.end() || it->second.expiry < Clock::now()) {
            return nullptr;
        }
        return &it->second.value;
    }

private:
    struct Stamp {
        bool tombstone;
        TimePoint expiry;
        SharedKey<Key> key;
    };

    struct Entry {
        size_t stampIndex;
        TimePoint expiry;
        Value value;
    };

    // Первый индекс очереди, чей срок ещё не наступил
    size_t expiredBoundary(TimePoint now) const {
        auto it = std::lower_bound(keys_.begin(), keys_.end(), now,
                                   [](const Stamp& stamp, TimePoint t) { return stamp.expiry < t; });
        return static_cast<size_t>(it - keys_.begin());
    }

    // Пометить и удалить из карты самые старые записи: все до expiredEnd и
    // не меньше liveToDrop живых.
    size_t dropOldest(size_t expiredEnd, size_t liveToDrop) {
        size_t removed = 0;
        for (size_t i = 0; i < keys_.size(); ++i) {
            if (i >= expiredEnd && removed >= liveToDrop) {
                break;
            }
            Stamp& stamp = keys_[i];
            if (stamp.tombstone) {
                continue;
            }
            map_.erase(stamp.key);
            stamp.tombstone = true;
            ++tombstoneCount_;
            ++removed;
        }
        checkClearTombstones();
        return removed;
    }

    void markTombstone(size_t stampIndex) {
        keys_[stampIndex].tombstone = true;
        ++tombstoneCount_;
    }

    // Уплотнение очереди: выбросить помеченные ключи и переписать stampIndex
    void checkClearTombstones() {
        if (tombstoneCount_ <= maxTombstones_) {
            return;
        }
        const size_t before = keys_.size();
        size_t write = 0;
        for (size_t read = 0; read < keys_.size(); ++read) {
            if (keys_[read].tombstone) {
                continue;
            }
            if (write != read) {
                keys_[write] = std::move(keys_[read]);
            }
            map_.find(keys_[write].key)->second.stampIndex = write;
            ++write;
        }
        keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(write), keys_.end());
        tombstoneCount_ = 0;
        spdlog::trace("ExpiringSizedCache: уплотнение очереди {} -> {}", before, write);
    }

    using KeyHash = SharedKeyHash<Key, Hash>;
    using KeyEq = SharedKeyEqual<Key, KeyEqual>;

    std::unordered_map<SharedKey<Key>, Entry, KeyHash, KeyEq> map_;
    // по возрастанию expiry
    std::deque<Stamp> keys_;
    Duration ttl_;
    std::optional<size_t> sizeLimit_;
    size_t tombstoneCount_ = 0;
    size_t maxTombstones_ = kDefaultMaxTombstones;
};

} // namespace cache
} // namespace core
} // namespace cachet
