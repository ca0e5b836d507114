#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "cachet/core/cache/base/BaseCache.hpp"
#include "cachet/core/cache/sized/SizedCache.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief LRU-кэш ограниченного размера с ограничением по времени жизни.
 * @details Срок жизни отсчитывается от момента вставки; в режиме refresh
 *          продлевается при каждом попадании. Просроченная запись считается промахом, но физически остаётся
 *          в кэше до вытеснения по ёмкости или очистки.
 */
template<typename Key, typename Value>
class TimedSizedCache : public BaseCache<Key, Value> {
public:
    using Factory = typename BaseCache<Key, Value>::Factory;

    struct Stamped {
        TimePoint stamp;
        Value value;
    };

    TimedSizedCache(size_t size, Duration lifespan, bool refresh = false)
        : store_(checkedSize(size)), size_(size), lifespan_(lifespan), refresh_(refresh) {}

    std::optional<Value> get(const Key& key) override {
        if (Value* value = getMut(key)) {
            return *value;
        }
        return std::nullopt;
    }

    Value* getMut(const Key& key) override {
        Stamped* stamped = store_.getIf(key, freshPredicate());
        if (!stamped) {
            ++misses_;
            return nullptr;
        }
        ++hits_;
        if (refresh_) {
            stamped->stamp = Clock::now();
        }
        return &stamped->value;
    }

    Value& getOrSetWith(const Key& key, const Factory& factory) override {
        auto setter = [&factory]() { return Stamped{Clock::now(), factory()}; };
        auto result = store_.getOrSetWithIf(key, setter, freshPredicate());
        if (result.wasPresent && result.wasValid) {
            ++hits_;
            if (refresh_) {
                result.value.stamp = Clock::now();
            }
        } else {
            ++misses_;
        }
        return result.value.value;
    }

    std::optional<Value> put(const Key& key, Value value) override {
        auto previous = store_.put(key, Stamped{Clock::now(), std::move(value)});
        if (!previous) {
            return std::nullopt;
        }
        return std::move(previous->value);
    }

    std::optional<Value> remove(const Key& key) override {
        auto removed = store_.remove(key);
        if (!removed) {
            return std::nullopt;
        }
        return std::move(removed->value);
    }

    void clear() override { store_.clear(); }
    void reset() override { clear(); }

    void resetMetrics() override {
        hits_ = 0;
        misses_ = 0;
    }

    size_t size() const override { return store_.size(); }
    std::optional<uint64_t> hits() const override { return hits_; }
    std::optional<uint64_t> misses() const override { return misses_; }
    std::optional<size_t> capacity() const override { return size_; }
    std::optional<Duration> lifespan() const override { return lifespan_; }

    std::optional<Duration> setLifespan(Duration lifespan) override {
        const Duration old = lifespan_;
        lifespan_ = lifespan;
        return old;
    }

    std::string policyName() const override { return "timed_sized"; }

    bool refresh() const { return refresh_; }
    void setRefresh(bool refresh) { refresh_ = refresh; }

    /// Живые ключи от самого свежего к самому старому (просроченные пропускаются).
    std::vector<Key> keyOrder() const {
        std::vector<Key> keys;
        const TimePoint now = Clock::now();
        store_.forEachOrdered([&](const Key& key, const Stamped& stamped) {
            if (detail::isFresh(stamped.stamp, now, lifespan_)) {
                keys.push_back(key);
            }
        });
        return keys;
    }

    /// Живые значения с отметками времени в том же порядке.
    std::vector<Stamped> valueOrder() const {
        std::vector<Stamped> values;
        const TimePoint now = Clock::now();
        store_.forEachOrdered([&](const Key&, const Stamped& stamped) {
            if (detail::isFresh(stamped.stamp, now, lifespan_)) {
                values.push_back(stamped);
            }
        });
        return values;
    }

private:
    static size_t checkedSize(size_t size) {
        if (size == 0) {
            throw std::invalid_argument("TimedSizedCache: размер должен быть больше нуля");
        }
        return size;
    }

    auto freshPredicate() const {
        const Duration lifespan = lifespan_;
        const TimePoint now = Clock::now();
        return [lifespan, now](const Stamped& stamped) {
            return detail::isFresh(stamped.stamp, now, lifespan);
        };
    }

    SizedCache<Key, Stamped> store_;
    size_t size_;
    Duration lifespan_;
    bool refresh_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace cache
} // namespace core
} // namespace cachet
