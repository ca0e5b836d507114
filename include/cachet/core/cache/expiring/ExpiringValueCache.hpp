#pragma once

#include <optional>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include "cachet/core/cache/base/BaseCache.hpp"
#include "cachet/core/cache/sized/SizedCache.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Способ узнать, истекло ли значение.
 * @details По умолчанию вызывается value.isExpired(). Для чужих типов
 *          специализируйте шаблон.
 */
template<typename Value>
struct ExpiryTraits {
    static bool isExpired(const Value& value) { return value.isExpired(); }
};

/**
 * @brief LRU-кэш, в котором срок жизни определяют сами значения.
 * @details Полезно для значений, несущих собственную метку истечения (токены,
 *          ответы с max-age). Просроченное значение при чтении считается промахом
 *          и удаляется.
 */
template<typename Key, typename Value, typename Traits = ExpiryTraits<Value>>
class ExpiringValueCache : public BaseCache<Key, Value> {
public:
    using Factory = typename BaseCache<Key, Value>::Factory;

    explicit ExpiringValueCache(size_t size) : store_(size) {}

    std::optional<Value> get(const Key& key) override {
        if (Value* value = getMut(key)) {
            return *value;
        }
        return std::nullopt;
    }

    Value* getMut(const Key& key) override {
        Value* value = store_.getIf(key, [](const Value& v) { return !Traits::isExpired(v); });
        if (value) {
            ++hits_;
            return value;
        }
        ++misses_;
        if (store_.contains(key)) {
            store_.remove(key);
        }
        return nullptr;
    }

    Value& getOrSetWith(const Key& key, const Factory& factory) override {
        auto result = store_.getOrSetWithIf(key, factory,
                                            [](const Value& v) { return !Traits::isExpired(v); });
        if (result.wasPresent && result.wasValid) {
            ++hits_;
        } else {
            ++misses_;
        }
        return result.value;
    }

    std::optional<Value> put(const Key& key, Value value) override {
        return store_.put(key, std::move(value));
    }

    std::optional<Value> remove(const Key& key) override {
        return store_.remove(key);
    }

    /// Удалить все просроченные значения. Возвращает число удалённых.
    size_t flush() {
        const size_t removed = store_.retain([](const Key&, const Value& v) {
            return !Traits::isExpired(v);
        });
        spdlog::debug("ExpiringValueCache: удалено просроченных значений: {}", removed);
        return removed;
    }

    void clear() override { store_.clear(); }
    void reset() override { store_.reset(); }

    void resetMetrics() override {
        hits_ = 0;
        misses_ = 0;
    }

    size_t size() const override { return store_.size(); }
    std::optional<uint64_t> hits() const override { return hits_; }
    std::optional<uint64_t> misses() const override { return misses_; }
    std::optional<size_t> capacity() const override { return store_.capacity(); }
    std::string policyName() const override { return "expiring_value"; }

private:
    SizedCache<Key, Value> store_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace cache
} // namespace core
} // namespace cachet
