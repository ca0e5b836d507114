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
 * @brief Кэш без ограничений по размеру и без вытеснения.
 * @details Эталон учёта попаданий/промахов для остальных политик.
 */
template<typename Key, typename Value>
class UnboundCache : public BaseCache<Key, Value> {
public:
    using Factory = typename BaseCache<Key, Value>::Factory;

    // Пустой кэш; initialCapacity резервирует место и восстанавливается в reset()
    explicit UnboundCache(std::optional<size_t> initialCapacity = std::nullopt)
        : initialCapacity_(initialCapacity) {
        if (initialCapacity_) {
            store_.reserve(*initialCapacity_);
        }
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
        ++hits_;
        return &it->second;
    }

    Value& getOrSetWith(const Key& key, const Factory& factory) override {
        auto it = store_.find(key);
        if (it != store_.end()) {
            ++hits_;
            return it->second;
        }
        ++misses_;
        return store_.emplace(key, factory()).first->second;
    }

    std::optional<Value> put(const Key& key, Value value) override {
        auto it = store_.find(key);
        if (it == store_.end()) {
            store_.emplace(key, std::move(value));
            return std::nullopt;
        }
        std::optional<Value> previous(std::move(it->second));
        it->second = std::move(value);
        return previous;
    }

    std::optional<Value> remove(const Key& key) override {
        auto it = store_.find(key);
        if (it == store_.end()) {
            return std::nullopt;
        }
        std::optional<Value> removed(std::move(it->second));
        store_.erase(it);
        return removed;
    }

    void clear() override {
        store_.clear();
    }

    void reset() override {
        store_ = std::unordered_map<Key, Value>();
        if (initialCapacity_) {
            store_.reserve(*initialCapacity_);
        }
        spdlog::debug("UnboundCache: сброс, резерв {}", initialCapacity_.value_or(0));
    }

    void resetMetrics() override {
        hits_ = 0;
        misses_ = 0;
    }

    size_t size() const override { return store_.size(); }
    std::optional<uint64_t> hits() const override { return hits_; }
    std::optional<uint64_t> misses() const override { return misses_; }
    std::string policyName() const override { return "unbound"; }

    // Прямой доступ к содержимому
    const std::unordered_map<Key, Value>& store() const { return store_; }

private:
    std::unordered_map<Key, Value> store_;
    std::optional<size_t> initialCapacity_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace cache
} // namespace core
} // namespace cachet
