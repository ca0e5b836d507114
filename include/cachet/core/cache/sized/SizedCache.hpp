#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "cachet/core/cache/base/BaseCache.hpp"
#include "cachet/core/cache/list/ArenaList.hpp"

namespace cachet {
namespace core {
namespace cache {

// Обновляет ли запись существующего ключа его позицию в LRU-порядке
enum class WritePolicy {
    KeepRecency,    // порядок обновляют только чтения (по умолчанию)
    PromoteOnWrite  // put() тоже переносит ключ в голову
};

/**
 * @brief LRU-кэш фиксированной ёмкости.
 * @details Порядок использования хранится в ArenaList, индекс ячейки по ключу в
 *          std::unordered_map. При заполнении вытесняется хвост списка.
 *          Чтение переносит ключ в голову; запись существующего ключа порядок не
 *          меняет, если не выбран WritePolicy::PromoteOnWrite.
 */
template<typename Key, typename Value>
class SizedCache : public BaseCache<Key, Value> {
public:
    using Factory = typename BaseCache<Key, Value>::Factory;

    // Результат getOrSetWithIf: был ли ключ, было ли значение валидно, ссылка на значение
    struct GetOrSetResult {
        bool wasPresent;
        bool wasValid;
        Value& value;
    };

    explicit SizedCache(size_t size, WritePolicy writePolicy = WritePolicy::KeepRecency)
        : capacity_(size), writePolicy_(writePolicy), order_(size) {
        if (size == 0) {
            throw std::invalid_argument("SizedCache: размер должен быть больше нуля");
        }
        index_.reserve(size);
    }

    std::optional<Value> get(const Key& key) override {
        if (Value* value = getMut(key)) {
            return *value;
        }
        return std::nullopt;
    }

    Value* getMut(const Key& key) override {
        return getIf(key, [](const Value&) { return true; });
    }

    Value& getOrSetWith(const Key& key, const Factory& factory) override {
        return getOrSetWithIf(key, factory, [](const Value&) { return true; }).value;
    }

    std::optional<Value> put(const Key& key, Value value) override {
        auto it = index_.find(key);
        if (it != index_.end()) {
            const size_t index = it->second;
            Value previous = std::exchange(order_.get(index).second, std::move(value));
            if (writePolicy_ == WritePolicy::PromoteOnWrite) {
                order_.moveToFront(index);
            }
            return previous;
        }
        evictIfFull();
        const size_t index = order_.pushFront(std::make_pair(key, std::move(value)));
        index_.emplace(key, index);
        return std::nullopt;
    }

    std::optional<Value> remove(const Key& key) override {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        const size_t index = it->second;
        index_.erase(it);
        return order_.remove(index).second;
    }

    void clear() override {
        index_.clear();
        order_.clear();
    }

    // Ёмкость фиксирована, сброс совпадает с очисткой
    void reset() override { clear(); }

    void resetMetrics() override {
        hits_ = 0;
        misses_ = 0;
    }

    size_t size() const override { return index_.size(); }
    std::optional<uint64_t> hits() const override { return hits_; }
    std::optional<uint64_t> misses() const override { return misses_; }
    std::optional<size_t> capacity() const override { return capacity_; }
    std::string policyName() const override { return "lru"; }

    WritePolicy writePolicy() const { return writePolicy_; }
    void setWritePolicy(WritePolicy policy) { writePolicy_ = policy; }

    /// Есть ли ключ в кэше. Не влияет на счётчики и порядок.
    bool contains(const Key& key) const { return index_.find(key) != index_.end(); }

    /**
     * @brief Получить значение, если оно проходит проверку isValid.
     * @details Валидное значение переносится в голову и считается попаданием,
     *          отсутствующее или невалидное считается промахом и остаётся на месте.
     */
    template<typename Pred>
    Value* getIf(const Key& key, Pred&& isValid) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            Value& value = order_.get(it->second).second;
            if (isValid(static_cast<const Value&>(value))) {
                order_.moveToFront(it->second);
                ++hits_;
                return &value;
            }
        }
        ++misses_;
        return nullptr;
    }

    /**
     * @brief Вернуть значение или записать новое из factory, если ключа нет или
     *        isValid отклоняет текущее.
     * @details wasValid всегда false, когда wasPresent false. factory вызывается
     *          до изменения структур, исключение из неё оставляет кэш нетронутым.
     */
    template<typename F, typename Pred>
    GetOrSetResult getOrSetWithIf(const Key& key, F&& factory, Pred&& isValid) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            const size_t index = it->second;
            const bool replace = !isValid(static_cast<const Value&>(order_.get(index).second));
            if (replace) {
                order_.get(index).second = factory();
                ++misses_;
            } else {
                ++hits_;
            }
            order_.moveToFront(index);
            return GetOrSetResult{true, !replace, order_.get(index).second};
        }
        Value value = factory();
        evictIfFull();
        ++misses_;
        const size_t index = order_.pushFront(std::make_pair(key, std::move(value)));
        index_.emplace(key, index);
        return GetOrSetResult{false, false, order_.get(index).second};
    }

    /// Удалить записи, для которых keep(key, value) вернул false. Возвращает число удалённых.
    template<typename Pred>
    size_t retain(Pred&& keep) {
        std::vector<size_t> doomed;
        order_.forEachIndexed([&](size_t index, const std::pair<Key, Value>& entry) {
            if (!keep(entry.first, entry.second)) {
                doomed.push_back(index);
            }
        });
        for (size_t index : doomed) {
            index_.erase(order_.get(index).first);
            order_.remove(index);
        }
        return doomed.size();
    }

    /// Обход от самой свежей записи к самой старой: f(key, value).
    template<typename F>
    void forEachOrdered(F&& f) const {
        order_.forEach([&](const std::pair<Key, Value>& entry) { f(entry.first, entry.second); });
    }

    /// Ключи от самого свежего к самому старому.
    std::vector<Key> keyOrder() const {
        std::vector<Key> keys;
        keys.reserve(index_.size());
        forEachOrdered([&](const Key& key, const Value&) { keys.push_back(key); });
        return keys;
    }

    /// Значения от самого свежего к самому старому.
    std::vector<Value> valueOrder() const {
        std::vector<Value> values;
        values.reserve(index_.size());
        forEachOrdered([&](const Key&, const Value& value) { values.push_back(value); });
        return values;
    }

private:
    void evictIfFull() {
        if (index_.size() < capacity_) {
            return;
        }
        // ёмкость не нулевая, значит в списке есть хвост
        const size_t victim = order_.back();
        index_.erase(order_.get(victim).first);
        order_.remove(victim);
        spdlog::trace("SizedCache: вытеснен LRU-ключ, ёмкость {}", capacity_);
    }

    size_t capacity_;
    WritePolicy writePolicy_;
    std::unordered_map<Key, size_t> index_;
    ArenaList<std::pair<Key, Value>> order_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace cache
} // namespace core
} // namespace cachet
