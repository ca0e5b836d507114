#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "cachet/core/cache/base/ExpiryClock.hpp"
#include "cachet/core/cache/metrics/CacheMetrics.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Базовый шаблонный интерфейс кэша для всех in-memory реализаций.
 * @details Указатели и ссылки, полученные из кэша, действительны только до
 *          следующей модифицирующей операции над этим же кэшем.
 * @tparam Key Тип ключа (хешируемый через std::hash, сравнимый на равенство)
 * @tparam Value Тип значения
 */
template<typename Key, typename Value>
class BaseCache {
public:
    using KeyType = Key;
    using ValueType = Value;
    using Factory = std::function<Value()>;

    virtual ~BaseCache() = default;

    /// Получить копию живого значения. Попадание/промах учитываются.
    virtual std::optional<Value> get(const Key& key) = 0;
    /// Изменяемый доступ к живому значению, nullptr при отсутствии.
    virtual Value* getMut(const Key& key) = 0;
    /// Вернуть живое значение или вычислить его через factory (не более одного вызова).
    virtual Value& getOrSetWith(const Key& key, const Factory& factory) = 0;
    /// Сохранить значение. Возвращает предыдущее значение, даже если оно истекло.
    virtual std::optional<Value> put(const Key& key, Value value) = 0;
    /// Удалить значение по ключу.
    virtual std::optional<Value> remove(const Key& key) = 0;
    /// Очистить кэш полностью.
    virtual void clear() = 0;
    /// Очистить кэш и вернуть исходную предвыделенную ёмкость.
    virtual void reset() { clear(); }
    /// Обнулить счётчики попаданий и промахов.
    virtual void resetMetrics() {}
    /// Получить количество элементов в кэше.
    virtual size_t size() const = 0;

    virtual std::optional<uint64_t> hits() const { return std::nullopt; }
    virtual std::optional<uint64_t> misses() const { return std::nullopt; }
    virtual std::optional<size_t> capacity() const { return std::nullopt; }
    virtual std::optional<Duration> lifespan() const { return std::nullopt; }
    /// Установить срок жизни. Возвращает прежний, если политика его поддерживает.
    virtual std::optional<Duration> setLifespan(Duration /*lifespan*/) { return std::nullopt; }

    /// Имя политики для логов и метрик.
    virtual std::string policyName() const = 0;

    /// Снимок метрик кэша.
    CacheMetrics metrics() const {
        CacheMetrics m;
        m.policy = policyName();
        m.entryCount = size();
        m.capacity = capacity();
        if (auto ttl = lifespan()) {
            m.lifespanMs = ttl->count();
        }
        m.hits = hits().value_or(0);
        m.misses = misses().value_or(0);
        m.requestCount = m.hits + m.misses;
        m.hitRate = m.requestCount == 0
            ? 0.0
            : static_cast<double>(m.hits) / static_cast<double>(m.requestCount);
        m.lastUpdate = Clock::now();
        return m;
    }
};

} // namespace cache
} // namespace core
} // namespace cachet
