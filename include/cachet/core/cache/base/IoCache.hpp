#pragma once
#include <optional>
#include "cachet/core/cache/base/ExpiryClock.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Интерфейс кэшей, делегирующих хранение внешнему бэкенду (диск и т.п.).
 * @details Любая операция может бросить исключение бэкенда (например,
 *          DiskCacheError). Счётчиков попаданий нет.
 */
template<typename Key, typename Value>
class IoCache {
public:
    virtual ~IoCache() = default;

    /// Получить неистёкшее значение.
    virtual std::optional<Value> get(const Key& key) = 0;
    /// Сохранить значение. Возвращает прежнее, только если оно ещё не истекло.
    virtual std::optional<Value> put(const Key& key, Value value) = 0;
    /// Удалить запись безусловно. Возвращает значение, только если оно ещё не истекло.
    virtual std::optional<Value> remove(const Key& key) = 0;

    virtual std::optional<Duration> lifespan() const = 0;
    virtual std::optional<Duration> setLifespan(Duration lifespan) = 0;
    /// Продлевается ли срок жизни при успешном get().
    virtual bool refresh() const = 0;
    /// Включить/выключить продление. Возвращает прежнее значение.
    virtual bool setRefresh(bool refresh) = 0;
};

} // namespace cache
} // namespace core
} // namespace cachet
