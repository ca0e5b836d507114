#pragma once

#include <stdexcept>
#include <string>

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Базовое исключение всех хранилищ кэша.
 * @note Ошибки использования (нулевая ёмкость и т.п.) бросаются как std::invalid_argument.
 */
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Вычисление момента истечения (now + ttl) вышло за пределы steady_clock.
 * @details Бросается до любой модификации хранилища, состояние остаётся согласованным.
 */
class TimeBoundsError : public CacheError {
public:
    explicit TimeBoundsError(const std::string& message) : CacheError(message) {}
};

/**
 * @brief Ошибка дискового хранилища. Исходное исключение бэкенда доступно
 *        через std::rethrow_if_nested.
 */
class DiskCacheError : public CacheError {
public:
    enum class Kind {
        Build,           // не удалось открыть/создать каталог хранилища
        Storage,         // ошибка файловой системы
        Serialization,   // ошибка кодирования значения
        Deserialization  // запись повреждена или не соответствует типу
    };

    DiskCacheError(Kind kind, const std::string& message)
        : CacheError(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace cache
} // namespace core
} // namespace cachet
