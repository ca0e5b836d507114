#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "cachet/core/cache/sized/SizedCache.hpp"

namespace cachet {
namespace core {
namespace cache {

// Политики вытеснения, доступные через конфигурацию
enum class EvictionPolicy {
    Unbound,
    Lru,
    Timed,
    TimedSized,
    ExpiringValue,
    ExpiringSized,
    Disk
};

// "unbound" | "lru" | "timed" | "timed_sized" | "expiring_value" | "expiring_sized" | "disk"
std::string toString(EvictionPolicy policy);
// @throws std::invalid_argument для неизвестного имени
EvictionPolicy parseEvictionPolicy(const std::string& name);

std::string toString(WritePolicy policy);
// "keep_recency" | "promote_on_write"
WritePolicy parseWritePolicy(const std::string& name);

// Унифицированная конфигурация кэша
struct CacheConfig {
    EvictionPolicy policy = EvictionPolicy::Lru;
    size_t capacity = 1024;                                   // Ёмкость LRU-хранилищ
    std::chrono::milliseconds lifespan{std::chrono::hours(1)}; // Срок жизни записей
    bool refresh = false;                                     // Продлевать срок при попадании
    WritePolicy writePolicy = WritePolicy::KeepRecency;
    size_t initialCapacity = 256;                             // Предвыделение для хеш-таблиц
    std::optional<size_t> sizeLimit;                          // Лимит размера хранилища с tombstone
    size_t maxTombstones = 50;                                // Порог уплотнения очереди
    std::string diskDirectory;                                // Пусто = каталог по умолчанию
    std::string cacheName = "cachet";
    bool compress = true;                                     // zlib для дисковых записей

    /**
     * @brief Валидация конфигурации
     *
     * @return true если конфигурация корректна для выбранной политики
     */
    bool validate() const;

    nlohmann::json toJson() const;

    /**
     * @brief Разбор конфигурации из JSON. Отсутствующие поля берутся по умолчанию.
     * @throws std::invalid_argument при неверном типе поля или имени политики
     */
    static CacheConfig fromJson(const nlohmann::json& j);

    /// @throws CacheError если файл не открывается или не является JSON
    static CacheConfig loadFromFile(const std::filesystem::path& path);
};

} // namespace cache
} // namespace core
} // namespace cachet
