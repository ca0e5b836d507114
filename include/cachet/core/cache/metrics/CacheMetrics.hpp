#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cachet {
namespace core {
namespace cache {

struct CacheMetrics {
    std::string policy;                      // Имя политики вытеснения
    size_t entryCount = 0;                   // Количество записей
    std::optional<size_t> capacity;          // Ёмкость (для ограниченных кэшей)
    std::optional<int64_t> lifespanMs;       // Срок жизни записей (мс)
    uint64_t hits = 0;                       // Попадания
    uint64_t misses = 0;                     // Промахи
    uint64_t requestCount = 0;               // Количество запросов
    double hitRate = 0.0;                    // Частота попаданий
    std::chrono::steady_clock::time_point lastUpdate; // Время снятия метрик

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"policy", policy},
            {"entryCount", entryCount},
            {"hits", hits},
            {"misses", misses},
            {"requestCount", requestCount},
            {"hitRate", hitRate},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
        j["capacity"] = capacity ? nlohmann::json(*capacity) : nlohmann::json(nullptr);
        j["lifespanMs"] = lifespanMs ? nlohmann::json(*lifespanMs) : nlohmann::json(nullptr);
        return j;
    }
};

} // namespace cache
} // namespace core
} // namespace cachet
