#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include "cachet/core/cache/base/CacheErrors.hpp"
#include "cachet/core/cache/base/IoCache.hpp"
#include "cachet/core/cache/disk/DiskStore.hpp"

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Персистентный кэш: запись на диске на каждый ключ.
 * @details Ключ приводится к строке через fmt, значение сериализуется в
 *          MessagePack через nlohmann::json (нужны to_json/from_json для Value).
 *          Время создания хранится по system_clock, поэтому срок жизни
 *          переживает перезапуск процесса.
 */
template<typename Key, typename Value>
class DiskCache : public IoCache<Key, Value> {
public:
    DiskCache(const DiskStoreConfig& config, std::optional<Duration> lifespan, bool refresh)
        : store_(config), lifespan_(lifespan), refresh_(refresh) {}

    std::optional<Value> get(const Key& key) override {
        const std::string name = fmt::to_string(key);
        std::optional<Record> record = load(name);
        if (!record) {
            return std::nullopt;
        }
        const int64_t now = nowMillis();
        if (!isLive(record->createdAtMs, now)) {
            store_.erase(name);
            return std::nullopt;
        }
        Value value = decodeValue(record->value);
        if (refresh_ && lifespan_) {
            record->createdAtMs = now;
            store_.write(name, encode(*record));
        }
        return value;
    }

    std::optional<Value> put(const Key& key, Value value) override {
        const std::string name = fmt::to_string(key);
        Record record{name, encodeValue(value), nowMillis()};
        std::optional<Value> previous = takeLive(name);
        store_.write(name, encode(record));
        return previous;
    }

    std::optional<Value> remove(const Key& key) override {
        const std::string name = fmt::to_string(key);
        std::optional<Value> previous = takeLive(name);
        store_.erase(name);
        return previous;
    }

    std::optional<Duration> lifespan() const override { return lifespan_; }

    std::optional<Duration> setLifespan(Duration lifespan) override {
        std::optional<Duration> previous = lifespan_;
        lifespan_ = lifespan;
        return previous;
    }

    bool refresh() const override { return refresh_; }

    bool setRefresh(bool refresh) override {
        const bool previous = refresh_;
        refresh_ = refresh;
        return previous;
    }

    /**
     * @brief Удалить с диска все истёкшие записи.
     * @details Повреждённые записи тоже удаляются (с предупреждением в лог).
     * @return Количество удалённых записей.
     */
    size_t removeExpiredEntries() {
        const int64_t now = nowMillis();
        const size_t removed = store_.retain([this, now](const std::vector<uint8_t>& payload) {
            return isLive(decode(payload).createdAtMs, now);
        });
        spdlog::debug("DiskCache: удалено {} истёкших записей из {}", removed, store_.path().string());
        return removed;
    }

    void clear() { store_.clear(); }
    size_t count() const { return store_.count(); }
    const std::filesystem::path& path() const { return store_.path(); }

private:
    struct Record {
        std::string key;
        nlohmann::json value;
        int64_t createdAtMs;
    };

    static int64_t nowMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // Запись из будущего (сдвиг часов) считается живой. Разность считается
    // беззнаково: метка с диска может быть любой.
    bool isLive(int64_t createdAtMs, int64_t nowMs) const {
        if (!lifespan_) {
            return true;
        }
        if (nowMs < createdAtMs) {
            return true;
        }
        if (lifespan_->count() <= 0) {
            return false;
        }
        const uint64_t elapsed = static_cast<uint64_t>(nowMs) - static_cast<uint64_t>(createdAtMs);
        return elapsed < static_cast<uint64_t>(lifespan_->count());
    }

    static nlohmann::json encodeValue(const Value& value) {
        try {
            return nlohmann::json(value);
        } catch (const nlohmann::json::exception& e) {
            std::throw_with_nested(DiskCacheError(DiskCacheError::Kind::Serialization,
                std::string("DiskCache: ошибка сериализации значения: ") + e.what()));
        }
    }

    static Value decodeValue(const nlohmann::json& json) {
        try {
            return json.get<Value>();
        } catch (const nlohmann::json::exception& e) {
            std::throw_with_nested(DiskCacheError(DiskCacheError::Kind::Deserialization,
                std::string("DiskCache: значение не соответствует типу: ") + e.what()));
        }
    }

    static std::vector<uint8_t> encode(const Record& record) {
        nlohmann::json json = {
            {"key", record.key},
            {"value", record.value},
            {"created_at", record.createdAtMs},
            {"version", DiskStore::kFileVersion}
        };
        try {
            return nlohmann::json::to_msgpack(json);
        } catch (const nlohmann::json::exception& e) {
            std::throw_with_nested(DiskCacheError(DiskCacheError::Kind::Serialization,
                std::string("DiskCache: ошибка кодирования MessagePack: ") + e.what()));
        }
    }

    static Record decode(const std::vector<uint8_t>& payload) {
        try {
            const nlohmann::json json = nlohmann::json::from_msgpack(payload);
            if (json.at("version").get<uint64_t>() != DiskStore::kFileVersion) {
                throw DiskCacheError(DiskCacheError::Kind::Deserialization,
                                     "DiskCache: неподдерживаемая версия записи");
            }
            return Record{json.at("key").get<std::string>(), json.at("value"),
                          json.at("created_at").get<int64_t>()};
        } catch (const nlohmann::json::exception& e) {
            std::throw_with_nested(DiskCacheError(DiskCacheError::Kind::Deserialization,
                std::string("DiskCache: повреждённая запись: ") + e.what()));
        }
    }

    // Запись с другим ключом (коллизия имени файла) считается отсутствующей
    std::optional<Record> load(const std::string& name) const {
        std::optional<std::vector<uint8_t>> payload = store_.read(name);
        if (!payload) {
            return std::nullopt;
        }
        Record record = decode(*payload);
        if (record.key != name) {
            return std::nullopt;
        }
        return record;
    }

    // Прежнее значение перед перезаписью/удалением: только живое. Повреждённая
    // запись не мешает перезаписи.
    std::optional<Value> takeLive(const std::string& name) const {
        try {
            std::optional<Record> record = load(name);
            if (!record || !isLive(record->createdAtMs, nowMillis())) {
                return std::nullopt;
            }
            return decodeValue(record->value);
        } catch (const DiskCacheError& e) {
            if (e.kind() != DiskCacheError::Kind::Deserialization) {
                throw;
            }
            spdlog::warn("DiskCache: прежняя запись '{}' не прочитана: {}", name, e.what());
            return std::nullopt;
        }
    }

    DiskStore store_;
    std::optional<Duration> lifespan_;
    bool refresh_;
};

/**
 * @brief Построитель DiskCache.
 * @code
 * auto cache = DiskCacheBuilder<std::string, int>("users")
 *                  .setLifespan(std::chrono::hours(1))
 *                  .setDiskDirectory("/var/cache/app")
 *                  .build();
 * @endcode
 */
template<typename Key, typename Value>
class DiskCacheBuilder {
public:
    explicit DiskCacheBuilder(std::string cacheName) {
        config_.cacheName = std::move(cacheName);
    }

    DiskCacheBuilder& setLifespan(Duration lifespan) {
        lifespan_ = lifespan;
        return *this;
    }

    DiskCacheBuilder& setRefresh(bool refresh) {
        refresh_ = refresh;
        return *this;
    }

    DiskCacheBuilder& setDiskDirectory(std::filesystem::path directory) {
        config_.directory = std::move(directory);
        return *this;
    }

    DiskCacheBuilder& setCompression(bool compress) {
        config_.compress = compress;
        return *this;
    }

    /// @throws DiskCacheError (Kind::Build) если каталог не удалось создать.
    DiskCache<Key, Value> build() const {
        return DiskCache<Key, Value>(config_, lifespan_, refresh_);
    }

private:
    DiskStoreConfig config_;
    std::optional<Duration> lifespan_;
    bool refresh_ = false;
};

} // namespace cache
} // namespace core
} // namespace cachet
