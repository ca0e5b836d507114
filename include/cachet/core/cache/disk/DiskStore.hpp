#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cachet {
namespace core {
namespace cache {

struct DiskStoreConfig {
    std::filesystem::path directory;   // Базовый каталог; пусто = каталог по умолчанию
    std::string cacheName = "default"; // Имя кэша (подкаталог <name>_v1)
    bool compress = true;              // Сжимать записи zlib
};

/**
 * @brief Хранилище байтовых записей в файлах, по файлу на ключ.
 * @details Имя файла: SHA-256 ключа в hex. Запись: магия "CHT1", байт флагов
 *          (бит 0 = сжато zlib), 8 байт исходной длины (little-endian), данные.
 *          Запись выполняется во временный файл с последующим rename.
 *          Ошибки файловой системы бросаются как DiskCacheError с вложенным исключением.
 */
class DiskStore {
public:
    static constexpr uint64_t kFileVersion = 1;

    explicit DiskStore(const DiskStoreConfig& config);

    // Прочитать и распаковать запись, std::nullopt если её нет
    std::optional<std::vector<uint8_t>> read(const std::string& key) const;
    // Записать (заменить) запись
    void write(const std::string& key, const std::vector<uint8_t>& payload);
    // Удалить запись; false если её не было
    bool erase(const std::string& key);
    // Обойти все записи; keep(payload) == false удаляет запись. Возвращает число удалённых
    size_t retain(const std::function<bool(const std::vector<uint8_t>&)>& keep);
    // Удалить все записи и оставшиеся временные файлы
    void clear();
    // Количество записей на диске
    size_t count() const;

    const std::filesystem::path& path() const { return path_; }
    bool compress() const { return config_.compress; }

    // $XDG_CACHE_HOME, затем $HOME/.cache, затем текущий каталог
    static std::filesystem::path defaultDirectory();

private:
    std::filesystem::path fileFor(const std::string& key) const;
    std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path& file) const;
    // Удалить временные файлы прерванных записей старше minAge
    size_t removeTempFiles(std::chrono::seconds minAge);

    DiskStoreConfig config_;
    std::filesystem::path path_;
};

} // namespace cache
} // namespace core
} // namespace cachet
