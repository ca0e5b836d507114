#include "cachet/core/cache/disk/DiskStore.hpp"
#include "cachet/core/cache/base/CacheErrors.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <system_error>
#include <thread>
#include <openssl/evp.h>
#include <zlib.h>
#include <spdlog/spdlog.h>

namespace cachet {
namespace core {
namespace cache {

namespace {

constexpr char kMagic[4] = {'C', 'H', 'T', '1'};
constexpr uint8_t kFlagCompressed = 0x01;
constexpr size_t kHeaderSize = sizeof(kMagic) + 1 + 8;
// Короткие записи zlib только раздувает
constexpr size_t kMinCompressSize = 64;
constexpr const char* kRecordExtension = ".rec";
constexpr const char* kTempMarker = ".rec.tmp.";
// Предел степени сжатия zlib (deflate) и общий предел размера записи
constexpr uint64_t kMaxInflateRatio = 1032;
constexpr uint64_t kMaxRecordSize = uint64_t{1} << 32;
// Временный файл старше этого срока остался от прерванной записи
constexpr auto kStaleTempAge = std::chrono::minutes(10);

using Kind = DiskCacheError::Kind;

std::string sha256Hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
        throw DiskCacheError(Kind::Storage, "DiskStore: ошибка вычисления SHA-256");
    }
    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::vector<uint8_t> encodeRecord(const std::vector<uint8_t>& payload, bool compress) {
    uint8_t flags = 0;
    std::vector<uint8_t> body;
    if (compress && payload.size() >= kMinCompressSize) {
        uLongf packedSize = compressBound(static_cast<uLong>(payload.size()));
        body.resize(packedSize);
        const int rc = compress2(body.data(), &packedSize, payload.data(),
                                 static_cast<uLong>(payload.size()), Z_BEST_SPEED);
        if (rc != Z_OK) {
            throw DiskCacheError(Kind::Storage, "DiskStore: ошибка zlib compress2: " + std::to_string(rc));
        }
        body.resize(packedSize);
        if (body.size() < payload.size()) {
            flags |= kFlagCompressed;
        }
    }
    if (!(flags & kFlagCompressed)) {
        body = payload;
    }

    std::vector<uint8_t> record;
    record.reserve(kHeaderSize + body.size());
    record.insert(record.end(), std::begin(kMagic), std::end(kMagic));
    record.push_back(flags);
    const uint64_t rawLength = payload.size();
    for (int shift = 0; shift < 64; shift += 8) {
        record.push_back(static_cast<uint8_t>((rawLength >> shift) & 0xFF));
    }
    record.insert(record.end(), body.begin(), body.end());
    return record;
}

std::vector<uint8_t> decodeRecord(const std::vector<uint8_t>& record) {
    if (record.size() < kHeaderSize || std::memcmp(record.data(), kMagic, sizeof(kMagic)) != 0) {
        throw DiskCacheError(Kind::Deserialization, "DiskStore: неверный заголовок записи");
    }
    const uint8_t flags = record[sizeof(kMagic)];
    uint64_t rawLength = 0;
    for (int i = 0; i < 8; ++i) {
        rawLength |= static_cast<uint64_t>(record[sizeof(kMagic) + 1 + i]) << (8 * i);
    }
    const uint8_t* body = record.data() + kHeaderSize;
    const size_t bodySize = record.size() - kHeaderSize;

    if (!(flags & kFlagCompressed)) {
        if (bodySize != rawLength) {
            throw DiskCacheError(Kind::Deserialization, "DiskStore: длина записи не совпадает с заголовком");
        }
        return std::vector<uint8_t>(body, body + bodySize);
    }

    if (rawLength > kMaxRecordSize || rawLength > bodySize * kMaxInflateRatio ||
        rawLength > std::numeric_limits<uLongf>::max() || bodySize > std::numeric_limits<uLong>::max()) {
        throw DiskCacheError(Kind::Deserialization,
            "DiskStore: недопустимая длина записи в заголовке: " + std::to_string(rawLength));
    }
    std::vector<uint8_t> payload(static_cast<size_t>(rawLength));
    uLongf unpackedSize = static_cast<uLongf>(rawLength);
    const int rc = uncompress(payload.data(), &unpackedSize, body, static_cast<uLong>(bodySize));
    if (rc != Z_OK || unpackedSize != rawLength) {
        throw DiskCacheError(Kind::Deserialization, "DiskStore: ошибка zlib uncompress: " + std::to_string(rc));
    }
    return payload;
}

std::string tempSuffix() {
    static std::atomic<uint64_t> counter{0};
    std::stringstream ss;
    ss << ".tmp." << std::hex << std::hash<std::thread::id>{}(std::this_thread::get_id())
       << "." << counter.fetch_add(1);
    return ss.str();
}

bool isRecord(const std::filesystem::directory_entry& entry) {
    return entry.is_regular_file() && entry.path().extension() == kRecordExtension;
}

bool isTempFile(const std::filesystem::directory_entry& entry) {
    return entry.is_regular_file() &&
           entry.path().filename().string().find(kTempMarker) != std::string::npos;
}

} // namespace

DiskStore::DiskStore(const DiskStoreConfig& config) : config_(config) {
    if (config_.cacheName.empty()) {
        throw DiskCacheError(Kind::Build, "DiskStore: имя кэша не задано");
    }
    const std::filesystem::path base = config_.directory.empty() ? defaultDirectory() : config_.directory;
    path_ = base / (config_.cacheName + "_v" + std::to_string(kFileVersion));
    try {
        std::filesystem::create_directories(path_);
    } catch (const std::filesystem::filesystem_error& e) {
        std::throw_with_nested(DiskCacheError(Kind::Build,
            "DiskStore: не удалось создать каталог " + path_.string() + ": " + e.what()));
    }
    const size_t stale = removeTempFiles(kStaleTempAge);
    if (stale > 0) {
        spdlog::warn("DiskStore: удалено {} незавершённых временных файлов в {}", stale, path_.string());
    }
    spdlog::debug("DiskStore: открыто хранилище {} (сжатие: {})", path_.string(), config_.compress);
}

std::filesystem::path DiskStore::defaultDirectory() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".cache";
    } else {
        base = std::filesystem::current_path();
    }
    return base / "cachet_disk_cache";
}

std::filesystem::path DiskStore::fileFor(const std::string& key) const {
    return path_ / (sha256Hex(key) + kRecordExtension);
}

std::optional<std::vector<uint8_t>> DiskStore::readFile(const std::filesystem::path& file) const {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!std::filesystem::exists(file, ec)) {
            return std::nullopt;
        }
        throw DiskCacheError(Kind::Storage, "DiskStore: не удалось открыть " + file.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw DiskCacheError(Kind::Storage, "DiskStore: ошибка чтения " + file.string());
    }
    return decodeRecord(bytes);
}

std::optional<std::vector<uint8_t>> DiskStore::read(const std::string& key) const {
    return readFile(fileFor(key));
}

void DiskStore::write(const std::string& key, const std::vector<uint8_t>& payload) {
    const std::vector<uint8_t> record = encodeRecord(payload, config_.compress);
    const std::filesystem::path target = fileFor(key);
    std::filesystem::path temp = target;
    temp += tempSuffix();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw DiskCacheError(Kind::Storage, "DiskStore: не удалось создать " + temp.string());
        }
        out.write(reinterpret_cast<const char*>(record.data()), static_cast<std::streamsize>(record.size()));
        if (!out) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            throw DiskCacheError(Kind::Storage, "DiskStore: ошибка записи " + temp.string());
        }
    }
    try {
        std::filesystem::rename(temp, target);
    } catch (const std::filesystem::filesystem_error& e) {
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        std::throw_with_nested(DiskCacheError(Kind::Storage,
            "DiskStore: не удалось заменить " + target.string() + ": " + e.what()));
    }
}

bool DiskStore::erase(const std::string& key) {
    const std::filesystem::path file = fileFor(key);
    try {
        return std::filesystem::remove(file);
    } catch (const std::filesystem::filesystem_error& e) {
        std::throw_with_nested(DiskCacheError(Kind::Storage,
            "DiskStore: не удалось удалить " + file.string() + ": " + e.what()));
    }
}

size_t DiskStore::retain(const std::function<bool(const std::vector<uint8_t>&)>& keep) {
    size_t removed = 0;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            if (!isRecord(entry)) {
                continue;
            }
            bool drop = false;
            try {
                std::optional<std::vector<uint8_t>> payload = readFile(entry.path());
                if (!payload) {
                    continue; // удалена параллельно
                }
                drop = !keep(*payload);
            } catch (const DiskCacheError& e) {
                if (e.kind() != Kind::Deserialization) {
                    throw;
                }
                spdlog::warn("DiskStore: повреждённая запись {} удалена: {}", entry.path().string(), e.what());
                drop = true;
            }
            if (drop && std::filesystem::remove(entry.path())) {
                ++removed;
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::throw_with_nested(DiskCacheError(Kind::Storage,
            "DiskStore: ошибка обхода " + path_.string() + ": " + e.what()));
    }
    return removed;
}

size_t DiskStore::removeTempFiles(std::chrono::seconds minAge) {
    size_t removed = 0;
    const auto now = std::filesystem::file_time_type::clock::now();
    try {
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            if (!isTempFile(entry)) {
                continue;
            }
            std::error_code ec;
            const auto modified = std::filesystem::last_write_time(entry.path(), ec);
            if (ec || now - modified < minAge) {
                continue; // запись ещё идёт или файл уже переименован
            }
            if (std::filesystem::remove(entry.path(), ec)) {
                ++removed;
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::throw_with_nested(DiskCacheError(Kind::Storage,
            "DiskStore: ошибка обхода " + path_.string() + ": " + e.what()));
    }
    return removed;
}

void DiskStore::clear() {
    try {
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            if (isRecord(entry) || isTempFile(entry)) {
                std::filesystem::remove(entry.path());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::throw_with_nested(DiskCacheError(Kind::Storage,
            "DiskStore: ошибка очистки " + path_.string() + ": " + e.what()));
    }
    spdlog::debug("DiskStore: хранилище {} очищено", path_.string());
}

size_t DiskStore::count() const {
    size_t total = 0;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            if (isRecord(entry)) {
                ++total;
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::throw_with_nested(DiskCacheError(Kind::Storage,
            "DiskStore: ошибка обхода " + path_.string() + ": " + e.what()));
    }
    return total;
}

} // namespace cache
} // namespace core
} // namespace cachet
