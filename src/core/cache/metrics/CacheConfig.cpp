#include "cachet/core/cache/metrics/CacheConfig.hpp"
#include "cachet/core/cache/base/CacheErrors.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>

namespace cachet {
namespace core {
namespace cache {

namespace {

const std::pair<EvictionPolicy, const char*> kPolicyNames[] = {
    {EvictionPolicy::Unbound, "unbound"},
    {EvictionPolicy::Lru, "lru"},
    {EvictionPolicy::Timed, "timed"},
    {EvictionPolicy::TimedSized, "timed_sized"},
    {EvictionPolicy::ExpiringValue, "expiring_value"},
    {EvictionPolicy::ExpiringSized, "expiring_sized"},
    {EvictionPolicy::Disk, "disk"}
};

bool usesCapacity(EvictionPolicy policy) {
    return policy == EvictionPolicy::Lru || policy == EvictionPolicy::TimedSized ||
           policy == EvictionPolicy::ExpiringValue;
}

bool usesLifespan(EvictionPolicy policy) {
    return policy == EvictionPolicy::Timed || policy == EvictionPolicy::TimedSized ||
           policy == EvictionPolicy::ExpiringSized;
}

} // namespace

std::string toString(EvictionPolicy policy) {
    for (const auto& [value, name] : kPolicyNames) {
        if (value == policy) {
            return name;
        }
    }
    return "unknown";
}

EvictionPolicy parseEvictionPolicy(const std::string& name) {
    for (const auto& [value, policyName] : kPolicyNames) {
        if (name == policyName) {
            return value;
        }
    }
    throw std::invalid_argument("Неизвестная политика вытеснения: " + name);
}

std::string toString(WritePolicy policy) {
    return policy == WritePolicy::PromoteOnWrite ? "promote_on_write" : "keep_recency";
}

WritePolicy parseWritePolicy(const std::string& name) {
    if (name == "keep_recency") return WritePolicy::KeepRecency;
    if (name == "promote_on_write") return WritePolicy::PromoteOnWrite;
    throw std::invalid_argument("Неизвестная политика записи: " + name);
}

bool CacheConfig::validate() const {
    if (usesCapacity(policy) && capacity == 0) return false;
    if (lifespan.count() < 0) return false;
    if (usesLifespan(policy) && lifespan.count() == 0) return false;
    if (sizeLimit && *sizeLimit == 0) return false;
    if (policy == EvictionPolicy::Disk && cacheName.empty()) return false;
    return true;
}

nlohmann::json CacheConfig::toJson() const {
    nlohmann::json j = {
        {"policy", toString(policy)},
        {"capacity", capacity},
        {"lifespan_ms", lifespan.count()},
        {"refresh", refresh},
        {"write_policy", toString(writePolicy)},
        {"initial_capacity", initialCapacity},
        {"max_tombstones", maxTombstones},
        {"disk_directory", diskDirectory},
        {"cache_name", cacheName},
        {"compress", compress}
    };
    j["size_limit"] = sizeLimit ? nlohmann::json(*sizeLimit) : nlohmann::json(nullptr);
    return j;
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("CacheConfig: ожидается JSON-объект");
    }
    CacheConfig config;
    try {
        config.policy = parseEvictionPolicy(j.value("policy", toString(config.policy)));
        config.capacity = j.value("capacity", config.capacity);
        config.lifespan = std::chrono::milliseconds(j.value("lifespan_ms", config.lifespan.count()));
        config.refresh = j.value("refresh", config.refresh);
        config.writePolicy = parseWritePolicy(j.value("write_policy", toString(config.writePolicy)));
        config.initialCapacity = j.value("initial_capacity", config.initialCapacity);
        if (j.contains("size_limit") && !j["size_limit"].is_null()) {
            config.sizeLimit = j["size_limit"].get<size_t>();
        }
        config.maxTombstones = j.value("max_tombstones", config.maxTombstones);
        config.diskDirectory = j.value("disk_directory", config.diskDirectory);
        config.cacheName = j.value("cache_name", config.cacheName);
        config.compress = j.value("compress", config.compress);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("CacheConfig: неверное поле: ") + e.what());
    }
    return config;
}

CacheConfig CacheConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw CacheError("CacheConfig: не удалось открыть " + path.string());
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw CacheError("CacheConfig: ошибка разбора " + path.string() + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace cache
} // namespace core
} // namespace cachet
