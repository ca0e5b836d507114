#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include "cachet/core/cache/base/CacheErrors.hpp"
#include "cachet/core/cache/manager/CacheFactory.hpp"
#include "cachet/core/cache/metrics/CacheConfig.hpp"

using namespace cachet::core::cache;

void smokeTestCacheConfigDefaults() {
    CacheConfig config;
    assert(config.validate());
    assert(config.policy == EvictionPolicy::Lru);

    const nlohmann::json j = config.toJson();
    assert(j["policy"] == "lru");
    assert(j["write_policy"] == "keep_recency");
    assert(j["size_limit"].is_null());

    const CacheConfig copy = CacheConfig::fromJson(j);
    assert(copy.policy == config.policy);
    assert(copy.capacity == config.capacity);
    assert(copy.lifespan == config.lifespan);
    assert(!copy.sizeLimit);

    for (const char* name : {"unbound", "lru", "timed", "timed_sized",
                             "expiring_value", "expiring_sized", "disk"}) {
        assert(toString(parseEvictionPolicy(name)) == name);
    }
    std::cout << "[OK] CacheConfig defaults test\n";
}

void smokeTestCacheConfigParsing() {
    const auto j = nlohmann::json::parse(R"({
        "policy": "timed_sized",
        "capacity": 16,
        "lifespan_ms": 250,
        "refresh": true,
        "write_policy": "promote_on_write",
        "size_limit": 8
    })");
    const CacheConfig config = CacheConfig::fromJson(j);
    assert(config.policy == EvictionPolicy::TimedSized);
    assert(config.capacity == 16);
    assert(config.lifespan == std::chrono::milliseconds(250));
    assert(config.refresh);
    assert(config.writePolicy == WritePolicy::PromoteOnWrite);
    assert(config.sizeLimit == 8u);
    assert(config.cacheName == "cachet");

    bool thrown = false;
    try {
        CacheConfig::fromJson(nlohmann::json{{"policy", "fifo"}});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        CacheConfig::fromJson(nlohmann::json{{"capacity", "big"}});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    CacheConfig invalid;
    invalid.capacity = 0;
    assert(!invalid.validate());
    invalid.policy = EvictionPolicy::Unbound;
    assert(invalid.validate());
    invalid.policy = EvictionPolicy::Timed;
    invalid.lifespan = std::chrono::milliseconds(0);
    assert(!invalid.validate());
    std::cout << "[OK] CacheConfig parsing test\n";
}

void smokeTestCacheConfigFile() {
    const auto path = std::filesystem::temp_directory_path() /
                      ("cachet_config_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"policy": "unbound", "initial_capacity": 32})";
    }
    const CacheConfig config = CacheConfig::loadFromFile(path);
    assert(config.policy == EvictionPolicy::Unbound);
    assert(config.initialCapacity == 32);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    bool thrown = false;
    try {
        CacheConfig::loadFromFile(path);
    } catch (const CacheError&) {
        thrown = true;
    }
    assert(thrown);
    std::filesystem::remove(path);

    thrown = false;
    try {
        CacheConfig::loadFromFile(path);
    } catch (const CacheError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] CacheConfig file test\n";
}

void smokeTestMakeCache() {
    CacheConfig config;
    config.capacity = 2;
    auto lru = makeCache<int, int>(config);
    assert(lru->policyName() == "lru");
    lru->put(1, 1);
    lru->put(2, 2);
    lru->put(3, 3);
    assert(lru->size() == 2);
    assert(lru->capacity() == 2u);

    config.policy = EvictionPolicy::Unbound;
    assert((makeCache<int, int>(config)->policyName() == "unbound"));

    config.policy = EvictionPolicy::Timed;
    config.lifespan = std::chrono::milliseconds(500);
    config.refresh = true;
    auto timed = makeCache<int, int>(config);
    assert(timed->policyName() == "timed");
    assert(timed->lifespan() == std::chrono::milliseconds(500));

    config.policy = EvictionPolicy::TimedSized;
    auto timedSized = makeCache<int, int>(config);
    assert(timedSized->policyName() == "timed_sized");
    assert(timedSized->metrics().capacity == 2u);

    for (EvictionPolicy policy : {EvictionPolicy::ExpiringValue, EvictionPolicy::ExpiringSized,
                                  EvictionPolicy::Disk}) {
        config.policy = policy;
        bool thrown = false;
        try {
            makeCache<int, int>(config);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    config.policy = EvictionPolicy::Lru;
    config.capacity = 0;
    bool thrown = false;
    try {
        makeCache<int, int>(config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    const nlohmann::json metrics = lru->metrics().toJson();
    assert(metrics["policy"] == "lru");
    assert(metrics["entryCount"] == 2);
    assert(metrics["capacity"] == 2);
    assert(metrics["lifespanMs"].is_null());
    std::cout << "[OK] makeCache test\n";
}

namespace {

struct Token {
    int value = 0;
    bool expired = false;

    bool isExpired() const { return expired; }
};

} // namespace

void smokeTestConfigBuilders() {
    CacheConfig config;
    config.policy = EvictionPolicy::ExpiringSized;
    config.lifespan = std::chrono::milliseconds(10000);
    config.sizeLimit = 2;
    config.maxTombstones = 3;
    auto shared = makeSharedExpiringCache<std::string, int>(config);
    assert(shared->ttl() == std::chrono::milliseconds(10000));
    assert(shared->sizeLimit() == 2u);
    assert(shared->maxTombstoneLimit() == 3u);
    shared->insert("a", 1);
    shared->insert("b", 2);
    shared->insert("c", 3);
    assert(shared->size() == 2);
    assert(!shared->get("a"));

    // без лимита размера хранилище не ограничено
    config.sizeLimit.reset();
    assert((!makeSharedExpiringCache<std::string, int>(config)->sizeLimit()));

    const auto directory = std::filesystem::temp_directory_path() /
                           ("cachet_config_disk_" + std::to_string(::getpid()));
    config.policy = EvictionPolicy::Disk;
    config.diskDirectory = directory.string();
    config.cacheName = "configured";
    config.compress = false;
    config.refresh = true;
    config.lifespan = std::chrono::milliseconds(5000);
    auto disk = makeDiskCache<std::string, int>(config);
    assert(disk.path() == directory / "configured_v1");
    assert(disk.lifespan() == std::chrono::milliseconds(5000));
    assert(disk.refresh());
    disk.put("x", 42);
    assert(disk.get("x") == 42);

    // нулевой срок жизни: записи бессрочные
    config.lifespan = std::chrono::milliseconds(0);
    assert((!makeDiskCache<std::string, int>(config).lifespan()));
    std::filesystem::remove_all(directory);

    config = CacheConfig{};
    config.policy = EvictionPolicy::ExpiringValue;
    config.capacity = 4;
    auto tokens = makeExpiringValueCache<int, Token>(config);
    assert(tokens->policyName() == "expiring_value");
    tokens->put(1, Token{1, false});
    tokens->put(2, Token{2, true});
    assert(tokens->get(1));
    assert(!tokens->get(2));

    // политика конфигурации должна совпадать с построителем
    bool thrown = false;
    try {
        makeDiskCache<std::string, int>(config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    config.policy = EvictionPolicy::ExpiringSized;
    config.lifespan = std::chrono::milliseconds(0);
    thrown = false;
    try {
        makeSharedExpiringCache<std::string, int>(config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] config builders test\n";
}

int main() {
    smokeTestCacheConfigDefaults();
    smokeTestCacheConfigParsing();
    smokeTestCacheConfigFile();
    smokeTestMakeCache();
    smokeTestConfigBuilders();
    std::cout << "All CacheConfig tests passed!\n";
    return 0;
}
