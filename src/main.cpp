#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

#include "cachet/core/logging/Logging.hpp"
#include "cachet/core/cache/metrics/CacheConfig.hpp"
#include "cachet/core/cache/manager/CacheFactory.hpp"
#include "cachet/core/cache/concurrent/SharedExpiringCache.hpp"

using namespace cachet::core;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

// Deliberately slow so that cache hits are visible
uint64_t slowFibonacci(uint64_t n) {
    return n < 2 ? n : slowFibonacci(n - 1) + slowFibonacci(n - 2);
}

// Run the memoized workload through any BaseCache policy
void runFibonacciWorkload(cache::BaseCache<uint64_t, uint64_t>& fibCache) {
    spdlog::info("Running fibonacci workload on '{}' cache...", fibCache.policyName());
    const auto start = std::chrono::steady_clock::now();
    uint64_t checksum = 0;
    for (int round = 0; round < 4 && g_running; ++round) {
        for (uint64_t n = 20; n < 30; ++n) {
            checksum += fibCache.getOrSetWith(n, [n]() { return slowFibonacci(n); });
        }
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("Fibonacci workload done in {} ms (checksum {})", elapsed.count(), checksum);
}

// Value that carries its own deadline, for the expiring_value policy
struct Quote {
    uint64_t value = 0;
    std::chrono::steady_clock::time_point expiresAt;

    bool isExpired() const { return std::chrono::steady_clock::now() >= expiresAt; }
};

void runQuoteWorkload(const cache::CacheConfig& config) {
    spdlog::info("Running expiring value workload...");
    auto quotes = cache::makeExpiringValueCache<uint64_t, Quote>(config);
    uint64_t checksum = 0;
    for (int round = 0; round < 4 && g_running; ++round) {
        for (uint64_t n = 20; n < 30; ++n) {
            // odd quotes are already stale and get recomputed every round
            const auto ttl = std::chrono::milliseconds(n % 2 == 0 ? 10000 : 0);
            checksum += quotes->getOrSetWith(n, [n, ttl]() {
                return Quote{slowFibonacci(n), std::chrono::steady_clock::now() + ttl};
            }).value;
        }
    }
    spdlog::info("Expiring value workload done (checksum {})", checksum);
    std::cout << quotes->metrics().toJson().dump(4) << std::endl;
}

// Memoize through the disk store; a second run of the demo starts warm
void runDiskWorkload(const cache::CacheConfig& config) {
    auto disk = cache::makeDiskCache<uint64_t, uint64_t>(config);
    spdlog::info("Running disk cache workload in {}...", disk.path().string());
    uint64_t hits = 0;
    uint64_t checksum = 0;
    for (uint64_t n = 20; n < 30 && g_running; ++n) {
        if (auto cached = disk.get(n)) {
            ++hits;
            checksum += *cached;
            continue;
        }
        const uint64_t value = slowFibonacci(n);
        disk.put(n, value);
        checksum += value;
    }
    const size_t expired = disk.removeExpiredEntries();
    spdlog::info("Disk cache: {} hits, {} records, {} expired removed (checksum {})",
                 hits, disk.count(), expired, checksum);
}

// Writers insert while readers look up under a shared lock
void runSharedWorkload(const cache::CacheConfig& config) {
    spdlog::info("Running shared expiring cache workload...");
    auto sharedPtr = cache::makeSharedExpiringCache<std::string, uint64_t>(config);
    auto& shared = *sharedPtr;

    std::atomic<uint64_t> found{0};
    std::atomic<bool> writing{true};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&shared, &found, &writing, r]() {
            uint64_t local = 0;
            while (writing && g_running) {
                for (int i = r; i < 1000; i += 4) {
                    if (shared.get("key-" + std::to_string(i))) {
                        ++local;
                    }
                }
            }
            found += local;
        });
    }

    for (int i = 0; i < 1000 && g_running; ++i) {
        shared.insertEvict("key-" + std::to_string(i), static_cast<uint64_t>(i), (i % 100) == 0);
    }
    writing = false;
    for (auto& reader : readers) {
        reader.join();
    }

    spdlog::info("Shared cache: {} entries live, {} reader hits", shared.size(), found.load());
    std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
        config.lifespan + std::chrono::milliseconds(50), std::chrono::seconds(1)));
    spdlog::info("Shared cache: evicted {} expired entries", shared.evict());
}

int main(int argc, char* argv[]) {
    try {
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        logging::initializeLogging();
        spdlog::info("=== cachet demo starting ===");

        cache::CacheConfig config;
        if (argc > 1) {
            config = cache::CacheConfig::loadFromFile(argv[1]);
            spdlog::info("Loaded cache configuration from {}", argv[1]);
        }
        spdlog::debug("Cache configuration: {}", config.toJson().dump());

        cache::CacheConfig sharedConfig;
        sharedConfig.policy = cache::EvictionPolicy::ExpiringSized;
        sharedConfig.lifespan = std::chrono::milliseconds(200);
        sharedConfig.sizeLimit = 500;

        switch (config.policy) {
            case cache::EvictionPolicy::ExpiringValue:
                runQuoteWorkload(config);
                break;
            case cache::EvictionPolicy::ExpiringSized:
                sharedConfig = config;
                break;
            case cache::EvictionPolicy::Disk:
                runDiskWorkload(config);
                break;
            default: {
                auto fibCache = cache::makeCache<uint64_t, uint64_t>(config);
                runFibonacciWorkload(*fibCache);
                std::cout << fibCache->metrics().toJson().dump(4) << std::endl;
                break;
            }
        }

        runSharedWorkload(sharedConfig);

        spdlog::info("=== cachet demo complete ===");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::default_logger()) {
            spdlog::critical("Fatal error: {}", e.what());
        }
        return 1;
    }
}
