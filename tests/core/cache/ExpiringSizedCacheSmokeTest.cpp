#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include "cachet/core/cache/base/CacheErrors.hpp"
#include "cachet/core/cache/expiring/ExpiringSizedCache.hpp"

using cachet::core::cache::ExpiringSizedCache;
using cachet::core::cache::TimeBoundsError;
using namespace std::chrono_literals;

void smokeTestExpiringSizedCache() {
    ExpiringSizedCache<std::string, int> cache(50ms);
    assert(!cache.insert("a", 1));
    assert(!cache.insert("b", 2));
    assert(cache.size() == 2);
    const int* a = cache.get("a");
    assert(a && *a == 1);
    assert(!cache.get("missing"));

    // перезапись возвращает живое прежнее значение
    auto previous = cache.insert("a", 10);
    assert(previous && *previous == 1);
    assert(*cache.get("a") == 10);
    assert(cache.tombstoneCount() == 1);

    std::this_thread::sleep_for(80ms);
    assert(!cache.get("a"));
    // size() учитывает истёкшие записи до evict()
    assert(cache.size() == 2);
    assert(cache.evict() == 2);
    assert(cache.evict() == 0);
    assert(cache.size() == 0);
    assert(cache.empty());
    std::cout << "[OK] ExpiringSizedCache smoke test\n";
}

void smokeTestExpiringSizedOverwriteExpired() {
    ExpiringSizedCache<std::string, int> cache(50ms);
    cache.insert("k", 1);
    std::this_thread::sleep_for(80ms);
    // прежнее значение истекло и не возвращается
    assert(!cache.insert("k", 2));
    assert(*cache.get("k") == 2);

    // remove возвращает значение без проверки срока
    std::this_thread::sleep_for(80ms);
    auto removed = cache.remove("k");
    assert(removed && *removed == 2);
    assert(!cache.remove("k"));
    std::cout << "[OK] ExpiringSizedCache overwrite test\n";
}

void smokeTestExpiringSizedLimit() {
    ExpiringSizedCache<std::string, int> cache(10000ms);
    assert(!cache.setSizeLimit(2));
    cache.insert("a", 1);
    cache.insert("b", 2);
    cache.insert("c", 3);
    assert(cache.size() == 2);
    assert(!cache.get("a"));
    assert(cache.get("b") && cache.get("c"));

    // перезапись существующего ключа не вытесняет
    cache.insert("b", 20);
    assert(cache.size() == 2);
    assert(*cache.get("c") == 3);

    auto old = cache.setSizeLimit(1);
    assert(old == 2u);
    bool thrown = false;
    try {
        cache.setSizeLimit(0);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    assert(cache.sizeLimit() == 1u);
    std::cout << "[OK] ExpiringSizedCache size limit test\n";
}

void smokeTestExpiringSizedRetainLatest() {
    ExpiringSizedCache<int, int> cache(10000ms, 16);
    for (int i = 0; i < 10; ++i) {
        cache.insert(i, i);
    }
    assert(cache.retainLatest(4, false) == 6);
    assert(cache.size() == 4);
    for (int i = 0; i < 6; ++i) {
        assert(!cache.get(i));
    }
    for (int i = 6; i < 10; ++i) {
        assert(cache.get(i) && *cache.get(i) == i);
    }
    assert(cache.retainLatest(10, false) == 0);

    cache.clear();
    assert(cache.size() == 0);
    assert(cache.stampCount() == 0);
    assert(cache.tombstoneCount() == 0);
    std::cout << "[OK] ExpiringSizedCache retainLatest test\n";
}

void smokeTestExpiringSizedTtlChanges() {
    ExpiringSizedCache<int, int> cache(10000ms);
    cache.insert(1, 1);
    assert(cache.setTtl(20ms) == std::chrono::milliseconds(10000));
    assert(cache.ttl() == std::chrono::milliseconds(20));
    cache.insert(2, 2);
    std::this_thread::sleep_for(50ms);
    // ключ 2 истёк, ключ 1 ещё жив, хотя вставлен раньше
    assert(!cache.get(2));
    assert(cache.get(1));
    cache.insertEvict(3, 3, true);
    assert(cache.get(1));
    assert(!cache.get(2));
    assert(cache.get(3));

    cache.setTtl(std::chrono::milliseconds::max());
    bool thrown = false;
    try {
        cache.insert(4, 4);
    } catch (const TimeBoundsError&) {
        thrown = true;
    }
    assert(thrown);
    assert(!cache.get(4));
    std::cout << "[OK] ExpiringSizedCache ttl test\n";
}

void smokeTestExpiringSizedTombstones() {
    ExpiringSizedCache<int, int> cache(10000ms);
    cache.setMaxTombstoneLimit(3);
    for (int i = 0; i < 5; ++i) {
        cache.insert(i, i);
    }
    cache.remove(0);
    cache.remove(1);
    cache.remove(2);
    assert(cache.tombstoneCount() == 3);
    assert(cache.stampCount() == 5);
    // четвёртая пометка превышает порог и запускает уплотнение
    cache.remove(3);
    assert(cache.tombstoneCount() == 0);
    assert(cache.stampCount() == 1);
    assert(cache.size() == 1);
    assert(*cache.get(4) == 4);
    std::cout << "[OK] ExpiringSizedCache tombstone test\n";
}

void stressTestExpiringSizedCompaction() {
    ExpiringSizedCache<std::string, int> cache(10000ms);
    cache.setMaxTombstoneLimit(8);
    assert(cache.maxTombstoneLimit() == 8);
    for (int round = 0; round < 100; ++round) {
        for (int i = 0; i < 20; ++i) {
            cache.insert("key-" + std::to_string(i), round);
        }
        for (int i = 0; i < 20; i += 2) {
            cache.remove("key-" + std::to_string(i));
        }
        assert(cache.tombstoneCount() <= 8);
        assert(cache.stampCount() <= cache.size() + 8);
    }
    assert(cache.size() == 10);
    for (int i = 1; i < 20; i += 2) {
        const int* value = cache.get("key-" + std::to_string(i));
        assert(value && *value == 99);
    }
    std::cout << "[OK] ExpiringSizedCache compaction stress test\n";
}

int main() {
    smokeTestExpiringSizedCache();
    smokeTestExpiringSizedOverwriteExpired();
    smokeTestExpiringSizedLimit();
    smokeTestExpiringSizedRetainLatest();
    smokeTestExpiringSizedTtlChanges();
    smokeTestExpiringSizedTombstones();
    stressTestExpiringSizedCompaction();
    std::cout << "All ExpiringSizedCache tests passed!\n";
    return 0;
}
