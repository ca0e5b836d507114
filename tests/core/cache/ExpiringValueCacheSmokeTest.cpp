#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include "cachet/core/cache/expiring/ExpiringValueCache.hpp"

using cachet::core::cache::ExpiringValueCache;

namespace {

struct Token {
    std::string secret;
    bool revoked = false;

    bool isExpired() const { return revoked; }
};

// Отрицательные значения считаются истёкшими
struct NegativeIsExpired {
    static bool isExpired(const int& value) { return value < 0; }
};

} // namespace

void smokeTestExpiringValueCache() {
    ExpiringValueCache<std::string, Token> cache(3);
    cache.put("alice", Token{"a1"});
    cache.put("bob", Token{"b1", true});
    assert(cache.size() == 2);

    auto alice = cache.get("alice");
    assert(alice && alice->secret == "a1");

    // просроченное значение удаляется при чтении
    assert(!cache.get("bob"));
    assert(cache.size() == 1);
    assert(cache.hits() == 1u);
    assert(cache.misses() == 1u);

    Token* token = cache.getMut("alice");
    assert(token);
    token->revoked = true;
    assert(!cache.getMut("alice"));
    assert(cache.size() == 0);
    assert(cache.metrics().policy == "expiring_value");
    std::cout << "[OK] ExpiringValueCache smoke test\n";
}

void smokeTestExpiringValueGetOrSetWith() {
    ExpiringValueCache<int, int, NegativeIsExpired> cache(2);
    int calls = 0;
    auto factory = [&calls]() { return ++calls; };
    assert(cache.getOrSetWith(1, factory) == 1);
    assert(cache.getOrSetWith(1, factory) == 1);
    assert(calls == 1);

    cache.put(1, -1);
    assert(cache.getOrSetWith(1, factory) == 2);
    assert(cache.hits() == 1u);
    assert(cache.misses() == 2u);

    cache.put(2, -5);
    cache.put(3, 3);
    // ёмкость 2: ключ 1 вытеснен
    assert(cache.size() == 2);
    assert(cache.flush() == 1);
    assert(cache.size() == 1);
    assert(cache.get(3) == 3);

    auto removed = cache.remove(3);
    assert(removed && *removed == 3);
    cache.reset();
    assert(cache.size() == 0);
    std::cout << "[OK] ExpiringValueCache getOrSetWith test\n";
}

int main() {
    smokeTestExpiringValueCache();
    smokeTestExpiringValueGetOrSetWith();
    std::cout << "All ExpiringValueCache tests passed!\n";
    return 0;
}
