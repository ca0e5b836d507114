#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "cachet/core/cache/list/ArenaList.hpp"

using cachet::core::cache::ArenaList;

namespace {

std::vector<std::string> contents(const ArenaList<std::string>& list) {
    std::vector<std::string> out;
    list.forEach([&](const std::string& v) { out.push_back(v); });
    return out;
}

} // namespace

void smokeTestArenaList() {
    ArenaList<std::string> list;
    assert(list.empty());
    const size_t a = list.pushFront("a");
    const size_t b = list.pushFront("b");
    const size_t c = list.pushFront("c");
    assert(list.size() == 3);
    assert((contents(list) == std::vector<std::string>{"c", "b", "a"}));
    assert(list.front() == c);
    assert(list.back() == a);

    list.moveToFront(a);
    assert((contents(list) == std::vector<std::string>{"a", "c", "b"}));
    assert(list.back() == b);

    assert(list.set(c, "C") == "c");
    assert(list.get(c) == "C");
    assert((contents(list) == std::vector<std::string>{"a", "C", "b"}));

    assert(list.remove(b) == "b");
    assert(!list.isOccupied(b));
    assert(list.size() == 2);

    // освободившаяся ячейка используется повторно
    const size_t cells = list.cellCount();
    const size_t d = list.pushFront("d");
    assert(d == b);
    assert(list.cellCount() == cells);
    assert((contents(list) == std::vector<std::string>{"d", "a", "C"}));

    list.clear();
    assert(list.empty());
    assert(list.cellCount() == 2);
    std::cout << "[OK] ArenaList smoke test\n";
}

void smokeTestArenaListInvalidIndex() {
    ArenaList<int> list;
    bool thrown = false;
    try {
        list.back();
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);

    const size_t index = list.pushFront(7);
    list.remove(index);
    thrown = false;
    try {
        list.get(index);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
    // вспомогательные ячейки никогда не считаются занятыми
    assert(!list.isOccupied(ArenaList<int>::kFree));
    assert(!list.isOccupied(ArenaList<int>::kOccupied));
    std::cout << "[OK] ArenaList invalid index test\n";
}

void stressTestArenaList() {
    ArenaList<int> list(64);
    std::vector<size_t> indexes;
    for (int i = 0; i < 1000; ++i) {
        indexes.push_back(list.pushFront(i));
        if (indexes.size() > 64) {
            list.remove(list.back());
            indexes.erase(indexes.begin());
        }
    }
    assert(list.size() == 64);
    // связность в обе стороны
    size_t steps = 0;
    for (size_t i = list.front(); i != ArenaList<int>::kOccupied; i = list.nextOf(i)) {
        assert(list.prevOf(list.nextOf(i)) == i);
        ++steps;
    }
    assert(steps == 64);
    assert(list.get(list.front()) == 999);
    assert(list.get(list.back()) == 936);
    std::cout << "[OK] ArenaList stress test\n";
}

int main() {
    smokeTestArenaList();
    smokeTestArenaListInvalidIndex();
    stressTestArenaList();
    std::cout << "All ArenaList tests passed!\n";
    return 0;
}
