#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Неизменяемый ключ с разделяемым владением.
 * @details Один экземпляр ключа держат одновременно карта и очередь истечения,
 *          поэтому байты ключа не дублируются. Хеш и сравнение делегируются
 *          внутреннему ключу.
 */
template<typename Key>
class SharedKey {
public:
    static SharedKey make(Key key) {
        return SharedKey(std::make_shared<const Key>(std::move(key)));
    }

    // Невладеющий дескриптор для поиска: ни копии ключа, ни выделения памяти.
    // Живёт не дольше, чем key.
    static SharedKey borrowed(const Key& key) {
        return SharedKey(std::shared_ptr<const Key>(std::shared_ptr<const Key>(), &key));
    }

    const Key& get() const { return *ptr_; }
    long useCount() const { return ptr_.use_count(); }

private:
    explicit SharedKey(std::shared_ptr<const Key> ptr) : ptr_(std::move(ptr)) {}

    std::shared_ptr<const Key> ptr_;
};

template<typename Key, typename Hash = std::hash<Key>>
struct SharedKeyHash {
    size_t operator()(const SharedKey<Key>& key) const { return Hash{}(key.get()); }
};

template<typename Key, typename KeyEqual = std::equal_to<Key>>
struct SharedKeyEqual {
    bool operator()(const SharedKey<Key>& lhs, const SharedKey<Key>& rhs) const {
        return KeyEqual{}(lhs.get(), rhs.get());
    }
};

} // namespace cache
} // namespace core
} // namespace cachet
