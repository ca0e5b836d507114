#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cachet {
namespace core {
namespace cache {

/**
 * @brief Двусвязный список поверх одного std::vector с индексами вместо указателей.
 * @details Свободные и занятые ячейки связаны в два кольцевых списка, каждый со
 *          своей вспомогательной ячейкой: #0 открывает список свободных, #1 список
 *          занятых. Ячейки не перевыделяются при обновлении порядка, индекс живой
 *          записи стабилен до её удаления.
 * @tparam T Тип хранимого значения
 */
template<typename T>
class ArenaList {
public:
    static constexpr size_t kFree = 0;
    static constexpr size_t kOccupied = 1;

    ArenaList() { initSentinels(); }

    explicit ArenaList(size_t capacity) {
        cells_.reserve(capacity + 2);
        initSentinels();
    }

    /// Вставить значение в голову списка. Возвращает индекс ячейки.
    size_t pushFront(T value) {
        if (cells_[kFree].next == kFree) {
            // свободных ячеек нет, добавляем одну в список свободных
            cells_.push_back(Cell{std::nullopt, kFree, kFree});
            linkAfter(cells_.size() - 1, kFree);
        }
        const size_t index = cells_[kFree].next;
        cells_[index].value.emplace(std::move(value));
        unlink(index);
        linkAfter(index, kOccupied);
        ++size_;
        return index;
    }

    /// Переместить живую ячейку в голову (самая свежая запись).
    void moveToFront(size_t index) {
        checkOccupied(index);
        unlink(index);
        linkAfter(index, kOccupied);
    }

    /// Вернуть ячейку в список свободных, отдав значение вызывающему.
    T remove(size_t index) {
        checkOccupied(index);
        unlink(index);
        linkAfter(index, kFree);
        T value = std::move(*cells_[index].value);
        cells_[index].value.reset();
        --size_;
        return value;
    }

    /// Индекс наименее недавно использованной ячейки.
    size_t back() const {
        if (empty()) {
            throw std::out_of_range("ArenaList: список пуст");
        }
        return cells_[kOccupied].prev;
    }

    size_t front() const {
        if (empty()) {
            throw std::out_of_range("ArenaList: список пуст");
        }
        return cells_[kOccupied].next;
    }

    T& get(size_t index) {
        checkOccupied(index);
        return *cells_[index].value;
    }

    const T& get(size_t index) const {
        checkOccupied(index);
        return *cells_[index].value;
    }

    /// Заменить значение в ячейке без изменения порядка. Возвращает старое.
    T set(size_t index, T value) {
        checkOccupied(index);
        T old = std::move(*cells_[index].value);
        *cells_[index].value = std::move(value);
        return old;
    }

    bool isOccupied(size_t index) const noexcept {
        return index > kOccupied && index < cells_.size() && cells_[index].value.has_value();
    }

    void clear() {
        cells_.clear();
        initSentinels();
        size_ = 0;
    }

    void reserve(size_t capacity) { cells_.reserve(capacity + 2); }

    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    /// Обход от самой свежей записи к самой старой.
    template<typename F>
    void forEach(F&& f) const {
        for (size_t i = cells_[kOccupied].next; i != kOccupied; i = cells_[i].next) {
            f(*cells_[i].value);
        }
    }

    template<typename F>
    void forEachIndexed(F&& f) const {
        for (size_t i = cells_[kOccupied].next; i != kOccupied; i = cells_[i].next) {
            f(i, *cells_[i].value);
        }
    }

    // Для проверки связности в тестах
    size_t nextOf(size_t index) const { return cells_.at(index).next; }
    size_t prevOf(size_t index) const { return cells_.at(index).prev; }
    size_t cellCount() const noexcept { return cells_.size(); }

private:
    struct Cell {
        std::optional<T> value;
        size_t next;
        size_t prev;
    };

    void initSentinels() {
        cells_.push_back(Cell{std::nullopt, kFree, kFree});
        cells_.push_back(Cell{std::nullopt, kOccupied, kOccupied});
    }

    void unlink(size_t index) {
        const size_t prev = cells_[index].prev;
        const size_t next = cells_[index].next;
        cells_[prev].next = next;
        cells_[next].prev = prev;
    }

    void linkAfter(size_t index, size_t prev) {
        const size_t next = cells_[prev].next;
        cells_[index].prev = prev;
        cells_[index].next = next;
        cells_[prev].next = index;
        cells_[next].prev = index;
    }

    void checkOccupied(size_t index) const {
        if (!isOccupied(index)) {
            throw std::out_of_range("ArenaList: неверный индекс " + std::to_string(index));
        }
    }

    std::vector<Cell> cells_;
    size_t size_ = 0;
};

} // namespace cache
} // namespace core
} // namespace cachet
