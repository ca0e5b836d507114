#pragma once

#include <chrono>
#include "cachet/core/cache/base/CacheErrors.hpp"

namespace cachet {
namespace core {
namespace cache {

// Монотонные часы и арифметика сроков жизни для всех in-memory хранилищ
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

namespace detail {

// now + ttl с проверкой переполнения. Бросает TimeBoundsError.
inline TimePoint checkedExpiry(TimePoint now, Duration ttl) {
    if (ttl.count() < 0) {
        throw TimeBoundsError("Отрицательный срок жизни записи");
    }
    // запас до конца диапазона, переведённый в миллисекунды с округлением вниз
    const auto headroom = std::chrono::duration_cast<Duration>(TimePoint::max() - now);
    if (ttl > headroom) {
        throw TimeBoundsError("Срок истечения выходит за пределы steady_clock");
    }
    return now + std::chrono::duration_cast<Clock::duration>(ttl);
}

// Запись жива, пока прошедшее время строго меньше ttl.
// Сравнение в миллисекундах: перевод ttl в наносекунды может переполниться.
inline bool isFresh(TimePoint stamp, TimePoint now, Duration ttl) {
    if (now < stamp) {
        return true;
    }
    return std::chrono::duration_cast<Duration>(now - stamp) < ttl;
}

} // namespace detail

} // namespace cache
} // namespace core
} // namespace cachet
