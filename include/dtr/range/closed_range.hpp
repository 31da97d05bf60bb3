#pragma once

#include <chrono>
#include <iterator>
#include <type_traits>
#include <utility>

#include <dtr/arith/advance.hpp>
#include <dtr/core/point_like.hpp>
#include <dtr/core/types.hpp>
#include <dtr/progression/step_cursor.hpp>
#include <dtr/range/range_like.hpp>

namespace dtr::range {

/**
 * @brief Шаг по умолчанию: одни сутки.
 *
 * Для дат и дат-времени это календарный день (CalendarPeriod{.days = 1}),
 * время суток сохраняется и пояс не нужен. Для моментов это 24 часа
 * прошедшего времени.
 */
struct DayStep {
    [[nodiscard]] core::Instant operator()(const core::Instant& p) const {
        return arith::advance(p, std::chrono::days{1});
    }
    [[nodiscard]] core::CalendarDate operator()(const core::CalendarDate& p) const {
        return arith::advance(p, core::CalendarPeriod{.days = 1});
    }
    [[nodiscard]] core::CalendarDateTime operator()(const core::CalendarDateTime& p) const {
        return arith::advance(p, core::CalendarPeriod{.days = 1});
    }
};

/**
 * @brief Замкнутый диапазон [start, endInclusive] над точками времени.
 *
 * Неизменяем после построения. При построении ничего не проверяется:
 * при start > endInclusive получается корректный пустой диапазон, а не ошибка.
 *
 * Обход по умолчанию идёт с шагом @ref DayStep; другой шаг задаётся через
 * @ref dtr::progression::withStep.
 *
 * @tparam T Instant, CalendarDate или CalendarDateTime.
 */
template <core::PointLike T>
class ClosedRange {
   public:
    using value_type = T;
    using cursor_type = progression::StepCursor<T, DayStep>;
    using iterator = progression::StepIterator<T, DayStep>;

    constexpr ClosedRange(T start, T endInclusive) noexcept(std::is_nothrow_move_constructible_v<T>)
        : start_(std::move(start)), end_(std::move(endInclusive)) {}

    [[nodiscard]] constexpr const T& start() const noexcept { return start_; }
    [[nodiscard]] constexpr const T& endInclusive() const noexcept { return end_; }

    [[nodiscard]] constexpr bool contains(const T& v) const noexcept { return start_ <= v && v <= end_; }

    [[nodiscard]] constexpr bool isEmpty() const noexcept { return start_ > end_; }

    /// @brief Свежий курсор с шагом в одни сутки.
    [[nodiscard]] cursor_type cursor() const { return cursor_type{start_, end_, DayStep{}}; }

    [[nodiscard]] iterator begin() const { return iterator{cursor()}; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    friend constexpr bool operator==(const ClosedRange&, const ClosedRange&) = default;

   private:
    T start_;
    T end_;
};

using InstantRange = ClosedRange<core::Instant>;
using DateRange = ClosedRange<core::CalendarDate>;
using DateTimeRange = ClosedRange<core::CalendarDateTime>;

/// @brief Построить диапазон [a, b] (аналог `a..b`).
template <core::PointLike T>
[[nodiscard]] constexpr ClosedRange<T> makeRange(T a, T b) {
    return ClosedRange<T>{std::move(a), std::move(b)};
}

// Самопроверка: все три диапазона удовлетворяют ClosedRangeLike.
static_assert(ClosedRangeLike<InstantRange>);
static_assert(ClosedRangeLike<DateRange>);
static_assert(ClosedRangeLike<DateTimeRange>);

}  // namespace dtr::range
