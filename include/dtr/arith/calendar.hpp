#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>

#include <dtr/core/errors.hpp>
#include <dtr/core/types.hpp>

namespace dtr::arith {

namespace detail {

[[nodiscard]] constexpr std::optional<std::int64_t> addChecked(std::int64_t a, std::int64_t b) noexcept {
    constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t min = std::numeric_limits<std::int64_t>::min();
    if ((b > 0 && a > max - b) || (b < 0 && a < min - b)) return std::nullopt;
    return a + b;
}

[[nodiscard]] constexpr std::optional<std::int64_t> mulChecked(std::int64_t a, std::int64_t b) noexcept {
    if (a == 0 || b == 0) return 0;
    constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t min = std::numeric_limits<std::int64_t>::min();
    if (a > 0) {
        if (b > 0 ? a > max / b : b < min / a) return std::nullopt;
    } else {
        if (b > 0 ? a < min / b : a < max / b) return std::nullopt;
    }
    return a * b;
}

// Деление с округлением вниз (для отрицательных номеров месяцев).
[[nodiscard]] constexpr std::int64_t floorDiv(std::int64_t a, std::int64_t b) noexcept {
    const std::int64_t q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

inline constexpr std::int64_t nanosPerSecond = 1'000'000'000;
inline constexpr std::int64_t nanosPerDay = 86'400 * nanosPerSecond;

}  // namespace detail

/// Границы представимых дат (совпадают с диапазоном std::chrono::year).
inline constexpr int minYear = static_cast<int>(std::chrono::year::min());
inline constexpr int maxYear = static_cast<int>(std::chrono::year::max());

/**
 * @brief Проверить, что дата существует и лежит в представимом диапазоне.
 * @throws core::CalendarOverflow иначе.
 */
inline void requireValid(const core::CalendarDate& d) {
    if (!d.ok()) {
        throw core::CalendarOverflow("date is outside the representable calendar domain");
    }
}

/**
 * @brief Прибавить к дате число месяцев.
 *
 * День месяца прижимается к последнему дню целевого месяца:
 * 2024-01-31 + 1 месяц = 2024-02-29.
 *
 * @throws core::CalendarOverflow если год результата вне [minYear, maxYear].
 */
[[nodiscard]] inline core::CalendarDate addMonths(const core::CalendarDate& d, std::int64_t months) {
    using namespace std::chrono;
    requireValid(d);
    if (months == 0) return d;

    const std::int64_t index = static_cast<std::int64_t>(static_cast<int>(d.year())) * 12 +
                               (static_cast<unsigned>(d.month()) - 1);
    const auto shifted = detail::addChecked(index, months);
    if (!shifted) throw core::CalendarOverflow("addMonths: month index overflow");

    const std::int64_t y = detail::floorDiv(*shifted, 12);
    const auto m = static_cast<unsigned>(*shifted - y * 12 + 1);
    if (y < minYear || y > maxYear) {
        throw core::CalendarOverflow("addMonths: year out of range");
    }

    const year_month ym{year{static_cast<int>(y)}, month{m}};
    const day last = year_month_day_last{ym.year(), month_day_last{ym.month()}}.day();
    return year_month_day{ym.year(), ym.month(), std::min(d.day(), last)};
}

/**
 * @brief Прибавить к дате число дней.
 * @throws core::CalendarOverflow если результат вне представимого диапазона.
 */
[[nodiscard]] inline core::CalendarDate addDays(const core::CalendarDate& d, std::int64_t days) {
    using namespace std::chrono;
    requireValid(d);
    if (days == 0) return d;

    static constexpr std::int64_t lo = sys_days{year{minYear} / January / 1}.time_since_epoch().count();
    static constexpr std::int64_t hi = sys_days{year{maxYear} / December / 31}.time_since_epoch().count();

    const auto shifted = detail::addChecked(sys_days{d}.time_since_epoch().count(), days);
    if (!shifted || *shifted < lo || *shifted > hi) {
        throw core::CalendarOverflow("addDays: date out of range");
    }
    return year_month_day{sys_days{std::chrono::days{*shifted}}};
}

/**
 * @brief Календарное сложение даты и периода.
 *
 * Сначала прибавляется общее число месяцев (years * 12 + months), затем дни.
 */
[[nodiscard]] inline core::CalendarDate plusPeriod(const core::CalendarDate& d, const core::CalendarPeriod& p) {
    return addDays(addMonths(d, p.totalMonths()), p.days);
}

/// Прибавить длительность к моменту с проверкой переполнения.
[[nodiscard]] inline core::Instant addElapsed(const core::Instant& t, core::ElapsedDuration d) {
    const auto sum = detail::addChecked(t.time_since_epoch().count(), d.count());
    if (!sum) throw core::CalendarOverflow("instant arithmetic overflow");
    return core::Instant{core::ElapsedDuration{*sum}};
}

/**
 * @brief Момент, соответствующий местной дате-времени при заданном смещении от UTC.
 *
 * instant = ldt - offset.
 *
 * @throws core::CalendarOverflow если момент не помещается в Instant.
 */
[[nodiscard]] inline core::Instant toInstantAtOffset(const core::CalendarDateTime& ldt, std::chrono::seconds offset) {
    using namespace std::chrono;
    requireValid(ldt.date);

    const std::int64_t dayCount = sys_days{ldt.date}.time_since_epoch().count();
    const auto dayNanos = detail::mulChecked(dayCount, detail::nanosPerDay);
    const auto offNanos = detail::mulChecked(offset.count(), detail::nanosPerSecond);
    if (!dayNanos || !offNanos) throw core::CalendarOverflow("date-time is outside the instant range");

    const auto local = detail::addChecked(*dayNanos, ldt.time.count());
    if (!local) throw core::CalendarOverflow("date-time is outside the instant range");
    const auto utc = detail::addChecked(*local, -*offNanos);
    if (!utc) throw core::CalendarOverflow("date-time is outside the instant range");

    return core::Instant{core::ElapsedDuration{*utc}};
}

/**
 * @brief Местная дата-время момента при заданном смещении от UTC.
 * @throws core::CalendarOverflow при переполнении.
 */
[[nodiscard]] inline core::CalendarDateTime toDateTimeAtOffset(const core::Instant& t, std::chrono::seconds offset) {
    using namespace std::chrono;
    const auto local = addElapsed(t, offset);
    const auto day = floor<days>(local);
    return {year_month_day{sys_days{day}}, local - day};
}

}  // namespace dtr::arith
