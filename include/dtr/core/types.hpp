#pragma once

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

#include <dtr/core/errors.hpp>

namespace dtr::core {

/// Абсолютный момент времени (UTC) с разрешением в наносекунды.
using Instant = std::chrono::sys_time<std::chrono::nanoseconds>;

/// Прошедшее (физическое) время со знаком.
using ElapsedDuration = std::chrono::nanoseconds;

/// Календарная дата без часового пояса.
using CalendarDate = std::chrono::year_month_day;

/**
 * @brief Календарные дата и время суток без часового пояса.
 *
 * Время суток хранится как смещение от полуночи в диапазоне [0, 24h).
 * Сравнение лексикографическое: сначала дата, затем время.
 */
struct CalendarDateTime {
    CalendarDate date{};
    std::chrono::nanoseconds time{};

    friend constexpr bool operator==(const CalendarDateTime&, const CalendarDateTime&) = default;
    friend constexpr auto operator<=>(const CalendarDateTime&, const CalendarDateTime&) = default;
};

/**
 * @brief Календарный период (годы, месяцы, дни) со знаком.
 *
 * Не имеет абсолютной длительности: прибавление зависит от календаря
 * (длина месяца, високосные годы). Годы и месяцы сливаются в общее число
 * месяцев, поэтому `{.years = 1}` и `{.months = 12}` равны.
 */
struct CalendarPeriod {
    int years{};
    int months{};
    int days{};

    [[nodiscard]] constexpr std::int64_t totalMonths() const noexcept {
        return static_cast<std::int64_t>(years) * 12 + months;
    }

    [[nodiscard]] constexpr bool isZero() const noexcept { return totalMonths() == 0 && days == 0; }

    friend constexpr bool operator==(const CalendarPeriod& a, const CalendarPeriod& b) noexcept {
        return a.totalMonths() == b.totalMonths() && a.days == b.days;
    }
};

/**
 * @brief Комбинированный период: календарная часть + внутрисуточная длительность.
 *
 * Календарная часть (years/months/days) прибавляется по правилам календаря,
 * внутрисуточная (hours/minutes/seconds/nanoseconds) прибавляется как прошедшее время
 * через часовой пояс. Порядок применения фиксирован: сначала дата, затем время.
 */
struct CombinedPeriod {
    int years{};
    int months{};
    int days{};
    std::int64_t hours{};
    std::int64_t minutes{};
    std::int64_t seconds{};
    std::int64_t nanoseconds{};

    [[nodiscard]] constexpr CalendarPeriod datePart() const noexcept { return {years, months, days}; }

    /**
     * @brief Внутрисуточная часть в наносекундах.
     * @return std::nullopt, если сумма не помещается в 64 бита.
     */
    [[nodiscard]] constexpr std::optional<ElapsedDuration> timePart() const noexcept {
        constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
        constexpr std::int64_t min = std::numeric_limits<std::int64_t>::min();

        std::int64_t total = 0;
        const std::int64_t parts[] = {hours, minutes, seconds, nanoseconds};
        const std::int64_t scale[] = {3'600'000'000'000, 60'000'000'000, 1'000'000'000, 1};

        for (std::size_t i = 0; i < 4; ++i) {
            const std::int64_t p = parts[i];
            const std::int64_t s = scale[i];
            if (p > max / s || p < min / s) return std::nullopt;
            const std::int64_t v = p * s;
            if ((v > 0 && total > max - v) || (v < 0 && total < min - v)) return std::nullopt;
            total += v;
        }
        return ElapsedDuration{total};
    }

    [[nodiscard]] constexpr bool isZero() const noexcept {
        const auto t = timePart();
        return datePart().isZero() && t && t->count() == 0;
    }

    friend constexpr bool operator==(const CombinedPeriod& a, const CombinedPeriod& b) noexcept {
        if (a.datePart() != b.datePart()) return false;
        const auto ta = a.timePart();
        const auto tb = b.timePart();
        if (ta && tb) return *ta == *tb;
        return a.hours == b.hours && a.minutes == b.minutes && a.seconds == b.seconds &&
               a.nanoseconds == b.nanoseconds;
    }
};

/**
 * @brief Построить дату с проверкой полей.
 * @throws InvalidFormat если такой даты не существует (например, 2023-02-29).
 */
[[nodiscard]] inline CalendarDate makeDate(int y, unsigned m, unsigned d) {
    const CalendarDate date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!date.ok()) {
        throw InvalidFormat("makeDate: no such calendar date");
    }
    return date;
}

/**
 * @brief Построить дату-время с проверкой полей.
 * @throws InvalidFormat при несуществующей дате или времени вне [00:00, 24:00).
 */
[[nodiscard]] inline CalendarDateTime makeDateTime(int y, unsigned m, unsigned d, int h = 0, int min = 0, int s = 0,
                                                   std::int64_t ns = 0) {
    if (h < 0 || h > 23 || min < 0 || min > 59 || s < 0 || s > 59 || ns < 0 || ns > 999'999'999) {
        throw InvalidFormat("makeDateTime: time of day out of range");
    }
    using namespace std::chrono;
    return {makeDate(y, m, d), hours{h} + minutes{min} + seconds{s} + nanoseconds{ns}};
}

}  // namespace dtr::core
