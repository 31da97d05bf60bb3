#pragma once

#include <string_view>

#include <dtr/arith/advance.hpp>
#include <dtr/arith/positivity.hpp>
#include <dtr/core/types.hpp>
#include <dtr/zone/time_zone.hpp>

namespace dtr::progression {

/**
 * @brief Трейты пары (вид точки, вид шага).
 *
 * Набор допустимых прогрессий замкнут: существуют только перечисленные ниже
 * специализации, общий шаблон не определён. Каждая специализация описывает:
 *  - нужен ли часовой пояс (`needs_zone`),
 *  - как проверить положительность шага (`isPositive`),
 *  - как продвинуть точку на шаг (`advance`).
 *
 * @tparam Point Тип точки.
 * @tparam Step  Тип шага.
 */
template <typename Point, typename Step>
struct StepTraits;

template <>
struct StepTraits<core::Instant, core::ElapsedDuration> {
    static constexpr bool needs_zone = false;
    static constexpr std::string_view name = "Instant/ElapsedDuration";

    [[nodiscard]] static bool isPositive(const core::ElapsedDuration& s) { return arith::isPositive(s); }

    [[nodiscard]] static core::Instant advance(const core::Instant& p, const core::ElapsedDuration& s) {
        return arith::advance(p, s);
    }
};

template <>
struct StepTraits<core::CalendarDate, core::CalendarPeriod> {
    static constexpr bool needs_zone = false;
    static constexpr std::string_view name = "CalendarDate/CalendarPeriod";

    [[nodiscard]] static bool isPositive(const core::CalendarPeriod& s) { return arith::isPositive(s); }

    [[nodiscard]] static core::CalendarDate advance(const core::CalendarDate& p, const core::CalendarPeriod& s) {
        return arith::advance(p, s);
    }
};

/// Прошедшее время для даты-времени: только через пояс.
template <>
struct StepTraits<core::CalendarDateTime, core::ElapsedDuration> {
    static constexpr bool needs_zone = true;
    static constexpr std::string_view name = "CalendarDateTime/ElapsedDuration";

    [[nodiscard]] static bool isPositive(const core::ElapsedDuration& s, const zone::TimeZone&) {
        return arith::isPositive(s);
    }

    [[nodiscard]] static core::CalendarDateTime advance(const core::CalendarDateTime& p,
                                                        const core::ElapsedDuration& s, const zone::TimeZone& tz) {
        return arith::advance(p, s, tz);
    }
};

template <>
struct StepTraits<core::CalendarDateTime, core::CalendarPeriod> {
    static constexpr bool needs_zone = false;
    static constexpr std::string_view name = "CalendarDateTime/CalendarPeriod";

    [[nodiscard]] static bool isPositive(const core::CalendarPeriod& s) { return arith::isPositive(s); }

    [[nodiscard]] static core::CalendarDateTime advance(const core::CalendarDateTime& p,
                                                        const core::CalendarPeriod& s) {
        return arith::advance(p, s);
    }
};

template <>
struct StepTraits<core::CalendarDateTime, core::CombinedPeriod> {
    static constexpr bool needs_zone = true;
    static constexpr std::string_view name = "CalendarDateTime/CombinedPeriod";

    [[nodiscard]] static bool isPositive(const core::CombinedPeriod& s, const zone::TimeZone& tz) {
        return arith::isPositive(s, tz);
    }

    [[nodiscard]] static core::CalendarDateTime advance(const core::CalendarDateTime& p,
                                                        const core::CombinedPeriod& s, const zone::TimeZone& tz) {
        return arith::advance(p, s, tz);
    }
};

}  // namespace dtr::progression
