#pragma once

#include <chrono>

#include <dtr/arith/calendar.hpp>
#include <dtr/core/errors.hpp>
#include <dtr/core/types.hpp>
#include <dtr/zone/time_zone.hpp>

namespace dtr::arith {

/**
 * @name Адаптеры шага
 *
 * Продвижение точки на шаг. Для CalendarDateTime прошедшее время всегда
 * прибавляется через часовой пояс: местное -> момент -> + длительность ->
 * местное. Разрешение разрывов и перекрытий полностью за @ref zone::TimeZone.
 *
 * Все функции бросают core::CalendarOverflow при выходе за пределы
 * представимых значений.
 * @{
 */

[[nodiscard]] inline core::Instant advance(const core::Instant& p, core::ElapsedDuration step) {
    return addElapsed(p, step);
}

[[nodiscard]] inline core::CalendarDate advance(const core::CalendarDate& p, const core::CalendarPeriod& step) {
    return plusPeriod(p, step);
}

[[nodiscard]] inline core::CalendarDateTime advance(const core::CalendarDateTime& p, core::ElapsedDuration step,
                                                    const zone::TimeZone& tz) {
    return tz.toLocal(addElapsed(tz.toInstant(p), step));
}

/// Меняется только дата; время суток копируется.
[[nodiscard]] inline core::CalendarDateTime advance(const core::CalendarDateTime& p,
                                                    const core::CalendarPeriod& step) {
    return {plusPeriod(p.date, step), p.time};
}

/**
 * Сначала календарная часть (без пояса), затем внутрисуточная длительность
 * (через пояс). Обратный порядок у перехода DST даёт другой результат и не
 * поддерживается.
 */
[[nodiscard]] inline core::CalendarDateTime advance(const core::CalendarDateTime& p, const core::CombinedPeriod& step,
                                                    const zone::TimeZone& tz) {
    const auto afterDate = advance(p, step.datePart());
    const auto time = step.timePart();
    if (!time) throw core::CalendarOverflow("combined period time part overflows nanoseconds");
    return advance(afterDate, *time, tz);
}

/** @} */

[[nodiscard]] inline core::Instant retreat(const core::Instant& p, core::ElapsedDuration step) {
    if (step == core::ElapsedDuration::min()) throw core::CalendarOverflow("cannot negate the minimal duration");
    return addElapsed(p, -step);
}

/// @brief Вычесть прошедшее время из местной даты-времени (через пояс).
[[nodiscard]] inline core::CalendarDateTime retreat(const core::CalendarDateTime& p, core::ElapsedDuration step,
                                                    const zone::TimeZone& tz) {
    if (step == core::ElapsedDuration::min()) throw core::CalendarOverflow("cannot negate the minimal duration");
    return advance(p, -step, tz);
}

}  // namespace dtr::arith
