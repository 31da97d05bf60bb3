#pragma once

#include <chrono>
#include <exception>

#include <dtr/arith/advance.hpp>
#include <dtr/core/log.hpp>
#include <dtr/core/types.hpp>
#include <dtr/zone/time_zone.hpp>

namespace dtr::arith {

/// Опорная дата для пробного сложения периодов.
inline constexpr core::CalendarDate referenceDate{std::chrono::year{1970}, std::chrono::January, std::chrono::day{1}};

/// Опорная дата-время (полночь опорной даты).
inline constexpr core::CalendarDateTime referenceDateTime{referenceDate, std::chrono::nanoseconds{0}};

/// @brief Длительность положительна, если строго больше нуля.
[[nodiscard]] constexpr bool isPositive(core::ElapsedDuration d) noexcept { return d > core::ElapsedDuration::zero(); }

/**
 * @brief Даёт ли календарный период движение вперёд.
 *
 * Покомпонентной проверки знаков недостаточно: у {+1 месяц, -40 дней}
 * итог зависит от календаря. Поэтому период прибавляется к опорной дате
 * 1970-01-01 и результат сравнивается с ней. Ошибка при пробном сложении
 * означает "не положителен".
 */
[[nodiscard]] inline bool isPositive(const core::CalendarPeriod& p) {
    if (p.isZero()) return false;
    try {
        return advance(referenceDate, p) > referenceDate;
    } catch (const std::exception& e) {
        DTR_LOG_DEBUG("calendar period trial addition failed: {}", e.what());
        return false;
    }
}

/**
 * @brief Даёт ли комбинированный период движение вперёд в поясе @p tz.
 *
 * Период прибавляется к 1970-01-01T00:00 тем же адаптером, что и при
 * итерации (сначала дата, затем время). У перехода DST один и тот же
 * период может оказаться положительным в одном поясе и нет в другом.
 */
[[nodiscard]] inline bool isPositive(const core::CombinedPeriod& p, const zone::TimeZone& tz) {
    if (p.isZero()) return false;
    try {
        return advance(referenceDateTime, p, tz) > referenceDateTime;
    } catch (const std::exception& e) {
        DTR_LOG_DEBUG("combined period trial addition failed in zone {}: {}", tz.id(), e.what());
        return false;
    }
}

/// Вариант с системным поясом процесса.
[[nodiscard]] inline bool isPositive(const core::CombinedPeriod& p) {
    return isPositive(p, zone::TimeZone::currentSystemDefault());
}

}  // namespace dtr::arith
