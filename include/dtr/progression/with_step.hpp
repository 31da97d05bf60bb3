#pragma once

#include <dtr/core/types.hpp>
#include <dtr/progression/progression.hpp>
#include <dtr/range/closed_range.hpp>
#include <dtr/zone/time_zone.hpp>

namespace dtr::progression {

/**
 * @name withStep
 *
 * Превращает замкнутый диапазон в прогрессию с заданным шагом.
 * Набор перегрузок замкнут: комбинации, не перечисленные здесь
 * (например, Instant + CalendarPeriod), не компилируются.
 *
 * Все перегрузки бросают core::InvalidStep для шага, не дающего движения
 * вперёд. Перегрузки без явного пояса там, где пояс нужен, берут системный
 * пояс процесса в момент вызова.
 * @{
 */

[[nodiscard]] inline InstantProgression withStep(const range::InstantRange& r, core::ElapsedDuration step) {
    return InstantProgression{r, step};
}

[[nodiscard]] inline DateProgression withStep(const range::DateRange& r, const core::CalendarPeriod& step) {
    return DateProgression{r, step};
}

[[nodiscard]] inline DateTimeDurationProgression withStep(const range::DateTimeRange& r,
                                                          core::ElapsedDuration step) {
    return DateTimeDurationProgression{r, step};
}

[[nodiscard]] inline DateTimeDurationProgression withStep(const range::DateTimeRange& r, core::ElapsedDuration step,
                                                          const zone::TimeZone& tz) {
    return DateTimeDurationProgression{r, step, tz};
}

[[nodiscard]] inline DateTimePeriodProgression withStep(const range::DateTimeRange& r,
                                                        const core::CalendarPeriod& step) {
    return DateTimePeriodProgression{r, step};
}

[[nodiscard]] inline DateTimeCombinedProgression withStep(const range::DateTimeRange& r,
                                                          const core::CombinedPeriod& step) {
    return DateTimeCombinedProgression{r, step};
}

[[nodiscard]] inline DateTimeCombinedProgression withStep(const range::DateTimeRange& r,
                                                          const core::CombinedPeriod& step,
                                                          const zone::TimeZone& tz) {
    return DateTimeCombinedProgression{r, step, tz};
}

/** @} */

}  // namespace dtr::progression
