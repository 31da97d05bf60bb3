#pragma once

#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <dtr/core/errors.hpp>
#include <dtr/core/log.hpp>
#include <dtr/core/point_like.hpp>
#include <dtr/core/types.hpp>
#include <dtr/progression/step_cursor.hpp>
#include <dtr/progression/step_traits.hpp>
#include <dtr/range/closed_range.hpp>
#include <dtr/text/iso.hpp>
#include <dtr/zone/time_zone.hpp>

namespace dtr::progression {

/**
 * @brief Прогрессия: замкнутый диапазон + проверенный положительный шаг.
 *
 * Шаг проверяется при построении (см. @ref StepTraits::isPositive); нулевой
 * или не дающий движения вперёд шаг -> core::InvalidStep, объект не создаётся.
 * Для пар, которым нужен часовой пояс, пояс фиксируется при построении
 * (по умолчанию системный пояс процесса).
 *
 * Прогрессия неизменяема и может обходиться сколько угодно раз: каждый
 * cursor()/begin() начинает заново с start.
 *
 * @tparam Point Тип точки.
 * @tparam Step  Тип шага; пара (Point, Step) должна иметь специализацию StepTraits.
 */
template <core::PointLike Point, typename Step>
class Progression {
   private:
    using Traits = StepTraits<Point, Step>;
    using ZoneSlot = std::conditional_t<Traits::needs_zone, zone::TimeZone, std::monostate>;

   public:
    using value_type = Point;
    using step_type = Step;
    using range_type = dtr::range::ClosedRange<Point>;

    static constexpr bool needs_zone = Traits::needs_zone;

    /// Функция продвижения: шаг и (если нужен) пояс.
    struct Advance {
        Step step;
        ZoneSlot zone;

        [[nodiscard]] Point operator()(const Point& p) const {
            if constexpr (needs_zone) {
                return Traits::advance(p, step, zone);
            } else {
                return Traits::advance(p, step);
            }
        }
    };

    using cursor_type = StepCursor<Point, Advance>;
    using iterator = StepIterator<Point, Advance>;

    /// @throws core::InvalidStep
    Progression(range_type r, Step step)
        requires(!needs_zone)
        : range_(std::move(r)), advance_{std::move(step), {}} {
        validate();
    }

    /// @throws core::InvalidStep
    Progression(range_type r, Step step, zone::TimeZone tz)
        requires(needs_zone)
        : range_(std::move(r)), advance_{std::move(step), std::move(tz)} {
        validate();
    }

    /// С системным поясом процесса. @throws core::InvalidStep
    Progression(range_type r, Step step)
        requires(needs_zone)
        : Progression(std::move(r), std::move(step), zone::TimeZone::currentSystemDefault()) {}

    [[nodiscard]] const range_type& range() const noexcept { return range_; }
    [[nodiscard]] const Point& start() const noexcept { return range_.start(); }
    [[nodiscard]] const Point& endInclusive() const noexcept { return range_.endInclusive(); }
    [[nodiscard]] const Step& step() const noexcept { return advance_.step; }

    [[nodiscard]] const zone::TimeZone& zone() const noexcept
        requires(needs_zone)
    {
        return advance_.zone;
    }

    [[nodiscard]] bool isEmpty() const noexcept { return range_.isEmpty(); }
    [[nodiscard]] bool contains(const Point& v) const noexcept { return range_.contains(v); }

    /// @brief Свежий курсор, начинающий с start.
    [[nodiscard]] cursor_type cursor() const { return cursor_type{range_.start(), range_.endInclusive(), advance_}; }

    [[nodiscard]] iterator begin() const { return iterator{cursor()}; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    /**
     * @brief Собрать всю последовательность в вектор.
     * @throws core::CalendarOverflow, core::StalledSequence из курсора.
     */
    [[nodiscard]] std::vector<Point> toVector() const {
        std::vector<Point> out;
        auto c = cursor();
        while (c.hasNext()) out.push_back(c.next());
        return out;
    }

   private:
    void validate() const {
        bool positive = false;
        if constexpr (needs_zone) {
            positive = Traits::isPositive(advance_.step, advance_.zone);
        } else {
            positive = Traits::isPositive(advance_.step);
        }

        if (!positive) {
            const std::string msg =
                fmt::format("{}: step {} is not a positive progression", Traits::name, text::toIsoString(advance_.step));
            DTR_LOG_WARN("{}", msg);
            throw core::InvalidStep(msg);
        }

        if (core::logger().should_log(spdlog::level::debug)) {
            std::string zoneId = "-";
            if constexpr (needs_zone) zoneId = std::string(advance_.zone.id());
            DTR_LOG_DEBUG("progression {} [{} .. {}] step {} zone {}", Traits::name,
                          text::toIsoString(range_.start()), text::toIsoString(range_.endInclusive()),
                          text::toIsoString(advance_.step), zoneId);
        }
    }

    range_type range_;
    Advance advance_;
};

using InstantProgression = Progression<core::Instant, core::ElapsedDuration>;
using DateProgression = Progression<core::CalendarDate, core::CalendarPeriod>;
using DateTimeDurationProgression = Progression<core::CalendarDateTime, core::ElapsedDuration>;
using DateTimePeriodProgression = Progression<core::CalendarDateTime, core::CalendarPeriod>;
using DateTimeCombinedProgression = Progression<core::CalendarDateTime, core::CombinedPeriod>;

static_assert(dtr::range::ClosedRangeLike<InstantProgression>);
static_assert(dtr::range::ClosedRangeLike<DateTimeCombinedProgression>);

}  // namespace dtr::progression
