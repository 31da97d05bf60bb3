#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <string_view>
#include <utility>

#include <dtr/arith/calendar.hpp>
#include <dtr/core/errors.hpp>
#include <dtr/core/log.hpp>
#include <dtr/core/types.hpp>
#include <dtr/zone/fixed_offset_rules.hpp>
#include <dtr/zone/posix_rules.hpp>
#include <dtr/zone/system_rules.hpp>
#include <dtr/zone/zone_rules.hpp>

#ifndef DTR_DEFAULT_OVERLAP_LATER
#define DTR_DEFAULT_OVERLAP_LATER 1
#endif

namespace dtr::zone {

/**
 * @brief Какое из двух вхождений выбирать для местного времени в перекрытии.
 *
 * Перекрытие возникает при переводе часов назад: местное время 02:30
 * встречается дважды.
 */
enum class OverlapPolicy {
    Earlier,  ///< Первое вхождение (смещение до перехода).
    Later,    ///< Второе вхождение (смещение после перехода).
};

inline constexpr OverlapPolicy defaultOverlapPolicy =
    DTR_DEFAULT_OVERLAP_LATER ? OverlapPolicy::Later : OverlapPolicy::Earlier;

/**
 * @brief Часовой пояс: отображение местной даты-времени в момент и обратно.
 *
 * Неизменяемое значение; копирование дешёвое (правила разделяются через
 * shared_ptr). Безопасно для одновременного чтения из нескольких потоков.
 *
 * Разрешение неоднозначностей при toInstant():
 *  - разрыв (перевод вперёд): местное время сдвигается вперёд на длину
 *    разрыва, т.е. используется смещение, действовавшее до перехода;
 *  - перекрытие (перевод назад): выбор по @ref OverlapPolicy.
 */
class TimeZone {
   public:
    /// @brief UTC.
    [[nodiscard]] static TimeZone utc() { return fixed(std::chrono::seconds{0}); }

    /**
     * @brief Пояс с постоянным смещением от UTC.
     * @throws core::InvalidTimeZone если |offset| > 18 часов.
     */
    [[nodiscard]] static TimeZone fixed(std::chrono::seconds offset) {
        if (offset > std::chrono::hours{18} || offset < -std::chrono::hours{18}) {
            throw core::InvalidTimeZone("fixed offset must be within +-18:00");
        }
        return TimeZone{std::make_shared<detail::FixedOffsetRules>(offset), defaultOverlapPolicy};
    }

    /**
     * @brief Пояс из POSIX TZ-строки (знак смещения по соглашению Boost: восток положителен).
     * @throws core::InvalidTimeZone если строка не разбирается.
     */
    [[nodiscard]] static TimeZone posix(std::string_view rule, OverlapPolicy policy = defaultOverlapPolicy) {
        return TimeZone{std::make_shared<detail::PosixRules>(rule), policy};
    }

    /// @brief Текущий системный пояс процесса (учитывает TZ).
    [[nodiscard]] static TimeZone currentSystemDefault() {
        return TimeZone{std::make_shared<detail::SystemRules>(), defaultOverlapPolicy};
    }

    [[nodiscard]] std::string_view id() const noexcept { return rules_->id(); }

    [[nodiscard]] OverlapPolicy overlapPolicy() const noexcept { return policy_; }

    /// @brief Тот же пояс с другой политикой перекрытий.
    [[nodiscard]] TimeZone withOverlapPolicy(OverlapPolicy p) const { return TimeZone{rules_, p}; }

    [[nodiscard]] std::chrono::seconds offsetAt(const core::Instant& t) const { return rules_->offsetAt(t); }

    /**
     * @brief Местная дата-время момента @p t.
     * @throws core::CalendarOverflow при выходе за пределы представимых значений.
     */
    [[nodiscard]] core::CalendarDateTime toLocal(const core::Instant& t) const {
        return arith::toDateTimeAtOffset(t, offsetAt(t));
    }

    /**
     * @brief Момент, соответствующий местной дате-времени @p ldt в этом поясе.
     * @throws core::CalendarOverflow если результат не помещается в Instant.
     */
    [[nodiscard]] core::Instant toInstant(const core::CalendarDateTime& ldt) const {
        using namespace std::chrono;

        // Местное время, прочитанное как UTC; от него ищем смещения по обе стороны перехода.
        const core::Instant asUtc = arith::toInstantAtOffset(ldt, seconds{0});
        const seconds before = offsetAt(probe(asUtc, -days{1}));
        const seconds after = offsetAt(probe(asUtc, days{1}));

        const core::Instant withBefore = arith::toInstantAtOffset(ldt, before);
        if (before == after) return withBefore;

        const core::Instant withAfter = arith::toInstantAtOffset(ldt, after);
        const bool beforeValid = offsetAt(withBefore) == before;
        const bool afterValid = offsetAt(withAfter) == after;

        if (beforeValid && afterValid) {
            DTR_LOG_DEBUG("zone {}: local time falls in an overlap, using {} occurrence", id(),
                          policy_ == OverlapPolicy::Earlier ? "earlier" : "later");
            const auto [first, second] = std::minmax(withBefore, withAfter);
            return policy_ == OverlapPolicy::Earlier ? first : second;
        }
        if (beforeValid) return withBefore;
        if (afterValid) return withAfter;

        DTR_LOG_DEBUG("zone {}: local time falls in a gap, shifting forward by {}s", id(),
                      (after - before).count());
        return withBefore;
    }

   private:
    TimeZone(std::shared_ptr<const detail::IZoneRules> rules, OverlapPolicy policy)
        : rules_(std::move(rules)), policy_(policy) {}

    // Сдвиг для поиска смещений; у границ диапазона Instant остаёмся на месте.
    static core::Instant probe(const core::Instant& t, core::ElapsedDuration d) noexcept {
        const auto moved = arith::detail::addChecked(t.time_since_epoch().count(), d.count());
        return moved ? core::Instant{core::ElapsedDuration{*moved}} : t;
    }

    std::shared_ptr<const detail::IZoneRules> rules_;
    OverlapPolicy policy_;
};

}  // namespace dtr::zone
