#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <string_view>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/local_time/posix_time_zone.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <fmt/format.h>

#include <dtr/core/errors.hpp>
#include <dtr/zone/zone_rules.hpp>

namespace dtr::zone::detail {

/**
 * @brief Правила пояса из POSIX TZ-строки (через boost::local_time::posix_time_zone).
 *
 * Пример: "CET+1CEST,M3.5.0/2,M10.5.0/3".
 *
 * @warning Boost трактует смещение как "UTC + offset" (восток положителен),
 *          т.е. знак обратный классическому POSIX TZ.
 */
class PosixRules final : public IZoneRules {
   public:
    explicit PosixRules(std::string_view rule) : id_(rule), zone_(parse(id_)) {
        base_ = std::chrono::seconds{zone_.base_utc_offset().total_seconds()};
        dst_ = std::chrono::seconds{zone_.dst_offset().total_seconds()};
    }

    [[nodiscard]] std::chrono::seconds offsetAt(const core::Instant& t) const override {
        using namespace std::chrono;
        if (!zone_.has_dst()) return base_;

        const auto utc = floor<seconds>(t);
        // Год переходов определяется по местному стандартному времени.
        const int y = static_cast<int>(year_month_day{floor<days>(utc + base_)}.year());
        if (y < minRuleYear || y > maxRuleYear) return base_;

        const boost::gregorian::greg_year gy(static_cast<unsigned short>(y));
        const auto start = toSys(zone_.dst_local_start_time(gy)) - base_;
        const auto end = toSys(zone_.dst_local_end_time(gy)) - base_ - dst_;

        // Южное полушарие: летнее время пересекает границу года.
        const bool inDst = (start < end) ? (utc >= start && utc < end) : (utc >= start || utc < end);
        return inDst ? base_ + dst_ : base_;
    }

    [[nodiscard]] std::string_view id() const noexcept override { return id_; }

   private:
    // Допустимый диапазон boost::gregorian::greg_year.
    static constexpr int minRuleYear = 1400;
    static constexpr int maxRuleYear = 9999;

    static boost::local_time::posix_time_zone parse(const std::string& rule) {
        try {
            return boost::local_time::posix_time_zone(rule);
        } catch (const std::exception& e) {
            throw core::InvalidTimeZone(fmt::format("invalid POSIX time zone '{}': {}", rule, e.what()));
        }
    }

    static std::chrono::sys_seconds toSys(const boost::posix_time::ptime& p) {
        static const boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
        return std::chrono::sys_seconds{std::chrono::seconds{(p - epoch).total_seconds()}};
    }

    std::string id_;
    boost::local_time::posix_time_zone zone_;
    std::chrono::seconds base_{};
    std::chrono::seconds dst_{};
};

}  // namespace dtr::zone::detail
