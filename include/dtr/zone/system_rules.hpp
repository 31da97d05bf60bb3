#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <string>
#include <string_view>

#include <dtr/core/errors.hpp>
#include <dtr/zone/zone_rules.hpp>

namespace dtr::zone::detail {

/**
 * @brief Местный пояс процесса (как его видит C-библиотека).
 *
 * Смещение берётся из `localtime_r(...).tm_gmtoff`, поэтому учитываются
 * /etc/localtime и переменная окружения TZ.
 */
class SystemRules final : public IZoneRules {
   public:
    SystemRules() {
        ::tzset();
        const char* tz = std::getenv("TZ");
        id_ = (tz && *tz) ? tz : "localtime";
    }

    [[nodiscard]] std::chrono::seconds offsetAt(const core::Instant& t) const override {
        const auto secs = std::chrono::floor<std::chrono::seconds>(t).time_since_epoch().count();
        const auto tt = static_cast<std::time_t>(secs);

        std::tm tm{};
        if (::localtime_r(&tt, &tm) == nullptr) {
            throw core::CalendarOverflow("localtime_r failed: instant outside the system time zone range");
        }
        return std::chrono::seconds{tm.tm_gmtoff};
    }

    [[nodiscard]] std::string_view id() const noexcept override { return id_; }

   private:
    std::string id_;
};

}  // namespace dtr::zone::detail
