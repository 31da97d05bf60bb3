#pragma once

#include <chrono>
#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <dtr/zone/zone_rules.hpp>

namespace dtr::zone::detail {

/// Пояс с постоянным смещением (UTC, "+03:00" и т.п.), без переходов.
class FixedOffsetRules final : public IZoneRules {
   public:
    explicit FixedOffsetRules(std::chrono::seconds offset) : offset_(offset), id_(formatId(offset)) {}

    [[nodiscard]] std::chrono::seconds offsetAt(const core::Instant&) const noexcept override { return offset_; }

    [[nodiscard]] std::string_view id() const noexcept override { return id_; }

   private:
    static std::string formatId(std::chrono::seconds offset) {
        if (offset.count() == 0) return "UTC";

        const long long total = offset.count();
        const long long a = std::llabs(total);
        const char sign = total < 0 ? '-' : '+';
        if (a % 60 != 0) {
            return fmt::format("{}{:02}:{:02}:{:02}", sign, a / 3600, (a / 60) % 60, a % 60);
        }
        return fmt::format("{}{:02}:{:02}", sign, a / 3600, (a / 60) % 60);
    }

    std::chrono::seconds offset_;
    std::string id_;
};

}  // namespace dtr::zone::detail
