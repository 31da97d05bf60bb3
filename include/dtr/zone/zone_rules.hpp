#pragma once

#include <chrono>
#include <string_view>

#include <dtr/core/types.hpp>

namespace dtr::zone::detail {

/**
 * @brief Внутренний type-erasure интерфейс правил часового пояса.
 *
 * Правила отвечают ровно на один вопрос: какое смещение от UTC действует
 * в заданный момент. Разрешение местного времени (переходы DST) строится
 * поверх этого в @ref dtr::zone::TimeZone.
 *
 * IZoneRules: внутренняя деталь реализации (не часть публичного API).
 */
struct IZoneRules {
    virtual ~IZoneRules() = default;

    /// @brief Смещение местного времени от UTC в момент @p t.
    [[nodiscard]] virtual std::chrono::seconds offsetAt(const core::Instant& t) const = 0;

    /// @brief Идентификатор пояса (для логов и диагностики).
    [[nodiscard]] virtual std::string_view id() const noexcept = 0;
};

}  // namespace dtr::zone::detail
