#pragma once

#include <concepts>

#include <dtr/core/types.hpp>

namespace dtr::core {

/**
 * @brief Концепт точки на оси времени.
 *
 * Тип @p T считается точкой (PointLike), если он полностью упорядочен и
 * копируем. Этого достаточно для диапазонов (contains/isEmpty) и для
 * курсора прогрессии (сравнение с верхней границей).
 */
template <typename T>
concept PointLike = std::totally_ordered<T> && std::copyable<T>;

// Самопроверка: все три вида точек удовлетворяют PointLike.
static_assert(PointLike<Instant>);
static_assert(PointLike<CalendarDate>);
static_assert(PointLike<CalendarDateTime>);

}  // namespace dtr::core
