#pragma once

#include <concepts>

namespace dtr::range {

/**
 * @brief Концепт замкнутого диапазона точек [start, endInclusive].
 *
 * Тип @p R считается диапазоном (ClosedRangeLike), если:
 *  - определён тип точки `value_type`,
 *  - есть границы `start()` и `endInclusive()`,
 *  - есть проверки `contains(v)` и `isEmpty()`.
 *
 * Диапазоны и прогрессии обходятся через `cursor()`, возвращающий свежий
 * курсор (см. @ref dtr::progression::StepCursor).
 */
template <typename R>
concept ClosedRangeLike = requires(const R& r, const typename R::value_type& v) {
    typename R::value_type;
    { r.start() } -> std::convertible_to<typename R::value_type>;
    { r.endInclusive() } -> std::convertible_to<typename R::value_type>;
    { r.contains(v) } -> std::convertible_to<bool>;
    { r.isEmpty() } -> std::convertible_to<bool>;
    r.cursor();
};

}  // namespace dtr::range
