#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include <dtr/core/errors.hpp>
#include <dtr/core/log.hpp>
#include <dtr/core/point_like.hpp>

namespace dtr::progression {

/**
 * @brief Концепт функции продвижения: T -> T.
 */
template <typename A, typename T>
concept AdvanceFor = std::copy_constructible<A> && requires(const A& a, const T& p) {
    { a(p) } -> std::same_as<T>;
};

/**
 * @brief Курсор последовательности точек с фиксированным шагом.
 *
 * Общий алгоритм для всех видов прогрессий; различаются только точка @p T
 * и функция продвижения @p Advance (в ней же хранятся шаг и пояс).
 *
 * Использование:
 *  - получить свежий курсор у диапазона или прогрессии (cursor()),
 *  - вызывать next() пока hasNext() == true (или tryNext() до std::nullopt).
 *
 * Курсор stateful и не потокобезопасен: у каждого потребителя свой.
 * Ошибка при продвижении (core::CalendarOverflow, core::StalledSequence)
 * прерывает только этот курсор; прогрессию можно обойти заново.
 *
 * @tparam T       Тип точки.
 * @tparam Advance Функциональный объект `T(const T&)`.
 */
template <core::PointLike T, AdvanceFor<T> Advance>
class StepCursor {
   public:
    using value_type = T;

    StepCursor(T start, T endInclusive, Advance advance)
        : current_(std::move(start)), end_(std::move(endInclusive)), advance_(std::move(advance)) {}

    /// @brief Есть ли ещё элементы (current <= endInclusive и курсор не прерван).
    [[nodiscard]] bool hasNext() const noexcept { return !aborted_ && current_ <= end_; }

    /**
     * @brief Вернуть текущий элемент и продвинуть курсор.
     *
     * @throws core::ExhaustedSequence если hasNext() == false.
     * @throws core::CalendarOverflow  если продвижение вышло за пределы домена.
     * @throws core::StalledSequence   если продвижение не увеличило значение.
     */
    T next() {
        if (!hasNext()) {
            throw core::ExhaustedSequence("next() called on an exhausted sequence");
        }

        T value = current_;
        try {
            T advanced = advance_(current_);
            if (!(value < advanced)) {
                throw core::StalledSequence("step made no forward progress");
            }
            current_ = std::move(advanced);
        } catch (const core::Error& e) {
            aborted_ = true;
            DTR_LOG_ERROR("sequence aborted ({}): {}", core::toString(e.kind()), e.message());
            throw;
        }
        return value;
    }

    /// @brief Следующий элемент или std::nullopt, если последовательность исчерпана.
    [[nodiscard]] std::optional<T> tryNext() {
        if (!hasNext()) return std::nullopt;
        return next();
    }

   private:
    T current_;
    T end_;
    Advance advance_;
    bool aborted_{false};
};

/**
 * @brief Input-итератор поверх StepCursor (для range-for).
 *
 * Владеет своим курсором; конец последовательности: std::default_sentinel.
 */
template <core::PointLike T, AdvanceFor<T> Advance>
class StepIterator {
   public:
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using iterator_concept = std::input_iterator_tag;

    StepIterator() = default;

    explicit StepIterator(StepCursor<T, Advance> cursor) : cursor_(std::move(cursor)) { fetch(); }

    [[nodiscard]] const T& operator*() const noexcept { return *value_; }

    StepIterator& operator++() {
        fetch();
        return *this;
    }

    void operator++(int) { fetch(); }

    friend bool operator==(const StepIterator& it, std::default_sentinel_t) noexcept { return !it.value_.has_value(); }

   private:
    void fetch() {
        if (cursor_) {
            value_ = cursor_->tryNext();
        } else {
            value_.reset();
        }
    }

    std::optional<StepCursor<T, Advance>> cursor_{};
    std::optional<T> value_{};
};

}  // namespace dtr::progression
