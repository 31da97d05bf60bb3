#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace dtr::core {

/**
 * @brief Вид ошибки библиотеки.
 *
 * Каждое исключение dtr несёт свой вид, чтобы вызывающий код мог
 * обработать их единообразно через @ref Error::kind().
 */
enum class ErrorKind {
    InvalidStep,        ///< Шаг нулевой или не даёт движения вперёд (при построении прогрессии).
    CalendarOverflow,   ///< Результат арифметики вне представимого диапазона.
    ExhaustedSequence,  ///< next() вызван после того, как hasNext() вернул false.
    StalledSequence,    ///< Продвижение курсора не дало роста значения.
    InvalidTimeZone,    ///< Некорректное описание часового пояса.
    InvalidFormat,      ///< Некорректная ISO-8601 строка или поля даты/времени.
};

[[nodiscard]] constexpr std::string_view toString(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::InvalidStep: return "InvalidStep";
        case ErrorKind::CalendarOverflow: return "CalendarOverflow";
        case ErrorKind::ExhaustedSequence: return "ExhaustedSequence";
        case ErrorKind::StalledSequence: return "StalledSequence";
        case ErrorKind::InvalidTimeZone: return "InvalidTimeZone";
        case ErrorKind::InvalidFormat: return "InvalidFormat";
    }
    return "Unknown";
}

/**
 * @brief Общий интерфейс ошибок dtr.
 *
 * Конкретные исключения наследуют и стандартное исключение (invalid_argument,
 * out_of_range, logic_error), и этот интерфейс. Ловить можно как по
 * стандартной иерархии, так и по `const dtr::core::Error&`.
 */
class Error {
   public:
    virtual ~Error() = default;

    [[nodiscard]] virtual ErrorKind kind() const noexcept = 0;
    [[nodiscard]] virtual const char* message() const noexcept = 0;
};

namespace detail {

template <typename Base, ErrorKind Kind>
class ErrorOf : public Base, public Error {
   public:
    explicit ErrorOf(const std::string& what) : Base(what) {}

    [[nodiscard]] ErrorKind kind() const noexcept override { return Kind; }
    [[nodiscard]] const char* message() const noexcept override { return this->what(); }
};

}  // namespace detail

/// Шаг прогрессии нулевой или не положительный.
class InvalidStep final : public detail::ErrorOf<std::invalid_argument, ErrorKind::InvalidStep> {
    using ErrorOf::ErrorOf;
};

/// Сложение вывело точку за пределы представимого диапазона.
class CalendarOverflow final : public detail::ErrorOf<std::out_of_range, ErrorKind::CalendarOverflow> {
    using ErrorOf::ErrorOf;
};

/// Запрошено значение у исчерпанной последовательности.
class ExhaustedSequence final : public detail::ErrorOf<std::out_of_range, ErrorKind::ExhaustedSequence> {
    using ErrorOf::ErrorOf;
};

/// Шаг курсора не сдвинул значение вперёд.
class StalledSequence final : public detail::ErrorOf<std::logic_error, ErrorKind::StalledSequence> {
    using ErrorOf::ErrorOf;
};

class InvalidTimeZone final : public detail::ErrorOf<std::invalid_argument, ErrorKind::InvalidTimeZone> {
    using ErrorOf::ErrorOf;
};

class InvalidFormat final : public detail::ErrorOf<std::invalid_argument, ErrorKind::InvalidFormat> {
    using ErrorOf::ErrorOf;
};

}  // namespace dtr::core
