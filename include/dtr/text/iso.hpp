#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <dtr/arith/calendar.hpp>
#include <dtr/core/errors.hpp>
#include <dtr/core/types.hpp>

namespace dtr::text {

namespace detail {

inline std::string fraction(std::int64_t ns) {
    if (ns == 0) return {};
    if (ns % 1'000'000 == 0) return fmt::format(".{:03}", ns / 1'000'000);
    if (ns % 1'000 == 0) return fmt::format(".{:06}", ns / 1'000);
    return fmt::format(".{:09}", ns);
}

/// Последовательное чтение ISO-строки; любая ошибка -> core::InvalidFormat.
class Reader {
   public:
    explicit Reader(std::string_view s) noexcept : s_(s) {}

    [[nodiscard]] bool done() const noexcept { return pos_ == s_.size(); }

    [[nodiscard]] char peek() const noexcept { return done() ? '\0' : s_[pos_]; }

    bool accept(char c) noexcept {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void expect(char c) {
        if (!accept(c)) fail(fmt::format("expected '{}' at position {}", c, pos_));
    }

    /// Ровно @p minDigits..@p maxDigits десятичных цифр.
    std::int64_t digits(std::size_t minDigits, std::size_t maxDigits) {
        std::size_t n = 0;
        while (pos_ + n < s_.size() && n < maxDigits && s_[pos_ + n] >= '0' && s_[pos_ + n] <= '9') ++n;
        if (n < minDigits) fail(fmt::format("expected {} digit(s) at position {}", minDigits, pos_));

        std::int64_t v = 0;
        const char* first = s_.data() + pos_;
        const auto [ptr, ec] = std::from_chars(first, first + n, v);
        if (ec != std::errc{} || ptr != first + n) fail("number out of range");
        pos_ += n;
        return v;
    }

    [[noreturn]] void fail(const std::string& why) const {
        throw core::InvalidFormat(fmt::format("cannot parse '{}': {}", s_, why));
    }

   private:
    std::string_view s_;
    std::size_t pos_{0};
};

inline core::CalendarDate readDate(Reader& r) {
    int sign = 1;
    if (r.accept('-')) sign = -1;
    else r.accept('+');

    const auto y = sign * r.digits(4, 6);
    r.expect('-');
    const auto m = r.digits(2, 2);
    r.expect('-');
    const auto d = r.digits(2, 2);

    if (y < arith::minYear || y > arith::maxYear) r.fail("year out of range");
    const core::CalendarDate date{std::chrono::year{static_cast<int>(y)}, std::chrono::month{static_cast<unsigned>(m)},
                                  std::chrono::day{static_cast<unsigned>(d)}};
    if (!date.ok()) r.fail("no such calendar date");
    return date;
}

inline core::CalendarDateTime readDateTime(Reader& r) {
    using namespace std::chrono;
    const auto date = readDate(r);
    if (!r.accept('T')) r.expect('t');

    const auto h = r.digits(2, 2);
    r.expect(':');
    const auto mi = r.digits(2, 2);
    std::int64_t s = 0;
    std::int64_t ns = 0;
    if (r.accept(':')) {
        s = r.digits(2, 2);
        if (r.accept('.')) {
            std::int64_t frac = 0;
            std::size_t width = 0;
            while (width < 9 && r.peek() >= '0' && r.peek() <= '9') {
                frac = frac * 10 + r.digits(1, 1);
                ++width;
            }
            if (width == 0) r.fail("empty fraction of a second");
            for (std::size_t i = width; i < 9; ++i) frac *= 10;
            ns = frac;
        }
    }
    if (h > 23 || mi > 59 || s > 59) r.fail("time of day out of range");
    return {date, hours{h} + minutes{mi} + seconds{s} + nanoseconds{ns}};
}

}  // namespace detail

/// @name Текстовое представление ISO-8601
/// @{

[[nodiscard]] inline std::string toIsoString(const core::CalendarDate& d) {
    const int y = static_cast<int>(d.year());
    const auto m = static_cast<unsigned>(d.month());
    const auto day = static_cast<unsigned>(d.day());
    if (y >= 0 && y <= 9999) return fmt::format("{:04}-{:02}-{:02}", y, m, day);
    return fmt::format("{}{:04}-{:02}-{:02}", y < 0 ? '-' : '+', std::abs(y), m, day);
}

[[nodiscard]] inline std::string toIsoString(const core::CalendarDateTime& dt) {
    using namespace std::chrono;
    const hh_mm_ss<nanoseconds> t{dt.time};
    return fmt::format("{}T{:02}:{:02}:{:02}{}", toIsoString(dt.date), t.hours().count(), t.minutes().count(),
                       t.seconds().count(), detail::fraction(t.subseconds().count()));
}

[[nodiscard]] inline std::string toIsoString(const core::Instant& t) {
    return toIsoString(arith::toDateTimeAtOffset(t, std::chrono::seconds{0})) + "Z";
}

/// ISO-8601 длительность: "PT1H30M", "PT0.5S", "-PT2H".
[[nodiscard]] inline std::string toIsoString(core::ElapsedDuration d) {
    const std::int64_t raw = d.count();
    if (raw == 0) return "PT0S";

    // Работаем с модулем в unsigned, чтобы не переполниться на минимуме.
    const std::uint64_t a = raw < 0 ? 0 - static_cast<std::uint64_t>(raw) : static_cast<std::uint64_t>(raw);
    const std::uint64_t h = a / 3'600'000'000'000ULL;
    const std::uint64_t m = (a / 60'000'000'000ULL) % 60;
    const std::uint64_t s = (a / 1'000'000'000ULL) % 60;
    const auto ns = static_cast<std::int64_t>(a % 1'000'000'000ULL);

    std::string out = raw < 0 ? "-PT" : "PT";
    if (h != 0) out += fmt::format("{}H", h);
    if (m != 0) out += fmt::format("{}M", m);
    if (s != 0 || ns != 0) out += fmt::format("{}{}S", s, detail::fraction(ns));
    return out;
}

[[nodiscard]] inline std::string toIsoString(const core::CalendarPeriod& p) {
    if (p.isZero()) return "P0D";
    const std::int64_t months = p.totalMonths();
    std::string out = "P";
    if (months / 12 != 0) out += fmt::format("{}Y", months / 12);
    if (months % 12 != 0) out += fmt::format("{}M", months % 12);
    if (p.days != 0) out += fmt::format("{}D", p.days);
    return out;
}

[[nodiscard]] inline std::string toIsoString(const core::CombinedPeriod& p) {
    const auto time = p.timePart();
    if (!time) {
        return fmt::format("{}T{}H{}M{}S+{}ns", toIsoString(p.datePart()), p.hours, p.minutes, p.seconds,
                           p.nanoseconds);
    }
    if (time->count() == 0) return toIsoString(p.datePart());

    const std::string t = toIsoString(*time);  // "PT..." или "-PT..."
    const bool negative = t.front() == '-';
    std::string out = p.datePart().isZero() ? "P" : toIsoString(p.datePart());
    out += negative ? "T-" : "T";
    out += t.substr(negative ? 3 : 2);
    return out;
}

/// @}

/**
 * @brief Разобрать дату "YYYY-MM-DD" (допускается знак и до 6 цифр года).
 * @throws core::InvalidFormat
 */
[[nodiscard]] inline core::CalendarDate parseDate(std::string_view s) {
    detail::Reader r{s};
    const auto d = detail::readDate(r);
    if (!r.done()) r.fail("trailing characters");
    return d;
}

/**
 * @brief Разобрать дату-время "YYYY-MM-DDTHH:MM[:SS[.fffffffff]]".
 * @throws core::InvalidFormat
 */
[[nodiscard]] inline core::CalendarDateTime parseDateTime(std::string_view s) {
    detail::Reader r{s};
    const auto dt = detail::readDateTime(r);
    if (!r.done()) r.fail("trailing characters");
    return dt;
}

/**
 * @brief Разобрать момент: дата-время и "Z" либо смещение "+HH:MM" / "-HH:MM".
 * @throws core::InvalidFormat при синтаксической ошибке,
 *         core::CalendarOverflow если момент не помещается в Instant.
 */
[[nodiscard]] inline core::Instant parseInstant(std::string_view s) {
    detail::Reader r{s};
    const auto dt = detail::readDateTime(r);

    std::chrono::seconds offset{0};
    if (!r.accept('Z') && !r.accept('z')) {
        int sign = 0;
        if (r.accept('+')) sign = 1;
        else if (r.accept('-')) sign = -1;
        else r.fail("expected 'Z' or a UTC offset");

        const auto oh = r.digits(2, 2);
        r.expect(':');
        const auto om = r.digits(2, 2);
        if (oh > 18 || om > 59) r.fail("UTC offset out of range");
        offset = std::chrono::seconds{sign * (oh * 3600 + om * 60)};
    }
    if (!r.done()) r.fail("trailing characters");
    return arith::toInstantAtOffset(dt, offset);
}

}  // namespace dtr::text

namespace dtr::core {

inline std::ostream& operator<<(std::ostream& os, const CalendarDateTime& v) { return os << text::toIsoString(v); }
inline std::ostream& operator<<(std::ostream& os, const CalendarPeriod& v) { return os << text::toIsoString(v); }
inline std::ostream& operator<<(std::ostream& os, const CombinedPeriod& v) { return os << text::toIsoString(v); }

}  // namespace dtr::core

template <>
struct fmt::formatter<dtr::core::CalendarDateTime> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dtr::core::CalendarDateTime& v, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(dtr::text::toIsoString(v), ctx);
    }
};

template <>
struct fmt::formatter<dtr::core::CalendarPeriod> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dtr::core::CalendarPeriod& v, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(dtr::text::toIsoString(v), ctx);
    }
};

template <>
struct fmt::formatter<dtr::core::CombinedPeriod> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dtr::core::CombinedPeriod& v, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(dtr::text::toIsoString(v), ctx);
    }
};
