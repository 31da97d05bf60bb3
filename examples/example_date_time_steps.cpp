#include <dtr/core/errors.hpp>
#include <dtr/core/types.hpp>
#include <dtr/progression/with_step.hpp>
#include <dtr/range/closed_range.hpp>
#include <dtr/text/iso.hpp>
#include <dtr/zone/time_zone.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <string>

namespace ex {

using namespace std::chrono;
using dtr::core::CalendarPeriod;
using dtr::core::CombinedPeriod;
using dtr::progression::withStep;
using dtr::range::makeRange;

// "2023-10-26 10:30:00" вместо ISO-разделителя 'T'.
std::string spaced(const dtr::core::CalendarDateTime& v) {
    std::string s = dtr::text::toIsoString(v);
    s[s.find('T')] = ' ';
    return s;
}

template <typename Seq, typename Fmt>
void listAll(const char* title, const Seq& seq, Fmt&& show) {
    fmt::print("\n{}\n", title);
    for (const auto& v : seq) fmt::print("{}\n", show(v));
}

void dateTimes(const dtr::zone::TimeZone& tz) {
    fmt::print("--- CalendarDateTime (zone {}) ---\n", tz.id());
    const auto r = makeRange(dtr::text::parseDateTime("2023-10-26T10:30:00"),
                             dtr::text::parseDateTime("2023-10-29T12:00:00"));

    listAll("Iterating by default (1 day):", r, spaced);
    listAll("Iterating by 2 days:", withStep(r, days{2}, tz), spaced);
    listAll("Iterating by 12 hours:", withStep(r, hours{12}, tz), spaced);
    listAll("Iterating by 90 minutes:", withStep(r, minutes{90}, tz), spaced);
    listAll("Iterating by 1 hour (combined period):", withStep(r, CombinedPeriod{.hours = 1}, tz), spaced);
    listAll("Iterating by 1 calendar day:", withStep(r, CalendarPeriod{.days = 1}), spaced);
    listAll("Reversed range:", withStep(makeRange(r.endInclusive(), r.start()), days{1}, tz), spaced);
}

void dates() {
    fmt::print("\n\n--- CalendarDate ---\n");
    const auto start = dtr::core::makeDate(2024, 2, 26);
    const auto end = dtr::core::makeDate(2024, 3, 5);
    const auto iso = [](const dtr::core::CalendarDate& d) { return dtr::text::toIsoString(d); };

    listAll("Iterating by default (1 day):", makeRange(start, end), iso);
    listAll("Iterating by 7 days:", withStep(makeRange(start, end), CalendarPeriod{.days = 7}), iso);
    const auto monthly = withStep(makeRange(start, dtr::core::makeDate(2024, 5, 15)), CalendarPeriod{.months = 1});
    listAll("Iterating by 1 month:", monthly, iso);

    fmt::print("\nIterating by a negative period:\n");
    try {
        const auto bad = withStep(makeRange(start, end), CalendarPeriod{.days = -1});
        fmt::print("not reached: {} element(s)\n", bad.toVector().size());
    } catch (const dtr::core::InvalidStep& e) {
        fmt::print("Caught expected error: {}\n", e.what());
    }

    listAll("Reversed range:", withStep(makeRange(end, start), CalendarPeriod{.days = 1}), iso);
}

void instants() {
    fmt::print("\n\n--- Instant ---\n");
    const auto start = dtr::text::parseInstant("2023-11-10T10:00:00Z");
    const auto finish = start + days{3} + hours{6};
    const auto iso = [](const dtr::core::Instant& t) { return dtr::text::toIsoString(t); };

    fmt::print("Start: {}\nEnd:   {}\n", iso(start), iso(finish));
    listAll("Iterating by default (1 day):", makeRange(start, finish), iso);
    listAll("Iterating by 6 hours:", withStep(makeRange(start, finish), hours{6}), iso);
    listAll("Iterating by 25 hours:", withStep(makeRange(start, finish), hours{25}), iso);
    listAll("Reversed range:", withStep(makeRange(finish, start), days{1}), iso);
}

}  // namespace ex

int main() {
    spdlog::set_level(spdlog::level::warn);

    try {
        // Центральная Европа: 2023-10-29 переход с летнего времени на зимнее.
        ex::dateTimes(dtr::zone::TimeZone::posix("CET+1CEST,M3.5.0/2,M10.5.0/3"));
        ex::dates();
        ex::instants();
    } catch (const dtr::core::Error& e) {
        spdlog::error("{}: {}", dtr::core::toString(e.kind()), e.message());
        return 1;
    }
    return 0;
}
