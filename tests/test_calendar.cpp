#include <gtest/gtest.h>

#include <chrono>
#include <limits>

#include <dtr/arith/calendar.hpp>
#include <dtr/core/errors.hpp>
#include <dtr/core/types.hpp>

using namespace std::chrono;
using dtr::core::makeDate;
using dtr::core::makeDateTime;

TEST(Calendar, add_months_clamps_to_month_end) {
    EXPECT_EQ(dtr::arith::addMonths(makeDate(2024, 1, 31), 1), makeDate(2024, 2, 29));
    EXPECT_EQ(dtr::arith::addMonths(makeDate(2023, 1, 31), 1), makeDate(2023, 2, 28));
    EXPECT_EQ(dtr::arith::addMonths(makeDate(2024, 3, 31), -1), makeDate(2024, 2, 29));
    EXPECT_EQ(dtr::arith::addMonths(makeDate(2024, 5, 15), 0), makeDate(2024, 5, 15));
}

TEST(Calendar, add_months_crosses_year_boundaries) {
    EXPECT_EQ(dtr::arith::addMonths(makeDate(2023, 11, 10), 3), makeDate(2024, 2, 10));
    EXPECT_EQ(dtr::arith::addMonths(makeDate(2024, 1, 10), -13), makeDate(2022, 12, 10));
    EXPECT_EQ(dtr::arith::addMonths(makeDate(0, 1, 1), -1), makeDate(-1, 12, 1));
}

TEST(Calendar, add_days_handles_leap_years) {
    EXPECT_EQ(dtr::arith::addDays(makeDate(2024, 2, 26), 7), makeDate(2024, 3, 4));
    EXPECT_EQ(dtr::arith::addDays(makeDate(2023, 2, 26), 7), makeDate(2023, 3, 5));
    EXPECT_EQ(dtr::arith::addDays(makeDate(2024, 1, 1), -1), makeDate(2023, 12, 31));
}

TEST(Calendar, plus_period_applies_months_before_days) {
    // 2024-01-31 + 1 месяц = 2024-02-29, затем + 1 день = 2024-03-01.
    const dtr::core::CalendarPeriod p{.months = 1, .days = 1};
    EXPECT_EQ(dtr::arith::plusPeriod(makeDate(2024, 1, 31), p), makeDate(2024, 3, 1));

    const dtr::core::CalendarPeriod y{.years = 1, .months = 2};
    EXPECT_EQ(dtr::arith::plusPeriod(makeDate(2023, 12, 15), y), makeDate(2025, 2, 15));
}

TEST(Calendar, overflow_at_domain_edges) {
    EXPECT_THROW((void)dtr::arith::addDays(makeDate(32767, 12, 31), 1), dtr::core::CalendarOverflow);
    EXPECT_THROW((void)dtr::arith::addDays(makeDate(-32767, 1, 1), -1), dtr::core::CalendarOverflow);
    EXPECT_THROW((void)dtr::arith::addMonths(makeDate(32767, 12, 1), 1), dtr::core::CalendarOverflow);
    EXPECT_THROW((void)dtr::arith::addMonths(makeDate(2024, 1, 1), std::numeric_limits<std::int64_t>::max()),
                 dtr::core::CalendarOverflow);
    EXPECT_THROW((void)dtr::arith::addDays(makeDate(2024, 1, 1), std::numeric_limits<std::int64_t>::min()),
                 dtr::core::CalendarOverflow);
}

TEST(Calendar, instant_arithmetic_is_checked) {
    const dtr::core::Instant top = dtr::core::Instant::max();
    EXPECT_THROW((void)dtr::arith::addElapsed(top, nanoseconds{1}), dtr::core::CalendarOverflow);
    EXPECT_EQ(dtr::arith::addElapsed(top, nanoseconds{-1}), top - nanoseconds{1});
}

TEST(Calendar, offset_conversions_are_inverse) {
    const auto ldt = makeDateTime(2023, 10, 29, 2, 30);
    const auto t = dtr::arith::toInstantAtOffset(ldt, hours{2});
    EXPECT_EQ(t, sys_days{2023y / October / 29} + minutes{30});
    EXPECT_EQ(dtr::arith::toDateTimeAtOffset(t, hours{2}), ldt);
    EXPECT_EQ(dtr::arith::toDateTimeAtOffset(t, seconds{0}), makeDateTime(2023, 10, 29, 0, 30));
}

TEST(Calendar, pre_epoch_instant_maps_to_previous_day) {
    const dtr::core::Instant t{sys_days{1969y / December / 31} + hours{23}};
    EXPECT_EQ(dtr::arith::toDateTimeAtOffset(t, seconds{0}), makeDateTime(1969, 12, 31, 23));
    EXPECT_EQ(dtr::arith::toDateTimeAtOffset(t, hours{1}), makeDateTime(1970, 1, 1, 0));
}

TEST(Calendar, far_date_does_not_fit_into_instant) {
    EXPECT_THROW((void)dtr::arith::toInstantAtOffset(makeDateTime(9999, 1, 1), seconds{0}),
                 dtr::core::CalendarOverflow);
}

TEST(Calendar, make_date_rejects_invalid_fields) {
    EXPECT_THROW((void)makeDate(2023, 2, 29), dtr::core::InvalidFormat);
    EXPECT_THROW((void)makeDate(2023, 13, 1), dtr::core::InvalidFormat);
    EXPECT_THROW((void)makeDateTime(2023, 1, 1, 24), dtr::core::InvalidFormat);
    EXPECT_THROW((void)makeDateTime(2023, 1, 1, 0, 0, 0, 1'000'000'000), dtr::core::InvalidFormat);
    EXPECT_NO_THROW((void)makeDate(2024, 2, 29));
}

TEST(Calendar, calendar_period_equality_merges_years_into_months) {
    EXPECT_EQ((dtr::core::CalendarPeriod{.years = 1}), (dtr::core::CalendarPeriod{.months = 12}));
    EXPECT_NE((dtr::core::CalendarPeriod{.days = 30}), (dtr::core::CalendarPeriod{.months = 1}));
    EXPECT_TRUE((dtr::core::CalendarPeriod{.years = 1, .months = -12}).isZero());
}

TEST(Calendar, combined_period_time_part) {
    const dtr::core::CombinedPeriod p{.days = 1, .hours = 1, .minutes = 30};
    ASSERT_TRUE(p.timePart().has_value());
    EXPECT_EQ(*p.timePart(), minutes{90});
    EXPECT_EQ(p.datePart(), (dtr::core::CalendarPeriod{.days = 1}));

    const dtr::core::CombinedPeriod huge{.hours = std::numeric_limits<std::int64_t>::max()};
    EXPECT_FALSE(huge.timePart().has_value());
    EXPECT_FALSE(huge.isZero());

    EXPECT_TRUE((dtr::core::CombinedPeriod{.hours = 1, .minutes = -60}).isZero());
}
