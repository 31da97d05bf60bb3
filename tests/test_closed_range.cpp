#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include <dtr/core/types.hpp>
#include <dtr/range/closed_range.hpp>

using namespace std::chrono;
using dtr::core::makeDate;
using dtr::core::makeDateTime;

TEST(ClosedRange, contains_and_is_empty) {
    const auto r = dtr::range::makeRange(makeDate(2024, 1, 1), makeDate(2024, 1, 31));
    EXPECT_TRUE(r.contains(makeDate(2024, 1, 1)));
    EXPECT_TRUE(r.contains(makeDate(2024, 1, 31)));
    EXPECT_FALSE(r.contains(makeDate(2024, 2, 1)));
    EXPECT_FALSE(r.isEmpty());
}

TEST(ClosedRange, reversed_bounds_form_an_empty_range) {
    const dtr::range::DateRange r{makeDate(2024, 2, 1), makeDate(2024, 1, 1)};
    EXPECT_TRUE(r.isEmpty());
    EXPECT_FALSE(r.contains(makeDate(2024, 1, 15)));
    EXPECT_FALSE(r.cursor().hasNext());
    EXPECT_TRUE(r.begin() == r.end());
}

TEST(ClosedRange, single_point_range) {
    const auto p = makeDateTime(2024, 5, 5, 12);
    const dtr::range::DateTimeRange r{p, p};
    EXPECT_FALSE(r.isEmpty());
    EXPECT_TRUE(r.contains(p));

    auto c = r.cursor();
    ASSERT_TRUE(c.hasNext());
    EXPECT_EQ(c.next(), p);
    EXPECT_FALSE(c.hasNext());
}

TEST(ClosedRange, default_iteration_steps_one_calendar_day) {
    const dtr::range::DateTimeRange r{makeDateTime(2024, 2, 27, 10, 30), makeDateTime(2024, 3, 1, 10, 30)};
    std::vector<dtr::core::CalendarDateTime> out;
    for (const auto& v : r) out.push_back(v);

    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0], makeDateTime(2024, 2, 27, 10, 30));
    EXPECT_EQ(out[1], makeDateTime(2024, 2, 28, 10, 30));
    EXPECT_EQ(out[2], makeDateTime(2024, 2, 29, 10, 30));
    EXPECT_EQ(out[3], makeDateTime(2024, 3, 1, 10, 30));
}

TEST(ClosedRange, instant_range_steps_24_hours) {
    const dtr::core::Instant a{sys_days{2024y / January / 1} + hours{6}};
    const dtr::range::InstantRange r{a, a + days{2} + hours{5}};

    std::vector<dtr::core::Instant> out;
    for (const auto& v : r) out.push_back(v);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[2], a + hours{48});
}

TEST(ClosedRange, equality_compares_bounds) {
    const auto a = dtr::range::makeRange(makeDate(2024, 1, 1), makeDate(2024, 1, 2));
    const auto b = dtr::range::makeRange(makeDate(2024, 1, 1), makeDate(2024, 1, 2));
    const auto c = dtr::range::makeRange(makeDate(2024, 1, 1), makeDate(2024, 1, 3));
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
}

TEST(ClosedRange, range_is_reiterable) {
    const auto r = dtr::range::makeRange(makeDate(2024, 1, 1), makeDate(2024, 1, 3));
    int first = 0;
    int second = 0;
    for (const auto& v : r) {
        (void)v;
        ++first;
    }
    for (const auto& v : r) {
        (void)v;
        ++second;
    }
    EXPECT_EQ(first, 3);
    EXPECT_EQ(second, 3);
}
