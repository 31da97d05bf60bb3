#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <dtr/core/errors.hpp>
#include <dtr/core/log.hpp>
#include <dtr/progression/with_step.hpp>

namespace {

bool anyContains(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& l : lines) {
        if (l.find(needle) != std::string::npos) return true;
    }
    return false;
}

class LogCapture : public ::testing::Test {
   protected:
    void SetUp() override {
        sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
        sink_->set_pattern("%l %v");
        auto l = std::make_shared<spdlog::logger>("dtr-test", sink_);
        l->set_level(spdlog::level::debug);
        dtr::core::setLogger(l);
    }

    void TearDown() override { dtr::core::setLogger(nullptr); }

    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

}  // namespace

TEST_F(LogCapture, rejected_step_is_logged_as_warning) {
    using dtr::core::makeDate;
    EXPECT_THROW((void)dtr::progression::withStep(dtr::range::makeRange(makeDate(2024, 1, 1), makeDate(2024, 2, 1)),
                                                  dtr::core::CalendarPeriod{}),
                 dtr::core::InvalidStep);

    const auto lines = sink_->last_formatted();
    EXPECT_TRUE(anyContains(lines, "warning CalendarDate/CalendarPeriod: step P0D is not a positive progression"));
}

TEST_F(LogCapture, accepted_progression_is_logged_at_debug) {
    using dtr::core::makeDate;
    const auto p = dtr::progression::withStep(dtr::range::makeRange(makeDate(2024, 1, 1), makeDate(2024, 2, 1)),
                                              dtr::core::CalendarPeriod{.days = 7});
    EXPECT_EQ(p.toVector().size(), 5u);
    EXPECT_TRUE(anyContains(sink_->last_formatted(), "debug progression CalendarDate/CalendarPeriod [2024-01-01 .. "
                                                     "2024-02-01] step P7D"));
}

TEST_F(LogCapture, aborted_sequence_is_logged_as_error) {
    using dtr::core::makeDate;
    const auto p = dtr::progression::withStep(
        dtr::range::makeRange(makeDate(32767, 12, 31), makeDate(32767, 12, 31)), dtr::core::CalendarPeriod{.days = 1});
    auto c = p.cursor();
    EXPECT_THROW((void)c.next(), dtr::core::CalendarOverflow);
    EXPECT_TRUE(anyContains(sink_->last_formatted(), "error sequence aborted (CalendarOverflow)"));
}

TEST(Log, falls_back_to_default_logger) {
    dtr::core::setLogger(nullptr);
    EXPECT_EQ(&dtr::core::logger(), spdlog::default_logger_raw());
}
