#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <dtr/Version.hpp>
#include <dtr/core/errors.hpp>

TEST(Errors, kinds_are_reported) {
    EXPECT_EQ(dtr::core::InvalidStep("x").kind(), dtr::core::ErrorKind::InvalidStep);
    EXPECT_EQ(dtr::core::CalendarOverflow("x").kind(), dtr::core::ErrorKind::CalendarOverflow);
    EXPECT_EQ(dtr::core::ExhaustedSequence("x").kind(), dtr::core::ErrorKind::ExhaustedSequence);
    EXPECT_EQ(dtr::core::StalledSequence("x").kind(), dtr::core::ErrorKind::StalledSequence);
    EXPECT_EQ(dtr::core::InvalidTimeZone("x").kind(), dtr::core::ErrorKind::InvalidTimeZone);
    EXPECT_EQ(dtr::core::InvalidFormat("x").kind(), dtr::core::ErrorKind::InvalidFormat);
}

TEST(Errors, kind_names) {
    EXPECT_EQ(dtr::core::toString(dtr::core::ErrorKind::InvalidStep), "InvalidStep");
    EXPECT_EQ(dtr::core::toString(dtr::core::ErrorKind::CalendarOverflow), "CalendarOverflow");
    EXPECT_EQ(dtr::core::toString(dtr::core::ErrorKind::StalledSequence), "StalledSequence");
}

TEST(Errors, caught_through_standard_hierarchy) {
    EXPECT_THROW(throw dtr::core::InvalidStep("bad step"), std::invalid_argument);
    EXPECT_THROW(throw dtr::core::CalendarOverflow("too far"), std::out_of_range);
    EXPECT_THROW(throw dtr::core::ExhaustedSequence("done"), std::out_of_range);
    EXPECT_THROW(throw dtr::core::StalledSequence("stuck"), std::logic_error);
}

TEST(Errors, caught_through_common_interface) {
    try {
        throw dtr::core::CalendarOverflow("year out of range");
    } catch (const dtr::core::Error& e) {
        EXPECT_EQ(e.kind(), dtr::core::ErrorKind::CalendarOverflow);
        EXPECT_EQ(std::string(e.message()), "year out of range");
        return;
    }
    FAIL() << "dtr::core::Error was not caught";
}

TEST(Version, macros_match_constants) {
    EXPECT_EQ(dtr::version_major, DTR_VERSION_MAJOR);
    EXPECT_EQ(dtr::version_minor, DTR_VERSION_MINOR);
    EXPECT_EQ(dtr::version_patch, DTR_VERSION_PATCH);
    EXPECT_EQ(DTR_VERSION_HEX, (DTR_VERSION_MAJOR << 16) | (DTR_VERSION_MINOR << 8) | DTR_VERSION_PATCH);
}
