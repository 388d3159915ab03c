// Copyright (c) 2025 <Your Name>
/**
 * @test Minute text parsing and formatting
 * @brief HHMM input rules and the two hour/minute display forms.
 */
#include "wtcore/duration_text.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

int Parsed(const std::string& text) {
  int out = -1;
  std::string err;
  EXPECT_TRUE(wtcore::ParseMinutes(text, &out, &err)) << text << ": " << err;
  return out;
}

}  // namespace

TEST(DurationTextTest, ParsesPlainMinutes) {
  EXPECT_EQ(Parsed("0"), 0);
  EXPECT_EQ(Parsed("5"), 5);
  EXPECT_EQ(Parsed("45"), 45);
  EXPECT_EQ(Parsed("07"), 7);
}

TEST(DurationTextTest, ParsesHoursAndMinutes) {
  EXPECT_EQ(Parsed("130"), 90);
  EXPECT_EQ(Parsed("0915"), 9 * 60 + 15);
  EXPECT_EQ(Parsed("1234"), 12 * 60 + 34);
}

/**
 * @test DurationTextTest.RejectsBadInput
 * @brief Wrong length, non-digits and minutes above 59 are rejected.
 * @expected false with the matching message; output untouched.
 */
TEST(DurationTextTest, RejectsBadInput) {
  int out = -1;
  std::string err;

  EXPECT_FALSE(wtcore::ParseMinutes("", &out, &err));
  EXPECT_EQ(err, "Incorrect time format. Should be 1-4 digit HHMM.");
  EXPECT_FALSE(wtcore::ParseMinutes("12345", &out, &err));
  EXPECT_FALSE(wtcore::ParseMinutes("1a", &out, &err));
  EXPECT_FALSE(wtcore::ParseMinutes("-5", &out, &err));
  EXPECT_EQ(err, "Incorrect time format. Should be 1-4 digit HHMM.");

  EXPECT_FALSE(wtcore::ParseMinutes("60", &out, &err));
  EXPECT_EQ(err, "Incorrect time format. Minutes cannot exceed 59.");
  EXPECT_FALSE(wtcore::ParseMinutes("0975", &out, &err));
  EXPECT_EQ(err, "Incorrect time format. Minutes cannot exceed 59.");

  EXPECT_EQ(out, -1);
}

TEST(DurationTextTest, Formats) {
  EXPECT_EQ(wtcore::FormatHourMinute(0), "0h:00m");
  EXPECT_EQ(wtcore::FormatHourMinute(5), "0h:05m");
  EXPECT_EQ(wtcore::FormatHourMinute(90), "1h:30m");
  EXPECT_EQ(wtcore::FormatHourMinute(605), "10h:05m");
  EXPECT_EQ(wtcore::FormatHourMinuteSpaced(125), "2h 05m");
}
