// File: tests/local_clock_test.cpp
#include <gtest/gtest.h>

#include "somni/core/util/local_clock.hpp"
#include "test_util.hpp"

namespace somni {
namespace {

using test::at;

TEST(LocalClock, MinutesSinceMidnightUsesTheOffset) {
  const LocalClock utc = LocalClock::fixed_offset(0);
  EXPECT_EQ(utc.minutes_since_midnight(at("2026-01-19T19:32:00Z")), 1172);
  EXPECT_EQ(utc.minutes_since_midnight(at("2026-01-19T19:47:59Z")), 1187);

  const LocalClock cet = LocalClock::fixed_offset(60);
  EXPECT_EQ(cet.minutes_since_midnight(at("2026-01-19T23:30:00Z")), 30);

  const LocalClock est = LocalClock::fixed_offset(-300);
  EXPECT_EQ(est.minutes_since_midnight(at("2026-01-19T03:00:00Z")), 22 * 60);
}

TEST(LocalClock, AtLocalTimeStaysOnTheLocalDate) {
  const LocalClock est = LocalClock::fixed_offset(-300);
  // 03:00Z is 22:00 local on the 18th, so 07:00 local is the morning of the 18th.
  EXPECT_EQ(est.at_local_time(at("2026-01-19T03:00:00Z"), ClockTime{7, 0}), at("2026-01-18T12:00:00Z"));
}

TEST(LocalClock, LastOccurrenceLooksBackAtMostOneDay) {
  const LocalClock utc = LocalClock::fixed_offset(0);
  EXPECT_EQ(utc.last_occurrence(at("2026-01-19T06:00:00Z"), ClockTime{22, 30}), at("2026-01-18T22:30:00Z"));
  EXPECT_EQ(utc.last_occurrence(at("2026-01-19T23:00:00Z"), ClockTime{22, 30}), at("2026-01-19T22:30:00Z"));
  EXPECT_EQ(utc.last_occurrence(at("2026-01-19T22:30:00Z"), ClockTime{22, 30}), at("2026-01-19T22:30:00Z"));
}

TEST(LocalClock, FormatLocalAppliesFixedOffset) {
  const LocalClock clock = LocalClock::fixed_offset(90);
  EXPECT_EQ(clock.format_local(at("2026-01-19T23:00:00Z")), "2026-01-20 00:30");
  EXPECT_EQ(clock.utc_offset_minutes(at("2026-07-01T00:00:00Z")), 90);
}

TEST(LocalClock, FromConfigPicksFixedOffsetWhenSet) {
  TimeZoneConfig tz;
  tz.utc_offset_minutes = 120;
  EXPECT_EQ(LocalClock::from_config(tz).utc_offset_minutes(at("2026-01-19T00:00:00Z")), 120);
}

TEST(Iso8601, ParsesZoneDesignators) {
  EXPECT_EQ(at("2026-01-19T07:00:00+01:00"), at("2026-01-19T06:00:00Z"));
  EXPECT_EQ(at("2026-01-19T07:00-02:30"), at("2026-01-19T09:30:00Z"));
  EXPECT_EQ(at("2026-01-19 07:00"), at("2026-01-19T07:00:00Z"));
  EXPECT_EQ(at("1970-01-01T00:00:01Z").ns, kNsPerSecond);
}

TEST(Iso8601, RejectsMalformedInput) {
  EXPECT_EQ(parse_iso8601("yesterday").status().code(), Status::Code::kParseError);
  EXPECT_EQ(parse_iso8601("2026-01-19").status().code(), Status::Code::kParseError);
  EXPECT_EQ(parse_iso8601("2026-01-19T07:00:00Zjunk").status().code(), Status::Code::kParseError);
  EXPECT_EQ(parse_iso8601("2026-13-01T00:00Z").status().code(), Status::Code::kOutOfRange);
}

TEST(Iso8601, FormatDropsFractionalSeconds) {
  const TimestampNs t = at("2026-01-19T07:00:00Z").plus(250'000'000);
  EXPECT_EQ(format_iso8601_utc(t), "2026-01-19T07:00:00Z");
}

}  // namespace
}  // namespace somni
