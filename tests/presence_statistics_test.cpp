// File: tests/presence_statistics_test.cpp
#include <gtest/gtest.h>

#include <vector>

#include "somni/stats/presence_statistics.hpp"
#include "test_util.hpp"

namespace somni {
namespace {

using test::at;

PresenceEvent ev(const std::string& ts, PresenceEventKind kind, double minutes = 0.0) {
  PresenceEvent e;
  e.timestamp = at(ts);
  e.kind = kind;
  e.duration_minutes = minutes;
  return e;
}

constexpr auto kPot = PresenceEventKind::kPotentiallyAway;
constexpr auto kConf = PresenceEventKind::kConfirmedAway;
constexpr auto kRet = PresenceEventKind::kReturned;

TEST(PresenceStatistics, NoEventsMeansActiveAllDay) {
  const auto s = compute_presence_statistics({}, at("2026-01-20T07:00:00Z"), at("2026-01-20T12:00:00Z"));
  EXPECT_DOUBLE_EQ(s.total_active_minutes, 300.0);
  EXPECT_DOUBLE_EQ(s.total_away_minutes, 0.0);
  EXPECT_EQ(s.away_count, 0);
  EXPECT_DOUBLE_EQ(s.current_session_minutes, 300.0);
  EXPECT_DOUBLE_EQ(s.current_away_minutes, 0.0);
}

TEST(PresenceStatistics, ClosedAwaySpans) {
  const std::vector<PresenceEvent> events{
      ev("2026-01-20T09:00:00Z", kPot),  ev("2026-01-20T09:00:00Z", kConf),
      ev("2026-01-20T09:30:00Z", kRet, 30.0),
      ev("2026-01-20T10:00:00Z", kPot),  ev("2026-01-20T10:00:00Z", kConf),
      ev("2026-01-20T10:45:00Z", kRet, 45.0),
  };
  const auto s = compute_presence_statistics(events, at("2026-01-20T07:00:00Z"), at("2026-01-20T12:00:00Z"));
  EXPECT_DOUBLE_EQ(s.total_away_minutes, 75.0);
  EXPECT_EQ(s.away_count, 2);
  EXPECT_DOUBLE_EQ(s.longest_away_minutes, 45.0);
  EXPECT_DOUBLE_EQ(s.total_active_minutes, 225.0);
  EXPECT_DOUBLE_EQ(s.current_session_minutes, 75.0);
  EXPECT_DOUBLE_EQ(s.current_away_minutes, 0.0);
}

TEST(PresenceStatistics, OpenAwaySpanRunsToNow) {
  const std::vector<PresenceEvent> events{
      ev("2026-01-20T09:00:00Z", kConf),
      ev("2026-01-20T09:30:00Z", kRet, 30.0),
      ev("2026-01-20T11:00:00Z", kPot),
      ev("2026-01-20T11:00:00Z", kConf),
  };
  const auto s = compute_presence_statistics(events, at("2026-01-20T07:00:00Z"), at("2026-01-20T12:00:00Z"));
  EXPECT_DOUBLE_EQ(s.total_away_minutes, 90.0);
  EXPECT_EQ(s.away_count, 2);
  EXPECT_DOUBLE_EQ(s.longest_away_minutes, 60.0);
  EXPECT_DOUBLE_EQ(s.current_away_minutes, 60.0);
  EXPECT_DOUBLE_EQ(s.current_session_minutes, 0.0);
  EXPECT_DOUBLE_EQ(s.total_active_minutes, 210.0);
}

TEST(PresenceStatistics, GracePeriodAloneIsNotAway) {
  const std::vector<PresenceEvent> events{ev("2026-01-20T11:00:00Z", kPot)};
  const auto s = compute_presence_statistics(events, at("2026-01-20T07:00:00Z"), at("2026-01-20T12:00:00Z"));
  EXPECT_DOUBLE_EQ(s.total_away_minutes, 0.0);
  EXPECT_EQ(s.away_count, 0);
  EXPECT_DOUBLE_EQ(s.current_session_minutes, 300.0);
}

TEST(PresenceStatistics, SpanOpenAtDayStartIsClipped) {
  const std::vector<PresenceEvent> events{
      ev("2026-01-19T23:00:00Z", kConf),
      ev("2026-01-20T07:30:00Z", kRet, 510.0),
  };
  const auto s = compute_presence_statistics(events, at("2026-01-20T07:00:00Z"), at("2026-01-20T08:00:00Z"));
  EXPECT_DOUBLE_EQ(s.total_away_minutes, 30.0);
  EXPECT_EQ(s.away_count, 1);
  EXPECT_DOUBLE_EQ(s.total_active_minutes, 30.0);
  EXPECT_DOUBLE_EQ(s.current_session_minutes, 30.0);
}

TEST(PresenceStatistics, ReturnWithoutItsStartUsesDuration) {
  const std::vector<PresenceEvent> events{ev("2026-01-20T08:00:00Z", kRet, 20.0)};
  const auto s = compute_presence_statistics(events, at("2026-01-20T07:00:00Z"), at("2026-01-20T09:00:00Z"));
  EXPECT_DOUBLE_EQ(s.total_away_minutes, 20.0);
  EXPECT_EQ(s.away_count, 1);
  EXPECT_DOUBLE_EQ(s.total_active_minutes, 100.0);
}

TEST(PresenceStatistics, EventsAfterNowAreIgnored) {
  const std::vector<PresenceEvent> events{
      ev("2026-01-20T09:00:00Z", kConf),
      ev("2026-01-20T13:00:00Z", kRet, 240.0),
  };
  const auto s = compute_presence_statistics(events, at("2026-01-20T07:00:00Z"), at("2026-01-20T10:00:00Z"));
  EXPECT_DOUBLE_EQ(s.total_away_minutes, 60.0);
  EXPECT_DOUBLE_EQ(s.current_away_minutes, 60.0);
}

TEST(PresenceStatistics, EmptyWindowIsAllZero) {
  const auto s = compute_presence_statistics({ev("2026-01-20T06:00:00Z", kConf)}, at("2026-01-20T07:00:00Z"),
                                             at("2026-01-20T07:00:00Z"));
  EXPECT_DOUBLE_EQ(s.total_active_minutes, 0.0);
  EXPECT_DOUBLE_EQ(s.total_away_minutes, 0.0);
  EXPECT_DOUBLE_EQ(s.current_away_minutes, 0.0);
  EXPECT_EQ(s.away_count, 0);
}

}  // namespace
}  // namespace somni
