// File: tests/day_boundary_resolver_test.cpp
#include <gtest/gtest.h>

#include <vector>

#include "somni/day/day_boundary_resolver.hpp"
#include "somni/store/memory_telemetry_store.hpp"
#include "test_util.hpp"

namespace somni {
namespace {

using test::at;

class DayBoundaryResolverTest : public ::testing::Test {
 protected:
  SleepSegment seg(const std::string& start, const std::string& end, SegmentSource src) {
    SleepSegment s;
    s.start = at(start);
    s.end = at(end);
    s.source = src;
    return s;
  }

  MemoryTelemetryStore store_;
  LocalClock clock_ = LocalClock::fixed_offset(0);
  SleepWakeRecorder recorder_{SleepWindowConfig{}, clock_, store_};
  std::vector<TimestampNs> fired_;
  DayBoundaryResolver resolver_{SleepWindowConfig{}, clock_, store_, recorder_,
                                [this](TimestampNs t) { fired_.push_back(t); }};
};

TEST_F(DayBoundaryResolverTest, ColdStartAssumesATypicalNight) {
  auto r = resolver_.resolve_startup(at("2026-01-20T10:00:00Z"));
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r.value().kind, StartupKind::kColdStart);
  EXPECT_EQ(r.value().day_start, at("2026-01-20T07:00:00Z"));

  ASSERT_TRUE(r.value().assumed_sleep.has_value());
  EXPECT_EQ(r.value().assumed_sleep->source, SegmentSource::kAssumedColdStart);
  EXPECT_EQ(r.value().assumed_sleep->start, at("2026-01-19T22:30:00Z"));
  EXPECT_EQ(*r.value().assumed_sleep->end, at("2026-01-20T07:00:00Z"));

  ASSERT_EQ(fired_.size(), 1u);
  EXPECT_EQ(fired_[0], at("2026-01-20T07:00:00Z"));

  auto stored = store_.sleep_segments_overlapping(at("2026-01-19T00:00:00Z"), at("2026-01-21T00:00:00Z"));
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(stored.value().size(), 1u);
}

TEST_F(DayBoundaryResolverTest, ColdStartBeforeTypicalWakeUsesYesterday) {
  auto r = resolver_.resolve_startup(at("2026-01-20T05:00:00Z"));
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value().day_start, at("2026-01-19T07:00:00Z"));
  EXPECT_EQ(r.value().assumed_sleep->start, at("2026-01-18T22:30:00Z"));
}

TEST_F(DayBoundaryResolverTest, RestartUsesLatestFinishedSleep) {
  ASSERT_TRUE(store_.append_sleep_segment(
      seg("2026-01-19T22:00:00Z", "2026-01-20T06:30:00Z", SegmentSource::kPresenceInferred)).ok());
  ASSERT_TRUE(store_.append_sleep_segment(
      seg("2026-01-20T13:00:00Z", "2026-01-20T13:30:00Z", SegmentSource::kUserStated)).ok());

  SleepSegment ongoing;
  ongoing.start = at("2026-01-20T14:00:00Z");
  ASSERT_TRUE(store_.append_sleep_segment(ongoing).ok());

  auto r = resolver_.resolve_startup(at("2026-01-20T15:00:00Z"));
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value().kind, StartupKind::kRestart);
  EXPECT_EQ(r.value().day_start, at("2026-01-20T13:30:00Z"));
  EXPECT_FALSE(r.value().assumed_sleep.has_value());
  EXPECT_TRUE(fired_.empty());
}

TEST_F(DayBoundaryResolverTest, StartupIsLatched) {
  auto first = resolver_.resolve_startup(at("2026-01-20T10:00:00Z"));
  auto second = resolver_.resolve_startup(at("2026-01-21T10:00:00Z"));
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(first.value().day_start, second.value().day_start);
  EXPECT_TRUE(resolver_.startup_resolved());
  EXPECT_EQ(fired_.size(), 1u);
}

TEST_F(DayBoundaryResolverTest, StartupPropagatesStoreFailure) {
  store_.set_unavailable(true);
  auto r = resolver_.resolve_startup(at("2026-01-20T10:00:00Z"));
  EXPECT_EQ(r.status().code(), Status::Code::kUnavailable);
  EXPECT_FALSE(resolver_.startup_resolved());
  EXPECT_TRUE(fired_.empty());
}

TEST_F(DayBoundaryResolverTest, ShortAwayIsNotADayStart) {
  EXPECT_EQ(resolver_.on_away_return(at("2026-01-20T02:00:00Z"), at("2026-01-20T02:10:00Z"),
                                     at("2026-01-20T02:10:00Z")),
            DayBoundaryDecision::kNotADayStart);
  EXPECT_TRUE(fired_.empty());
}

TEST_F(DayBoundaryResolverTest, EveningGapIsNotADayStart) {
  EXPECT_EQ(resolver_.on_away_return(at("2026-01-19T19:32:00Z"), at("2026-01-19T22:17:00Z"),
                                     at("2026-01-19T22:17:00Z")),
            DayBoundaryDecision::kNotADayStart);
  EXPECT_FALSE(resolver_.pending_wake().has_value());
}

TEST_F(DayBoundaryResolverTest, ReturnAfterWindowConfirmsImmediately) {
  ASSERT_TRUE(resolver_.resolve_startup(at("2026-01-19T20:00:00Z")).ok());
  fired_.clear();

  const auto d = resolver_.on_away_return(at("2026-01-19T23:00:00Z"), at("2026-01-20T09:30:00Z"),
                                          at("2026-01-20T09:30:00Z"));
  EXPECT_EQ(d, DayBoundaryDecision::kConfirmedDayStart);
  EXPECT_EQ(resolver_.day_start(), at("2026-01-20T09:30:00Z"));
  ASSERT_EQ(fired_.size(), 1u);
  EXPECT_EQ(fired_[0], at("2026-01-20T09:30:00Z"));
}

TEST_F(DayBoundaryResolverTest, ReturnInsideWindowWaitsForTheUserToStayUp) {
  const auto d = resolver_.on_away_return(at("2026-01-19T23:00:00Z"), at("2026-01-20T07:00:00Z"),
                                          at("2026-01-20T07:00:00Z"));
  EXPECT_EQ(d, DayBoundaryDecision::kAwaitingConfirmation);
  EXPECT_EQ(resolver_.pending_wake(), at("2026-01-20T07:00:00Z"));

  EXPECT_FALSE(resolver_.on_active_tick(at("2026-01-20T07:10:00Z")));
  EXPECT_TRUE(fired_.empty());

  EXPECT_TRUE(resolver_.on_active_tick(at("2026-01-20T07:15:00Z")));
  EXPECT_EQ(resolver_.day_start(), at("2026-01-20T07:00:00Z"));
  EXPECT_FALSE(resolver_.pending_wake().has_value());
  ASSERT_EQ(fired_.size(), 1u);
  EXPECT_EQ(fired_[0], at("2026-01-20T07:00:00Z"));

  // Already confirmed; further ticks are quiet.
  EXPECT_FALSE(resolver_.on_active_tick(at("2026-01-20T07:20:00Z")));
  EXPECT_EQ(fired_.size(), 1u);
}

TEST_F(DayBoundaryResolverTest, WindowClosingConfirmsAPendingWake) {
  ASSERT_EQ(resolver_.on_away_return(at("2026-01-19T23:00:00Z"), at("2026-01-20T08:55:00Z"),
                                     at("2026-01-20T08:55:00Z")),
            DayBoundaryDecision::kAwaitingConfirmation);
  EXPECT_TRUE(resolver_.on_active_tick(at("2026-01-20T09:00:00Z")));
  EXPECT_EQ(resolver_.day_start(), at("2026-01-20T08:55:00Z"));
}

TEST_F(DayBoundaryResolverTest, GoingAwayAgainRecordsABriefInterruption) {
  ASSERT_EQ(resolver_.on_away_return(at("2026-01-19T23:00:00Z"), at("2026-01-20T03:00:00Z"),
                                     at("2026-01-20T03:00:00Z")),
            DayBoundaryDecision::kAwaitingConfirmation);

  ASSERT_TRUE(resolver_.on_away_start(at("2026-01-20T03:10:00Z")).ok());
  EXPECT_FALSE(resolver_.pending_wake().has_value());
  EXPECT_FALSE(resolver_.day_start().has_value());
  EXPECT_TRUE(fired_.empty());

  auto wakes = store_.wake_segments_overlapping(at("2026-01-19T22:00:00Z"), at("2026-01-20T09:00:00Z"));
  ASSERT_TRUE(wakes.ok());
  ASSERT_EQ(wakes.value().size(), 1u);
  EXPECT_EQ(wakes.value()[0].start, at("2026-01-20T03:00:00Z"));
  EXPECT_EQ(*wakes.value()[0].end, at("2026-01-20T03:10:00Z"));
  EXPECT_EQ(wakes.value()[0].source, SegmentSource::kPresenceInferred);
  EXPECT_EQ(wakes.value()[0].notes, "brief interruption");
}

TEST_F(DayBoundaryResolverTest, FailedInterruptionWriteIsRetried) {
  ASSERT_EQ(resolver_.on_away_return(at("2026-01-19T23:00:00Z"), at("2026-01-20T03:00:00Z"),
                                     at("2026-01-20T03:00:00Z")),
            DayBoundaryDecision::kAwaitingConfirmation);

  store_.set_unavailable(true);
  EXPECT_EQ(resolver_.on_away_start(at("2026-01-20T03:10:00Z")).code(), Status::Code::kUnavailable);
  EXPECT_FALSE(resolver_.pending_wake().has_value());
  EXPECT_EQ(resolver_.unrecorded_count(), 1u);
  EXPECT_EQ(resolver_.retry_unrecorded().code(), Status::Code::kUnavailable);
  EXPECT_EQ(resolver_.unrecorded_count(), 1u);

  store_.set_unavailable(false);
  ASSERT_TRUE(resolver_.retry_unrecorded().ok());
  EXPECT_EQ(resolver_.unrecorded_count(), 0u);
  ASSERT_TRUE(resolver_.retry_unrecorded().ok());

  auto wakes = store_.wake_segments_overlapping(at("2026-01-19T22:00:00Z"), at("2026-01-20T09:00:00Z"));
  ASSERT_TRUE(wakes.ok());
  ASSERT_EQ(wakes.value().size(), 1u);
  EXPECT_EQ(wakes.value()[0].start, at("2026-01-20T03:00:00Z"));
  EXPECT_EQ(*wakes.value()[0].end, at("2026-01-20T03:10:00Z"));
}

TEST_F(DayBoundaryResolverTest, AwayStartWithoutPendingWakeIsANoop) {
  ASSERT_TRUE(resolver_.on_away_start(at("2026-01-20T12:00:00Z")).ok());
  auto wakes = store_.wake_segments_overlapping(at("2026-01-20T00:00:00Z"), at("2026-01-21T00:00:00Z"));
  ASSERT_TRUE(wakes.ok());
  EXPECT_TRUE(wakes.value().empty());
}

TEST_F(DayBoundaryResolverTest, NapAfterTheDayStartedIsNotADayStart) {
  ASSERT_TRUE(resolver_.resolve_startup(at("2026-01-20T07:05:00Z")).ok());
  ASSERT_EQ(resolver_.day_start(), at("2026-01-20T07:00:00Z"));
  fired_.clear();

  // Inside the window, long enough, but no new window opened since the day started.
  EXPECT_EQ(resolver_.on_away_return(at("2026-01-20T07:30:00Z"), at("2026-01-20T08:30:00Z"),
                                     at("2026-01-20T08:30:00Z")),
            DayBoundaryDecision::kNotADayStart);
  EXPECT_EQ(resolver_.day_start(), at("2026-01-20T07:00:00Z"));
  EXPECT_TRUE(fired_.empty());
}

TEST(DayBoundaryDecisionNames, AreStable) {
  EXPECT_STREQ(to_string(DayBoundaryDecision::kNotADayStart), "not_a_day_start");
  EXPECT_STREQ(to_string(DayBoundaryDecision::kAwaitingConfirmation), "awaiting_confirmation");
  EXPECT_STREQ(to_string(DayBoundaryDecision::kConfirmedDayStart), "confirmed_day_start");
}

}  // namespace
}  // namespace somni
