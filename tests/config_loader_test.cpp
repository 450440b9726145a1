// File: tests/config_loader_test.cpp
#include <fstream>

#include <gtest/gtest.h>

#include "somni/core/util/config_loader.hpp"
#include "test_util.hpp"

namespace somni {
namespace {

TEST(ParseHhmm, AcceptsStrictFormOnly) {
  auto ok = parse_hhmm("07:05");
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(ok.value().hour, 7);
  EXPECT_EQ(ok.value().minute, 5);
  EXPECT_EQ(ok.value().minutes_since_midnight(), 425);

  EXPECT_EQ(parse_hhmm("7:05").status().code(), Status::Code::kParseError);
  EXPECT_EQ(parse_hhmm("07:05:00").status().code(), Status::Code::kParseError);
  EXPECT_EQ(parse_hhmm("ab:cd").status().code(), Status::Code::kParseError);
  EXPECT_EQ(parse_hhmm("24:00").status().code(), Status::Code::kOutOfRange);
  EXPECT_EQ(parse_hhmm("23:60").status().code(), Status::Code::kOutOfRange);
}

TEST(ParseHhmm, FormatPadsBothFields) {
  EXPECT_EQ(format_hhmm(ClockTime{9, 0}), "09:00");
  EXPECT_EQ(format_hhmm(ClockTime{22, 30}), "22:30");
}

TEST(ConfigLoader, MissingSleepWindowKeepsDefaults) {
  auto r = load_config_from_string("presence:\n  grace_threshold_s: 30\n  confirm_threshold_s: 90\n");
  ASSERT_TRUE(r.ok()) << r.status().message();
  const Config& cfg = r.value();
  EXPECT_DOUBLE_EQ(cfg.presence.grace_threshold_s, 30.0);
  EXPECT_DOUBLE_EQ(cfg.presence.confirm_threshold_s, 90.0);
  EXPECT_DOUBLE_EQ(cfg.presence.return_threshold_s, 5.0);
  EXPECT_EQ(cfg.sleep_window.start, (ClockTime{22, 30}));
  EXPECT_EQ(cfg.sleep_window.end, (ClockTime{9, 0}));
  EXPECT_DOUBLE_EQ(cfg.sleep_window.min_sleep_minutes, 120.0);
  EXPECT_EQ(cfg.storage.type, "sqlite");
}

TEST(ConfigLoader, ReadsEverySection) {
  const char* yaml = R"(
sleep_window:
  start: "23:00"
  end: "08:30"
  min_sleep_minutes: 90
  typical_wake: "06:45"
  real_wake_grace_minutes: 10
reconcile:
  lookback_hours: 36
  good_minutes: 450
  fair_minutes: 380
  merge_gap_minutes: 5
timezone:
  utc_offset_minutes: -300
storage:
  type: memory
  presence_retention_days: 7
input:
  type: idle_file
  tick_hz: 1
  idle_file:
    path: /tmp/idle
    max_age_s: 5
logging:
  level: debug
)";
  auto r = load_config_from_string(yaml);
  ASSERT_TRUE(r.ok()) << r.status().message();
  const Config& cfg = r.value();
  EXPECT_EQ(cfg.sleep_window.start, (ClockTime{23, 0}));
  EXPECT_EQ(cfg.sleep_window.end, (ClockTime{8, 30}));
  EXPECT_EQ(cfg.sleep_window.typical_wake, (ClockTime{6, 45}));
  EXPECT_DOUBLE_EQ(cfg.sleep_window.min_sleep_minutes, 90.0);
  EXPECT_DOUBLE_EQ(cfg.sleep_window.real_wake_grace_minutes, 10.0);
  EXPECT_DOUBLE_EQ(cfg.reconcile.lookback_hours, 36.0);
  EXPECT_DOUBLE_EQ(cfg.reconcile.good_minutes, 450.0);
  EXPECT_DOUBLE_EQ(cfg.reconcile.merge_gap_minutes, 5.0);
  ASSERT_TRUE(cfg.timezone.utc_offset_minutes.has_value());
  EXPECT_EQ(*cfg.timezone.utc_offset_minutes, -300);
  EXPECT_EQ(cfg.storage.type, "memory");
  EXPECT_EQ(cfg.storage.presence_retention_days, 7);
  EXPECT_EQ(cfg.input.type, "idle_file");
  EXPECT_EQ(cfg.input.idle_file.path, "/tmp/idle");
  EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(ConfigLoader, RejectsBadClockTime) {
  auto r = load_config_from_string("sleep_window:\n  start: \"25:00\"\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kOutOfRange);
  EXPECT_NE(r.status().message().find("sleep_window.start"), std::string::npos);
}

TEST(ConfigLoader, RejectsInconsistentThresholds) {
  auto r = load_config_from_string("presence:\n  grace_threshold_s: 120\n  confirm_threshold_s: 60\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST(ConfigLoader, RejectsNegativeMergeGap) {
  auto r = load_config_from_string("reconcile:\n  merge_gap_minutes: -1\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
  EXPECT_NE(r.status().message().find("merge_gap_minutes"), std::string::npos);
}

TEST(ConfigLoader, WrongScalarTypeIsParseError) {
  auto r = load_config_from_string("presence:\n  grace_threshold_s: soon\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kParseError);
}

TEST(ConfigLoader, UnknownStorageTypeRejected) {
  auto r = load_config_from_string("storage:\n  type: postgres\n");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kInvalidArgument);
}

TEST(ConfigLoader, MissingFileIsNotFound) {
  test::TempDir dir;
  auto r = load_config(dir.file("nope.yaml"));
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kNotFound);
}

TEST(ConfigLoader, IncludesAreOverriddenByTheIncludingFile) {
  test::TempDir dir;
  {
    std::ofstream base(dir.file("base.yaml"));
    base << "sleep_window:\n  start: \"23:15\"\n  end: \"07:30\"\nstorage:\n  type: memory\n";
  }
  {
    std::ofstream top(dir.file("top.yaml"));
    top << "includes:\n  - base.yaml\nsleep_window:\n  end: \"08:00\"\n";
  }

  auto r = load_config(dir.file("top.yaml"));
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r.value().sleep_window.start, (ClockTime{23, 15}));
  EXPECT_EQ(r.value().sleep_window.end, (ClockTime{8, 0}));
  EXPECT_EQ(r.value().storage.type, "memory");
}

}  // namespace
}  // namespace somni
