// File: tests/jsonl_event_sink_test.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "somni/events/jsonl_event_sink.hpp"
#include "test_util.hpp"

namespace somni {
namespace {

using test::at;

std::vector<std::string> read_lines(const std::string& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

void touch(const std::string& path) { std::ofstream(path) << "{}\n"; }

TEST(JsonlEventSink, WritesRunFileAndLatest) {
  test::TempDir dir;
  RunInfo run;
  run.config_path = "config/default.yaml";
  run.out_dir = dir.file("journal");
  run.store = "memory";
  run.start_time = at("2026-01-20T07:00:00Z");

  JsonlEventSink sink;
  ASSERT_TRUE(sink.open(run).ok());
  EXPECT_TRUE(std::filesystem::exists(sink.path()));
  EXPECT_EQ(std::filesystem::path(sink.latest_path()).filename().string(), "events_latest.jsonl");

  Event e;
  e.type = "returned";
  e.timestamp = at("2026-01-20T07:30:00Z");
  e.minutes = 12.5;
  e.message = "back \"early\"\nagain";
  ASSERT_TRUE(sink.emit(e).ok());
  ASSERT_TRUE(sink.flush().ok());
  sink.close();

  for (const auto& path : {sink.path(), sink.latest_path()}) {
    const auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u) << path;
    EXPECT_NE(lines[0].find("\"type\":\"run_started\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"store\":\"memory\""), std::string::npos);
    EXPECT_NE(lines[1].find("\"type\":\"returned\""), std::string::npos);
    EXPECT_NE(lines[1].find("\"t\":\"2026-01-20T07:30:00Z\""), std::string::npos);
    EXPECT_NE(lines[1].find("\"minutes\":12.50"), std::string::npos);
    EXPECT_NE(lines[1].find("back \\\"early\\\"\\nagain"), std::string::npos);
  }
}

TEST(JsonlEventSink, EmitBeforeOpenFails) {
  JsonlEventSink sink;
  Event e;
  e.type = "heartbeat";
  EXPECT_EQ(sink.emit(e).code(), Status::Code::kInvalidArgument);
  EXPECT_TRUE(sink.flush().ok());
}

TEST(JsonEscape, EscapesControlCharacters) {
  EXPECT_EQ(json_escape("plain"), "plain");
  EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
  EXPECT_EQ(json_escape("tab\there"), "tab\\there");
  EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(PruneEventJournals, KeepsNewestRuns) {
  test::TempDir dir;
  for (int i = 1; i <= 5; ++i) touch(dir.file("events_" + std::to_string(i) + "000.jsonl"));
  touch(dir.file("events_latest.jsonl"));
  touch(dir.file("notes.txt"));

  EXPECT_EQ(prune_event_journals(dir.path().string(), 2), 3u);
  EXPECT_TRUE(std::filesystem::exists(dir.file("events_5000.jsonl")));
  EXPECT_TRUE(std::filesystem::exists(dir.file("events_4000.jsonl")));
  EXPECT_FALSE(std::filesystem::exists(dir.file("events_3000.jsonl")));
  EXPECT_FALSE(std::filesystem::exists(dir.file("events_1000.jsonl")));
  EXPECT_TRUE(std::filesystem::exists(dir.file("events_latest.jsonl")));
  EXPECT_TRUE(std::filesystem::exists(dir.file("notes.txt")));

  EXPECT_EQ(prune_event_journals(dir.path().string(), 2), 0u);
}

TEST(PruneEventJournals, MissingDirectoryIsQuiet) {
  test::TempDir dir;
  EXPECT_EQ(prune_event_journals(dir.file("nope"), 1), 0u);
}

}  // namespace
}  // namespace somni
