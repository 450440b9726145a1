// File: src/core/util/local_clock.cpp
#include "somni/core/util/local_clock.hpp"

#include <chrono>
#include <cctype>
#include <ctime>

namespace somni {
namespace {

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

std::int64_t floor_mod(std::int64_t a, std::int64_t b) { return a - floor_div(a, b) * b; }

std::time_t to_time_t(TimestampNs t) {
  return static_cast<std::time_t>(floor_div(t.ns, kNsPerSecond));
}

std::string strftime_tm(const std::tm& tm, const char* fmt) {
  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

// Reads exactly `width` digits starting at pos.
bool read_int(const std::string& s, std::size_t& pos, std::size_t width, int& out) {
  if (pos + width > s.size()) return false;
  int v = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  pos += width;
  out = v;
  return true;
}

bool expect(const std::string& s, std::size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

}  // namespace

LocalClock LocalClock::system_zone() { return LocalClock(std::nullopt); }

LocalClock LocalClock::fixed_offset(int utc_offset_minutes) { return LocalClock(utc_offset_minutes); }

LocalClock LocalClock::from_config(const TimeZoneConfig& cfg) {
  return cfg.utc_offset_minutes ? fixed_offset(*cfg.utc_offset_minutes) : system_zone();
}

int LocalClock::utc_offset_minutes(TimestampNs t) const {
  if (fixed_offset_min_) return *fixed_offset_min_;

  const std::time_t secs = to_time_t(t);
  std::tm tm{};
  if (localtime_r(&secs, &tm) == nullptr) return 0;
  return static_cast<int>(tm.tm_gmtoff / 60);
}

int LocalClock::minutes_since_midnight(TimestampNs t) const {
  const std::int64_t local_ns = t.ns + static_cast<std::int64_t>(utc_offset_minutes(t)) * kNsPerMinute;
  return static_cast<int>(floor_mod(local_ns, kNsPerDay) / kNsPerMinute);
}

TimestampNs LocalClock::at_local_time(TimestampNs ref, const ClockTime& ct) const {
  const std::int64_t off_ref = static_cast<std::int64_t>(utc_offset_minutes(ref)) * kNsPerMinute;
  const std::int64_t local_ns = ref.ns + off_ref;
  const std::int64_t local_midnight = local_ns - floor_mod(local_ns, kNsPerDay);
  const std::int64_t target_local = local_midnight + ct.minutes_since_midnight() * kNsPerMinute;

  // Re-evaluate the offset at the candidate so a DST change between ref and target is honoured.
  const TimestampNs guess{target_local - off_ref};
  const std::int64_t off_target = static_cast<std::int64_t>(utc_offset_minutes(guess)) * kNsPerMinute;
  return TimestampNs{target_local - off_target};
}

TimestampNs LocalClock::last_occurrence(TimestampNs t, const ClockTime& ct) const {
  const TimestampNs today = at_local_time(t, ct);
  if (today <= t) return today;
  return at_local_time(t.minus(kNsPerDay), ct);
}

std::string LocalClock::format_local(TimestampNs t) const {
  std::tm tm{};
  if (fixed_offset_min_) {
    const std::time_t secs = to_time_t(t) + static_cast<std::time_t>(*fixed_offset_min_) * 60;
    gmtime_r(&secs, &tm);
  } else {
    const std::time_t secs = to_time_t(t);
    localtime_r(&secs, &tm);
  }
  return strftime_tm(tm, "%Y-%m-%d %H:%M");
}

TimestampNs wall_now() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

std::string format_iso8601_utc(TimestampNs t) {
  const std::time_t secs = to_time_t(t);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  return strftime_tm(tm, "%Y-%m-%dT%H:%M:%SZ");
}

Result<TimestampNs> parse_iso8601(const std::string& text) {
  const auto bad = [&text]() {
    return Result<TimestampNs>::err(Status::parse_error("invalid ISO-8601 timestamp: '" + text + "'"));
  };

  std::size_t pos = 0;
  std::tm tm{};
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!read_int(text, pos, 4, year) || !expect(text, pos, '-') ||
      !read_int(text, pos, 2, month) || !expect(text, pos, '-') ||
      !read_int(text, pos, 2, day)) {
    return bad();
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) return bad();
  ++pos;
  if (!read_int(text, pos, 2, hour) || !expect(text, pos, ':') || !read_int(text, pos, 2, minute)) {
    return bad();
  }
  if (pos < text.size() && text[pos] == ':') {
    ++pos;
    if (!read_int(text, pos, 2, second)) return bad();
  }

  int offset_min = 0;
  if (pos < text.size()) {
    const char z = text[pos];
    if (z == 'Z' || z == 'z') {
      ++pos;
    } else if (z == '+' || z == '-') {
      ++pos;
      int oh = 0, om = 0;
      if (!read_int(text, pos, 2, oh) || !expect(text, pos, ':') || !read_int(text, pos, 2, om)) {
        return bad();
      }
      offset_min = (oh * 60 + om) * (z == '-' ? -1 : 1);
    } else {
      return bad();
    }
  }
  if (pos != text.size()) return bad();

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return Result<TimestampNs>::err(Status::out_of_range("ISO-8601 field out of range: '" + text + "'"));
  }

  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

  const std::time_t secs = timegm(&tm);
  const std::int64_t utc_secs = static_cast<std::int64_t>(secs) - static_cast<std::int64_t>(offset_min) * 60;
  return Result<TimestampNs>::ok(TimestampNs{utc_secs * kNsPerSecond});
}

}  // namespace somni
