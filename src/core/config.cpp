// File: src/core/config.cpp
#include "somni/core/config.hpp"

#include <cctype>
#include <cstdio>

namespace somni {

Result<ClockTime> parse_hhmm(const std::string& text) {
  // Exactly two digits, colon, two digits. "7:00" and "07:00:00" are rejected.
  if (text.size() != 5 || text[2] != ':') {
    return Result<ClockTime>::err(Status::parse_error("invalid HH:MM: '" + text + "'"));
  }
  for (std::size_t i : {0u, 1u, 3u, 4u}) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return Result<ClockTime>::err(Status::parse_error("invalid HH:MM: '" + text + "'"));
    }
  }

  ClockTime t;
  t.hour = (text[0] - '0') * 10 + (text[1] - '0');
  t.minute = (text[3] - '0') * 10 + (text[4] - '0');
  if (t.hour > 23 || t.minute > 59) {
    return Result<ClockTime>::err(Status::out_of_range("HH:MM out of range: '" + text + "'"));
  }
  return Result<ClockTime>::ok(t);
}

std::string format_hhmm(const ClockTime& t) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", t.hour, t.minute);
  return std::string(buf);
}

}  // namespace somni
