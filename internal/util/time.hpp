#pragma once

#include <chrono>
#include <string>

#include "date/tz.h"

namespace commute::util {

/*
  Time utilities. Every clock read goes through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using TimeZone  = date::time_zone;

TimePoint Now();

// Wall-clock time of day, whole seconds.
struct TimeOfDay {
  int hour   = 0;
  int minute = 0;
  int second = 0;

  int SecondsSinceMidnight() const {
    return hour * 3600 + minute * 60 + second;
  }
};

// "YYYY-MM-DD HH:MM:SS" in UTC, the layout SQLite CURRENT_TIMESTAMP uses.
std::string FormatUtcTimestamp(TimePoint tp);

// IANA zone lookup ("America/New_York"). Throws ConfigurationError for an unknown name.
const TimeZone* LocateZone(const std::string& name);

// Time of day of `tp` in `zone`, truncated to seconds.
TimeOfDay LocalTimeOfDay(TimePoint tp, const TimeZone* zone);

} // namespace commute::util
