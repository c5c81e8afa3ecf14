#include "time.hpp"

#include <ctime>
#include <stdexcept>

#include "errors.hpp"

namespace commute::util {

TimePoint Now() {
  return Clock::now();
}

std::string FormatUtcTimestamp(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           utc{};
  if (!gmtime_r(&t, &utc)) {
    throw std::runtime_error("gmtime_r failed");
  }

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &utc);
  return buf;
}

const TimeZone* LocateZone(const std::string& name) {
  try {
    return date::locate_zone(name);
  } catch (const std::runtime_error& e) {
    throw ConfigurationError("unknown time zone '" + name + "': " + e.what());
  }
}

TimeOfDay LocalTimeOfDay(TimePoint tp, const TimeZone* zone) {
  const auto zoned = date::make_zoned(zone, date::floor<std::chrono::seconds>(tp));
  const auto local = zoned.get_local_time();

  const date::hh_mm_ss<std::chrono::seconds> clock{local - date::floor<date::days>(local)};
  return {static_cast<int>(clock.hours().count()), static_cast<int>(clock.minutes().count()),
          static_cast<int>(clock.seconds().count())};
}

} // namespace commute::util
