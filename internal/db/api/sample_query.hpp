#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace commute::db {

/*
  Read contract used by dashboards and reports.

  Rows for (origin_label, dest_label) created at or after `since`,
  ascending by created_at. Timestamps use the stored "YYYY-MM-DD HH:MM:SS"
  layout; time-of-day bounds use "HH:MM:SS" and are inclusive.
*/
struct SampleQuery {
  std::string origin_label;
  std::string dest_label;
  std::string since;

  std::optional<std::string> time_of_day_start;
  std::optional<std::string> time_of_day_end;

  // Keep only the most recent N rows (still returned ascending).
  std::optional<std::size_t> limit;
};

} // namespace commute::db
