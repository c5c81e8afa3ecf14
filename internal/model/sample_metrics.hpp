#pragma once

#include <cstdint>
#include <string>

namespace commute::model {

/*
  Typed metrics of one route alternative, as produced by RouteExtractor.
*/
struct SampleMetrics {
  std::string description;

  int64_t meters = 0;
  double  miles  = 0.0;

  // Raw provider duration.
  int64_t duration_seconds = 0;

  // Localized "no traffic" and "with traffic" estimates.
  int duration_static_minutes = 0;
  int duration_minutes        = 0;
};

} // namespace commute::model
