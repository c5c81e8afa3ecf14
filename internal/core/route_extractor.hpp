#pragma once

#include "internal/core/route_client.hpp"
#include "internal/model/sample_metrics.hpp"

namespace commute::core {

/*
  Normalizes one provider route into typed metrics. Pure; throws
  util::ParseError when a field is missing or malformed.

    description                         -> description
    distanceMeters                      -> meters
    localizedValues.distance.text       -> miles             ("12.3 mi")
    duration                            -> duration_seconds  ("1532s")
    localizedValues.staticDuration.text -> duration_static_minutes ("25 min")
    localizedValues.duration.text       -> duration_minutes        ("28 mins")
*/
class RouteExtractor {
 public:
  static model::SampleMetrics Extract(const RawRoute& route);
};

} // namespace commute::core
