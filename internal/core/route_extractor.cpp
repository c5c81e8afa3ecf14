#include "route_extractor.hpp"

#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/localized_text.hpp"

namespace commute::core {

namespace {

[[noreturn]] void Missing(const char* field) {
  throw util::ParseError(std::string("route field missing: ") + field);
}

const std::string& RequireText(const commute::provider::v1::LocalizedText& text, bool present, const char* field) {
  if (!present || text.text().empty()) Missing(field);
  return text.text();
}

} // namespace

model::SampleMetrics RouteExtractor::Extract(const RawRoute& route) {
  if (!route.has_description()) Missing("description");
  if (!route.has_distance_meters()) Missing("distanceMeters");
  if (!route.has_duration()) Missing("duration");
  if (!route.has_localized_values()) Missing("localizedValues");

  const auto& localized = route.localized_values();

  model::SampleMetrics metrics;
  metrics.description      = route.description();
  metrics.meters           = route.distance_meters();
  metrics.miles            = util::ParseMiles(RequireText(localized.distance(), localized.has_distance(), "localizedValues.distance"));
  metrics.duration_seconds = util::ParseDurationSeconds(route.duration());
  metrics.duration_static_minutes =
      util::ParseMinutes(RequireText(localized.static_duration(), localized.has_static_duration(), "localizedValues.staticDuration"));
  metrics.duration_minutes = util::ParseMinutes(RequireText(localized.duration(), localized.has_duration(), "localizedValues.duration"));
  return metrics;
}

} // namespace commute::core
