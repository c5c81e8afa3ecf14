#pragma once

#include <optional>
#include <string>

namespace commute::db::model {

/*
  Persistent location row.

  lat/lon stay empty until the label has been geocoded.
*/

struct LocationRecord {
  std::string label;
  std::string address;

  std::optional<double> lat;
  std::optional<double> lon;

  std::string created_at;

  bool HasCoordinates() const {
    return lat.has_value() && lon.has_value();
  }
};

}
