#pragma once

namespace commute::model {

struct Coordinates {
  double lat = 0.0;
  double lon = 0.0;
};

inline bool operator==(const Coordinates& a, const Coordinates& b) {
  return a.lat == b.lat && a.lon == b.lon;
}

} // namespace commute::model
