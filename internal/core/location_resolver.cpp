#include "location_resolver.hpp"

#include "internal/core/storage_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace commute::core {

using observability::DoubleField;
using observability::StringField;

LocationResolver::LocationResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<Geocoder> geocoder)
    : repository_(std::move(repository)), geocoder_(std::move(geocoder)) {
}

model::Coordinates LocationResolver::Resolve(const std::string& label, const std::string& address) {
  {
    auto tx     = repository_->Begin();
    auto cached = repository_->GetLocation(*tx, label);
    tx->Rollback();

    if (cached && cached->HasCoordinates()) {
      COMMUTE_LOG_DEBUG("location cache hit", {StringField("label", label)});
      return {*cached->lat, *cached->lon};
    }
  }

  COMMUTE_LOG_INFO("geocoding location", {StringField("label", label), StringField("address", address)});

  model::Coordinates coordinates;
  try {
    coordinates = geocoder_->Geocode(address);
  } catch (const util::ResolutionError& e) {
    throw util::ResolutionError("resolve '" + label + "': " + e.what());
  }

  db::model::LocationRecord record;
  record.label   = label;
  record.address = address;
  record.lat     = coordinates.lat;
  record.lon     = coordinates.lon;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertLocation(*tx, record), "upsert location '" + label + "'");
  tx->Commit();

  COMMUTE_LOG_INFO("location resolved",
                   {StringField("label", label), DoubleField("lat", coordinates.lat), DoubleField("lon", coordinates.lon)});
  return coordinates;
}

} // namespace commute::core
