#pragma once

#include <memory>
#include <string>

#include "internal/core/geocoder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/coordinates.hpp"

namespace commute::core {

/*
  Cache-through label -> coordinates resolver.

  A label whose stored row has both lat and lon is answered from the
  repository without touching the geocoder. Otherwise the address is
  geocoded and (label, address, lat, lon) is upserted.

  The lookup and the upsert run in separate transactions so no write lock
  is held across the network call.
*/
class LocationResolver {
 public:
  LocationResolver(std::shared_ptr<db::Repository> repository, std::shared_ptr<Geocoder> geocoder);

  model::Coordinates Resolve(const std::string& label, const std::string& address);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<Geocoder>       geocoder_;
};

} // namespace commute::core
