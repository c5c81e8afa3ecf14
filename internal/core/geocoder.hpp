#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/http/http_client.hpp"
#include "internal/model/coordinates.hpp"

namespace commute::core {

// Address -> coordinates lookup. Throws util::ResolutionError.
class Geocoder {
 public:
  virtual ~Geocoder() = default;

  virtual model::Coordinates Geocode(const std::string& address) = 0;
};

/*
  Google Geocoding API client.

  GET <geocode_url>?address=...&key=...; the first result wins.
*/
class GoogleGeocoder final : public Geocoder {
 public:
  static constexpr std::chrono::seconds kTimeout{20};

  GoogleGeocoder(const commute::runtime::config::ProviderConfig& provider, std::shared_ptr<http::HttpClient> http);

  model::Coordinates Geocode(const std::string& address) override;

 private:
  std::string                       url_;
  std::string                       api_key_;
  std::shared_ptr<http::HttpClient> http_;
};

} // namespace commute::core
