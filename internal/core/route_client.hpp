#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "commute/provider/v1/routes.pb.h"
#include "config/config.pb.h"
#include "internal/http/http_client.hpp"
#include "internal/model/coordinates.hpp"

namespace commute::core {

using RawRoute = commute::provider::v1::Route;

// One routing request per call; throws util::UpstreamError, never retries.
class RouteClient {
 public:
  virtual ~RouteClient() = default;

  virtual std::vector<RawRoute> GetRoutes(const model::Coordinates& origin, const model::Coordinates& destination) = 0;
};

/*
  Google Routes API (directions/v2:computeRoutes) client.

  Asks for traffic-aware driving routes including alternatives, with a
  field mask limited to what RouteExtractor reads.
*/
class GoogleRouteClient final : public RouteClient {
 public:
  static constexpr std::chrono::seconds kTimeout{25};
  static constexpr const char*          kFieldMask =
      "routes.duration,routes.distanceMeters,routes.localizedValues,routes.description";

  GoogleRouteClient(const commute::runtime::config::ProviderConfig& provider, std::shared_ptr<http::HttpClient> http);

  std::vector<RawRoute> GetRoutes(const model::Coordinates& origin, const model::Coordinates& destination) override;

 private:
  std::string                       url_;
  std::string                       api_key_;
  std::shared_ptr<http::HttpClient> http_;
};

} // namespace commute::core
