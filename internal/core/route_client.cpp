#include "route_client.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace commute::core {

using commute::util::UpstreamError;

namespace {

void SetWaypoint(const model::Coordinates& c, commute::provider::v1::Waypoint* waypoint) {
  auto* lat_lng = waypoint->mutable_location()->mutable_lat_lng();
  lat_lng->set_latitude(c.lat);
  lat_lng->set_longitude(c.lon);
}

std::string BuildRequestBody(const model::Coordinates& origin, const model::Coordinates& destination) {
  commute::provider::v1::ComputeRoutesRequest body;
  SetWaypoint(origin, body.mutable_origin());
  SetWaypoint(destination, body.mutable_destination());
  body.set_travel_mode("DRIVE");
  body.set_units("IMPERIAL");
  body.set_compute_alternative_routes(true);
  body.set_routing_preference("TRAFFIC_AWARE_OPTIMAL");

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw UpstreamError("encode routes request: " + std::string(status.message()), 0, {});
  }
  return json;
}

} // namespace

GoogleRouteClient::GoogleRouteClient(const commute::runtime::config::ProviderConfig& provider, std::shared_ptr<http::HttpClient> http)
    : url_(provider.routes_url()), api_key_(provider.api_key()), http_(std::move(http)) {
}

std::vector<RawRoute> GoogleRouteClient::GetRoutes(const model::Coordinates& origin, const model::Coordinates& destination) {
  http::HttpRequest request;
  request.url          = url_;
  request.headers      = {{"X-Goog-Api-Key", api_key_}, {"X-Goog-FieldMask", kFieldMask}};
  request.body         = BuildRequestBody(origin, destination);
  request.content_type = "application/json";
  request.timeout      = kTimeout;

  const auto response = http_->Post(request);
  if (!response.Completed()) {
    throw UpstreamError("routes request failed: " + response.error, 0, {});
  }
  if (!response.Ok()) {
    throw UpstreamError("routes API returned HTTP " + std::to_string(response.status) +
                            "; check that the API is enabled, billing is active and the key is permitted",
                        response.status, response.body);
  }

  commute::provider::v1::ComputeRoutesResponse document;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(response.body, &document, options);
  if (!status.ok()) {
    throw UpstreamError("routes response is not valid: " + std::string(status.message()), response.status, response.body);
  }

  if (document.routes_size() == 0) {
    throw UpstreamError("routes API returned no routes", response.status, response.body);
  }

  return std::vector<RawRoute>(document.routes().begin(), document.routes().end());
}

} // namespace commute::core
