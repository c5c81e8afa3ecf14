#include "geocoder.hpp"

#include <google/protobuf/util/json_util.h>

#include "commute/provider/v1/geocode.pb.h"
#include "internal/util/errors.hpp"

namespace commute::core {

using commute::util::ResolutionError;

GoogleGeocoder::GoogleGeocoder(const commute::runtime::config::ProviderConfig& provider, std::shared_ptr<http::HttpClient> http)
    : url_(provider.geocode_url()), api_key_(provider.api_key()), http_(std::move(http)) {
}

model::Coordinates GoogleGeocoder::Geocode(const std::string& address) {
  http::HttpRequest request;
  request.url     = url_;
  request.query   = {{"address", address}, {"key", api_key_}};
  request.timeout = kTimeout;

  const auto response = http_->Get(request);
  if (!response.Completed()) {
    throw ResolutionError("geocode request failed: " + response.error);
  }
  if (!response.Ok()) {
    throw ResolutionError("geocode request returned HTTP " + std::to_string(response.status) + ": " + response.body);
  }

  commute::provider::v1::GeocodeResponse document;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(response.body, &document, options);
  if (!status.ok()) {
    throw ResolutionError("geocode response is not valid: " + std::string(status.message()));
  }

  if (document.status() != "OK" || document.results_size() == 0) {
    std::string msg = "geocode status " + (document.status().empty() ? std::string("<none>") : document.status());
    if (!document.error_message().empty()) msg += ": " + document.error_message();
    throw ResolutionError(msg);
  }

  const auto& result = document.results(0);
  if (!result.has_geometry() || !result.geometry().has_location() || !result.geometry().location().has_lat() ||
      !result.geometry().location().has_lng()) {
    throw ResolutionError("geocode result for '" + address + "' has no coordinates");
  }

  const auto& location = result.geometry().location();
  return {location.lat(), location.lng()};
}

} // namespace commute::core
