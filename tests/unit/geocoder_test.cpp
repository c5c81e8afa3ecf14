#include "internal/core/geocoder.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "../test_support.hpp"
#include "internal/util/errors.hpp"

namespace {

using commute::core::GoogleGeocoder;
using commute::testing::ScriptedHttpClient;

commute::runtime::config::ProviderConfig Provider() {
  commute::runtime::config::ProviderConfig provider;
  provider.set_api_key("geo-key");
  provider.set_geocode_url("https://maps.example.test/maps/api/geocode/json");
  return provider;
}

bool Fails(const std::shared_ptr<ScriptedHttpClient>& http) {
  GoogleGeocoder geocoder(Provider(), http);
  try {
    (void)geocoder.Geocode("1 Main St");
  } catch (const commute::util::ResolutionError&) {
    return true;
  }
  return false;
}

void TestFirstResultWins() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Enqueue(200, R"({"status": "OK", "results": [
    {"formatted_address": "1 Main St", "geometry": {"location": {"lat": 40.71, "lng": -74.01}, "location_type": "ROOFTOP"}},
    {"formatted_address": "1 Main Ave", "geometry": {"location": {"lat": 10.0, "lng": 10.0}}}
  ]})");
  GoogleGeocoder geocoder(Provider(), http);

  const auto coords = geocoder.Geocode("1 Main St, Springfield");
  assert(coords.lat == 40.71);
  assert(coords.lon == -74.01);

  assert(http->gets.size() == 1);
  const auto& request = http->gets[0];
  assert(request.url == "https://maps.example.test/maps/api/geocode/json");
  assert(request.timeout == std::chrono::seconds(20));
  assert(request.query.size() == 2);
  assert(request.query[0].first == "address" && request.query[0].second == "1 Main St, Springfield");
  assert(request.query[1].first == "key" && request.query[1].second == "geo-key");
}

void TestProviderStatusIsResolutionError() {
  auto zero = std::make_shared<ScriptedHttpClient>();
  zero->Enqueue(200, R"({"status": "ZERO_RESULTS", "results": []})");
  assert(Fails(zero));

  auto denied = std::make_shared<ScriptedHttpClient>();
  denied->Enqueue(200, R"({"status": "REQUEST_DENIED", "error_message": "The provided API key is invalid."})");
  GoogleGeocoder geocoder(Provider(), denied);
  bool threw = false;
  try {
    (void)geocoder.Geocode("x");
  } catch (const commute::util::ResolutionError& e) {
    const std::string msg = e.what();
    threw = msg.find("REQUEST_DENIED") != std::string::npos && msg.find("API key is invalid") != std::string::npos;
  }
  assert(threw);

  // OK with nothing in it is still a failure
  auto empty = std::make_shared<ScriptedHttpClient>();
  empty->Enqueue(200, R"({"status": "OK", "results": []})");
  assert(Fails(empty));
}

void TestTransportAndHttpFailures() {
  auto transport = std::make_shared<ScriptedHttpClient>();
  transport->EnqueueTransportFailure("Could not establish connection");
  assert(Fails(transport));

  auto server_error = std::make_shared<ScriptedHttpClient>();
  server_error->Enqueue(500, "internal");
  assert(Fails(server_error));

  auto garbage = std::make_shared<ScriptedHttpClient>();
  garbage->Enqueue(200, "not json");
  assert(Fails(garbage));
}

void TestResultWithoutCoordinatesIsResolutionError() {
  for (const char* body : {
           R"({"status": "OK", "results": [{"formatted_address": "x"}]})",
           R"({"status": "OK", "results": [{"formatted_address": "x", "geometry": {}}]})",
           R"({"status": "OK", "results": [{"geometry": {"location": {"lat": 40.7}}}]})",
           R"({"status": "OK", "results": [{"geometry": {"location": {"lng": -74.0}}}]})",
       }) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->Enqueue(200, body);
    assert(Fails(http));
  }

  // zero is a real coordinate when the provider sends it
  auto equator = std::make_shared<ScriptedHttpClient>();
  equator->Enqueue(200, R"({"status": "OK", "results": [{"geometry": {"location": {"lat": 0, "lng": 0}}}]})");
  GoogleGeocoder geocoder(Provider(), equator);
  const auto coords = geocoder.Geocode("Null Island");
  assert(coords.lat == 0.0 && coords.lon == 0.0);
}

} // namespace

int main() {
  TestFirstResultWins();
  TestProviderStatusIsResolutionError();
  TestTransportAndHttpFailures();
  TestResultWithoutCoordinatesIsResolutionError();

  std::cout << "commute_unit_geocoder: pass\n";
  return 0;
}
