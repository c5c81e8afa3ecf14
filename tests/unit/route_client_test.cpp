#include "internal/core/route_client.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "../test_support.hpp"
#include "internal/util/errors.hpp"

namespace {

using commute::core::GoogleRouteClient;
using commute::testing::ScriptedHttpClient;

commute::runtime::config::ProviderConfig Provider() {
  commute::runtime::config::ProviderConfig provider;
  provider.set_api_key("test-key");
  provider.set_routes_url("https://routes.example.test/directions/v2:computeRoutes");
  return provider;
}

std::string HeaderValue(const commute::http::HttpRequest& request, const std::string& name) {
  for (const auto& [key, value] : request.headers)
    if (key == name) return value;
  return {};
}

constexpr const char* kTwoRoutes = R"({"routes": [
  {"description": "I-95 N", "distanceMeters": 16000, "duration": "1200s",
   "localizedValues": {"distance": {"text": "9.9 mi"}, "duration": {"text": "20 mins"}, "staticDuration": {"text": "18 mins"}}},
  {"description": "US-1 N", "distanceMeters": 17500, "duration": "1500s",
   "localizedValues": {"distance": {"text": "10.9 mi"}, "duration": {"text": "25 mins"}, "staticDuration": {"text": "21 mins"}}}
]})";

void TestRequestAsksForTrafficAwareAlternatives() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Enqueue(200, kTwoRoutes);
  GoogleRouteClient client(Provider(), http);

  const auto routes = client.GetRoutes({40.1, -74.2}, {40.7, -74.0});
  assert(routes.size() == 2);
  assert(routes[0].description() == "I-95 N");
  assert(routes[1].distance_meters() == 17500);

  assert(http->posts.size() == 1);
  const auto& request = http->posts[0];
  assert(request.url == "https://routes.example.test/directions/v2:computeRoutes");
  assert(request.timeout == std::chrono::seconds(25));
  assert(HeaderValue(request, "X-Goog-Api-Key") == "test-key");
  assert(HeaderValue(request, "X-Goog-FieldMask") ==
         "routes.duration,routes.distanceMeters,routes.localizedValues,routes.description");

  commute::provider::v1::ComputeRoutesRequest body;
  assert(google::protobuf::util::JsonStringToMessage(request.body, &body).ok());
  assert(body.compute_alternative_routes());
  assert(body.routing_preference() == "TRAFFIC_AWARE_OPTIMAL");
  assert(body.travel_mode() == "DRIVE");
  assert(body.origin().location().lat_lng().latitude() == 40.1);
  assert(body.destination().location().lat_lng().longitude() == -74.0);

  // wire names are the provider's camelCase
  assert(request.body.find("\"computeAlternativeRoutes\":true") != std::string::npos);
  assert(request.body.find("\"latLng\"") != std::string::npos);
}

void TestHttpFailureCarriesStatusAndBody() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Enqueue(403, R"({"error": {"code": 403, "status": "PERMISSION_DENIED"}})");
  GoogleRouteClient client(Provider(), http);

  bool threw = false;
  try {
    (void)client.GetRoutes({1, 2}, {3, 4});
  } catch (const commute::util::UpstreamError& e) {
    threw = true;
    assert(e.http_status() == 403);
    assert(e.body().find("PERMISSION_DENIED") != std::string::npos);
  }
  assert(threw);
  assert(http->posts.size() == 1);
}

void TestZeroRoutesIsUpstreamError() {
  for (const char* body : {"{}", R"({"routes": []})"}) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->Enqueue(200, body);
    GoogleRouteClient client(Provider(), http);

    bool threw = false;
    try {
      (void)client.GetRoutes({1, 2}, {3, 4});
    } catch (const commute::util::UpstreamError& e) {
      threw = e.http_status() == 200;
    }
    assert(threw);
  }
}

void TestTransportFailureIsUpstreamError() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->EnqueueTransportFailure("Read timeout");
  GoogleRouteClient client(Provider(), http);

  bool threw = false;
  try {
    (void)client.GetRoutes({1, 2}, {3, 4});
  } catch (const commute::util::UpstreamError& e) {
    threw = e.http_status() == 0 && std::string(e.what()).find("Read timeout") != std::string::npos;
  }
  assert(threw);
}

void TestGarbageBodyIsUpstreamError() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Enqueue(200, "<html>oops</html>");
  GoogleRouteClient client(Provider(), http);

  bool threw = false;
  try {
    (void)client.GetRoutes({1, 2}, {3, 4});
  } catch (const commute::util::UpstreamError& e) {
    threw = e.body() == "<html>oops</html>";
  }
  assert(threw);
}

} // namespace

int main() {
  TestRequestAsksForTrafficAwareAlternatives();
  TestHttpFailureCarriesStatusAndBody();
  TestZeroRoutesIsUpstreamError();
  TestTransportFailureIsUpstreamError();
  TestGarbageBodyIsUpstreamError();

  std::cout << "commute_unit_route_client: pass\n";
  return 0;
}
