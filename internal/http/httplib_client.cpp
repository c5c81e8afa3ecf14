#include "internal/http/httplib_client.hpp"

#include <httplib.h>

#include <string>

namespace commute::http {

namespace {

struct SplitUrl {
  std::string origin;  // scheme://host[:port]
  std::string path;
};

// Returns false when the URL has no scheme://host part.
bool Split(const std::string& url, SplitUrl* out) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return false;

  const auto path_start = url.find('/', scheme_end + 3);
  if (path_start == std::string::npos) {
    out->origin = url;
    out->path   = "/";
  } else {
    out->origin = url.substr(0, path_start);
    out->path   = url.substr(path_start);
  }
  return out->origin.size() > scheme_end + 3;
}

httplib::Headers ToHeaders(const HttpRequest& request) {
  httplib::Headers headers;
  for (const auto& [name, value] : request.headers) headers.emplace(name, value);
  return headers;
}

void Configure(httplib::Client& client, const HttpRequest& request) {
  const auto seconds = static_cast<time_t>(request.timeout.count());
  client.set_connection_timeout(seconds, 0);
  client.set_read_timeout(seconds, 0);
  client.set_write_timeout(seconds, 0);
  client.set_follow_location(true);
}

HttpResponse FromResult(const httplib::Result& result) {
  HttpResponse response;
  if (!result) {
    response.error = httplib::to_string(result.error());
    return response;
  }
  response.status = result->status;
  response.body   = result->body;
  return response;
}

HttpResponse InvalidUrl(const std::string& url) {
  HttpResponse response;
  response.error = "invalid url: " + url;
  return response;
}

} // namespace

HttpResponse HttplibClient::Get(const HttpRequest& request) {
  SplitUrl target;
  if (!Split(request.url, &target)) return InvalidUrl(request.url);

  httplib::Client client(target.origin);
  Configure(client, request);

  httplib::Params params;
  for (const auto& [name, value] : request.query) params.emplace(name, value);

  return FromResult(client.Get(target.path, params, ToHeaders(request)));
}

HttpResponse HttplibClient::Post(const HttpRequest& request) {
  SplitUrl target;
  if (!Split(request.url, &target)) return InvalidUrl(request.url);

  httplib::Client client(target.origin);
  Configure(client, request);

  auto path = target.path;
  if (!request.query.empty()) {
    httplib::Params params;
    for (const auto& [name, value] : request.query) params.emplace(name, value);
    path = httplib::append_query_params(path, params);
  }

  return FromResult(client.Post(path, ToHeaders(request), request.body, request.content_type));
}

} // namespace commute::http
