#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace commute::http {

struct HttpRequest {
  // Absolute URL: scheme://host[:port]/path
  std::string url;

  std::vector<std::pair<std::string, std::string>> query;
  std::vector<std::pair<std::string, std::string>> headers;

  std::string body;
  std::string content_type = "application/json";

  std::chrono::seconds timeout{30};
};

struct HttpResponse {
  // 0 when the request never completed (DNS, connect, TLS, timeout).
  int         status = 0;
  std::string body;

  // Transport failure description when status == 0.
  std::string error;

  bool Completed() const {
    return status != 0;
  }

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

/*
  Blocking HTTP transport used by the provider clients.

  Implementations never throw for HTTP-level or transport failures; they
  report them through HttpResponse so callers map them onto their own
  error types.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Get(const HttpRequest& request)  = 0;
  virtual HttpResponse Post(const HttpRequest& request) = 0;
};

} // namespace commute::http
