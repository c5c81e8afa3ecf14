#pragma once

#include "internal/http/http_client.hpp"

namespace commute::http {

// cpp-httplib transport. One connection per request; https needs OpenSSL support.
class HttplibClient final : public HttpClient {
 public:
  HttpResponse Get(const HttpRequest& request) override;
  HttpResponse Post(const HttpRequest& request) override;
};

} // namespace commute::http
