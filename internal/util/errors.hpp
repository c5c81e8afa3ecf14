#pragma once

#include <stdexcept>
#include <string>

namespace commute::util {

/*
  Central error types.

  Every one of these aborts the current invocation; main() maps them to
  an exit code.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResolutionError : public std::runtime_error {
 public:
  explicit ResolutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Routing provider failure. Keeps the HTTP status (0 when the request never
// completed) and the raw response body for diagnosis.
class UpstreamError : public std::runtime_error {
 public:
  UpstreamError(const std::string& msg, int http_status, std::string body)
      : std::runtime_error(msg), http_status_(http_status), body_(std::move(body)) {
  }

  int http_status() const {
    return http_status_;
  }

  const std::string& body() const {
    return body_;
  }

 private:
  int         http_status_;
  std::string body_;
};

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace commute::util
