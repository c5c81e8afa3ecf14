#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/commute_sampler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/http/http_client.hpp"

namespace commute::factory {

/*
  Application

  Owns everything one sampler invocation uses.
*/
struct Application {
  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<http::HttpClient>     http;
  std::shared_ptr<core::CommuteSampler> sampler;
};

// Opens (and bootstraps) the configured storage backend.
std::shared_ptr<db::Repository> BuildRepository(const commute::runtime::config::DatabaseConfig& database);

/*
  Build

  Constructs the whole pipeline from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and HTTP types.
*/
Application Build(const commute::runtime::config::RuntimeConfig& config);

}
