#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using commute::config::ConfigLoader;
using commute::observability::IntField;
using commute::observability::StringField;

namespace {

constexpr int kExitUsage         = 1;
constexpr int kExitConfiguration = 2;
constexpr int kExitRunFailure    = 3;

void Usage() {
  std::cerr << "Usage: commute-sampler [--config <config.yaml>] [run|init-db]\n"
            << "  run      sample the commute once (default)\n"
            << "  init-db  create the database schema and exit\n";
}

} // namespace

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::string                command = "run";

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "run" || arg == "init-db") {
      command = arg;
    } else {
      Usage();
      return kExitUsage;
    }
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  commute::runtime::config::RuntimeConfig config;
  try {
    config = ConfigLoader::Load(config_path, ConfigLoader::ProcessEnvironment());
    commute::observability::InitializeLogging(config);
    if (command == "run") {
      ConfigLoader::Validate(config);
    }
  } catch (const commute::util::ConfigurationError& e) {
    std::cerr << "configuration error: " << e.what() << std::endl;
    return kExitConfiguration;
  }

  try {
    if (command == "init-db") {
      commute::factory::BuildRepository(config.database());
      COMMUTE_LOG_INFO("database ready", {StringField("path", config.database().sqlite().path())});
    } else {
      auto app = commute::factory::Build(config);
      auto run = app.sampler->RunOnce(commute::util::Now());
      if (run.batch) {
        COMMUTE_LOG_INFO("run complete", {StringField("batch_id", run.batch->batch_id),
                                          IntField("routes", static_cast<int64_t>(run.batch->records.size()))});
      }
    }
  } catch (const std::exception& e) {
    COMMUTE_LOG_ERROR("run failed", {StringField("error", e.what())});
    if (const auto* upstream = dynamic_cast<const commute::util::UpstreamError*>(&e)) {
      COMMUTE_LOG_ERROR("upstream response", {IntField("http_status", upstream->http_status()), StringField("body", upstream->body())});
    }
    commute::observability::ShutdownLogging();
    return kExitRunFailure;
  }

  commute::observability::ShutdownLogging();
  return 0;
}
