#include "commute_sampler.hpp"

#include <cstdio>

#include "internal/core/route_extractor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace commute::core {

using observability::IntField;
using observability::StringField;

namespace {

std::string Summary(const SampleRun& run, const model::SampleMetrics& m) {
  char distance[64];
  std::snprintf(distance, sizeof(distance), "%.1f km / %g mi", static_cast<double>(m.meters) / 1000.0, m.miles);
  return "[" + run.batch->batch_id + "] " + run.origin_label + " -> " + run.dest_label + ": " + m.description + " | " +
         std::to_string(m.duration_minutes) + " min | " + distance;
}

} // namespace

CommuteSampler::CommuteSampler(const commute::runtime::config::RuntimeConfig& config, std::shared_ptr<LocationResolver> resolver,
                               std::shared_ptr<RouteClient> routes, std::shared_ptr<BatchWriter> writer)
    : home_(config.home()),
      work_(config.work()),
      selector_(config.schedule()),
      resolver_(std::move(resolver)),
      routes_(std::move(routes)),
      writer_(std::move(writer)) {
}

SampleRun CommuteSampler::RunOnce(util::TimePoint now) {
  SampleRun run;
  run.direction = selector_.Select(now);

  if (run.direction == model::Direction::kSkip) {
    COMMUTE_LOG_INFO("outside commute windows; no request made");
    return run;
  }

  const bool  outbound    = run.direction == model::Direction::kHomeToWork;
  const auto& origin      = outbound ? home_ : work_;
  const auto& destination = outbound ? work_ : home_;
  run.origin_label        = origin.label();
  run.dest_label          = destination.label();

  COMMUTE_LOG_INFO("sampling", {StringField("direction", model::ToString(run.direction)), StringField("origin", run.origin_label),
                                StringField("destination", run.dest_label)});

  const auto origin_coords      = resolver_->Resolve(origin.label(), origin.address());
  const auto destination_coords = resolver_->Resolve(destination.label(), destination.address());

  const auto raw_routes = routes_->GetRoutes(origin_coords, destination_coords);
  if (raw_routes.empty()) {
    throw util::UpstreamError("routing provider returned no routes", 0, {});
  }

  run.routes.reserve(raw_routes.size());
  for (const auto& raw : raw_routes) {
    run.routes.push_back(RouteExtractor::Extract(raw));
  }

  run.batch = writer_->Commit(run.origin_label, run.dest_label, run.routes);
  if (!run.batch) {
    throw util::UpstreamError("no routes to persist", 0, {});
  }

  for (const auto& m : run.routes) {
    COMMUTE_LOG_INFO(Summary(run, m), {IntField("duration_seconds", m.duration_seconds),
                                       IntField("duration_static_minutes", m.duration_static_minutes)});
  }
  return run;
}

} // namespace commute::core
